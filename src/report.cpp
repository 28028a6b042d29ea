/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/report.hpp"
#include <sstream>

namespace reelforge {

std::vector<const ItemReport*> BatchReport::failures() const {
    std::vector<const ItemReport*> out;
    for (const auto& item : items) {
        if (item.stage == Stage::Failed) out.push_back(&item);
    }
    return out;
}

ItemReport toItemReport(const ContentItem& item) {
    ItemReport r;
    r.id = item.id;
    r.index = item.index;
    r.topic = item.topic;
    r.stage = item.stage;
    r.attempts = item.attempts;
    r.scriptPath = item.scriptPath.string();
    r.mediaPath = item.mediaPath.string();
    r.receipt = item.receipt;
    r.failureKind = item.failureKind;
    r.reason = item.reason;
    return r;
}

Progress tally(const std::vector<ItemReport>& items) {
    Progress p;
    for (const auto& item : items) {
        ++p.total;
        switch (item.stage) {
            case Stage::Queued: ++p.queued; break;
            case Stage::Done: ++p.done; break;
            case Stage::Failed: ++p.failed; break;
            default: ++p.inFlight; break;
        }
    }
    return p;
}

std::string formatProgress(const Progress& progress) {
    std::ostringstream out;
    out << progress.done << "/" << progress.total << " done, "
        << progress.failed << " failed, "
        << progress.inFlight << " in flight, "
        << progress.queued << " queued";
    return out.str();
}

std::string formatReport(const BatchReport& report) {
    std::ostringstream out;
    out << "batch " << report.id << (report.cancelled ? " (cancelled)" : "") << "\n";
    out << "  " << formatProgress(report.progress) << "\n";

    for (const auto& item : report.items) {
        if (item.stage == Stage::Done && item.receipt) {
            out << "  done    " << item.id << "  " << item.receipt->remoteId;
            if (!item.receipt->publishedUrl.empty()) out << "  " << item.receipt->publishedUrl;
            out << "\n";
        }
    }
    for (const auto* item : report.failures()) {
        out << "  failed  " << item->id << "  [" << failureKindName(item->failureKind) << "] "
            << item->reason << "  (topic: " << item->topic << ")\n";
    }
    for (const auto& item : report.items) {
        if (!isTerminal(item.stage)) {
            out << "  " << stageName(item.stage) << "  " << item.id << "\n";
        }
    }
    return out.str();
}

}
