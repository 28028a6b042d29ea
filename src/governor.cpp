/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/governor.hpp"
#include "reelforge/logger.hpp"
#include <algorithm>

namespace reelforge {

namespace {
// Waiters re-check their cancel flag at least this often.
constexpr auto kCancelPoll = std::chrono::milliseconds(50);
}

Lease::~Lease() {
    release();
}

Lease::Lease(Lease&& other) noexcept
    : governor_(other.governor_), id_(other.id_), cost_(other.cost_) {
    other.governor_ = nullptr;
    other.id_ = 0;
    other.cost_ = 0;
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        governor_ = other.governor_;
        id_ = other.id_;
        cost_ = other.cost_;
        other.governor_ = nullptr;
        other.id_ = 0;
        other.cost_ = 0;
    }
    return *this;
}

void Lease::release() noexcept {
    if (governor_) {
        governor_->release(id_);
        governor_ = nullptr;
    }
}

ResourceGovernor::ResourceGovernor(unsigned capacity) noexcept : capacity_(capacity) {
    LOG_DEBUG("Resource governor created with capacity " + std::to_string(capacity));
}

ResourceGovernor::~ResourceGovernor() {
    shutdown();
}

bool ResourceGovernor::headFits(std::uint64_t ticket) const noexcept {
    if (queue_.empty() || queue_.front().ticket != ticket) {
        return false;
    }
    return inUse_ + queue_.front().cost <= capacity_;
}

LeaseResult ResourceGovernor::grant(std::uint64_t ticket, unsigned cost) {
    leases_[ticket] = cost;
    inUse_ += cost;
    peak_ = std::max(peak_, inUse_);
    LOG_TRACE("Lease " + std::to_string(ticket) + " granted (cost " + std::to_string(cost) +
              ", in use " + std::to_string(inUse_) + "/" + std::to_string(capacity_) + ")");
    LeaseResult result;
    result.ok = true;
    result.lease = Lease(this, ticket, cost);
    return result;
}

void ResourceGovernor::dropWaiter(std::uint64_t ticket) noexcept {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [ticket](const Waiter& w) { return w.ticket == ticket; });
    if (it != queue_.end()) {
        queue_.erase(it);
    }
}

LeaseResult ResourceGovernor::acquire(unsigned costHint, Millis timeout, const CancelFlag& cancel) {
    LeaseResult result;
    if (costHint == 0 || costHint > capacity_) {
        result.error = LeaseError::InvalidCost;
        result.message = "Cost " + std::to_string(costHint) + " outside 1.." + std::to_string(capacity_);
        return result;
    }

    const bool bounded = timeout.count() > 0;
    const auto deadline = Clock::now() + (bounded ? timeout : Millis(0));
    auto cancelled = [&cancel] { return cancel && cancel->load(); };

    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdown_) {
        result.error = LeaseError::ShuttingDown;
        result.message = "Resource governor is shutting down";
        return result;
    }

    const std::uint64_t ticket = nextTicket_++;
    queue_.push_back({ticket, costHint});

    while (true) {
        if (shutdown_) {
            result.error = LeaseError::ShuttingDown;
            result.message = "Resource governor is shutting down";
            break;
        }
        if (cancelled()) {
            result.error = LeaseError::Cancelled;
            result.message = "Cancelled while waiting for a render slot";
            break;
        }
        if (headFits(ticket)) {
            queue_.pop_front();
            LeaseResult granted = grant(ticket, costHint);
            // The next head may fit as well.
            changed_.notify_all();
            return granted;
        }
        auto now = Clock::now();
        if (bounded && now >= deadline) {
            result.error = LeaseError::ResourceTimeout;
            result.message = "Timed out after " + std::to_string(timeout.count()) + "ms waiting for a render slot";
            break;
        }
        auto wakeAt = now + kCancelPoll;
        if (bounded && deadline < wakeAt) {
            wakeAt = deadline;
        }
        changed_.wait_until(lock, wakeAt);
    }

    dropWaiter(ticket);
    changed_.notify_all();
    LOG_DEBUG(std::string("Lease request ") + std::to_string(ticket) + " abandoned: " + leaseErrorName(result.error));
    return result;
}

LeaseResult ResourceGovernor::tryAcquire(unsigned costHint) {
    LeaseResult result;
    if (costHint == 0 || costHint > capacity_) {
        result.error = LeaseError::InvalidCost;
        result.message = "Cost " + std::to_string(costHint) + " outside 1.." + std::to_string(capacity_);
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        result.error = LeaseError::ShuttingDown;
        result.message = "Resource governor is shutting down";
        return result;
    }
    if (!queue_.empty() || inUse_ + costHint > capacity_) {
        result.error = LeaseError::Busy;
        result.message = "No render slot available";
        return result;
    }
    return grant(nextTicket_++, costHint);
}

bool ResourceGovernor::release(std::uint64_t leaseId) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = leases_.find(leaseId);
        if (it == leases_.end()) {
            LOG_WARN("Ignoring release of unknown lease " + std::to_string(leaseId));
            return false;
        }
        inUse_ -= it->second;
        leases_.erase(it);
        LOG_TRACE("Lease " + std::to_string(leaseId) + " released (in use " + std::to_string(inUse_) + ")");
    }
    changed_.notify_all();
    return true;
}

void ResourceGovernor::wake() noexcept {
    changed_.notify_all();
}

void ResourceGovernor::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    changed_.notify_all();
}

unsigned ResourceGovernor::inUse() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return inUse_;
}

unsigned ResourceGovernor::peakInUse() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

std::size_t ResourceGovernor::waiting() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t ResourceGovernor::outstanding() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return leases_.size();
}

const char* leaseErrorName(LeaseError error) noexcept {
    switch (error) {
        case LeaseError::None: return "none";
        case LeaseError::InvalidCost: return "invalid_cost";
        case LeaseError::ResourceTimeout: return "resource_timeout";
        case LeaseError::Cancelled: return "cancelled";
        case LeaseError::ShuttingDown: return "shutting_down";
        case LeaseError::Busy: return "busy";
        default: return "unknown";
    }
}

}
