/*
 * reelforge - Batch status tool (reelflow)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/flow.hpp"
#include "reelforge/logger.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace reelforge;

void printUsage(const char* progName) {
    std::cout << "reelforge Batch Status Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [batch_id] [-w|--wait] [--list]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Pipeline workspace\n";
    std::cout << "  batch_id      Batch to report (optional, defaults to latest)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Poll until the batch is complete\n";
    std::cout << "  --list        List batch ids recorded in the journal\n\n";
    std::cout << "Exit status: 0 complete, 1 error or unknown batch, 2 batch not complete\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace 1731808123456_12345_0 --wait\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::ERROR);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string batchId;
    bool wait = false;
    bool list = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            batchId = arg;
        }
    }

    // Batch id may be piped in
    if (batchId.empty() && !list && !isatty(fileno(stdin))) {
        std::cin >> batchId;
    }

    try {
        Flow flow(workspace);

        if (list) {
            for (const auto& id : flow.batches()) {
                std::cout << id << "\n";
            }
            return 0;
        }

        if (batchId.empty()) {
            auto latest = flow.latest();
            if (!latest) {
                std::cerr << "No batches found" << std::endl;
                return 1;
            }
            batchId = *latest;
        }

        auto report = flow.report(batchId);
        while (wait && report && !report->complete()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            report = flow.report(batchId);
        }

        if (!report) {
            std::cerr << "Batch not found: " << batchId << std::endl;
            return 1;
        }

        std::cout << formatReport(*report);
        return report->complete() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
