/*
 * reelforge - Pipeline daemon (reelforged)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/config.hpp"
#include "reelforge/errors.hpp"
#include "reelforge/llama_generator.hpp"
#include "reelforge/logger.hpp"
#include "reelforge/orchestrator.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <unistd.h>

using namespace reelforge;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "reelforge pipeline daemon " << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <topics-file|-> [options]\n";
    std::cout << "       " << progName << " <workspace> --resume [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace          Directory for journal, scripts and media\n";
    std::cout << "  topics-file        One topic per line ('-' reads stdin, '#' starts a comment)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>    JSON configuration overlay\n";
    std::cout << "  --resume           Continue unfinished items recorded in the journal\n";
    std::cout << "  --assets <dir>     Asset directory (backgrounds/, music/, fonts/)\n";
    std::cout << "  --model <path>     GGUF model for script generation\n";
    std::cout << "  --uploader <cmd>   Upload command\n";
    std::cout << "  -q, --quiet        No per-item status lines\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  REELFORGE_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  REELFORGE_GPU_SLOTS        Concurrent renders\n";
    std::cout << "  REELFORGE_UPLOADS_PER_MINUTE  Upload rate limit\n";
    std::cout << "  REELFORGE_MODEL, REELFORGE_UPLOADER, REELFORGE_FFMPEG\n\n";
    std::cout << "Exit status: 0 all published, 3 some items failed, 1 usage or configuration error\n";
}

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool containsToken(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> readTopics(std::istream& in) {
    std::vector<std::string> topics;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        topics.push_back(line);
    }
    return topics;
}

std::filesystem::path resolveModelsDir(const char* argv0) {
    std::error_code ec;
    auto exe = std::filesystem::canonical(std::filesystem::path(argv0), ec);
    if (!ec) {
        for (auto dir = exe.parent_path(); !dir.empty(); dir = dir.parent_path()) {
            if (std::filesystem::is_directory(dir / "models", ec)) {
                return dir / "models";
            }
            if (dir == dir.parent_path()) break;
        }
    }
    return "models";
}

// Exact path, or the first .gguf under the models directory whose name contains the argument
std::optional<std::filesystem::path> resolveModelPath(const std::string& modelArg, const std::filesystem::path& modelsDir) {
    std::filesystem::path candidate(modelArg);
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
        return candidate;
    }
    if (modelArg.empty() || !std::filesystem::is_directory(modelsDir, ec)) {
        return std::nullopt;
    }

    std::string needle = toLower(modelArg);
    std::vector<std::filesystem::path> matches;
    for (const auto& entry : std::filesystem::directory_iterator(modelsDir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".gguf") {
            continue;
        }
        std::string filename = toLower(entry.path().filename().string());
        if (containsToken(filename, "mmproj")) {
            continue;
        }
        if (containsToken(filename, needle)) {
            matches.push_back(entry.path());
        }
    }
    if (matches.empty()) {
        return std::nullopt;
    }
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

void applyDefaultEnv(const char* key,
                     const std::string& value,
                     const std::unordered_set<std::string>& lockedKeys,
                     std::unordered_map<std::string, std::string>& applied) {
    if (lockedKeys.count(key) > 0) {
        return;
    }
    setenv(key, value.c_str(), 1);
    applied[key] = value;
}

void applyModelDefaults(const std::filesystem::path& modelPath) {
    std::string filename = toLower(modelPath.filename().string());
    std::unordered_set<std::string> lockedKeys;

    if (std::getenv("REELFORGE_TEMP")) lockedKeys.insert("REELFORGE_TEMP");

    std::unordered_map<std::string, std::string> applied;

    // Scripts must come back as strict JSON; keep sampling on the cool side
    if (containsToken(filename, "deepseek") || containsToken(filename, "r1")) {
        applyDefaultEnv("REELFORGE_TEMP", "0.6", lockedKeys, applied);
    } else {
        applyDefaultEnv("REELFORGE_TEMP", "0.7", lockedKeys, applied);
    }

    if (!applied.empty()) {
        LOG_DEBUG("Applied default params: " + std::to_string(applied.size()));
        for (const auto& entry : applied) {
            LOG_DEBUG("  " + entry.first + "=" + entry.second);
        }
    }
}

bool allComplete(const Orchestrator& pipeline) {
    for (const auto& id : pipeline.batches()) {
        if (!pipeline.pollProgress(id).complete()) {
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::setLevel(LogLevel::WARN);
    Logger::initFromEnv();
    setThreadName("Main");

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string topicsArg;
    std::string configPath;
    std::string assetsDir;
    std::string modelArg;
    std::string uploader;
    bool resume = false;
    bool quiet = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = value("--config"); if (!v) return 1; configPath = *v;
        } else if (arg == "--assets") {
            auto v = value("--assets"); if (!v) return 1; assetsDir = *v;
        } else if (arg == "--model") {
            auto v = value("--model"); if (!v) return 1; modelArg = *v;
        } else if (arg == "--uploader") {
            auto v = value("--uploader"); if (!v) return 1; uploader = *v;
        } else if (arg == "--resume") {
            resume = true;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (topicsArg.empty() && (arg == "-" || arg.rfind("--", 0) != 0)) {
            topicsArg = arg;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    if (topicsArg.empty() && !resume) {
        std::cerr << "Error: No topics file given\n";
        return 1;
    }

    PipelineConfig config;
    try {
        config = PipelineConfig::load(configPath);
        config.workspace = workspace;
        config.resume = resume;
        config.echoStatus = !quiet;
        if (!assetsDir.empty()) config.assets.directory = assetsDir;
        if (!uploader.empty()) config.upload.command = uploader;
        if (!modelArg.empty()) config.generator.modelPath = modelArg;
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (auto resolved = resolveModelPath(config.generator.modelPath, resolveModelsDir(argv[0]))) {
        config.generator.modelPath = resolved->string();
    } else {
        std::cerr << "Error: Model not found: "
                  << (config.generator.modelPath.empty() ? "(set --model or REELFORGE_MODEL)" : config.generator.modelPath)
                  << "\n";
        return 1;
    }
    applyModelDefaults(config.generator.modelPath);

    std::vector<std::string> topics;
    if (!topicsArg.empty()) {
        if (topicsArg == "-") {
            topics = readTopics(std::cin);
        } else {
            std::ifstream file(topicsArg);
            if (!file) {
                std::cerr << "Error: Cannot read topics file: " << topicsArg << "\n";
                return 1;
            }
            topics = readTopics(file);
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "\n";
    std::cout << "  \033[1mreelforge\033[0m " << VERSION << "                     \033[90mscript · render · publish\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";
    std::cout << "  Loading " << std::filesystem::path(config.generator.modelPath).filename().string() << "\n" << std::flush;

    try {
        LlamaScriptGenerator generator(config.generator, config.render.durationSeconds);
        FfmpegRenderWorker renderer(config.render);
        CommandPublishEndpoint endpoint(config.upload);
        Orchestrator pipeline(config, generator, renderer, endpoint);

        if (!pipeline.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Workspace  " << workspace << "\n";
        std::cout << "    Lanes      " << config.lanes.scriptWorkers << " script, " << config.lanes.renderWorkers
                  << " render, " << config.lanes.uploadWorkers << " upload\n";
        std::cout << "    GPU slots  " << config.governor.capacity << "\n";
        std::cout << "    Uploads    " << config.upload.maxPerInterval << " per "
                  << config.upload.interval.count() / 1000 << "s\n";
        std::cout << "\n";

        if (!topics.empty()) {
            try {
                BatchHandle batch = pipeline.submitBatch(topics);
                std::cout << "  Batch " << batch << " (" << topics.size() << " topics)\n\n" << std::flush;
            } catch (const InvalidBatchError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                pipeline.shutdown();
                return 1;
            }
        } else if (pipeline.batches().empty()) {
            std::cout << "  Nothing to resume\n";
            pipeline.shutdown();
            return 0;
        }

        bool cancelled = false;
        while (!allComplete(pipeline)) {
            if (g_shutdown_requested && !cancelled) {
                std::cout << "\nCancelling, stopping in-flight work..." << std::endl;
                for (const auto& id : pipeline.batches()) {
                    (void)pipeline.cancelBatch(id);
                }
                cancelled = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        pipeline.shutdown();

        bool allDone = true;
        std::cout << "\n";
        for (const auto& id : pipeline.batches()) {
            BatchReport report = pipeline.report(id);
            std::cout << formatReport(report);
            allDone = allDone && report.allDone();
        }
        std::cout << "\n  Status:  ./reelflow " << workspace << "\n\n";
        LOG_DEBUG("reelforge daemon stopped");
        return allDone ? 0 : 3;

    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Pipeline error: " + std::string(e.what()));
        return 1;
    }
}
