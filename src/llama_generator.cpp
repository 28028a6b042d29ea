/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/llama_generator.hpp"
#include "reelforge/logger.hpp"
#include "reelforge/runner.hpp"

namespace reelforge {

LlamaScriptGenerator::LlamaScriptGenerator(const GeneratorConfig& config, double videoSeconds)
    : modelPath_(config.modelPath),
      promptTemplate_(config.promptTemplate.empty() ? defaultPromptTemplate() : config.promptTemplate),
      videoSeconds_(videoSeconds) {
    LOG_DEBUG("Script generator using model: " + modelPath_);
}

LlamaScriptGenerator::~LlamaScriptGenerator() = default;

// Runner construction calls ggml_backend_load_all(); keep it on the calling thread
bool LlamaScriptGenerator::prepare(int workers) {
    std::lock_guard<std::mutex> lock(runnersMutex_);

    try {
        for (int i = 0; i < workers; ++i) {
            if (runners_.count(i)) continue;
            LOG_DEBUG("Pre-creating Runner instance for script worker " + std::to_string(i));
            runners_[i] = std::make_unique<Runner>(modelPath_);
        }
        LOG_DEBUG("All " + std::to_string(workers) + " Runner instances initialized");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize runners: " + std::string(e.what()));
        return false;
    }
}

Runner* LlamaScriptGenerator::runnerForWorker(int workerId) {
    std::lock_guard<std::mutex> lock(runnersMutex_);
    auto it = runners_.find(workerId);
    return it == runners_.end() ? nullptr : it->second.get();
}

std::string LlamaScriptGenerator::buildPrompt(const std::string& topic) const {
    static const std::string placeholder = "{topic}";
    std::string prompt = promptTemplate_;
    size_t pos = 0;
    while ((pos = prompt.find(placeholder, pos)) != std::string::npos) {
        prompt.replace(pos, placeholder.size(), topic);
        pos += topic.size();
    }
    return prompt;
}

GenerationResult LlamaScriptGenerator::generate(const std::string& topic, const ActionContext& ctx) {
    Runner* runner = runnerForWorker(ctx.workerId);
    if (!runner) {
        return GenerationResult::failure(GenerationErrorKind::Unavailable,
            "no model runner for script worker " + std::to_string(ctx.workerId));
    }

    RunResult run = runner->run(buildPrompt(topic), [&ctx] { return ctx.shouldStop(); });
    if (!run.ok) {
        if (run.stopped) {
            return GenerationResult::failure(
                ctx.isCancelled() ? GenerationErrorKind::Cancelled : GenerationErrorKind::Timeout, run.error);
        }
        return GenerationResult::failure(GenerationErrorKind::Unavailable, run.error);
    }

    ScriptParseResult parsed = parseScript(run.output, videoSeconds_);
    if (!parsed) {
        auto kind = parsed.problem == ScriptProblem::EmptyOutput
            ? GenerationErrorKind::EmptyOutput : GenerationErrorKind::Malformed;
        LOG_DEBUG("Unusable model output for '" + topic + "': " + parsed.error);
        return GenerationResult::failure(kind, parsed.error);
    }
    return GenerationResult::success(std::move(parsed.script));
}

}
