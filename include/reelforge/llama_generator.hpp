/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "reelforge/config.hpp"
#include "reelforge/generator.hpp"

namespace reelforge {

class Runner;

// Script generation on a local GGUF model through llama.cpp.
class LlamaScriptGenerator final : public ScriptGenerator {
public:
    LlamaScriptGenerator(const GeneratorConfig& config, double videoSeconds);
    ~LlamaScriptGenerator() override;

    LlamaScriptGenerator(const LlamaScriptGenerator&) = delete;
    LlamaScriptGenerator& operator=(const LlamaScriptGenerator&) = delete;

    // Pre-create one Runner per script worker (must run before lane threads start)
    [[nodiscard]] bool prepare(int workers) override;
    [[nodiscard]] GenerationResult generate(const std::string& topic, const ActionContext& ctx) override;

    [[nodiscard]] std::string buildPrompt(const std::string& topic) const;

private:
    std::string modelPath_;
    std::string promptTemplate_;
    double videoSeconds_;

    std::unordered_map<int, std::unique_ptr<Runner>> runners_;
    std::mutex runnersMutex_;

    Runner* runnerForWorker(int workerId);
};

}
