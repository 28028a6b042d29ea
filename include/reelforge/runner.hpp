/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct llama_model;
struct llama_context;
struct llama_context_params;
struct llama_sampler;

namespace reelforge {

struct RunResult {
    bool ok = false;
    bool stopped = false;     // generation interrupted by the stop predicate
    std::string output;
    std::string error;
};

// Text generation on a llama.cpp model. The model is shared across all
// instances; each instance owns its context, so one Runner per worker.
class Runner final {
public:
    using StopFn = std::function<bool()>;

    explicit Runner(const std::string& modelPath);
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    // shouldStop is polled between tokens.
    [[nodiscard]] RunResult run(const std::string& prompt, const StopFn& shouldStop = nullptr);

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.8f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    static std::shared_ptr<llama_model> shared_model_;
    static std::string current_model_path_;
    static std::mutex model_mutex_;

    std::string formatPrompt(const std::string& content);
    SamplingConfig buildSamplingConfig() const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    llama_sampler* buildSampler(const SamplingConfig& config) const;
    void releaseContext() noexcept;

    llama_context* context_ = nullptr;
};

}
