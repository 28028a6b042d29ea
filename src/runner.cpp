/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/runner.hpp"
#include "reelforge/logger.hpp"
#include "llama.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <vector>

namespace reelforge {

std::shared_ptr<llama_model> Runner::shared_model_ = nullptr;
std::string Runner::current_model_path_ = "";
std::mutex Runner::model_mutex_;

static int env_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) return std::atoi(v);
    return defv;
}

static float env_float(const char* name, float defv) {
    if (const char* v = std::getenv(name)) return std::atof(v);
    return defv;
}

// Strip <think>...</think> blocks emitted by reasoning models
static std::string stripThinkBlocks(const std::string& text) {
    static const std::regex thinkRegex("<think>[\\s\\S]*?</think>\\s*");
    std::string result = std::regex_replace(text, thinkRegex, "");
    size_t start = result.find_first_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : result.substr(start);
}

static void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;

    if (filter_level == -1) {
        const char* env = std::getenv("LLAMA_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "warn" ? GGML_LOG_LEVEL_WARN :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             GGML_LOG_LEVEL_ERROR) : GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}

Runner::Runner(const std::string& modelPath) {
    llama_log_set(filtered_llama_log, nullptr);
    ggml_backend_load_all();

    std::lock_guard<std::mutex> lock(model_mutex_);
    if (!shared_model_ || current_model_path_ != modelPath) {
        LOG_INFO("Loading model: " + modelPath);

        llama_model_params model_params = llama_model_default_params();

        #if defined(__APPLE__)
            model_params.n_gpu_layers = env_int("REELFORGE_GPU_LAYERS", 99);
        #else
            model_params.n_gpu_layers = env_int("REELFORGE_GPU_LAYERS", 0);
        #endif

        llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
        if (!model) {
            LOG_ERROR("Failed to load model: " + modelPath);
            throw std::runtime_error("Failed to load model: " + modelPath);
        }

        shared_model_ = std::shared_ptr<llama_model>(model, llama_model_free);
        current_model_path_ = modelPath;
        LOG_INFO("Model loaded successfully");
    }
}

Runner::~Runner() {
    releaseContext();
}

void Runner::releaseContext() noexcept {
    if (context_) {
        llama_free(context_);
        context_ = nullptr;
    }
}

Runner::SamplingConfig Runner::buildSamplingConfig() const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(shared_model_.get());

    config.temp = env_float("REELFORGE_TEMP", 0.8f);
    config.top_k = env_int("REELFORGE_TOP_K", 40);
    config.top_p = env_float("REELFORGE_TOP_P", 0.9f);
    config.min_p = env_float("REELFORGE_MIN_P", 0.05f);
    config.repeat_penalty = env_float("REELFORGE_REPEAT_PENALTY", 1.1f);
    config.repeat_last_n = env_int("REELFORGE_REPEAT_LAST_N", 64);
    config.seed = static_cast<uint32_t>(env_int("REELFORGE_SEED", 0));

    // A script is a few hundred tokens; keep contexts small so workers fit side by side
    config.max_ctx = std::min(n_ctx_train, env_int("REELFORGE_MAX_CTX", 4096));
    config.n_predict = env_int("REELFORGE_PREDICT", 1024);

    LOG_DEBUG("Model context: " + std::to_string(n_ctx_train) +
              ", using max_ctx=" + std::to_string(config.max_ctx) +
              ", n_predict=" + std::to_string(config.n_predict));

    return config;
}

void Runner::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = env_int("REELFORGE_BATCH", 2048);
    params.no_perf = true;
}

llama_sampler* Runner::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(
        config.repeat_last_n,
        config.repeat_penalty,
        0.0f,
        0.0f
    ));

    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed));

    return smpl;
}

RunResult Runner::run(const std::string& prompt, const StopFn& shouldStop) {
    if (!shared_model_) {
        return {false, false, "", "Model not loaded"};
    }

    try {
        SamplingConfig config = buildSamplingConfig();
        std::string formatted_prompt = formatPrompt(prompt);
        const llama_vocab* vocab = llama_model_get_vocab(shared_model_.get());
        const int n_prompt = -llama_tokenize(vocab, formatted_prompt.c_str(), formatted_prompt.size(), NULL, 0, true, true);
        if (n_prompt <= 0) {
            return {false, false, "", "Failed to tokenize input"};
        }

        int max_predict = config.max_ctx - n_prompt - 64;
        if (max_predict < 0) max_predict = 0;
        if (config.n_predict > max_predict) {
            config.n_predict = max_predict;
        }

        std::vector<llama_token> prompt_tokens(n_prompt);
        if (llama_tokenize(vocab, formatted_prompt.c_str(), formatted_prompt.size(), prompt_tokens.data(), prompt_tokens.size(), true, true) < 0) {
            return {false, false, "", "Failed to tokenize the prompt"};
        }

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        context_ = llama_init_from_model(shared_model_.get(), ctx_params);
        if (!context_) {
            return {false, false, "", "Failed to create context"};
        }

        LOG_DEBUG("Context: " + std::to_string(ctx_params.n_ctx) + " tokens");

        llama_sampler* smpl = buildSampler(config);
        llama_batch batch = llama_batch_get_one(prompt_tokens.data(), prompt_tokens.size());

        llama_token decoder_start_token_id = 0;
        if (llama_model_has_encoder(shared_model_.get())) {
            if (llama_encode(context_, batch)) {
                LOG_ERROR("Failed to encode");
                llama_sampler_free(smpl);
                releaseContext();
                return {false, false, "", "Failed to encode"};
            }

            decoder_start_token_id = llama_model_decoder_start_token(shared_model_.get());
            if (decoder_start_token_id == LLAMA_TOKEN_NULL) {
                decoder_start_token_id = llama_vocab_bos(vocab);
            }

            batch = llama_batch_get_one(&decoder_start_token_id, 1);
        }

        std::string output;
        llama_token new_token_id;
        int n_pos = 0;
        bool stopped = false;
        bool decodeFailed = false;

        for (; n_pos + batch.n_tokens < n_prompt + config.n_predict; ) {
            if (shouldStop && shouldStop()) {
                stopped = true;
                break;
            }

            if (llama_decode(context_, batch)) {
                LOG_ERROR("Failed to decode");
                decodeFailed = true;
                break;
            }

            n_pos += batch.n_tokens;

            new_token_id = llama_sampler_sample(smpl, context_, -1);
            llama_sampler_accept(smpl, new_token_id);

            if (llama_vocab_is_eog(vocab, new_token_id)) {
                break;
            }

            char buf[128];
            int n = llama_token_to_piece(vocab, new_token_id, buf, sizeof(buf), 0, true);
            if (n < 0) {
                LOG_ERROR("Failed to convert token to piece");
                break;
            }

            output.append(buf, n);

            batch = llama_batch_get_one(&new_token_id, 1);
        }

        llama_sampler_free(smpl);
        releaseContext();

        if (stopped) {
            return {false, true, "", "Generation interrupted after " + std::to_string(output.size()) + " bytes"};
        }
        if (decodeFailed && output.empty()) {
            return {false, false, "", "Failed to decode"};
        }

        LOG_DEBUG("Generated " + std::to_string(output.size()) + " bytes");
        return {true, false, stripThinkBlocks(output), ""};

    } catch (const std::exception& e) {
        releaseContext();
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, false, "", "Inference error: " + std::string(e.what())};
    }
}

std::string Runner::formatPrompt(const std::string& content) {
    // Apply chat template if model has one (instruct models)
    // Pass through raw if no template (base models)
    const char* tmpl = llama_model_chat_template(shared_model_.get(), nullptr);
    if (!tmpl) {
        return content;
    }

    llama_chat_message msg = {"user", content.c_str()};
    int len = llama_chat_apply_template(tmpl, &msg, 1, true, nullptr, 0);
    if (len < 0) {
        return content;
    }

    std::vector<char> buf(len + 1);
    int res = llama_chat_apply_template(tmpl, &msg, 1, true, buf.data(), buf.size());
    return (res > 0) ? std::string(buf.data(), res) : content;
}

}
