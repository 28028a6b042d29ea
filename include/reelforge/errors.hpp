/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace reelforge {

// Raised synchronously by submitBatch; the only stage-independent error callers see.
class InvalidBatchError : public std::runtime_error {
public:
    explicit InvalidBatchError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}
