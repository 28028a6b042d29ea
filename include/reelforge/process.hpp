/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "reelforge/context.hpp"

namespace reelforge {

struct CommandResult {
    bool started = false;
    int exitCode = -1;
    bool timedOut = false;
    bool cancelled = false;
    std::string out;
    std::string err;

    [[nodiscard]] bool ok() const noexcept { return started && exitCode == 0 && !timedOut && !cancelled; }
};

// Run argv[0] (PATH lookup) with stdin from /dev/null, capturing stdout and
// stderr up to maxCapture bytes each. The child's process group is
// terminated when the context deadline passes or its cancel flag is raised.
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       const ActionContext& ctx,
                                       std::size_t maxCapture = 1 << 20);

[[nodiscard]] std::string describeCommand(const std::vector<std::string>& argv);

}
