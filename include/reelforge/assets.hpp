/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/config.hpp"
#include "reelforge/types.hpp"

namespace reelforge {

struct AssetSet {
    std::filesystem::path background;
    std::optional<std::filesystem::path> music;
    std::filesystem::path font;
};

// Read-only registry of render assets, scanned once at construction.
class AssetStore {
public:
    explicit AssetStore(const AssetConfig& config);

    AssetStore(const AssetStore&) = delete;
    AssetStore& operator=(const AssetStore&) = delete;
    AssetStore(AssetStore&&) noexcept = default;
    AssetStore& operator=(AssetStore&&) noexcept = default;

    // Deterministic choice per item id; nullopt when no background exists.
    [[nodiscard]] std::optional<AssetSet> select(const ItemId& itemId) const;

    [[nodiscard]] const std::vector<std::filesystem::path>& backgrounds() const noexcept { return backgrounds_; }
    [[nodiscard]] const std::vector<std::filesystem::path>& music() const noexcept { return music_; }
    [[nodiscard]] const std::filesystem::path& font() const noexcept { return font_; }
    [[nodiscard]] bool ready() const noexcept { return !backgrounds_.empty() && !font_.empty(); }

private:
    std::filesystem::path root_;
    std::vector<std::filesystem::path> backgrounds_;
    std::vector<std::filesystem::path> music_;
    std::filesystem::path font_;

    [[nodiscard]] std::vector<std::filesystem::path> scan(const std::filesystem::path& dir,
                                                          const std::vector<std::string>& extensions) const noexcept;
    [[nodiscard]] std::filesystem::path findFont(const std::vector<std::filesystem::path>& fallbacks) const noexcept;
};

// FNV-1a; stable across runs and platforms.
[[nodiscard]] std::uint64_t stableHash(const std::string& text) noexcept;

}
