/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/assets.hpp"
#include "reelforge/logger.hpp"
#include <algorithm>
#include <cctype>

namespace reelforge {

namespace {
std::string lowerExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}
}

AssetStore::AssetStore(const AssetConfig& config) : root_(config.directory) {
    backgrounds_ = scan(root_ / "backgrounds", {".jpg", ".jpeg", ".png"});
    music_ = scan(root_ / "music", {".mp3", ".wav", ".m4a", ".aac", ".ogg"});
    font_ = findFont(config.fontFallbacks);

    LOG_INFO("Assets: " + std::to_string(backgrounds_.size()) + " background(s), " +
             std::to_string(music_.size()) + " music track(s), font " +
             (font_.empty() ? std::string("<none>") : font_.string()));
    if (backgrounds_.empty()) {
        LOG_WARN("No background images under " + (root_ / "backgrounds").string());
    }
    if (music_.empty()) {
        LOG_INFO("No music under " + (root_ / "music").string() + " - videos will be silent");
    }
}

std::optional<AssetSet> AssetStore::select(const ItemId& itemId) const {
    if (backgrounds_.empty()) {
        return std::nullopt;
    }
    const std::uint64_t h = stableHash(itemId);
    AssetSet set;
    set.background = backgrounds_[h % backgrounds_.size()];
    if (!music_.empty()) {
        set.music = music_[(h / 7) % music_.size()];
    }
    set.font = font_;
    return set;
}

std::vector<std::filesystem::path> AssetStore::scan(const std::filesystem::path& dir,
                                                    const std::vector<std::string>& extensions) const noexcept {
    std::vector<std::filesystem::path> found;
    try {
        if (!std::filesystem::exists(dir)) {
            LOG_DEBUG("Asset directory does not exist: " + dir.string());
            return found;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (std::filesystem::file_size(entry.path()) == 0) {
                LOG_DEBUG("Skipping empty asset: " + entry.path().string());
                continue;
            }
            std::string ext = lowerExtension(entry.path());
            if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
                found.push_back(std::filesystem::absolute(entry.path()));
                LOG_TRACE("Found asset: " + entry.path().string());
            }
        }
        // Sorted so selection does not depend on directory order
        std::sort(found.begin(), found.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Asset scan error in " + dir.string() + ": " + e.what());
    }
    return found;
}

std::filesystem::path AssetStore::findFont(const std::vector<std::filesystem::path>& fallbacks) const noexcept {
    auto local = scan(root_ / "fonts", {".ttf", ".otf", ".ttc"});
    if (!local.empty()) {
        return local.front();
    }
    for (const auto& candidate : fallbacks) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    LOG_WARN("No usable font found in assets or fallback list");
    return {};
}

std::uint64_t stableHash(const std::string& text) noexcept {
    std::uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

}
