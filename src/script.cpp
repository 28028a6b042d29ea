/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/script.hpp"
#include "reelforge/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>

namespace reelforge {

namespace {

using json = nlohmann::json;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool startsWithNoCase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string dropCommentLines(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::string out;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (!t.empty() && (t[0] == '#' || t.rfind("//", 0) == 0)) {
            continue;
        }
        out += line;
        out += '\n';
    }
    return out;
}

std::string removeTrailingCommas(const std::string& text) {
    static const std::regex trailingComma(",\\s*([}\\]])");
    return std::regex_replace(text, trailingComma, "$1");
}

std::string removeEscapedNewlines(std::string text) {
    size_t pos = 0;
    while ((pos = text.find("\\\n", pos)) != std::string::npos) {
        text.erase(pos, 2);
    }
    return text;
}

bool readNumber(const json& value, double& out) {
    if (value.is_number()) {
        out = value.get<double>();
        return true;
    }
    if (value.is_string()) {
        try {
            size_t used = 0;
            std::string s = value.get<std::string>();
            out = std::stod(s, &used);
            return used > 0;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

const json* findAny(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

ScriptParseResult invalid(const std::string& msg) {
    ScriptParseResult result;
    result.problem = ScriptProblem::InvalidFields;
    result.error = msg;
    return result;
}

}

std::optional<std::string> extractJsonObject(const std::string& text) {
    static const std::regex jsonFence("```json\\s*(\\{[\\s\\S]*?\\})\\s*```", std::regex::icase);
    static const std::regex anyFence("```[A-Za-z]*\\s*(\\{[\\s\\S]*?\\})\\s*```");

    std::string content;
    std::smatch match;
    if (std::regex_search(text, match, jsonFence)) {
        content = match[1].str();
    } else if (std::regex_search(text, match, anyFence)) {
        content = match[1].str();
    } else {
        size_t open = text.find('{');
        size_t close = text.rfind('}');
        if (open == std::string::npos || close == std::string::npos || close <= open) {
            return std::nullopt;
        }
        content = text.substr(open, close - open + 1);
    }

    content = dropCommentLines(content);
    content = removeEscapedNewlines(content);
    content = removeTrailingCommas(content);
    return trim(content);
}

std::string cleanValue(const std::string& value) {
    static const char* fenceOpeners[] = {"```json", "```python", "```text", "```", "'''", "\"\"\""};
    static const char* fenceClosers[] = {"```", "'''", "\"\"\""};

    std::string s = trim(value);

    bool changed = true;
    while (changed && !s.empty()) {
        changed = false;
        for (const char* opener : fenceOpeners) {
            if (startsWithNoCase(s, opener)) {
                s = trim(s.substr(std::char_traits<char>::length(opener)));
                changed = true;
                break;
            }
        }
        if (!changed && (s.front() == '"' || s.front() == '\'')) {
            s = trim(s.substr(1));
            changed = true;
        }
    }

    changed = true;
    while (changed && !s.empty()) {
        changed = false;
        for (const char* closer : fenceClosers) {
            std::string c(closer);
            if (s.size() >= c.size() && s.compare(s.size() - c.size(), c.size(), c) == 0) {
                s = trim(s.substr(0, s.size() - c.size()));
                changed = true;
                break;
            }
        }
        if (!changed && (s.back() == '"' || s.back() == '\'')) {
            s = trim(s.substr(0, s.size() - 1));
            changed = true;
        }
    }
    return s;
}

std::vector<CaptionCue> deriveCues(const std::vector<std::string>& lines, double durationSeconds) {
    std::vector<CaptionCue> cues;
    if (lines.empty() || durationSeconds <= 0.0) {
        return cues;
    }
    const double slot = durationSeconds / static_cast<double>(lines.size());
    cues.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        double start = slot * static_cast<double>(i);
        double end = (i + 1 == lines.size()) ? durationSeconds : slot * static_cast<double>(i + 1);
        cues.push_back({lines[i], start, end});
    }
    return cues;
}

ScriptParseResult parseScript(const std::string& modelOutput, double durationSeconds) {
    if (trim(modelOutput).empty()) {
        ScriptParseResult result;
        result.problem = ScriptProblem::EmptyOutput;
        result.error = "Model returned empty output";
        return result;
    }

    auto extracted = extractJsonObject(modelOutput);
    if (!extracted) {
        ScriptParseResult result;
        result.problem = ScriptProblem::NoJson;
        result.error = "No JSON object found in model output";
        return result;
    }

    json data;
    try {
        data = json::parse(*extracted);
    } catch (const json::parse_error& e) {
        ScriptParseResult result;
        result.problem = ScriptProblem::InvalidJson;
        result.error = std::string("JSON decode error: ") + e.what();
        return result;
    }
    if (!data.is_object()) {
        return invalid("Script JSON is not an object");
    }

    Script script;

    const json* title = findAny(data, {"title"});
    if (!title || !title->is_string()) {
        return invalid("Field 'title' is missing or not a string");
    }
    script.title = cleanValue(title->get<std::string>());
    if (script.title.empty()) {
        return invalid("Field 'title' is empty");
    }

    const json* narration = findAny(data, {"narration", "narrationLines", "narration_lines", "lines"});
    if (!narration || !narration->is_array()) {
        return invalid("Field 'narration' is missing or not a list");
    }
    for (const auto& line : *narration) {
        if (!line.is_string()) {
            return invalid("Field 'narration' must contain only strings");
        }
        std::string cleaned = cleanValue(line.get<std::string>());
        if (!cleaned.empty()) {
            script.narration.push_back(std::move(cleaned));
        }
    }
    if (script.narration.empty()) {
        return invalid("Field 'narration' has no usable lines");
    }

    const json* captions = findAny(data, {"captions", "captionCues", "caption_cues"});
    if (captions && !captions->is_array()) {
        return invalid("Field 'captions' is not a list");
    }
    if (captions) {
        for (const auto& cue : *captions) {
            if (!cue.is_object()) {
                return invalid("Caption cue is not an object");
            }
            CaptionCue parsed;
            const json* text = findAny(cue, {"text"});
            const json* start = findAny(cue, {"start", "startTime", "start_time"});
            const json* end = findAny(cue, {"end", "endTime", "end_time"});
            if (!text || !text->is_string() || !start || !end) {
                return invalid("Caption cue needs text, start and end");
            }
            parsed.text = cleanValue(text->get<std::string>());
            if (!readNumber(*start, parsed.start) || !readNumber(*end, parsed.end)) {
                return invalid("Caption cue times must be numbers");
            }
            if (parsed.start < 0.0 || parsed.end <= parsed.start) {
                return invalid("Caption cue '" + parsed.text + "' has an invalid time window");
            }
            if (!parsed.text.empty()) {
                script.captions.push_back(std::move(parsed));
            }
        }
    }
    if (script.captions.empty()) {
        script.captions = deriveCues(script.narration, durationSeconds);
    }

    ScriptParseResult result;
    result.ok = true;
    result.script = std::move(script);
    return result;
}

std::string scriptToJson(const Script& script) {
    json captions = json::array();
    for (const auto& cue : script.captions) {
        captions.push_back({{"text", cue.text}, {"start", cue.start}, {"end", cue.end}});
    }
    json doc = {
        {"title", script.title},
        {"narration", script.narration},
        {"captions", captions},
    };
    return doc.dump(4);
}

bool writeScriptFile(const std::filesystem::path& path, const Script& script) noexcept {
    try {
        std::filesystem::create_directories(path.parent_path());
        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary);
            if (!file) return false;
            file << scriptToJson(script);
            file.flush();
            if (!file.good()) return false;
        }
        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write script file " + path.string() + ": " + e.what());
        return false;
    }
}

std::optional<Script> readScriptFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        auto parsed = parseScript(content, 0.0);
        if (!parsed) {
            LOG_WARN("Cached script is unusable (" + path.string() + "): " + parsed.error);
            return std::nullopt;
        }
        return parsed.script;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read script file " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

}
