/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/progress.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace tuneq {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

Progress makeProgress(Stage stage, const std::string& line) {
    Progress p;
    p.stage = stage;
    p.currentStep = line;
    return p;
}

}

std::optional<Progress> ProgressParser::parse(const std::string& line) {
    if (line.empty()) {
        return std::nullopt;
    }
    if (auto p = parseDownload(line)) return p;
    if (auto p = parseSteps(line)) return p;
    if (auto p = parseStageMarkers(line)) return p;
    return parseKeywords(line);
}

// "[download]  45.2% of 3.45MiB at 1.23MiB/s ETA 00:02"
std::optional<Progress> ProgressParser::parseDownload(const std::string& line) {
    static const std::regex downloadRegex(R"(\[download\]\s+(\d+(?:\.\d+)?)%\s+of\s+~?\s*[\d.]+\w+)");
    std::smatch match;
    if (!std::regex_search(line, match, downloadRegex)) {
        return std::nullopt;
    }
    try {
        float pct = std::stof(match[1].str());
        Progress p = makeProgress(Stage::DownloadingAudio, line);
        p.percentage = std::clamp(pct, 0.0f, 100.0f);
        return p;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// "Step 3 of 5: Processing audio" or "[3/5] Downloading track"
std::optional<Progress> ProgressParser::parseSteps(const std::string& line) {
    static const std::regex stepRegex(R"((?:Step\s+(\d+)\s+of\s+(\d+)|\[(\d+)/(\d+)\]))");
    std::smatch match;
    if (!std::regex_search(line, match, stepRegex)) {
        return std::nullopt;
    }

    std::string current = match[1].matched ? match[1].str() : match[3].str();
    std::string total = match[2].matched ? match[2].str() : match[4].str();

    try {
        auto index = static_cast<std::uint32_t>(std::stoul(current));
        auto count = static_cast<std::uint32_t>(std::stoul(total));

        Progress p = makeProgress(inferStage(toLowerCopy(line)), line);
        p.currentStepIndex = index;
        p.totalSteps = count;
        if (count > 0) {
            float raw = static_cast<float>(index) / static_cast<float>(count) * 100.0f;
            p.percentage = std::round(raw * 100.0f) / 100.0f;
        }
        return p;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Progress> ProgressParser::parseStageMarkers(const std::string& line) {
    if (contains(line, "Initializing") || contains(line, "Starting") || contains(line, "Setting up")) {
        return makeProgress(Stage::Initializing, line);
    }
    if ((contains(line, "Fetching") && (contains(line, "metadata") || contains(line, "info"))) ||
        contains(line, "Getting video info") || contains(line, "Extracting")) {
        return makeProgress(Stage::FetchingMetadata, line);
    }
    if (contains(line, "[download]") && !contains(line, "%")) {
        return makeProgress(Stage::DownloadingAudio, line);
    }
    if (contains(line, "Remuxing") || contains(line, "Processing") ||
        contains(line, "Converting") || contains(line, "Merging")) {
        return makeProgress(Stage::Remuxing, line);
    }
    if (contains(line, "Applying tags") || contains(line, "Writing tags") ||
        contains(line, "Adding metadata") || contains(line, "Tagging") ||
        contains(line, "Writing metadata") || contains(line, "Adding cover")) {
        return makeProgress(Stage::ApplyingTags, line);
    }
    if (contains(line, "Finalizing") || contains(line, "Finishing") ||
        contains(line, "Completed") || contains(line, "Done") || contains(line, "completed")) {
        return makeProgress(Stage::Finalizing, line);
    }
    return std::nullopt;
}

std::optional<Progress> ProgressParser::parseKeywords(const std::string& line) {
    const std::string lower = toLowerCopy(line);

    Stage stage;
    if (contains(lower, "init") || contains(lower, "start")) {
        stage = Stage::Initializing;
    } else if (contains(lower, "fetch") || contains(lower, "extract") ||
               contains(lower, "metadata") || contains(lower, "info")) {
        stage = Stage::FetchingMetadata;
    } else if (contains(lower, "download") || contains(lower, "audio")) {
        stage = Stage::DownloadingAudio;
    } else if (contains(lower, "remux") || contains(lower, "process") || contains(lower, "convert")) {
        stage = Stage::Remuxing;
    } else if (contains(lower, "tag")) {
        stage = Stage::ApplyingTags;
    } else if (contains(lower, "final") || contains(lower, "complete") ||
               contains(lower, "done") || contains(lower, "finish")) {
        stage = Stage::Finalizing;
    } else {
        return std::nullopt;
    }
    return makeProgress(stage, line);
}

Stage ProgressParser::inferStage(const std::string& lower) {
    if (contains(lower, "init") || contains(lower, "start")) return Stage::Initializing;
    if (contains(lower, "fetch") || contains(lower, "extract") || contains(lower, "metadata")) {
        return Stage::FetchingMetadata;
    }
    if (contains(lower, "download") || contains(lower, "audio")) return Stage::DownloadingAudio;
    if (contains(lower, "remux") || contains(lower, "process") || contains(lower, "convert")) {
        return Stage::Remuxing;
    }
    if (contains(lower, "tag")) return Stage::ApplyingTags;
    if (contains(lower, "final") || contains(lower, "complete")) return Stage::Finalizing;
    return Stage::DownloadingAudio;
}

bool ProgressParser::parseMetadata(const std::string& line, JobMetadata& metadata) {
    static const std::regex metaRegex(R"(^(Title|Artist|Album|Duration|Thumbnail):\s*(.+)$)",
                                      std::regex::icase);
    std::smatch match;
    if (!std::regex_match(line, match, metaRegex)) {
        return false;
    }

    const std::string key = toLowerCopy(match[1].str());
    const std::string value = trim(match[2].str());
    if (value.empty()) {
        return false;
    }

    if (key == "title") {
        metadata.title = value;
    } else if (key == "artist") {
        metadata.artist = value;
    } else if (key == "album") {
        metadata.album = value;
    } else if (key == "thumbnail") {
        metadata.thumbnail = value;
    } else if (key == "duration") {
        try {
            metadata.duration = static_cast<std::uint32_t>(std::stoul(value));
        } catch (const std::exception&) {
            return false;
        }
    }
    return true;
}

bool ProgressParser::isErrorLine(const std::string& line) {
    const std::string lower = toLowerCopy(line);
    return contains(lower, "error") || contains(lower, "failed") ||
           contains(lower, "exception") || contains(lower, "traceback") ||
           lower.rfind("fatal:", 0) == 0;
}

std::string ProgressParser::sanitize(const std::string& line) {
    static const std::regex ansiRegex("\x1b\\[[0-9;]*m");
    return trim(std::regex_replace(line, ansiRegex, ""));
}

} // namespace tuneq
