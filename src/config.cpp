/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/config.hpp"
#include "tuneq/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace tuneq {

namespace {

std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return std::nullopt;
    }
    return std::string(val);
}

// Zero and garbage fall back to the default
template <typename T>
T env_uint(const char* name, T defv) {
    auto val = env_str(name);
    if (!val) {
        return defv;
    }
    try {
        auto parsed = std::stoull(*val);
        if (parsed == 0) {
            return defv;
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid value for ") + name + ": " + *val);
        return defv;
    }
}

bool env_flag(const char* name, bool defv) {
    auto val = env_str(name);
    if (!val) {
        return defv;
    }
    std::string lower = *val;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

}

DownloadConfig DownloadConfig::fromEnv() {
    DownloadConfig config;

    if (auto v = env_str("TUNEQ_OUTPUT_PATH")) config.outputPath = *v;
    if (auto v = env_str("TUNEQ_TEMP_PATH")) config.tempPath = *v;
    if (auto v = env_str("TUNEQ_COOKIES_PATH")) config.cookiesPath = std::filesystem::path(*v);
    if (auto v = env_str("TUNEQ_ITAG")) config.itag = *v;
    if (auto v = env_str("TUNEQ_MODE")) {
        if (auto mode = parseDownloadMode(*v)) {
            config.mode = *mode;
        } else {
            LOG_WARN("Unknown download mode: " + *v + ", using audio");
        }
    }
    if (auto v = env_str("TUNEQ_COVER_FORMAT")) {
        if (auto format = parseCoverFormat(*v)) {
            config.coverFormat = *format;
        } else {
            LOG_WARN("Unknown cover format: " + *v + ", using jpg");
        }
    }
    config.concurrentLimit = env_uint<std::size_t>("TUNEQ_CONCURRENT", config.concurrentLimit);
    config.coverSize = env_uint<std::uint32_t>("TUNEQ_COVER_SIZE", config.coverSize);
    config.coverQuality = static_cast<std::uint8_t>(
        std::min<std::uint32_t>(100, env_uint<std::uint32_t>("TUNEQ_COVER_QUALITY", config.coverQuality)));
    config.saveCover = env_flag("TUNEQ_SAVE_COVER", config.saveCover);
    config.overwrite = env_flag("TUNEQ_OVERWRITE", config.overwrite);
    config.noSyncedLyrics = env_flag("TUNEQ_NO_SYNCED_LYRICS", config.noSyncedLyrics);

    if (auto v = env_str("TUNEQ_TEMPLATE_FOLDER")) config.templateFolder = *v;
    if (auto v = env_str("TUNEQ_TEMPLATE_FILE")) config.templateFile = *v;
    if (auto v = env_str("TUNEQ_TEMPLATE_DATE")) config.templateDate = *v;
    if (auto v = env_str("TUNEQ_PO_TOKEN")) config.poToken = *v;
    if (auto v = env_str("TUNEQ_EXCLUDE_TAGS")) config.excludeTags = *v;
    if (env_str("TUNEQ_TRUNCATE")) config.truncate = env_uint<std::uint32_t>("TUNEQ_TRUNCATE", 0);
    if (config.truncate && *config.truncate == 0) config.truncate.reset();

    if (auto v = env_str("TUNEQ_BINARY")) config.binary = *v;
    config.cancelGrace = std::chrono::milliseconds(
        env_uint<long long>("TUNEQ_GRACE_MS", config.cancelGrace.count()));

    return config;
}

std::vector<std::string> buildArgs(const DownloadConfig& config, const std::string& url) {
    std::vector<std::string> args;
    args.reserve(32);

    args.push_back("--output-path");
    args.push_back(config.outputPath.string());

    args.push_back("--temp-path");
    args.push_back(config.tempPath.string());

    if (config.cookiesPath) {
        args.push_back("--cookies-path");
        args.push_back(config.cookiesPath->string());
    }

    args.push_back("--itag");
    args.push_back(config.itag);

    switch (config.mode) {
        case DownloadMode::Audio:
            break;
        case DownloadMode::Video:
            args.push_back("--video");
            break;
        case DownloadMode::AudioVideo:
            args.push_back("--audio-video");
            break;
    }

    if (config.saveCover) {
        args.push_back("--cover-size");
        args.push_back(std::to_string(config.coverSize));
        args.push_back("--cover-format");
        args.push_back(toString(config.coverFormat));
        args.push_back("--cover-quality");
        args.push_back(std::to_string(static_cast<unsigned>(config.coverQuality)));
    } else {
        args.push_back("--no-cover");
    }

    args.push_back("--template-folder");
    args.push_back(config.templateFolder);
    args.push_back("--template-file");
    args.push_back(config.templateFile);
    args.push_back("--template-date");
    args.push_back(config.templateDate);

    if (config.poToken && !isBlank(*config.poToken)) {
        args.push_back("--po-token");
        args.push_back(*config.poToken);
    }

    if (config.excludeTags && !isBlank(*config.excludeTags)) {
        args.push_back("--exclude-tags");
        args.push_back(*config.excludeTags);
    }

    if (config.truncate) {
        args.push_back("--truncate");
        args.push_back(std::to_string(*config.truncate));
    }

    if (config.overwrite) {
        args.push_back("--overwrite");
    }
    if (config.noSyncedLyrics) {
        args.push_back("--no-synced-lyrics");
    }

    args.push_back("--progress");
    args.push_back("--verbose");

    args.push_back(url);
    return args;
}

const char* toString(DownloadMode mode) noexcept {
    switch (mode) {
        case DownloadMode::Audio: return "audio";
        case DownloadMode::Video: return "video";
        case DownloadMode::AudioVideo: return "audio-video";
        default: return "audio";
    }
}

const char* toString(CoverFormat format) noexcept {
    switch (format) {
        case CoverFormat::Jpg: return "jpg";
        case CoverFormat::Png: return "png";
        case CoverFormat::Webp: return "webp";
        default: return "jpg";
    }
}

std::optional<DownloadMode> parseDownloadMode(const std::string& value) noexcept {
    if (value == "audio") return DownloadMode::Audio;
    if (value == "video") return DownloadMode::Video;
    if (value == "audio-video" || value == "audiovideo") return DownloadMode::AudioVideo;
    return std::nullopt;
}

std::optional<CoverFormat> parseCoverFormat(const std::string& value) noexcept {
    if (value == "jpg" || value == "jpeg") return CoverFormat::Jpg;
    if (value == "png") return CoverFormat::Png;
    if (value == "webp") return CoverFormat::Webp;
    return std::nullopt;
}

Settings::Settings(DownloadConfig config) : config_(std::move(config)) {
    if (config_.concurrentLimit == 0) {
        throw std::invalid_argument("Concurrent limit must be greater than 0");
    }
}

DownloadConfig Settings::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void Settings::update(DownloadConfig config) {
    if (config.concurrentLimit == 0) {
        throw std::invalid_argument("Concurrent limit must be greater than 0");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
    LOG_DEBUG("Settings updated");
}

std::size_t Settings::concurrentLimit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.concurrentLimit;
}

void Settings::setConcurrentLimit(std::size_t limit) {
    if (limit == 0) {
        throw std::invalid_argument("Concurrent limit must be greater than 0");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_.concurrentLimit = limit;
}

} // namespace tuneq
