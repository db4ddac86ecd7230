/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tuneq {

enum class DownloadMode : uint8_t { Audio, Video, AudioVideo };
enum class CoverFormat : uint8_t { Jpg, Png, Webp };

// Snapshot handed to a runner at dispatch. Opaque to the orchestrator.
struct DownloadConfig {
    std::filesystem::path outputPath = "./downloads";
    std::filesystem::path tempPath = "./temp";
    std::optional<std::filesystem::path> cookiesPath;

    std::string itag = "141";
    DownloadMode mode = DownloadMode::Audio;
    std::size_t concurrentLimit = 3;

    bool saveCover = true;
    std::uint32_t coverSize = 1400;
    CoverFormat coverFormat = CoverFormat::Jpg;
    std::uint8_t coverQuality = 95;

    std::string templateFolder = "{album_artist}/{album}";
    std::string templateFile = "{track:02d} {title}";
    std::string templateDate = "%Y-%m-%d";

    std::optional<std::string> poToken;
    std::optional<std::string> excludeTags;
    std::optional<std::uint32_t> truncate;
    bool overwrite = false;
    bool noSyncedLyrics = false;

    std::filesystem::path binary = "gytmdl";
    std::chrono::milliseconds cancelGrace{5000};

    // Reads TUNEQ_* variables over the defaults.
    [[nodiscard]] static DownloadConfig fromEnv();
};

// Ordered downloader argument list for one request; the url is always last.
[[nodiscard]] std::vector<std::string> buildArgs(const DownloadConfig& config, const std::string& url);

[[nodiscard]] const char* toString(DownloadMode mode) noexcept;
[[nodiscard]] const char* toString(CoverFormat format) noexcept;
[[nodiscard]] std::optional<DownloadMode> parseDownloadMode(const std::string& value) noexcept;
[[nodiscard]] std::optional<CoverFormat> parseCoverFormat(const std::string& value) noexcept;

// Thread-safe holder of the current configuration. Readers always get a copy.
class Settings final {
public:
    Settings() = default;
    explicit Settings(DownloadConfig config);

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;
    Settings(Settings&&) = delete;
    Settings& operator=(Settings&&) = delete;

    [[nodiscard]] DownloadConfig current() const;
    void update(DownloadConfig config);

    [[nodiscard]] std::size_t concurrentLimit() const;
    void setConcurrentLimit(std::size_t limit);

private:
    mutable std::mutex mutex_;
    DownloadConfig config_;
};

} // namespace tuneq
