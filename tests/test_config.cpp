/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/config.hpp"
#include "tuneq/logger.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tuneq;

namespace {

const char* kVars[] = {
    "TUNEQ_OUTPUT_PATH", "TUNEQ_TEMP_PATH", "TUNEQ_COOKIES_PATH", "TUNEQ_ITAG", "TUNEQ_MODE",
    "TUNEQ_COVER_FORMAT", "TUNEQ_CONCURRENT", "TUNEQ_COVER_SIZE", "TUNEQ_COVER_QUALITY",
    "TUNEQ_SAVE_COVER", "TUNEQ_OVERWRITE", "TUNEQ_NO_SYNCED_LYRICS", "TUNEQ_TEMPLATE_FOLDER",
    "TUNEQ_TEMPLATE_FILE", "TUNEQ_TEMPLATE_DATE", "TUNEQ_PO_TOKEN", "TUNEQ_EXCLUDE_TAGS",
    "TUNEQ_TRUNCATE", "TUNEQ_BINARY", "TUNEQ_GRACE_MS",
};

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string valueOf(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::ERROR);
        clearEnv();
    }

    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : kVars) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, Defaults) {
    DownloadConfig config;
    EXPECT_EQ(config.outputPath, std::filesystem::path("./downloads"));
    EXPECT_EQ(config.tempPath, std::filesystem::path("./temp"));
    EXPECT_EQ(config.itag, "141");
    EXPECT_EQ(config.mode, DownloadMode::Audio);
    EXPECT_EQ(config.concurrentLimit, 3u);
    EXPECT_TRUE(config.saveCover);
    EXPECT_EQ(config.coverSize, 1400u);
    EXPECT_EQ(config.coverFormat, CoverFormat::Jpg);
    EXPECT_EQ(config.coverQuality, 95);
    EXPECT_EQ(config.binary, std::filesystem::path("gytmdl"));
    EXPECT_EQ(config.cancelGrace.count(), 5000);
}

TEST_F(ConfigTest, DefaultArguments) {
    DownloadConfig config;
    auto args = buildArgs(config, "https://music.example/watch?v=abc");

    std::vector<std::string> expected = {
        "--output-path", "./downloads",
        "--temp-path", "./temp",
        "--itag", "141",
        "--cover-size", "1400",
        "--cover-format", "jpg",
        "--cover-quality", "95",
        "--template-folder", "{album_artist}/{album}",
        "--template-file", "{track:02d} {title}",
        "--template-date", "%Y-%m-%d",
        "--progress", "--verbose",
        "https://music.example/watch?v=abc",
    };
    EXPECT_EQ(args, expected);
}

TEST_F(ConfigTest, OptionalArguments) {
    DownloadConfig config;
    config.cookiesPath = std::filesystem::path("/tmp/cookies.txt");
    config.mode = DownloadMode::AudioVideo;
    config.saveCover = false;
    config.poToken = "tok";
    config.excludeTags = "lyrics,comment";
    config.truncate = 40;
    config.overwrite = true;
    config.noSyncedLyrics = true;

    auto args = buildArgs(config, "https://youtu.be/xyz");
    EXPECT_EQ(valueOf(args, "--cookies-path"), "/tmp/cookies.txt");
    EXPECT_TRUE(hasFlag(args, "--audio-video"));
    EXPECT_TRUE(hasFlag(args, "--no-cover"));
    EXPECT_FALSE(hasFlag(args, "--cover-size"));
    EXPECT_EQ(valueOf(args, "--po-token"), "tok");
    EXPECT_EQ(valueOf(args, "--exclude-tags"), "lyrics,comment");
    EXPECT_EQ(valueOf(args, "--truncate"), "40");
    EXPECT_TRUE(hasFlag(args, "--overwrite"));
    EXPECT_TRUE(hasFlag(args, "--no-synced-lyrics"));
    EXPECT_EQ(args.back(), "https://youtu.be/xyz");
}

TEST_F(ConfigTest, BlankTokensAreOmitted) {
    DownloadConfig config;
    config.poToken = "   ";
    config.excludeTags = "";
    auto args = buildArgs(config, "https://youtu.be/xyz");
    EXPECT_FALSE(hasFlag(args, "--po-token"));
    EXPECT_FALSE(hasFlag(args, "--exclude-tags"));
}

TEST_F(ConfigTest, VideoMode) {
    DownloadConfig config;
    config.mode = DownloadMode::Video;
    auto args = buildArgs(config, "https://youtu.be/xyz");
    EXPECT_TRUE(hasFlag(args, "--video"));
    EXPECT_FALSE(hasFlag(args, "--audio-video"));
}

TEST_F(ConfigTest, FromEnvironment) {
    ::setenv("TUNEQ_OUTPUT_PATH", "/music", 1);
    ::setenv("TUNEQ_ITAG", "251", 1);
    ::setenv("TUNEQ_MODE", "video", 1);
    ::setenv("TUNEQ_COVER_FORMAT", "png", 1);
    ::setenv("TUNEQ_CONCURRENT", "5", 1);
    ::setenv("TUNEQ_COVER_QUALITY", "250", 1);
    ::setenv("TUNEQ_SAVE_COVER", "false", 1);
    ::setenv("TUNEQ_OVERWRITE", "yes", 1);
    ::setenv("TUNEQ_TRUNCATE", "60", 1);
    ::setenv("TUNEQ_BINARY", "/opt/gytmdl/bin/gytmdl", 1);
    ::setenv("TUNEQ_GRACE_MS", "1500", 1);

    auto config = DownloadConfig::fromEnv();
    EXPECT_EQ(config.outputPath, std::filesystem::path("/music"));
    EXPECT_EQ(config.itag, "251");
    EXPECT_EQ(config.mode, DownloadMode::Video);
    EXPECT_EQ(config.coverFormat, CoverFormat::Png);
    EXPECT_EQ(config.concurrentLimit, 5u);
    EXPECT_EQ(config.coverQuality, 100);
    EXPECT_FALSE(config.saveCover);
    EXPECT_TRUE(config.overwrite);
    EXPECT_EQ(config.truncate.value_or(0), 60u);
    EXPECT_EQ(config.binary, std::filesystem::path("/opt/gytmdl/bin/gytmdl"));
    EXPECT_EQ(config.cancelGrace.count(), 1500);
}

TEST_F(ConfigTest, InvalidEnvironmentFallsBackToDefaults) {
    ::setenv("TUNEQ_CONCURRENT", "0", 1);
    ::setenv("TUNEQ_COVER_SIZE", "huge", 1);
    ::setenv("TUNEQ_MODE", "karaoke", 1);
    ::setenv("TUNEQ_COVER_FORMAT", "bmp", 1);
    ::setenv("TUNEQ_TRUNCATE", "0", 1);

    auto config = DownloadConfig::fromEnv();
    EXPECT_EQ(config.concurrentLimit, 3u);
    EXPECT_EQ(config.coverSize, 1400u);
    EXPECT_EQ(config.mode, DownloadMode::Audio);
    EXPECT_EQ(config.coverFormat, CoverFormat::Jpg);
    EXPECT_FALSE(config.truncate);
}

TEST_F(ConfigTest, ParseHelpers) {
    EXPECT_EQ(parseDownloadMode("audio-video"), DownloadMode::AudioVideo);
    EXPECT_EQ(parseCoverFormat("jpeg"), CoverFormat::Jpg);
    EXPECT_EQ(parseCoverFormat("webp"), CoverFormat::Webp);
    EXPECT_FALSE(parseDownloadMode("AUDIO"));
    EXPECT_STREQ(toString(DownloadMode::Video), "video");
    EXPECT_STREQ(toString(CoverFormat::Webp), "webp");
}

TEST_F(ConfigTest, SettingsRejectZeroLimit) {
    DownloadConfig config;
    config.concurrentLimit = 0;
    EXPECT_THROW(Settings{config}, std::invalid_argument);

    Settings settings;
    EXPECT_THROW(settings.update(config), std::invalid_argument);
    EXPECT_EQ(settings.current().concurrentLimit, 3u);
    EXPECT_THROW(settings.setConcurrentLimit(0), std::invalid_argument);
}

TEST_F(ConfigTest, SettingsConcurrentLimitKeepsOtherFields) {
    DownloadConfig config;
    config.itag = "251";
    Settings settings(config);

    settings.setConcurrentLimit(6);
    EXPECT_EQ(settings.concurrentLimit(), 6u);
    EXPECT_EQ(settings.current().concurrentLimit, 6u);
    EXPECT_EQ(settings.current().itag, "251");
}

TEST_F(ConfigTest, SettingsHandOutCopies) {
    Settings settings;
    auto snapshot = settings.current();

    DownloadConfig updated = snapshot;
    updated.itag = "251";
    settings.update(updated);

    EXPECT_EQ(snapshot.itag, "141");
    EXPECT_EQ(settings.current().itag, "251");
}

TEST(LoggerTest, LevelFromEnvironment) {
    ::setenv("TUNEQ_LOG_LEVEL", "Debug", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::DEBUG);

    ::setenv("TUNEQ_LOG_LEVEL", "1", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::WARN);

    ::setenv("TUNEQ_LOG_LEVEL", "loud", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::INFO);

    ::unsetenv("TUNEQ_LOG_LEVEL");
    Logger::setLevel(LogLevel::ERROR);
}
