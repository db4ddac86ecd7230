/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/progress.hpp"
#include <gtest/gtest.h>

using namespace tuneq;

TEST(ProgressParserTest, DownloadPercentage) {
    auto p = ProgressParser::parse("[download]  45.2% of 3.45MiB at 1.23MiB/s ETA 00:02");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->stage, Stage::DownloadingAudio);
    ASSERT_TRUE(p->percentage);
    EXPECT_FLOAT_EQ(*p->percentage, 45.2f);
    EXPECT_EQ(p->currentStep, "[download]  45.2% of 3.45MiB at 1.23MiB/s ETA 00:02");
}

TEST(ProgressParserTest, DownloadApproximateSize) {
    auto p = ProgressParser::parse("[download] 100% of ~ 4.10MiB");
    ASSERT_TRUE(p);
    EXPECT_FLOAT_EQ(p->percentage.value_or(0.0f), 100.0f);
}

TEST(ProgressParserTest, StepOfTotal) {
    auto p = ProgressParser::parse("Step 1 of 3: Downloading audio");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->stage, Stage::DownloadingAudio);
    EXPECT_EQ(p->currentStepIndex.value_or(0), 1u);
    EXPECT_EQ(p->totalSteps.value_or(0), 3u);
    EXPECT_FLOAT_EQ(p->percentage.value_or(0.0f), 33.33f);
}

TEST(ProgressParserTest, BracketedSteps) {
    auto p = ProgressParser::parse("[2/4] Remuxing track");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->stage, Stage::Remuxing);
    EXPECT_EQ(p->currentStepIndex.value_or(0), 2u);
    EXPECT_EQ(p->totalSteps.value_or(0), 4u);
    EXPECT_FLOAT_EQ(p->percentage.value_or(0.0f), 50.0f);
}

TEST(ProgressParserTest, ZeroTotalStepsHasNoPercentage) {
    auto p = ProgressParser::parse("[0/0] Tagging");
    ASSERT_TRUE(p);
    EXPECT_FALSE(p->percentage);
}

TEST(ProgressParserTest, StageMarkers) {
    EXPECT_EQ(ProgressParser::parse("Initializing downloader")->stage, Stage::Initializing);
    EXPECT_EQ(ProgressParser::parse("Fetching metadata for track")->stage, Stage::FetchingMetadata);
    EXPECT_EQ(ProgressParser::parse("Getting video info")->stage, Stage::FetchingMetadata);
    EXPECT_EQ(ProgressParser::parse("[download] Destination: song.m4a")->stage, Stage::DownloadingAudio);
    EXPECT_EQ(ProgressParser::parse("Remuxing to m4a")->stage, Stage::Remuxing);
    EXPECT_EQ(ProgressParser::parse("Applying tags")->stage, Stage::ApplyingTags);
    EXPECT_EQ(ProgressParser::parse("Adding cover art")->stage, Stage::ApplyingTags);
    EXPECT_EQ(ProgressParser::parse("Finalizing")->stage, Stage::Finalizing);
}

TEST(ProgressParserTest, MarkerWithoutPercentageLeavesItUnset) {
    auto p = ProgressParser::parse("Remuxing to m4a");
    ASSERT_TRUE(p);
    EXPECT_FALSE(p->percentage);
    EXPECT_EQ(p->currentStep, "Remuxing to m4a");
}

TEST(ProgressParserTest, KeywordFallbackIsCaseInsensitive) {
    EXPECT_EQ(ProgressParser::parse("now EXTRACTING streams")->stage, Stage::FetchingMetadata);
    EXPECT_EQ(ProgressParser::parse("audio stream selected")->stage, Stage::DownloadingAudio);
    EXPECT_EQ(ProgressParser::parse("converting container")->stage, Stage::Remuxing);
    EXPECT_EQ(ProgressParser::parse("all tags written")->stage, Stage::ApplyingTags);
    EXPECT_EQ(ProgressParser::parse("job finished")->stage, Stage::Finalizing);
}

TEST(ProgressParserTest, UnrecognizedLinesAreIgnored) {
    EXPECT_FALSE(ProgressParser::parse(""));
    EXPECT_FALSE(ProgressParser::parse("random noise 123"));
    EXPECT_FALSE(ProgressParser::parse("=========="));
    EXPECT_FALSE(ProgressParser::parse("[youtube] abc: 200 OK"));
}

TEST(ProgressParserTest, MetadataLines) {
    JobMetadata meta;
    EXPECT_TRUE(ProgressParser::parseMetadata("Title: Never Gonna Give You Up", meta));
    EXPECT_TRUE(ProgressParser::parseMetadata("artist: Rick Astley", meta));
    EXPECT_TRUE(ProgressParser::parseMetadata("Album:  Whenever You Need Somebody  ", meta));
    EXPECT_TRUE(ProgressParser::parseMetadata("Duration: 213", meta));
    EXPECT_TRUE(ProgressParser::parseMetadata("Thumbnail: https://img.example/a.jpg", meta));

    EXPECT_EQ(meta.title.value_or(""), "Never Gonna Give You Up");
    EXPECT_EQ(meta.artist.value_or(""), "Rick Astley");
    EXPECT_EQ(meta.album.value_or(""), "Whenever You Need Somebody");
    EXPECT_EQ(meta.duration.value_or(0), 213u);
    EXPECT_EQ(meta.thumbnail.value_or(""), "https://img.example/a.jpg");
    EXPECT_FALSE(meta.empty());
}

TEST(ProgressParserTest, MetadataRejectsOtherLines) {
    JobMetadata meta;
    EXPECT_FALSE(ProgressParser::parseMetadata("Duration: three minutes", meta));
    EXPECT_FALSE(ProgressParser::parseMetadata("Subtitle: none", meta));
    EXPECT_FALSE(ProgressParser::parseMetadata("The Title: x", meta));
    EXPECT_TRUE(meta.empty());
}

TEST(ProgressParserTest, ErrorLines) {
    EXPECT_TRUE(ProgressParser::isErrorLine("ERROR: Video unavailable"));
    EXPECT_TRUE(ProgressParser::isErrorLine("Download failed after 3 attempts"));
    EXPECT_TRUE(ProgressParser::isErrorLine("Traceback (most recent call last):"));
    EXPECT_TRUE(ProgressParser::isErrorLine("fatal: cookies file unreadable"));
    EXPECT_FALSE(ProgressParser::isErrorLine("[download]  45.2% of 3.45MiB"));
}

TEST(ProgressParserTest, SanitizeStripsColourAndWhitespace) {
    EXPECT_EQ(ProgressParser::sanitize("  \x1b[0;32m[download]\x1b[0m 10%  \r"), "[download] 10%");
    EXPECT_EQ(ProgressParser::sanitize("   "), "");
}
