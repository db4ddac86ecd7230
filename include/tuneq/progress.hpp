/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

#include "tuneq/job.hpp"

namespace tuneq {

// Maps downloader output lines to progress observations. Stateless.
class ProgressParser final {
public:
    ProgressParser() = delete;

    // Unrecognized lines yield nullopt.
    [[nodiscard]] static std::optional<Progress> parse(const std::string& line);

    // Folds "Title: ..." style lines into metadata; returns true if the line was consumed.
    static bool parseMetadata(const std::string& line, JobMetadata& metadata);

    [[nodiscard]] static bool isErrorLine(const std::string& line);

    // Strips ANSI colour sequences and surrounding whitespace.
    [[nodiscard]] static std::string sanitize(const std::string& line);

private:
    static std::optional<Progress> parseDownload(const std::string& line);
    static std::optional<Progress> parseSteps(const std::string& line);
    static std::optional<Progress> parseStageMarkers(const std::string& line);
    static std::optional<Progress> parseKeywords(const std::string& line);
    static Stage inferStage(const std::string& lower);
};

} // namespace tuneq
