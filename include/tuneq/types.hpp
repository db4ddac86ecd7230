/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace tuneq {

// Job lifecycle states.
enum class Status : std::uint8_t { Queued, Running, Completed, Failed, Cancelled };

// Stage reported by the downloader while a job is running.
enum class Stage : std::uint8_t {
    Initializing,
    FetchingMetadata,
    DownloadingAudio,
    Remuxing,
    ApplyingTags,
    Finalizing,
    Completed,
    Failed
};

// Opaque job identifier, assigned at enqueue time.
using JobId = std::string;

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(Stage stage) noexcept;

[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed || status == Status::Cancelled;
}

} // namespace tuneq
