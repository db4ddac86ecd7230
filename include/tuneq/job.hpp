/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "tuneq/types.hpp"

namespace tuneq {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Advisory progress; any field may be unset.
struct Progress {
    Stage stage = Stage::Initializing;
    std::optional<float> percentage;
    std::string currentStep;
    std::optional<std::uint32_t> currentStepIndex;
    std::optional<std::uint32_t> totalSteps;
};

struct JobMetadata {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::uint32_t> duration;
    std::optional<std::string> thumbnail;

    [[nodiscard]] bool empty() const noexcept {
        return !title && !artist && !album && !duration && !thumbnail;
    }
};

struct Job {
    JobId id;
    std::string url;
    Status status = Status::Queued;
    Progress progress;
    std::optional<JobMetadata> metadata;
    std::optional<std::string> error;
    Timestamp createdAt;
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> completedAt;
    std::uint32_t retryCount = 0;
    // Incremented on every dispatch; tags runner events with the run they belong to
    std::uint64_t runId = 0;
};

// Events that drive a job through its lifecycle.
enum class JobEvent : std::uint8_t {
    Dispatch,
    Progress,
    Succeed,
    Fail,
    CancelAck,
    Cancel,
    Retry,
    Remove
};

[[nodiscard]] const char* toString(JobEvent event) noexcept;

/**
 * Guards and applies legal status transitions for a single job.
 *
 *   Queued  --dispatch-->  Running --succeed--> Completed
 *                          Running --fail-----> Failed
 *                          Running --cancel-ack-> Cancelled
 *   Queued  --cancel---->  Cancelled
 *   Failed|Cancelled --retry--> Queued
 *
 * Remove is legal from every status except Running. Cancel on a running job is not a
 * transition here: the job stays Running until the runner acknowledges.
 */
class Lifecycle final {
public:
    Lifecycle() = delete;

    [[nodiscard]] static bool allows(Status from, JobEvent event) noexcept;

    // Each apply* returns false and leaves the job untouched when the guard rejects.
    [[nodiscard]] static Job create(JobId id, std::string url, Timestamp now);
    [[nodiscard]] static bool dispatch(Job& job, Timestamp now);
    [[nodiscard]] static bool progress(Job& job, const Progress& progress);
    [[nodiscard]] static bool succeed(Job& job, std::optional<JobMetadata> metadata, Timestamp now);
    [[nodiscard]] static bool fail(Job& job, const std::string& error, Timestamp now);
    [[nodiscard]] static bool cancelAck(Job& job, Timestamp now);
    [[nodiscard]] static bool cancelQueued(Job& job, Timestamp now);
    [[nodiscard]] static bool retry(Job& job);

    [[nodiscard]] static Progress initializingProgress();
    [[nodiscard]] static Progress completedProgress();
    [[nodiscard]] static Progress failedProgress(const std::string& error);
};

} // namespace tuneq
