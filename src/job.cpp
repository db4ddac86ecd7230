/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/job.hpp"
#include <algorithm>
#include <utility>

namespace tuneq {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued: return "queued";
        case Status::Running: return "running";
        case Status::Completed: return "completed";
        case Status::Failed: return "failed";
        case Status::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(Stage stage) noexcept {
    switch (stage) {
        case Stage::Initializing: return "initializing";
        case Stage::FetchingMetadata: return "fetching-metadata";
        case Stage::DownloadingAudio: return "downloading";
        case Stage::Remuxing: return "remuxing";
        case Stage::ApplyingTags: return "tagging";
        case Stage::Finalizing: return "finalizing";
        case Stage::Completed: return "completed";
        case Stage::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(JobEvent event) noexcept {
    switch (event) {
        case JobEvent::Dispatch: return "dispatch";
        case JobEvent::Progress: return "progress";
        case JobEvent::Succeed: return "succeed";
        case JobEvent::Fail: return "fail";
        case JobEvent::CancelAck: return "cancel-ack";
        case JobEvent::Cancel: return "cancel";
        case JobEvent::Retry: return "retry";
        case JobEvent::Remove: return "remove";
        default: return "unknown";
    }
}

bool Lifecycle::allows(Status from, JobEvent event) noexcept {
    switch (event) {
        case JobEvent::Dispatch:
        case JobEvent::Cancel:
            return from == Status::Queued;
        case JobEvent::Progress:
        case JobEvent::Succeed:
        case JobEvent::Fail:
        case JobEvent::CancelAck:
            return from == Status::Running;
        case JobEvent::Retry:
            return from == Status::Failed || from == Status::Cancelled;
        case JobEvent::Remove:
            return from != Status::Running;
    }
    return false;
}

Job Lifecycle::create(JobId id, std::string url, Timestamp now) {
    Job job;
    job.id = std::move(id);
    job.url = std::move(url);
    job.status = Status::Queued;
    job.progress = Progress{Stage::Initializing, std::nullopt, "Queued", std::nullopt, std::nullopt};
    job.createdAt = now;
    return job;
}

bool Lifecycle::dispatch(Job& job, Timestamp now) {
    if (!allows(job.status, JobEvent::Dispatch)) {
        return false;
    }
    job.status = Status::Running;
    job.startedAt = std::max(now, job.createdAt);
    job.progress = initializingProgress();
    ++job.runId;
    return true;
}

bool Lifecycle::progress(Job& job, const Progress& progress) {
    if (!allows(job.status, JobEvent::Progress)) {
        return false;
    }
    job.progress = progress;
    return true;
}

bool Lifecycle::succeed(Job& job, std::optional<JobMetadata> metadata, Timestamp now) {
    if (!allows(job.status, JobEvent::Succeed)) {
        return false;
    }
    job.status = Status::Completed;
    job.progress = completedProgress();
    job.completedAt = job.startedAt ? std::max(now, *job.startedAt) : now;
    if (metadata && !metadata->empty()) {
        job.metadata = std::move(metadata);
    }
    return true;
}

bool Lifecycle::fail(Job& job, const std::string& error, Timestamp now) {
    if (!allows(job.status, JobEvent::Fail)) {
        return false;
    }
    job.status = Status::Failed;
    job.error = error.empty() ? std::string("Download failed") : error;
    job.progress = failedProgress(*job.error);
    job.completedAt = job.startedAt ? std::max(now, *job.startedAt) : now;
    return true;
}

bool Lifecycle::cancelAck(Job& job, Timestamp now) {
    if (!allows(job.status, JobEvent::CancelAck)) {
        return false;
    }
    job.status = Status::Cancelled;
    job.error.reset();
    job.completedAt = job.startedAt ? std::max(now, *job.startedAt) : now;
    return true;
}

bool Lifecycle::cancelQueued(Job& job, Timestamp now) {
    if (!allows(job.status, JobEvent::Cancel)) {
        return false;
    }
    job.status = Status::Cancelled;
    job.error.reset();
    job.completedAt = std::max(now, job.createdAt);
    return true;
}

bool Lifecycle::retry(Job& job) {
    if (!allows(job.status, JobEvent::Retry)) {
        return false;
    }
    job.status = Status::Queued;
    job.progress = Progress{Stage::Initializing, std::nullopt, "Queued", std::nullopt, std::nullopt};
    job.error.reset();
    job.metadata.reset();
    job.startedAt.reset();
    job.completedAt.reset();
    ++job.retryCount;
    return true;
}

Progress Lifecycle::initializingProgress() {
    return Progress{Stage::Initializing, std::nullopt, "Initializing download...", std::nullopt, std::nullopt};
}

Progress Lifecycle::completedProgress() {
    return Progress{Stage::Completed, 100.0f, "Download completed successfully", std::nullopt, std::nullopt};
}

Progress Lifecycle::failedProgress(const std::string& error) {
    return Progress{Stage::Failed, std::nullopt, "Error: " + error, std::nullopt, std::nullopt};
}

} // namespace tuneq
