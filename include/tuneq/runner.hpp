/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

#include "tuneq/config.hpp"
#include "tuneq/job.hpp"

namespace tuneq {

enum class RunOutcome : uint8_t { Success, Failure, Cancelled };

enum class RunErrorKind : uint8_t {
    None = 0,
    SpawnError,
    ExecutionError,
    Cancelled
};

[[nodiscard]] const char* toString(RunErrorKind kind) noexcept;

struct RunRequest {
    JobId jobId;
    std::string url;
    DownloadConfig config;
};

struct RunResult {
    RunOutcome outcome = RunOutcome::Failure;
    RunErrorKind kind = RunErrorKind::None;
    std::string error;
    std::optional<JobMetadata> metadata;
    int exitCode = -1;

    [[nodiscard]] bool ok() const noexcept { return outcome == RunOutcome::Success; }

    [[nodiscard]] static RunResult success(std::optional<JobMetadata> metadata = std::nullopt);
    [[nodiscard]] static RunResult failure(RunErrorKind kind, std::string error, int exitCode = -1);
    [[nodiscard]] static RunResult cancelled();
};

using ProgressSink = std::function<void(const Progress&)>;

// Executes the downloader for exactly one job. One instance per dispatch.
class Runner {
public:
    virtual ~Runner() = default;

    // Blocks until the work ends. Observations reach the sink in emission order.
    [[nodiscard]] virtual RunResult run(const RunRequest& request, const ProgressSink& sink) = 0;

    // Any thread, any time; returns without waiting for the process to exit.
    virtual void cancel() noexcept = 0;
};

using RunnerFactory = std::function<std::unique_ptr<Runner>()>;

struct ProbeResult {
    bool ok = false;
    std::string version;
    std::string error;
};

class ProcessRunner final : public Runner {
public:
    ProcessRunner() = default;
    ~ProcessRunner() override;

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;
    ProcessRunner(ProcessRunner&&) = delete;
    ProcessRunner& operator=(ProcessRunner&&) = delete;

    [[nodiscard]] RunResult run(const RunRequest& request, const ProgressSink& sink) override;
    void cancel() noexcept override;

    [[nodiscard]] bool cancelRequested() const noexcept { return cancelRequested_.load(); }

    // Runs "<binary> --version" and captures its first output line.
    [[nodiscard]] static ProbeResult probe(const std::filesystem::path& binary,
                                           std::chrono::milliseconds timeout = std::chrono::seconds(10));

    [[nodiscard]] static RunnerFactory factory();

private:
    struct LineState {
        std::string lastError;
        JobMetadata metadata;
    };

    void handleLine(const std::string& raw, const JobId& jobId, const ProgressSink& sink, LineState& state);
    void signalGroup(int sig) noexcept;
    [[nodiscard]] bool reap(int& status) noexcept;

    std::atomic<bool> cancelRequested_{false};
    std::mutex pidMutex_;
    pid_t pid_ = 0;
};

} // namespace tuneq
