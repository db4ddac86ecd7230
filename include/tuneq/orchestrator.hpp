/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "tuneq/channel.hpp"
#include "tuneq/config.hpp"
#include "tuneq/job.hpp"
#include "tuneq/pool.hpp"
#include "tuneq/runner.hpp"
#include "tuneq/url.hpp"

namespace tuneq {

enum class QueueError : uint8_t {
    None = 0,
    Validation,
    NotFound,
    InvalidState
};

[[nodiscard]] const char* toString(QueueError error) noexcept;

struct QueueResult {
    bool ok = false;
    QueueError error = QueueError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct AddResult {
    bool ok = false;
    JobId id;
    QueueError error = QueueError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct CommandPreview {
    bool ok = false;
    std::filesystem::path binary;
    std::vector<std::string> args;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Point-in-time copy of the whole queue, jobs in insertion order.
struct QueueState {
    std::vector<Job> jobs;
    bool paused = false;
    std::size_t concurrentLimit = 0;
    std::size_t boundRunners = 0;
};

struct QueueStats {
    std::size_t queued = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::size_t total = 0;
    bool paused = false;
};

enum class UpdateKind : uint8_t {
    Added,
    Dispatched,
    Progress,
    CancelRequested,
    Completed,
    Failed,
    Cancelled,
    Requeued,
    Removed
};

[[nodiscard]] const char* toString(UpdateKind kind) noexcept;

struct JobUpdate {
    UpdateKind kind;
    Job job;
};

using JobListener = std::function<void(const JobUpdate&)>;

/**
 * Owns every job and the only path that mutates them.
 *
 * All mutations go through one mutex. Runners execute on pool workers and report
 * back through a channel that the scheduler thread drains; nothing here calls into a
 * runner synchronously except the non-blocking cancel().
 *
 * Listeners are invoked on the scheduler thread, outside the lock, in the order the
 * transitions were applied.
 */
class Orchestrator final {
public:
    Orchestrator(Settings& settings, RunnerFactory factory, UrlValidator validator = UrlValidator());
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] bool start();
    // Cancels running jobs and waits for their runners to finish.
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] AddResult add(const std::string& url);
    [[nodiscard]] QueueResult retry(const JobId& id);
    [[nodiscard]] QueueResult cancel(const JobId& id);
    [[nodiscard]] QueueResult remove(const JobId& id);
    // Queue-level switches; they change no job, so listeners receive no update.
    // snapshot() and stats() report the current state.
    void pause();
    void resume();
    std::size_t clearCompleted();

    [[nodiscard]] QueueResult setConcurrentLimit(std::size_t limit);
    std::size_t cancelAll();
    std::size_t retryAllFailed();

    [[nodiscard]] QueueState snapshot() const;
    [[nodiscard]] std::optional<Job> job(const JobId& id) const;
    [[nodiscard]] QueueStats stats() const;

    // Validates the url and shows the downloader invocation under the current settings.
    [[nodiscard]] CommandPreview previewCommand(const std::string& url) const;
    [[nodiscard]] ProbeResult healthCheck() const;

    std::uint64_t subscribe(JobListener listener);
    void unsubscribe(std::uint64_t subscription);

private:
    struct Entry {
        Job job;
        std::uint64_t order = 0;            // FIFO key, renewed on retry
        std::shared_ptr<Runner> runner;     // non-null exactly while Running
        bool cancelRequested = false;
    };

    struct RunnerMessage {
        enum class Kind : uint8_t { Progress, Finished };
        Kind kind;
        JobId jobId;
        std::uint64_t runId;
        Progress progress;
        RunResult result;
    };

    void scheduleLocked();
    [[nodiscard]] bool dispatchLocked(Entry& entry);
    void applyLocked(RunnerMessage& message);
    void finishLocked(Entry& entry, const RunResult& result);
    void emitLocked(UpdateKind kind, const Job& job);
    void execute(const std::shared_ptr<Runner>& runner, const RunRequest& request, std::uint64_t runId);
    void deliver(const std::vector<JobUpdate>& updates);
    void schedulerLoop();

    [[nodiscard]] Entry* findLocked(const JobId& id);
    [[nodiscard]] const Entry* findLocked(const JobId& id) const;
    [[nodiscard]] JobId generateId();

    Settings& settings_;
    RunnerFactory factory_;
    UrlValidator validator_;

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::size_t runningCount_ = 0;
    bool paused_ = false;
    bool accepting_ = false;
    std::uint64_t nextOrder_ = 0;
    std::uint64_t nextId_ = 0;
    std::vector<JobUpdate> outbox_;

    std::mutex listenersMutex_;
    std::unordered_map<std::uint64_t, JobListener> listeners_;
    std::uint64_t nextListener_ = 0;

    Channel<RunnerMessage> inbox_;
    std::unique_ptr<Pool> pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread schedulerThread_;
};

} // namespace tuneq
