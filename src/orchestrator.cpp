/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/orchestrator.hpp"
#include "tuneq/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace tuneq {

namespace {

constexpr auto kSchedulerTick = std::chrono::milliseconds(200);

QueueResult success() {
    return {true, QueueError::None, ""};
}

QueueResult failure(QueueError error, std::string message) {
    return {false, error, std::move(message)};
}

}

const char* toString(QueueError error) noexcept {
    switch (error) {
        case QueueError::None: return "none";
        case QueueError::Validation: return "validation-error";
        case QueueError::NotFound: return "not-found";
        case QueueError::InvalidState: return "invalid-state";
        default: return "unknown";
    }
}

const char* toString(UpdateKind kind) noexcept {
    switch (kind) {
        case UpdateKind::Added: return "added";
        case UpdateKind::Dispatched: return "dispatched";
        case UpdateKind::Progress: return "progress";
        case UpdateKind::CancelRequested: return "cancel-requested";
        case UpdateKind::Completed: return "completed";
        case UpdateKind::Failed: return "failed";
        case UpdateKind::Cancelled: return "cancelled";
        case UpdateKind::Requeued: return "requeued";
        case UpdateKind::Removed: return "removed";
        default: return "unknown";
    }
}

Orchestrator::Orchestrator(Settings& settings, RunnerFactory factory, UrlValidator validator)
    : settings_(settings), factory_(std::move(factory)), validator_(std::move(validator)) {
    if (!factory_) {
        throw std::invalid_argument("Orchestrator requires a runner factory");
    }
    const std::size_t limit = settings_.concurrentLimit();
    pool_ = std::make_unique<Pool>(static_cast<int>(limit));
    LOG_DEBUG("Orchestrator created - concurrent limit: " + std::to_string(limit));
}

Orchestrator::~Orchestrator() {
    shutdown();
    if (schedulerThread_.joinable() && std::this_thread::get_id() != schedulerThread_.get_id()) {
        schedulerThread_.join();
    }
}

bool Orchestrator::start() {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }
    if (inbox_.closed()) {
        LOG_WARN("Orchestrator cannot be restarted after shutdown");
        return false;
    }

    if (!pool_->start()) {
        LOG_ERROR("Failed to start worker pool");
        return false;
    }

    try {
        running_.store(true);
        shutdown_.store(false);
        schedulerThread_ = std::thread(&Orchestrator::schedulerLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start scheduler: " + std::string(e.what()));
        running_.store(false);
        pool_->stop();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = true;
        scheduleLocked();
    }
    inbox_.wake();

    LOG_INFO("Download queue started (limit " + std::to_string(settings_.concurrentLimit()) + ")");
    return true;
}

void Orchestrator::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down download queue...");

    std::vector<std::shared_ptr<Runner>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        for (auto& entry : entries_) {
            if (entry.runner) {
                entry.cancelRequested = true;
                live.push_back(entry.runner);
            }
        }
    }
    for (auto& runner : live) {
        runner->cancel();
    }

    // Workers finish their current runs, which now end promptly
    pool_->stop();

    shutdown_.store(true);
    inbox_.close();

    // A listener may call shutdown() on the scheduler thread, which cannot join itself.
    // It applies the remaining results here and the loop exits once the listener returns.
    std::vector<RunnerMessage> pending;
    if (std::this_thread::get_id() == schedulerThread_.get_id()) {
        pending = inbox_.drain(std::chrono::milliseconds(0));
    } else if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }

    // Any runner result lost with the channel still leaves its job Running
    std::vector<JobUpdate> updates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& message : pending) {
            applyLocked(message);
        }
        for (auto& entry : entries_) {
            if (entry.runner) {
                finishLocked(entry, RunResult::cancelled());
            }
        }
        updates.swap(outbox_);
    }
    deliver(updates);

    LOG_INFO("Download queue shutdown complete");
}

AddResult Orchestrator::add(const std::string& url) {
    if (!validator_.isValid(url)) {
        LOG_DEBUG("Rejected url: " + url);
        return {false, "", QueueError::Validation, "Invalid URL: " + url};
    }

    JobId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = generateId();
        Entry entry;
        entry.job = Lifecycle::create(id, url, Clock::now());
        entry.order = nextOrder_++;
        entries_.push_back(std::move(entry));
        emitLocked(UpdateKind::Added, entries_.back().job);
        scheduleLocked();
    }
    inbox_.wake();

    LOG_INFO("Job queued: " + id + " (" + url + ")");
    return {true, id, QueueError::None, ""};
}

QueueResult Orchestrator::retry(const JobId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry) {
            return failure(QueueError::NotFound, "Job not found: " + id);
        }
        if (!Lifecycle::retry(entry->job)) {
            return failure(QueueError::InvalidState,
                           std::string("Job cannot be retried while ") + toString(entry->job.status));
        }
        entry->order = nextOrder_++;
        entry->cancelRequested = false;
        emitLocked(UpdateKind::Requeued, entry->job);
        LOG_INFO("Job requeued: " + id + " (retry " + std::to_string(entry->job.retryCount) + ")");
        scheduleLocked();
    }
    inbox_.wake();
    return success();
}

QueueResult Orchestrator::cancel(const JobId& id) {
    std::shared_ptr<Runner> runner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry) {
            return failure(QueueError::NotFound, "Job not found: " + id);
        }

        switch (entry->job.status) {
            case Status::Queued:
                if (Lifecycle::cancelQueued(entry->job, Clock::now())) {
                    emitLocked(UpdateKind::Cancelled, entry->job);
                    LOG_INFO("Job cancelled before dispatch: " + id);
                }
                break;
            case Status::Running:
                if (!entry->cancelRequested) {
                    entry->cancelRequested = true;
                    runner = entry->runner;
                    emitLocked(UpdateKind::CancelRequested, entry->job);
                    LOG_INFO("Cancelling running job: " + id);
                }
                break;
            default:
                break;
        }
    }

    // Signalling happens outside the lock; the runner acknowledges through the channel
    if (runner) {
        runner->cancel();
    }
    inbox_.wake();
    return success();
}

QueueResult Orchestrator::remove(const JobId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&id](const Entry& e) { return e.job.id == id; });
        if (it == entries_.end()) {
            return failure(QueueError::NotFound, "Job not found: " + id);
        }
        if (!Lifecycle::allows(it->job.status, JobEvent::Remove)) {
            return failure(QueueError::InvalidState, "Running job must be cancelled before removal");
        }
        emitLocked(UpdateKind::Removed, it->job);
        entries_.erase(it);
    }
    inbox_.wake();
    LOG_INFO("Job removed: " + id);
    return success();
}

void Orchestrator::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_) {
            return;
        }
        paused_ = true;
        LOG_INFO("Queue paused");
    }
    inbox_.wake();
}

void Orchestrator::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) {
            return;
        }
        paused_ = false;
        LOG_INFO("Queue resumed");
        scheduleLocked();
    }
    inbox_.wake();
}

std::size_t Orchestrator::clearCompleted() {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.begin();
        while (it != entries_.end()) {
            if (isTerminal(it->job.status)) {
                emitLocked(UpdateKind::Removed, it->job);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        inbox_.wake();
        LOG_INFO("Cleared " + std::to_string(removed) + " finished job(s)");
    }
    return removed;
}

QueueResult Orchestrator::setConcurrentLimit(std::size_t limit) {
    if (limit == 0) {
        return failure(QueueError::Validation, "Concurrent limit must be greater than 0");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.setConcurrentLimit(limit);
        LOG_INFO("Concurrent limit set to " + std::to_string(limit));
        scheduleLocked();
    }
    inbox_.wake();
    return success();
}

std::size_t Orchestrator::cancelAll() {
    std::size_t count = 0;
    std::vector<std::shared_ptr<Runner>> runners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        for (auto& entry : entries_) {
            if (entry.job.status == Status::Queued) {
                if (Lifecycle::cancelQueued(entry.job, now)) {
                    emitLocked(UpdateKind::Cancelled, entry.job);
                    ++count;
                }
            } else if (entry.job.status == Status::Running) {
                if (!entry.cancelRequested) {
                    entry.cancelRequested = true;
                    runners.push_back(entry.runner);
                    emitLocked(UpdateKind::CancelRequested, entry.job);
                }
                ++count;
            }
        }
    }

    for (auto& runner : runners) {
        runner->cancel();
    }
    inbox_.wake();

    if (count > 0) {
        LOG_INFO("Cancelled " + std::to_string(count) + " job(s)");
    }
    return count;
}

std::size_t Orchestrator::retryAllFailed() {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Entry*> failed;
        for (auto& entry : entries_) {
            if (entry.job.status == Status::Failed) {
                failed.push_back(&entry);
            }
        }
        std::sort(failed.begin(), failed.end(),
            [](const Entry* a, const Entry* b) { return a->order < b->order; });

        for (Entry* entry : failed) {
            if (Lifecycle::retry(entry->job)) {
                entry->order = nextOrder_++;
                entry->cancelRequested = false;
                emitLocked(UpdateKind::Requeued, entry->job);
                ++count;
            }
        }
        scheduleLocked();
    }
    inbox_.wake();

    if (count > 0) {
        LOG_INFO("Requeued " + std::to_string(count) + " failed job(s)");
    }
    return count;
}

QueueState Orchestrator::snapshot() const {
    QueueState state;
    std::lock_guard<std::mutex> lock(mutex_);
    state.jobs.reserve(entries_.size());
    for (const auto& entry : entries_) {
        state.jobs.push_back(entry.job);
        if (entry.runner) {
            ++state.boundRunners;
        }
    }
    state.paused = paused_;
    state.concurrentLimit = settings_.concurrentLimit();
    return state;
}

std::optional<Job> Orchestrator::job(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* entry = findLocked(id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->job;
}

QueueStats Orchestrator::stats() const {
    QueueStats stats;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        switch (entry.job.status) {
            case Status::Queued: ++stats.queued; break;
            case Status::Running: ++stats.running; break;
            case Status::Completed: ++stats.completed; break;
            case Status::Failed: ++stats.failed; break;
            case Status::Cancelled: ++stats.cancelled; break;
        }
    }
    stats.total = entries_.size();
    stats.paused = paused_;
    return stats;
}

CommandPreview Orchestrator::previewCommand(const std::string& url) const {
    CommandPreview preview;
    if (!validator_.isValid(url)) {
        preview.message = "Invalid URL: " + url;
        return preview;
    }
    DownloadConfig config = settings_.current();
    preview.ok = true;
    preview.binary = config.binary;
    preview.args = buildArgs(config, url);
    return preview;
}

ProbeResult Orchestrator::healthCheck() const {
    DownloadConfig config = settings_.current();
    ProbeResult result = ProcessRunner::probe(config.binary);
    if (result.ok) {
        LOG_INFO("Downloader healthy: " + result.version);
    } else {
        LOG_WARN("Health check failed: " + result.error);
    }
    return result;
}

std::uint64_t Orchestrator::subscribe(JobListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    std::uint64_t id = ++nextListener_;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void Orchestrator::unsubscribe(std::uint64_t subscription) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(subscription);
}

void Orchestrator::scheduleLocked() {
    if (!accepting_ || paused_) {
        return;
    }

    // The limit may change through Settings at any time
    const std::size_t limit = settings_.concurrentLimit();
    pool_->ensureWorkers(static_cast<int>(limit));

    while (runningCount_ < limit) {
        Entry* next = nullptr;
        for (auto& entry : entries_) {
            if (entry.job.status == Status::Queued && (!next || entry.order < next->order)) {
                next = &entry;
            }
        }
        if (!next) {
            return;
        }
        if (!dispatchLocked(*next)) {
            // The job already moved to Failed; keep filling remaining slots
            continue;
        }
    }
}

bool Orchestrator::dispatchLocked(Entry& entry) {
    std::shared_ptr<Runner> runner;
    try {
        runner = factory_();
    } catch (const std::exception& e) {
        LOG_ERROR("Runner factory failed for job " + entry.job.id + ": " + e.what());
    }

    if (!Lifecycle::dispatch(entry.job, Clock::now())) {
        return false;
    }

    if (!runner) {
        finishLocked(entry, RunResult::failure(RunErrorKind::SpawnError, "No runner available"));
        return false;
    }

    entry.runner = runner;
    entry.cancelRequested = false;
    ++runningCount_;
    emitLocked(UpdateKind::Dispatched, entry.job);

    // Configuration is re-read for every dispatch
    RunRequest request{entry.job.id, entry.job.url, settings_.current()};
    const std::uint64_t runId = entry.job.runId;

    bool submitted = pool_->submit([this, runner, request, runId](int) {
        execute(runner, request, runId);
    });
    if (!submitted) {
        finishLocked(entry, RunResult::failure(RunErrorKind::SpawnError, "Worker pool unavailable"));
        return false;
    }

    LOG_INFO("Job dispatched: " + entry.job.id + " (" + std::to_string(runningCount_) + "/" +
             std::to_string(settings_.concurrentLimit()) + " running)");
    return true;
}

void Orchestrator::execute(const std::shared_ptr<Runner>& runner, const RunRequest& request, std::uint64_t runId) {
    RunResult result;
    try {
        result = runner->run(request, [this, &request, runId](const Progress& progress) {
            RunnerMessage message{RunnerMessage::Kind::Progress, request.jobId, runId, progress, {}};
            inbox_.push(std::move(message));
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Runner crashed for job " + request.jobId + ": " + e.what());
        result = RunResult::failure(RunErrorKind::ExecutionError, "Internal runner error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Runner crashed for job " + request.jobId + " with unknown error");
        result = RunResult::failure(RunErrorKind::ExecutionError, "Unknown internal runner error");
    }

    RunnerMessage message{RunnerMessage::Kind::Finished, request.jobId, runId, {}, std::move(result)};
    if (!inbox_.push(std::move(message))) {
        LOG_DEBUG("Result for job " + request.jobId + " arrived after shutdown");
    }
}

void Orchestrator::applyLocked(RunnerMessage& message) {
    Entry* entry = findLocked(message.jobId);
    if (!entry || entry->job.runId != message.runId || entry->job.status != Status::Running) {
        LOG_DEBUG("Dropping stale runner message for job " + message.jobId);
        return;
    }

    if (message.kind == RunnerMessage::Kind::Progress) {
        if (Lifecycle::progress(entry->job, message.progress)) {
            emitLocked(UpdateKind::Progress, entry->job);
        }
        return;
    }

    finishLocked(*entry, message.result);
}

void Orchestrator::finishLocked(Entry& entry, const RunResult& result) {
    const auto now = Clock::now();
    const JobId& id = entry.job.id;

    bool applied = false;
    UpdateKind kind = UpdateKind::Failed;

    if (result.outcome == RunOutcome::Success) {
        applied = Lifecycle::succeed(entry.job, result.metadata, now);
        kind = UpdateKind::Completed;
        LOG_INFO("JOB COMPLETED: " + id);
    } else if (entry.cancelRequested) {
        // A kill shows up as a failed exit; the request decides the outcome
        applied = Lifecycle::cancelAck(entry.job, now);
        kind = UpdateKind::Cancelled;
        LOG_INFO("JOB CANCELLED: " + id);
    } else if (result.outcome == RunOutcome::Cancelled) {
        applied = Lifecycle::fail(entry.job, "Downloader stopped unexpectedly", now);
        LOG_WARN("JOB FAILED: " + id + " - runner cancelled without request");
    } else {
        applied = Lifecycle::fail(entry.job, result.error, now);
        LOG_WARN("JOB FAILED: " + id + " [" + toString(result.kind) + "] " + result.error);
    }

    if (entry.runner) {
        entry.runner.reset();
        --runningCount_;
    }
    entry.cancelRequested = false;

    if (applied) {
        emitLocked(kind, entry.job);
    }
}

void Orchestrator::emitLocked(UpdateKind kind, const Job& job) {
    outbox_.push_back(JobUpdate{kind, job});
}

void Orchestrator::deliver(const std::vector<JobUpdate>& updates) {
    if (updates.empty()) {
        return;
    }

    std::vector<JobListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners.reserve(listeners_.size());
        for (const auto& item : listeners_) {
            listeners.push_back(item.second);
        }
    }
    if (listeners.empty()) {
        return;
    }

    for (const auto& update : updates) {
        for (const auto& listener : listeners) {
            try {
                listener(update);
            } catch (const std::exception& e) {
                LOG_ERROR("Listener error on " + std::string(toString(update.kind)) + " for job " +
                          update.job.id + ": " + e.what());
            } catch (...) {
                LOG_ERROR("Unknown listener error for job " + update.job.id);
            }
        }
    }
}

void Orchestrator::schedulerLoop() {
    ThreadNameScope threadName("Scheduler");
    LOG_DEBUG("Scheduler loop started");

    while (true) {
        std::vector<RunnerMessage> messages;
        try {
            messages = inbox_.drain(kSchedulerTick);

            std::vector<JobUpdate> updates;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto& message : messages) {
                    applyLocked(message);
                }
                scheduleLocked();
                updates.swap(outbox_);
            }
            deliver(updates);
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler loop error: " + std::string(e.what()));
        }

        if (shutdown_.load() && messages.empty() && inbox_.size() == 0) {
            break;
        }
    }

    LOG_DEBUG("Scheduler loop stopped");
}

Orchestrator::Entry* Orchestrator::findLocked(const JobId& id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&id](const Entry& e) { return e.job.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

const Orchestrator::Entry* Orchestrator::findLocked(const JobId& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&id](const Entry& e) { return e.job.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

JobId Orchestrator::generateId() {
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now().time_since_epoch()).count();
    return std::to_string(now) + "_" + std::to_string(nextId_++);
}

} // namespace tuneq
