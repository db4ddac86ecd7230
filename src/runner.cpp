/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/runner.hpp"
#include "tuneq/logger.hpp"
#include "tuneq/progress.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tuneq {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kMaxPendingLine = 64 * 1024;

struct SpawnedChild {
    pid_t pid = 0;
    int out = -1;
    int err = -1;
    int error = 0;
};

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Both output streams are piped back; stdin is /dev/null. The child leads its own
// process group so a cancel reaches anything it forks.
SpawnedChild spawnChild(const std::string& program, const std::vector<std::string>& args) {
    SpawnedChild child;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        child.error = errno;
        return child;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        child.error = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return child;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t mask;
    sigemptyset(&mask);
    posix_spawnattr_setsigmask(&attr, &mask);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, program.c_str(), &actions, &attr, argv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    if (rc != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        child.error = rc;
        return child;
    }

    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, ::fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    child.pid = pid;
    child.out = outPipe[0];
    child.err = errPipe[0];
    return child;
}

// Line splitter over one non-blocking pipe. '\r' also ends a line since the
// downloader redraws its progress bar in place.
struct OutputStream {
    int fd = -1;
    std::string pending;

    [[nodiscard]] bool open() const noexcept { return fd >= 0; }

    template <typename OnLine>
    void drain(OnLine&& onLine) {
        char buf[4096];
        while (fd >= 0) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                for (ssize_t i = 0; i < n; ++i) {
                    char c = buf[i];
                    if (c == '\n' || c == '\r') {
                        if (!pending.empty()) {
                            onLine(pending);
                            pending.clear();
                        }
                    } else if (pending.size() < kMaxPendingLine) {
                        pending.push_back(c);
                    }
                }
            } else if (n == 0) {
                closeFd(fd);
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            } else {
                LOG_WARN("Error reading downloader output: " + std::string(std::strerror(errno)));
                closeFd(fd);
            }
        }
    }

    template <typename OnLine>
    void flush(OnLine&& onLine) {
        if (!pending.empty()) {
            onLine(pending);
            pending.clear();
        }
    }

    ~OutputStream() { closeFd(fd); }
};

void pollStreams(OutputStream* streams, std::size_t count, int timeoutMs) {
    pollfd fds[2];
    nfds_t n = 0;
    for (std::size_t i = 0; i < count && n < 2; ++i) {
        if (streams[i].open()) {
            fds[n].fd = streams[i].fd;
            fds[n].events = POLLIN;
            fds[n].revents = 0;
            ++n;
        }
    }
    if (n == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
        return;
    }
    if (::poll(fds, n, timeoutMs) < 0 && errno != EINTR) {
        LOG_WARN("poll failed: " + std::string(std::strerror(errno)));
        std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
    }
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

}

const char* toString(RunErrorKind kind) noexcept {
    switch (kind) {
        case RunErrorKind::None: return "none";
        case RunErrorKind::SpawnError: return "spawn-error";
        case RunErrorKind::ExecutionError: return "execution-error";
        case RunErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

RunResult RunResult::success(std::optional<JobMetadata> metadata) {
    RunResult result;
    result.outcome = RunOutcome::Success;
    result.kind = RunErrorKind::None;
    result.metadata = std::move(metadata);
    result.exitCode = 0;
    return result;
}

RunResult RunResult::failure(RunErrorKind kind, std::string error, int exitCode) {
    RunResult result;
    result.outcome = RunOutcome::Failure;
    result.kind = kind;
    result.error = std::move(error);
    result.exitCode = exitCode;
    return result;
}

RunResult RunResult::cancelled() {
    RunResult result;
    result.outcome = RunOutcome::Cancelled;
    result.kind = RunErrorKind::Cancelled;
    return result;
}

ProcessRunner::~ProcessRunner() {
    int status = 0;
    std::lock_guard<std::mutex> lock(pidMutex_);
    if (pid_ > 0) {
        LOG_WARN("Runner destroyed with live process " + std::to_string(pid_) + ", killing it");
        ::kill(-pid_, SIGKILL);
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = 0;
    }
}

RunnerFactory ProcessRunner::factory() {
    return [] { return std::make_unique<ProcessRunner>(); };
}

void ProcessRunner::cancel() noexcept {
    cancelRequested_.store(true);
    signalGroup(SIGTERM);
}

void ProcessRunner::signalGroup(int sig) noexcept {
    try {
        std::lock_guard<std::mutex> lock(pidMutex_);
        if (pid_ <= 0) {
            return;
        }
        if (::kill(-pid_, sig) != 0 && errno == ESRCH) {
            (void)::kill(pid_, sig);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to signal downloader: " + std::string(e.what()));
    }
}

bool ProcessRunner::reap(int& status) noexcept {
    try {
        std::lock_guard<std::mutex> lock(pidMutex_);
        if (pid_ <= 0) {
            return true;
        }
        pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            pid_ = 0;
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            LOG_ERROR("waitpid failed for " + std::to_string(pid_) + ": " + std::strerror(errno));
            status = -1;
            pid_ = 0;
            return true;
        }
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to reap downloader: " + std::string(e.what()));
        return false;
    }
}

void ProcessRunner::handleLine(const std::string& raw, const JobId& jobId,
                               const ProgressSink& sink, LineState& state) {
    std::string line = ProgressParser::sanitize(raw);
    if (line.empty()) {
        return;
    }

    if (ProgressParser::parseMetadata(line, state.metadata)) {
        LOG_DEBUG("Job " + jobId + " metadata: " + line);
        return;
    }

    if (ProgressParser::isErrorLine(line)) {
        LOG_DEBUG("Job " + jobId + " reported: " + line);
        state.lastError = line;
        return;
    }

    if (auto progress = ProgressParser::parse(line)) {
        LOG_DEBUG("Job " + jobId + " [" + toString(progress->stage) + "] " + line);
        if (sink) {
            sink(*progress);
        }
    } else {
        LOG_TRACE("Job " + jobId + " ignored output: " + line);
    }
}

RunResult ProcessRunner::run(const RunRequest& request, const ProgressSink& sink) {
    const JobId& jobId = request.jobId;
    const std::string program = request.config.binary.string();

    if (cancelRequested_.load()) {
        LOG_INFO("Job " + jobId + " cancelled before launch");
        return RunResult::cancelled();
    }

    const auto args = buildArgs(request.config, request.url);
    LOG_INFO("Launching downloader for job " + jobId + ": " + program);
    LOG_DEBUG("Arguments: " + joinArgs(args));

    SpawnedChild child;
    {
        std::lock_guard<std::mutex> lock(pidMutex_);
        child = spawnChild(program, args);
        if (child.pid > 0) {
            pid_ = child.pid;
        }
    }

    if (child.pid <= 0) {
        std::string message = "Failed to start downloader '" + program + "': " + std::strerror(child.error);
        LOG_ERROR(message + " (job: " + jobId + ")");
        return RunResult::failure(RunErrorKind::SpawnError, message);
    }

    LOG_DEBUG("Job " + jobId + " downloader pid " + std::to_string(child.pid));

    OutputStream streams[2];
    streams[0].fd = child.out;
    streams[1].fd = child.err;

    LineState state;
    auto onLine = [&](const std::string& line) { handleLine(line, jobId, sink, state); };

    using SteadyClock = std::chrono::steady_clock;
    std::optional<SteadyClock::time_point> killDeadline;
    bool killed = false;
    int status = 0;
    bool exited = false;

    // A throwing sink must not leave the process running
    struct Abandon {
        ProcessRunner& self;
        const bool& exited;
        ~Abandon() {
            if (!exited) {
                self.signalGroup(SIGKILL);
                int st = 0;
                while (!self.reap(st)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
        }
    } abandon{*this, exited};

    while (!exited) {
        if (cancelRequested_.load() && !killDeadline) {
            // cancel() may have raced the spawn and found no pid yet
            signalGroup(SIGTERM);
            killDeadline = SteadyClock::now() + request.config.cancelGrace;
            LOG_INFO("Terminating downloader for job " + jobId);
        }
        if (killDeadline && !killed && SteadyClock::now() >= *killDeadline) {
            LOG_WARN("Downloader for job " + jobId + " ignored SIGTERM, sending SIGKILL");
            signalGroup(SIGKILL);
            killed = true;
        }

        pollStreams(streams, 2, kPollIntervalMs);
        streams[0].drain(onLine);
        streams[1].drain(onLine);
        exited = reap(status);
    }

    const bool wasCancelled = cancelRequested_.load();

    // Grandchildren may still hold the pipes, so take what is buffered and stop
    for (auto& stream : streams) {
        stream.drain(onLine);
        stream.flush(onLine);
        closeFd(stream.fd);
    }

    if (wasCancelled) {
        LOG_INFO("Job " + jobId + " downloader terminated on request");
        return RunResult::cancelled();
    }

    if (status >= 0 && WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            LOG_INFO("Downloader finished for job " + jobId);
            std::optional<JobMetadata> metadata;
            if (!state.metadata.empty()) {
                metadata = state.metadata;
            }
            return RunResult::success(std::move(metadata));
        }
        std::string message = state.lastError.empty()
            ? "Downloader exited with code " + std::to_string(code)
            : state.lastError;
        LOG_WARN("Downloader for job " + jobId + " exited with code " + std::to_string(code) + ": " + message);
        return RunResult::failure(RunErrorKind::ExecutionError, message, code);
    }

    std::string message;
    if (status >= 0 && WIFSIGNALED(status)) {
        message = "Downloader was terminated by signal " + std::to_string(WTERMSIG(status));
    } else {
        message = "Downloader exit status unavailable";
    }
    if (!state.lastError.empty()) {
        message += ": " + state.lastError;
    }
    LOG_WARN("Job " + jobId + ": " + message);
    return RunResult::failure(RunErrorKind::ExecutionError, message);
}

ProbeResult ProcessRunner::probe(const std::filesystem::path& binary, std::chrono::milliseconds timeout) {
    ProbeResult result;
    const std::string program = binary.string();

    SpawnedChild child = spawnChild(program, {"--version"});
    if (child.pid <= 0) {
        result.error = "Failed to start '" + program + "': " + std::strerror(child.error);
        return result;
    }

    OutputStream streams[2];
    streams[0].fd = child.out;
    streams[1].fd = child.err;

    std::string firstOut;
    std::string lastErr;
    auto onOut = [&](const std::string& line) {
        if (firstOut.empty()) firstOut = ProgressParser::sanitize(line);
    };
    auto onErr = [&](const std::string& line) { lastErr = ProgressParser::sanitize(line); };

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool exited = false;
    bool timedOut = false;
    while (!exited) {
        if (!timedOut && std::chrono::steady_clock::now() >= deadline) {
            ::kill(-child.pid, SIGKILL);
            timedOut = true;
        }
        pollStreams(streams, 2, kPollIntervalMs);
        streams[0].drain(onOut);
        streams[1].drain(onErr);
        pid_t rc = ::waitpid(child.pid, &status, WNOHANG);
        if (rc == child.pid) {
            exited = true;
        } else if (rc < 0 && errno != EINTR) {
            status = -1;
            exited = true;
        }
    }
    streams[0].drain(onOut);
    streams[0].flush(onOut);
    streams[1].drain(onErr);
    streams[1].flush(onErr);

    if (timedOut) {
        result.error = "'" + program + " --version' timed out";
    } else if (status >= 0 && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.ok = true;
        result.version = firstOut;
    } else {
        result.error = "Binary test failed" + (lastErr.empty() ? std::string() : ": " + lastErr);
    }
    return result;
}

} // namespace tuneq
