/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/orchestrator.hpp"
#include "tuneq/logger.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace tuneq;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;
static std::mutex g_output_mutex;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "tuneq Download Queue v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <url> [url...]\n";
    std::cout << "       " << progName << " --check\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -j, --jobs <n>      Concurrent downloads (default: 3)\n";
    std::cout << "  -o, --output <dir>  Output directory (default: ./downloads)\n";
    std::cout << "  --binary <path>     Downloader executable (default: gytmdl)\n";
    std::cout << "  --dry-run           Print the downloader command for each url and exit\n";
    std::cout << "  --check             Verify the downloader is installed and exit\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TUNEQ_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  TUNEQ_CONCURRENT      Concurrent downloads\n";
    std::cout << "  TUNEQ_OUTPUT_PATH     Output directory\n";
    std::cout << "  TUNEQ_BINARY          Downloader executable\n";
    std::cout << "  TUNEQ_ACCEPTED_HOSTS  Extra accepted hosts (comma separated)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " https://music.youtube.com/watch?v=dQw4w9WgXcQ\n";
    std::cout << "  " << progName << " -j 2 -o ~/Music https://music.youtube.com/playlist?list=PL123\n";
}

std::string quote(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"'\\$&;|<>*?()") == std::string::npos) {
        return arg;
    }
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shortId(const JobId& id) {
    auto pos = id.find('_');
    return pos == std::string::npos ? id : id.substr(pos + 1);
}

void printUpdate(const JobUpdate& update) {
    const Job& job = update.job;
    std::lock_guard<std::mutex> lock(g_output_mutex);
    switch (update.kind) {
        case UpdateKind::Added:
            std::cout << "  \033[33mqueued\033[0m     #" << shortId(job.id) << "  " << job.url << "\n";
            break;
        case UpdateKind::Dispatched:
            std::cout << "  \033[36mstarted\033[0m    #" << shortId(job.id) << "  " << job.url << "\n";
            break;
        case UpdateKind::Completed: {
            std::cout << "  \033[32mcompleted\033[0m  #" << shortId(job.id);
            if (job.metadata && job.metadata->title) {
                std::cout << "  " << *job.metadata->title;
                if (job.metadata->artist) {
                    std::cout << " \033[90m- " << *job.metadata->artist << "\033[0m";
                }
            }
            std::cout << "\n";
            break;
        }
        case UpdateKind::Failed:
            std::cout << "  \033[31mfailed\033[0m     #" << shortId(job.id) << "  "
                      << job.error.value_or("Download failed") << "\n";
            break;
        case UpdateKind::Cancelled:
            std::cout << "  \033[90mcancelled\033[0m  #" << shortId(job.id) << "\n";
            break;
        default:
            break;
    }
    std::cout.flush();
}

void printProgress(const QueueState& state) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    for (const auto& job : state.jobs) {
        if (job.status != Status::Running) {
            continue;
        }
        std::cout << "  \033[90m" << std::left << std::setw(10) << ("#" + shortId(job.id))
                  << std::setw(18) << toString(job.progress.stage) << "\033[0m";
        if (job.progress.percentage) {
            std::cout << std::right << std::fixed << std::setprecision(1) << std::setw(6)
                      << *job.progress.percentage << "%  ";
        } else {
            std::cout << "         ";
        }
        std::cout << job.progress.currentStep << "\n";
    }
    std::cout.flush();
}

bool allFinished(const QueueState& state) {
    for (const auto& job : state.jobs) {
        if (!isTerminal(job.status)) {
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    // Default to WARN so status lines stay readable; TUNEQ_LOG_LEVEL overrides
    if (!std::getenv("TUNEQ_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    else
        Logger::initFromEnv();

    std::vector<std::string> urls;
    std::optional<int> jobs;
    std::optional<std::string> output;
    std::optional<std::string> binary;
    bool dryRun = false;
    bool check = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number\n";
                return 1;
            }
            try {
                jobs = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid job count: " << argv[i] << "\n";
                return 1;
            }
            if (*jobs <= 0) {
                std::cerr << "Error: job count must be greater than 0\n";
                return 1;
            }
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a directory\n";
                return 1;
            }
            output = argv[++i];
        } else if (arg == "--binary") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --binary requires a path\n";
                return 1;
            }
            binary = argv[++i];
        } else if (arg == "--dry-run") {
            dryRun = true;
        } else if (arg == "--check") {
            check = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return 1;
        } else {
            urls.push_back(arg);
        }
    }

    if (urls.empty() && !check) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        DownloadConfig config = DownloadConfig::fromEnv();
        if (jobs) config.concurrentLimit = static_cast<std::size_t>(*jobs);
        if (output) config.outputPath = *output;
        if (binary) config.binary = *binary;

        Settings settings(config);
        Orchestrator queue(settings, ProcessRunner::factory(), UrlValidator::fromEnv());

        if (check) {
            ProbeResult probe = queue.healthCheck();
            if (!probe.ok) {
                std::cerr << "  \033[31munavailable\033[0m  " << config.binary.string() << ": " << probe.error << "\n";
                return 1;
            }
            std::cout << "  \033[32mok\033[0m  " << config.binary.string() << " " << probe.version << "\n";
            if (urls.empty()) {
                return 0;
            }
        }

        if (dryRun) {
            int status = 0;
            for (const auto& url : urls) {
                CommandPreview preview = queue.previewCommand(url);
                if (!preview) {
                    std::cerr << "Error: " << preview.message << "\n";
                    status = 1;
                    continue;
                }
                std::cout << quote(preview.binary.string());
                for (const auto& a : preview.args) {
                    std::cout << " " << quote(a);
                }
                std::cout << "\n";
            }
            return status;
        }

        queue.subscribe(printUpdate);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::size_t accepted = 0;
        for (const auto& url : urls) {
            AddResult result = queue.add(url);
            if (!result) {
                std::cerr << "Error: " << result.message << "\n";
                continue;
            }
            ++accepted;
        }
        if (accepted == 0) {
            return 1;
        }

        if (!queue.start()) {
            std::cerr << "  \033[31mFailed to start download queue\033[0m\n";
            return 1;
        }

        bool cancelling = false;
        auto lastReport = std::chrono::steady_clock::now();
        while (true) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            if (g_shutdown_requested && !cancelling) {
                cancelling = true;
                {
                    std::lock_guard<std::mutex> lock(g_output_mutex);
                    std::cout << "\nCancelling downloads..." << std::endl;
                }
                queue.cancelAll();
            }

            QueueState state = queue.snapshot();
            if (allFinished(state)) {
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now - lastReport >= std::chrono::seconds(1)) {
                lastReport = now;
                printProgress(state);
            }
        }

        queue.shutdown();

        QueueStats stats = queue.stats();
        std::cout << "\n  \033[32m" << stats.completed << " completed\033[0m";
        if (stats.failed > 0) std::cout << "  \033[31m" << stats.failed << " failed\033[0m";
        if (stats.cancelled > 0) std::cout << "  \033[90m" << stats.cancelled << " cancelled\033[0m";
        std::cout << "\n";

        bool allCompleted = stats.completed == stats.total && accepted == urls.size();
        return allCompleted ? 0 : 1;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        LOG_ERROR("Unknown fatal error");
        return 1;
    }
}
