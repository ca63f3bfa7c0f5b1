/**
 * ModelFetch - model and asset downloader
 *
 * Command line entry point.
 * Downloads one or more files with bounded parallelism, or verifies a file
 * against a SHA-256 digest.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Logger.hpp"
#include "core/Config.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/DownloadError.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

using namespace modelfetch;
using core::downloader::BatchRequest;
using core::downloader::DownloadEvent;
using core::downloader::DownloadManager;
using core::downloader::DownloadOptions;
using core::downloader::DownloadResult;
using core::downloader::DownloadStatus;
using utils::StringUtils;

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// Set from the signal handler, acted on by the watcher thread
std::atomic<bool> g_interrupted{false};

/**
 * Signal handler for graceful cancellation
 */
void signalHandler(int /*signal*/) {
    g_interrupted = true;
}

/**
 * Setup signal handlers for graceful cancellation
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

struct CliOptions {
    bool debug{false};
    bool json{false};
    bool resume{false};
    std::optional<std::string> configPath;
    std::optional<int> retries;
    std::optional<size_t> concurrency;
    std::optional<int64_t> timeoutMs;
    std::optional<std::string> sha256;
    std::vector<std::string> positional;
};

void printUsage(const char* program) {
    std::cout << "ModelFetch - model and asset downloader\n"
              << "\nUsage: " << program << " [options] <url> <dest> [<url> <dest> ...]\n"
              << "       " << program << " verify <file> <sha256>\n"
              << "\nOptions:\n"
              << "  -d, --debug            Enable debug logging\n"
              << "  -c, --config <path>    Configuration file\n"
              << "  -r, --retries <n>      Retries after the first attempt\n"
              << "  -j, --concurrency <n>  Parallel downloads\n"
              << "      --timeout <ms>     Timeout of a single attempt\n"
              << "      --resume           Continue partial files with range requests\n"
              << "      --sha256 <hex>     Expected digest (single download only)\n"
              << "      --json             Print the report as JSON\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << std::endl;
}

/**
 * @return Exit code to stop with, or nothing to continue
 */
std::optional<int> parseArguments(int argc, char* argv[], CliOptions& options) {
    auto needValue = [&](int& i, const std::string& name) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << name << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return kExitOk;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "ModelFetch v" << kVersion << std::endl;
            return kExitOk;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--resume") {
            options.resume = true;
        } else if (arg == "--config" || arg == "-c") {
            auto value = needValue(i, arg);
            if (!value) return kExitUsage;
            options.configPath = *value;
        } else if (arg == "--retries" || arg == "-r") {
            auto value = needValue(i, arg);
            int retries = value ? StringUtils::parseInt(*value, -1) : -1;
            if (retries < 0) {
                std::cerr << "Invalid retry count" << std::endl;
                return kExitUsage;
            }
            options.retries = retries;
        } else if (arg == "--concurrency" || arg == "-j") {
            auto value = needValue(i, arg);
            int concurrency = value ? StringUtils::parseInt(*value, 0) : 0;
            if (concurrency <= 0) {
                std::cerr << "Invalid concurrency" << std::endl;
                return kExitUsage;
            }
            options.concurrency = static_cast<size_t>(concurrency);
        } else if (arg == "--timeout") {
            auto value = needValue(i, arg);
            int64_t timeout = value ? StringUtils::parseLong(*value, 0) : 0;
            if (timeout <= 0) {
                std::cerr << "Invalid timeout" << std::endl;
                return kExitUsage;
            }
            options.timeoutMs = timeout;
        } else if (arg == "--sha256") {
            auto value = needValue(i, arg);
            if (!value || value->size() != 64 || !StringUtils::isHex(*value)) {
                std::cerr << "Expected a 64 character hex SHA-256 digest" << std::endl;
                return kExitUsage;
            }
            options.sha256 = *value;
        } else if (StringUtils::startsWith(arg, "-") && arg.size() > 1) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return kExitUsage;
        } else {
            options.positional.push_back(arg);
        }
    }

    return std::nullopt;
}

/**
 * Load the configuration file and start logging as it says
 */
void initializeFromConfig(const CliOptions& options) {
    auto& config = core::Config::instance();

    std::string configPath = options.configPath
        ? *options.configPath
        : utils::PathUtils::getConfigPath().string();
    bool loaded = config.load(configPath);

    core::LogSettings settings;
    settings.level = options.debug
        ? core::LogLevel::Debug
        : core::Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    settings.directory = config.get<std::string>("logging.directory", "");
    if (settings.directory.empty()) {
        settings.directory = utils::PathUtils::getLogsPath().string();
    }
    settings.maxFileBytes = config.get<size_t>("logging.maxFileSizeMB", 10) * 1024 * 1024;
    settings.maxFiles = config.get<size_t>("logging.maxFiles", 5);

    core::Logger::instance().initialize(settings);

    if (loaded) {
        LOG_INFO("Configuration loaded from {}", configPath);
    } else if (options.configPath) {
        LOG_WARN("Using default configuration: {}", config.lastError());
    }
}

int runVerify(const CliOptions& options) {
    if (options.positional.size() != 3) {
        std::cerr << "Usage: modelfetch verify <file> <sha256>" << std::endl;
        return kExitUsage;
    }

    const std::string& file = options.positional[1];
    const std::string& digest = options.positional[2];

    DownloadManager manager;
    try {
        bool ok = manager.verifyDownload(file, digest);
        if (options.json) {
            std::cout << nlohmann::json{{"file", file}, {"verified", ok}}.dump(2) << std::endl;
        } else {
            std::cout << (ok ? "OK       " : "MISMATCH ") << file << std::endl;
        }
        return ok ? kExitOk : kExitFailed;
    } catch (const core::downloader::IntegrityError& e) {
        std::cerr << e.what() << std::endl;
        return kExitFailed;
    }
}

/**
 * Throttled one-line progress per task on stderr
 */
class ProgressPrinter {
public:
    void operator()(const DownloadEvent& event) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto now = std::chrono::steady_clock::now();
        auto& last = m_lastPrint[event.taskId];
        bool statusChange = event.progress.status != DownloadStatus::InProgress;
        if (!statusChange && now - last < std::chrono::milliseconds(500)) {
            return;
        }
        last = now;

        const auto& progress = event.progress;
        std::cerr << event.taskId << "  " << core::downloader::toString(progress.status) << "  "
                  << StringUtils::formatBytes(static_cast<int64_t>(progress.downloadedBytes));
        if (progress.hasKnownTotal()) {
            std::cerr << " / " << StringUtils::formatBytes(progress.totalBytes);
        }
        if (progress.percentage) {
            std::cerr << "  " << static_cast<int>(*progress.percentage) << "%";
        }
        if (progress.status == DownloadStatus::InProgress) {
            std::cerr << "  " << StringUtils::formatRate(progress.speed);
        }
        std::cerr << std::endl;
    }

private:
    std::mutex m_mutex;
    std::map<std::string, std::chrono::steady_clock::time_point> m_lastPrint;
};

/**
 * Turns SIGINT/SIGTERM into cancelAll() for as long as it lives
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(DownloadManager& manager)
        : m_thread([this, &manager]() {
              while (!m_finished) {
                  if (g_interrupted.exchange(false)) {
                      LOG_WARN("Interrupted, cancelling downloads");
                      manager.cancelAll();
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {}

    ~InterruptWatcher() {
        m_finished = true;
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::atomic<bool> m_finished{false};
    std::thread m_thread;
};

void printReport(const std::vector<BatchRequest>& requests,
                 const std::vector<DownloadResult>& results,
                 const DownloadManager& manager,
                 bool asJson) {
    if (asJson) {
        nlohmann::json report;
        report["results"] = nlohmann::json::array();
        for (const auto& result : results) {
            report["results"].push_back(result.toJson());
        }
        report["stats"] = manager.getDownloadStats().toJson();
        std::cout << report.dump(2) << std::endl;
        return;
    }

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (result.success) {
            std::cout << "OK    " << result.filePath << "  "
                      << StringUtils::formatBytes(static_cast<int64_t>(result.fileSize)) << "  "
                      << StringUtils::formatMillis(result.duration) << "  "
                      << result.checksum << "\n";
        } else {
            std::cout << "FAIL  " << requests[i].url << "  " << result.error << "\n";
        }
    }

    auto stats = manager.getDownloadStats();
    std::cout << stats.successfulDownloads << "/" << stats.totalDownloads << " succeeded, "
              << StringUtils::formatBytes(static_cast<int64_t>(stats.totalBytesDownloaded)) << " downloaded, "
              << stats.totalAttempts << " attempts" << std::endl;
}

int runDownloads(const CliOptions& options) {
    const auto& args = options.positional;
    if (args.empty() || args.size() % 2 != 0) {
        std::cerr << "Expected <url> <dest> pairs (see --help)" << std::endl;
        return kExitUsage;
    }
    if (options.sha256 && args.size() != 2) {
        std::cerr << "--sha256 applies to a single download only" << std::endl;
        return kExitUsage;
    }

    DownloadOptions base = DownloadOptions::fromConfig();
    if (options.retries) base.retries = *options.retries;
    if (options.timeoutMs) base.timeout = std::chrono::milliseconds(*options.timeoutMs);
    if (options.resume) base.resumeSupport = true;
    if (options.sha256) base.expectedChecksum = StringUtils::toLower(*options.sha256);

    std::vector<BatchRequest> requests;
    for (size_t i = 0; i < args.size(); i += 2) {
        if (!StringUtils::isUrl(args[i])) {
            std::cerr << "Not an http(s) URL: " << args[i] << std::endl;
            return kExitUsage;
        }
        requests.push_back(BatchRequest{args[i], args[i + 1], base});
    }

    DownloadManager manager;

    ProgressPrinter printer;
    core::SubscriptionPtr subscription;
    if (!options.json) {
        subscription = manager.subscribe([&printer](const DownloadEvent& event) { printer(event); });
    }

    std::vector<DownloadResult> results;
    {
        InterruptWatcher watcher(manager);
        results = manager.downloadBatch(requests, options.concurrency);
    }
    manager.unsubscribe(subscription);

    printReport(requests, results, manager, options.json);

    bool allSucceeded = std::all_of(results.begin(), results.end(), [](const DownloadResult& result) {
        return result.success;
    });
    return allSucceeded ? kExitOk : kExitFailed;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CliOptions options;
    if (auto exitCode = parseArguments(argc, argv, options)) {
        return *exitCode;
    }

    if (options.positional.empty()) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    initializeFromConfig(options);
    setupSignalHandlers();

    LOG_INFO("ModelFetch v{} starting", kVersion);

    try {
        int exitCode = options.positional.front() == "verify"
            ? runVerify(options)
            : runDownloads(options);

        core::Logger::instance().flush();
        return exitCode;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailed;
    }
}
