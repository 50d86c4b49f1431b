/**
 * @file chunked_upload.cpp
 * @brief Push a large file to a network appliance in verified chunks
 *
 * USAGE:
 *   chunked_upload <host> <local_file> [chunk_size_mb] [remote_file] [options]
 *
 * The password is read from CXFER_PASSWORD; without it public key
 * authentication is used. Rerunning the same command resumes from the ledger.
 * Ctrl-C cancels between chunks or during a backoff wait.
 */

#include "cxfer/core/cancellation.hpp"
#include "cxfer/core/config.hpp"
#include "cxfer/events/components.hpp"
#include "cxfer/events/event_bus.hpp"
#include "cxfer/remote/session.hpp"
#include "cxfer/remote/ssh_transport.hpp"
#include "cxfer/transfer/service.hpp"
#include "cxfer/transfer/summary.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <pthread.h>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace cxfer;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitAborted = 130;

struct Options {
    std::string host;
    fs::path local_file;
    std::optional<std::uint64_t> chunk_size;
    std::string remote_file;
    std::optional<fs::path> config_file;
    std::optional<std::string> user;
    std::optional<std::uint16_t> port;
    std::optional<fs::path> ledger_dir;
    bool partial = false;
    std::optional<fs::path> summary_json;
    std::optional<fs::path> log_file;
    bool debug = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <host> <local_file> [chunk_size_mb] [remote_file] [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE         JSON transfer settings\n"
              << "  --user NAME           SSH user name\n"
              << "  --port N              SSH port (default 22)\n"
              << "  --ledger-dir DIR      Where resume ledgers are kept (default .cxfer)\n"
              << "  --partial             Keep going after a chunk fails for good\n"
              << "  --summary-json FILE   Write the final summary as JSON\n"
              << "  --log-file FILE       Also log to FILE\n"
              << "  --debug               Verbose logging\n"
              << "  -h, --help            Show this help\n"
              << "\n"
              << "Environment:\n"
              << "  CXFER_PASSWORD        SSH password (public key auth when unset)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " switch01 nxos64.bin\n"
              << "  " << program << " switch01 nxos64.bin 50 bootflash:images/\n";
}

std::optional<Options> parse_arguments(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg == "--config") {
            auto value = next();
            if (!value) return std::nullopt;
            options.config_file = *value;
        } else if (arg == "--user") {
            auto value = next();
            if (!value) return std::nullopt;
            options.user = *value;
        } else if (arg == "--port") {
            auto value = next();
            if (!value) return std::nullopt;
            try {
                auto port = checked_port(std::stoll(*value));
                if (port.is_error()) {
                    spdlog::error("Invalid port {}: {}", *value, port.error().describe());
                    return std::nullopt;
                }
                options.port = port.value();
            } catch (const std::exception&) {
                spdlog::error("Invalid port: {}", *value);
                return std::nullopt;
            }
        } else if (arg == "--ledger-dir") {
            auto value = next();
            if (!value) return std::nullopt;
            options.ledger_dir = *value;
        } else if (arg == "--summary-json") {
            auto value = next();
            if (!value) return std::nullopt;
            options.summary_json = *value;
        } else if (arg == "--log-file") {
            auto value = next();
            if (!value) return std::nullopt;
            options.log_file = *value;
        } else if (arg == "--partial") {
            options.partial = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2 || positional.size() > 4) {
        return std::nullopt;
    }
    options.host = positional[0];
    options.local_file = positional[1];
    if (positional.size() >= 3) {
        try {
            auto size = chunk_size_from_mb(std::stod(positional[2]));
            if (size.is_error()) {
                spdlog::error("Invalid chunk size {}: {}", positional[2], size.error().describe());
                return std::nullopt;
            }
            options.chunk_size = size.value();
        } catch (const std::exception&) {
            spdlog::error("Invalid chunk size: {}", positional[2]);
            return std::nullopt;
        }
    }
    if (positional.size() == 4) {
        options.remote_file = positional[3];
    }
    return options;
}

void configure_logging(const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (options.log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string()));
    }
    auto logger = std::make_shared<spdlog::logger>("cxfer", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
}

std::optional<TransferConfig> build_config(const Options& options) {
    TransferConfig config;
    if (options.config_file) {
        auto loaded = load_config(*options.config_file);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return std::nullopt;
        }
        config = loaded.value();
    }

    config.endpoint.host = options.host;
    if (options.user) config.endpoint.username = *options.user;
    if (options.port) config.endpoint.port = *options.port;
    if (options.chunk_size) config.chunk_size = *options.chunk_size;
    if (options.ledger_dir) config.ledger_dir = *options.ledger_dir;
    if (options.partial) config.partial_success = true;
    if (const char* password = std::getenv("CXFER_PASSWORD")) {
        config.endpoint.password = password;
    }

    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("{}", valid.error().describe());
        return std::nullopt;
    }
    return config;
}

bool write_summary(const fs::path& path, const transfer::JobSummary& summary) {
    std::ofstream output(path);
    if (!output) {
        return false;
    }
    output << transfer::to_json(summary).dump(2) << '\n';
    return static_cast<bool>(output);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    try {
        configure_logging(*options);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log file: {}", e.what());
        return kExitUsage;
    }

    auto config = build_config(*options);
    if (!config) {
        return kExitUsage;
    }

    // Signals are taken by a dedicated thread so cancellation can use the token's mutex
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    CancellationToken cancel;
    std::thread signal_thread([&signals, &cancel]() {
        int received = 0;
        while (sigwait(&signals, &received) == 0) {
            if (received == SIGUSR1) {
                return;
            }
            spdlog::warn("Signal {} received, cancelling after the current step", received);
            cancel.cancel();
        }
    });

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    remote::SessionSettings settings;
    settings.connect_attempts = config->connect_attempts;
    settings.connect_backoff = config->connect_backoff;
    settings.command_timeout = config->command_timeout;

    remote::RemoteSession session(
        std::make_unique<remote::SshTransport>(config->endpoint, config->command_timeout), settings, &cancel);

    transfer::TransferService service(*config, session, bus);

    int exit_code = kExitFailed;
    auto job = service.prepare(options->local_file, options->remote_file);
    if (job.is_error()) {
        spdlog::error("{}", job.error().describe());
        exit_code = kExitUsage;
    } else {
        const auto summary = service.run(job.value(), cancel);

        const auto& stats = metrics.get_stats();
        spdlog::info("Uploads: {} attempts, {} retries, {} session refreshes, {} weak verifications",
                     stats.upload_attempts.load(), stats.retries.load(),
                     stats.session_refreshes.load(), stats.weak_verifications.load());

        if (options->summary_json && !write_summary(*options->summary_json, summary)) {
            spdlog::error("Failed to write summary to {}", options->summary_json->string());
        }

        switch (summary.state) {
            case transfer::JobState::Completed: exit_code = kExitOk; break;
            case transfer::JobState::Aborted: exit_code = kExitAborted; break;
            default: exit_code = kExitFailed; break;
        }
    }

    session.close();
    pthread_kill(signal_thread.native_handle(), SIGUSR1);
    signal_thread.join();
    spdlog::shutdown();
    return exit_code;
}
