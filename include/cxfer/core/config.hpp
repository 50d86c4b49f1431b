#pragma once

#include "cxfer/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cxfer {

using Millis = std::chrono::milliseconds;

/**
 * @brief SSH endpoint of the appliance
 */
struct EndpointConfig {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;          ///< Empty selects public key authentication
    bool strict_host_key = false;  ///< Reject hosts missing from known_hosts
};

/**
 * @brief Device CLI commands, `{path}` is replaced by the remote path
 */
struct CommandTemplates {
    std::string listing = "dir {path}";
    std::string remove = "delete {path} no-prompt";
    std::string probe = "show file {path} | head";
    std::string checksum = "show file {path} md5sum";
    std::string keepalive = "show clock";
    std::string version = "show version";
};

/**
 * @brief Operator-tunable parameters of a chunked transfer
 */
struct TransferConfig {
    static constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
    static constexpr std::uint64_t kMaxChunkSize = 64ULL * 1024ULL * kMiB;

    EndpointConfig endpoint;
    CommandTemplates commands;

    std::uint64_t chunk_size = 100 * kMiB;
    int max_retries = 2;
    Millis chunk_timeout{std::chrono::minutes(20)};
    Millis command_timeout{std::chrono::seconds(90)};
    Millis keepalive_interval{std::chrono::seconds(30)};

    double space_margin = 1.15;
    bool allow_unknown_space = true;
    bool recheck_space = false;
    std::string remote_filesystem = "bootflash:";

    std::filesystem::path staging_dir = std::filesystem::temp_directory_path();
    std::filesystem::path ledger_dir = ".cxfer";

    int connect_attempts = 3;
    Millis connect_backoff{std::chrono::seconds(20)};
    Millis retry_backoff{std::chrono::seconds(30)};

    int verify_attempts = 3;
    Millis verify_delay{std::chrono::seconds(5)};
    Millis settle_delay{std::chrono::seconds(3)};
    bool accept_read_probe = true;
    bool verify_checksum = false;

    int refresh_every_chunks = 5;
    bool partial_success = false;

    Result<void> validate() const;
};

/**
 * @brief Load a config from a JSON file, absent keys keep their defaults
 */
Result<TransferConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Apply JSON text on top of an existing config
 */
Result<TransferConfig> parse_config(const std::string& json_text, TransferConfig base = {});

/**
 * @brief Accept an SSH port in 1..65535
 */
Result<std::uint16_t> checked_port(long long value);

/**
 * @brief Convert a chunk size given in MiB to bytes
 *
 * Rejects sizes that are not positive or exceed TransferConfig::kMaxChunkSize.
 */
Result<std::uint64_t> chunk_size_from_mb(double mb);

/**
 * @brief Replace every `{path}` occurrence in a command template
 */
std::string render_command(const std::string& command_template, const std::string& path);

} // namespace cxfer
