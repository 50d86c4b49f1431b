#include "cxfer/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace cxfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Millis seconds_to_millis(double seconds) {
    return std::chrono::duration_cast<Millis>(std::chrono::duration<double>(seconds));
}

void read_duration(const json& j, const char* key, Millis& target) {
    if (j.contains(key)) {
        target = seconds_to_millis(j.at(key).get<double>());
    }
}

template<typename T>
void read_value(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

Result<void> apply_endpoint(const json& j, EndpointConfig& endpoint) {
    if (j.contains("port")) {
        auto port = checked_port(j.at("port").get<long long>());
        if (port.is_error()) {
            return Err<void>(port.error());
        }
        endpoint.port = port.value();
    }
    read_value(j, "host", endpoint.host);
    read_value(j, "username", endpoint.username);
    read_value(j, "password", endpoint.password);
    read_value(j, "strict_host_key", endpoint.strict_host_key);
    return Ok();
}

void apply_commands(const json& j, CommandTemplates& commands) {
    read_value(j, "listing_command", commands.listing);
    read_value(j, "delete_command", commands.remove);
    read_value(j, "probe_command", commands.probe);
    read_value(j, "checksum_command", commands.checksum);
    read_value(j, "keepalive_command", commands.keepalive);
    read_value(j, "version_command", commands.version);
}

Result<void> apply(const json& j, TransferConfig& config) {
    if (j.contains("endpoint")) {
        if (auto endpoint = apply_endpoint(j.at("endpoint"), config.endpoint); endpoint.is_error()) {
            return endpoint;
        }
    }
    if (j.contains("commands")) {
        apply_commands(j.at("commands"), config.commands);
    }

    if (j.contains("chunk_size_mb")) {
        auto size = chunk_size_from_mb(j.at("chunk_size_mb").get<double>());
        if (size.is_error()) {
            return Err<void>(size.error());
        }
        config.chunk_size = size.value();
    }
    read_value(j, "chunk_size_bytes", config.chunk_size);
    read_value(j, "max_retries", config.max_retries);
    read_duration(j, "chunk_timeout_s", config.chunk_timeout);
    read_duration(j, "command_timeout_s", config.command_timeout);
    read_duration(j, "keepalive_interval_s", config.keepalive_interval);

    read_value(j, "space_margin", config.space_margin);
    read_value(j, "allow_unknown_space", config.allow_unknown_space);
    read_value(j, "recheck_space", config.recheck_space);
    read_value(j, "remote_filesystem", config.remote_filesystem);

    if (j.contains("staging_dir")) {
        config.staging_dir = j.at("staging_dir").get<std::string>();
    }
    if (j.contains("ledger_dir")) {
        config.ledger_dir = j.at("ledger_dir").get<std::string>();
    }

    read_value(j, "connect_attempts", config.connect_attempts);
    read_duration(j, "connect_backoff_s", config.connect_backoff);
    read_duration(j, "retry_backoff_s", config.retry_backoff);

    read_value(j, "verify_attempts", config.verify_attempts);
    read_duration(j, "verify_delay_s", config.verify_delay);
    read_duration(j, "settle_delay_s", config.settle_delay);
    read_value(j, "accept_read_probe", config.accept_read_probe);
    read_value(j, "verify_checksum", config.verify_checksum);

    read_value(j, "refresh_every_chunks", config.refresh_every_chunks);
    read_value(j, "partial_success", config.partial_success);
    return Ok();
}

} // namespace

Result<void> TransferConfig::validate() const {
    if (chunk_size == 0) {
        return Err<void>(Error::usage("chunk size must be > 0"));
    }
    if (chunk_size > kMaxChunkSize) {
        return Err<void>(Error::usage("chunk size must be <= " + std::to_string(kMaxChunkSize / kMiB) + " MiB"));
    }
    if (endpoint.port == 0) {
        return Err<void>(Error::usage("port must be in 1..65535"));
    }
    if (max_retries < 0) {
        return Err<void>(Error::usage("max_retries must be >= 0"));
    }
    if (space_margin < 1.0) {
        return Err<void>(Error::usage("space_margin must be >= 1.0"));
    }
    if (verify_attempts < 1) {
        return Err<void>(Error::usage("verify_attempts must be >= 1"));
    }
    if (connect_attempts < 1) {
        return Err<void>(Error::usage("connect_attempts must be >= 1"));
    }
    if (remote_filesystem.empty()) {
        return Err<void>(Error::usage("remote_filesystem must not be empty"));
    }
    if (keepalive_interval <= Millis::zero()) {
        return Err<void>(Error::usage("keepalive_interval must be > 0"));
    }
    return Ok();
}

Result<TransferConfig> parse_config(const std::string& json_text, TransferConfig base) {
    try {
        const auto j = json::parse(json_text);
        if (!j.is_object()) {
            return Err<TransferConfig>(Error::usage("config root must be a JSON object"));
        }
        if (auto applied = apply(j, base); applied.is_error()) {
            return Err<TransferConfig>(applied.error());
        }
    } catch (const json::exception& e) {
        return Err<TransferConfig>(Error::usage(std::string("invalid config: ") + e.what()));
    }

    if (auto valid = base.validate(); valid.is_error()) {
        return Err<TransferConfig>(valid.error());
    }
    return Ok(std::move(base));
}

Result<TransferConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(Error::io("Failed to open config file: " + path.string()));
    }
    std::ostringstream text;
    text << input.rdbuf();

    auto config = parse_config(text.str());
    if (config.is_ok()) {
        spdlog::debug("Loaded config from {}", path.string());
    }
    return config;
}

Result<std::uint16_t> checked_port(long long value) {
    if (value < 1 || value > 65535) {
        return Err<std::uint16_t>(Error::usage("port must be in 1..65535, got " + std::to_string(value)));
    }
    return Ok(static_cast<std::uint16_t>(value));
}

Result<std::uint64_t> chunk_size_from_mb(double mb) {
    constexpr double kMaxMb = static_cast<double>(TransferConfig::kMaxChunkSize / TransferConfig::kMiB);
    if (!(mb > 0.0) || mb > kMaxMb) {
        return Err<std::uint64_t>(Error::usage("chunk size must be > 0 and <= " +
                                               std::to_string(TransferConfig::kMaxChunkSize / TransferConfig::kMiB) +
                                               " MiB"));
    }
    const auto bytes = static_cast<std::uint64_t>(mb * static_cast<double>(TransferConfig::kMiB));
    if (bytes == 0) {
        return Err<std::uint64_t>(Error::usage("chunk size rounds to 0 bytes"));
    }
    return Ok(bytes);
}

std::string render_command(const std::string& command_template, const std::string& path) {
    static const std::string placeholder = "{path}";
    std::string rendered = command_template;
    std::size_t pos = 0;
    while ((pos = rendered.find(placeholder, pos)) != std::string::npos) {
        rendered.replace(pos, placeholder.size(), path);
        pos += path.size();
    }
    return rendered;
}

} // namespace cxfer
