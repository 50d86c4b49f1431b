#include "cxfer/transfer/job_ledger.hpp"

#include "cxfer/transfer/summary.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <system_error>

namespace cxfer::transfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::optional<LedgerRecord> parse_record(const std::string& line, const std::string& job_id) {
    const auto parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    try {
        if (parsed.at("job_id").get<std::string>() != job_id) {
            return std::nullopt;
        }
        const auto status = chunk_status_from_string(parsed.at("status").get<std::string>());
        if (!status) {
            return std::nullopt;
        }

        LedgerRecord record;
        record.index = parsed.at("index").get<std::uint32_t>();
        record.status = *status;
        record.attempts = parsed.value("attempts", 0u);
        record.verify_listings = parsed.value("verify_listings", 0u);
        record.verified_by = verification_method_from_string(parsed.value("verified_by", std::string("none")))
                                 .value_or(VerificationMethod::None);
        record.remote_path = parsed.at("remote_path").get<std::string>();
        record.length = parsed.at("length").get<std::uint64_t>();
        record.error = parsed.value("error", std::string());
        record.timestamp = parsed.value("timestamp", std::string());
        return record;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace

JobLedger::JobLedger(fs::path directory, std::string job_id)
    : directory_(std::move(directory)),
      job_id_(std::move(job_id)) {
    path_ = directory_ / (job_id_ + ".ledger.jsonl");
}

bool JobLedger::persistent() const {
    std::lock_guard lock(mutex_);
    return persistent_;
}

Result<void> JobLedger::disable(std::string reason) {
    persistent_ = false;
    spdlog::error("Ledger {} disabled, progress will not be resumable: {}", path_.string(), reason);
    return Err<void>(Error::ledger(std::move(reason)));
}

Result<std::map<std::uint32_t, LedgerRecord>> JobLedger::load(const std::vector<Chunk>& manifest) {
    std::map<std::uint32_t, LedgerRecord> records;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            return Err<std::map<std::uint32_t, LedgerRecord>>(
                Error::ledger("Cannot access " + path_.string() + ": " + ec.message()));
        }
        return Ok(std::move(records));
    }
    if (!fs::is_regular_file(path_, ec)) {
        return Err<std::map<std::uint32_t, LedgerRecord>>(
            Error::ledger(path_.string() + " is not a regular file"));
    }

    std::ifstream input(path_);
    if (!input) {
        return Err<std::map<std::uint32_t, LedgerRecord>>(Error::ledger("Cannot read " + path_.string()));
    }

    std::string line;
    std::size_t line_number = 0;
    std::size_t skipped = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto record = parse_record(line, job_id_);
        if (!record) {
            ++skipped;
            spdlog::debug("Ledger {}:{} is malformed, skipped", path_.string(), line_number);
            continue;
        }
        if (record->index >= manifest.size() ||
            manifest[record->index].length != record->length ||
            manifest[record->index].remote_path != record->remote_path) {
            ++skipped;
            spdlog::debug("Ledger {}:{} does not match the current plan, skipped", path_.string(), line_number);
            continue;
        }
        records[record->index] = std::move(*record);
    }

    if (skipped > 0) {
        spdlog::warn("Ignored {} unusable line(s) in ledger {}", skipped, path_.string());
    }
    return Ok(std::move(records));
}

Result<std::size_t> JobLedger::restore(TransferJob& job) {
    auto records = load(job.chunks());
    if (records.is_error()) {
        return Err<std::size_t>(records.error());
    }

    std::size_t restored = 0;
    for (auto& chunk : job.chunks()) {
        const auto it = records.value().find(chunk.index);
        if (it == records.value().end() || it->second.status != ChunkStatus::Verified) {
            continue;
        }
        chunk.status = ChunkStatus::Verified;
        chunk.attempts = it->second.attempts;
        chunk.verify_listings = it->second.verify_listings;
        chunk.verified_by = it->second.verified_by;
        chunk.resumed = true;
        ++restored;
    }
    if (restored > 0) {
        job.touch();
        spdlog::info("Resuming job {}: {}/{} chunks already verified", job.id(), restored, job.chunks().size());
    }
    return Ok(restored);
}

Result<void> JobLedger::record(const Chunk& chunk) {
    std::lock_guard lock(mutex_);
    if (!persistent_) {
        return Ok();
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return disable("Cannot create ledger directory " + directory_.string() + ": " + ec.message());
    }

    json line = {
        {"job_id", job_id_},
        {"index", chunk.index},
        {"status", to_string(chunk.status)},
        {"attempts", chunk.attempts},
        {"verify_listings", chunk.verify_listings},
        {"verified_by", to_string(chunk.verified_by)},
        {"remote_path", chunk.remote_path},
        {"length", chunk.length},
        {"error", chunk.last_error ? chunk.last_error->describe() : std::string()},
        {"timestamp", utc_timestamp()},
    };

    std::ofstream output(path_, std::ios::app);
    if (!output) {
        return disable("Cannot open " + path_.string() + " for append");
    }
    output << line.dump() << '\n';
    output.flush();
    if (!output) {
        return disable("Write to " + path_.string() + " failed");
    }
    return Ok();
}

JobSummary JobLedger::summarize(const TransferJob& job,
                                const std::optional<SpaceReport>& space,
                                std::chrono::milliseconds duration) const {
    return build_summary(job, space, duration);
}

} // namespace cxfer::transfer
