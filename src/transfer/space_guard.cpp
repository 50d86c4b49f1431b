#include "cxfer/transfer/space_guard.hpp"

#include "cxfer/core/config.hpp"
#include "cxfer/remote/listing.hpp"

#include <spdlog/spdlog.h>

namespace cxfer::transfer {

SpaceGuard::SpaceGuard(remote::RemoteSession& session, SpaceGuardOptions options)
    : session_(session),
      options_(std::move(options)) {}

Result<SpaceReport> SpaceGuard::check(std::uint64_t required_bytes) {
    SpaceReport report;
    report.required_bytes = required_bytes;
    report.margin = options_.margin;

    auto listing = session_.command(render_command(options_.listing_command, options_.filesystem));
    if (listing.is_error()) {
        return Err<SpaceReport>(listing.error());
    }

    report.free_bytes = remote::parse_bytes_free(listing.value());
    if (!report.free_bytes) {
        report.warning = true;
        spdlog::warn("Could not read free space of {} from listing", options_.filesystem);
        return Ok(std::move(report));
    }

    spdlog::info("Space check on {}: free={} required={} budget={} (margin {:.2f})",
                 options_.filesystem, *report.free_bytes, required_bytes, report.budget(), report.margin);

    if (!report.sufficient()) {
        return Err<SpaceReport>(Error::space(
            "Insufficient space on " + options_.filesystem + ": need " +
            std::to_string(report.budget()) + " bytes (" + std::to_string(required_bytes) +
            " with margin), " + std::to_string(*report.free_bytes) + " bytes free"));
    }
    return Ok(std::move(report));
}

} // namespace cxfer::transfer
