#pragma once

#include "cxfer/core/result.hpp"
#include "cxfer/remote/session.hpp"
#include "cxfer/transfer/types.hpp"

#include <cstdint>
#include <string>

namespace cxfer::transfer {

struct SpaceGuardOptions {
    std::string filesystem = "bootflash:";
    std::string listing_command = "dir {path}";
    double margin = 1.15;
};

/**
 * @brief Pre-flight check that the remote filesystem can hold the chunks
 *
 * check() fails with a Space error only when free space is known and below
 * `required * margin`. Unknown free space yields a report with the warning
 * flag set; whether to proceed is the caller's decision.
 */
class SpaceGuard {
public:
    SpaceGuard(remote::RemoteSession& session, SpaceGuardOptions options);

    Result<SpaceReport> check(std::uint64_t required_bytes);

private:
    remote::RemoteSession& session_;
    SpaceGuardOptions options_;
};

} // namespace cxfer::transfer
