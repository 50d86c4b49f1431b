#pragma once

#include "cxfer/core/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace cxfer::remote {

/**
 * @brief Background thread that keeps an idle management session alive
 *
 * WHAT IT DOES:
 * Every interval it runs the probe (a side-effect-free CLI command issued
 * through the session's serialized command path). Failures are counted and
 * logged at debug level. They are expected while a large upload saturates the
 * link and never fail the job.
 *
 * LIFECYCLE:
 * - start() spawns the thread, calling it twice is a no-op
 * - stop() wakes the thread and joins it; no probe runs after stop() returns
 * - the destructor calls stop()
 */
class KeepaliveMonitor {
public:
    using Probe = std::function<Result<void>()>;

    KeepaliveMonitor(Probe probe, std::chrono::milliseconds interval);
    ~KeepaliveMonitor();

    KeepaliveMonitor(const KeepaliveMonitor&) = delete;
    KeepaliveMonitor& operator=(const KeepaliveMonitor&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool running() const;
    [[nodiscard]] std::uint64_t probes_sent() const noexcept { return probes_sent_.load(); }
    [[nodiscard]] std::uint64_t probes_failed() const noexcept { return probes_failed_.load(); }

private:
    void run();

    Probe probe_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread thread_;

    std::atomic<std::uint64_t> probes_sent_{0};
    std::atomic<std::uint64_t> probes_failed_{0};
};

} // namespace cxfer::remote
