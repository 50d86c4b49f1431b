#include "cxfer/remote/keepalive.hpp"

#include <spdlog/spdlog.h>

namespace cxfer::remote {

KeepaliveMonitor::KeepaliveMonitor(Probe probe, std::chrono::milliseconds interval)
    : probe_(std::move(probe)), interval_(interval) {}

KeepaliveMonitor::~KeepaliveMonitor() {
    stop();
}

void KeepaliveMonitor::start() {
    std::lock_guard lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stop_requested_ = false;
    thread_ = std::thread(&KeepaliveMonitor::run, this);
    spdlog::debug("Keepalive started, interval={}ms", interval_.count());
}

void KeepaliveMonitor::stop() {
    std::thread worker;
    {
        std::lock_guard lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        stop_requested_ = true;
        worker = std::move(thread_);
    }
    cv_.notify_all();
    worker.join();
    spdlog::debug("Keepalive stopped after {} probes ({} failed)",
                  probes_sent_.load(), probes_failed_.load());
}

bool KeepaliveMonitor::running() const {
    std::lock_guard lock(mutex_);
    return thread_.joinable() && !stop_requested_;
}

void KeepaliveMonitor::run() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        // Probe without holding the lock so stop() is never blocked behind a slow command
        lock.unlock();
        ++probes_sent_;
        auto result = probe_();
        if (result.is_error()) {
            ++probes_failed_;
            spdlog::debug("Keepalive probe failed (normal during active transfer): {}",
                          result.error().describe());
        }
        lock.lock();
    }
}

} // namespace cxfer::remote
