#include <gtest/gtest.h>
#include "cxfer/events/event_bus.hpp"
#include "cxfer/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cxfer::events;

namespace {

ChunkVerifiedEvent verified(std::uint32_t index, std::uint64_t bytes) {
    ChunkVerifiedEvent event;
    event.job_id = "job-1";
    event.chunk_index = index;
    event.total_chunks = 4;
    event.bytes = bytes;
    event.attempts = 1;
    event.verify_listings = 1;
    event.method = cxfer::transfer::VerificationMethod::Size;
    return event;
}

} // namespace

TEST(EventBus, DeliversOnlyToSubscribersOfThatEvent) {
    EventBus bus;
    std::vector<std::uint32_t> verified_chunks;
    int refreshes = 0;

    bus.subscribe<ChunkVerifiedEvent>([&](const ChunkVerifiedEvent& e) { verified_chunks.push_back(e.chunk_index); });
    bus.subscribe<SessionRefreshedEvent>([&](const SessionRefreshedEvent&) { ++refreshes; });

    bus.emit(verified(0, 100));
    bus.emit(SessionRefreshedEvent{"job-1", "periodic", true});
    bus.emit(verified(1, 100));
    bus.emit(ChunkProgressEvent{"job-1", 2, 50, 100, 50});

    EXPECT_EQ(verified_chunks, (std::vector<std::uint32_t>{0, 1}));
    EXPECT_EQ(refreshes, 1);
}

TEST(EventBus, ThrowingObserverDoesNotReachTheWorker) {
    EventBus bus;
    int delivered = 0;

    bus.subscribe<ChunkFailedEvent>([](const ChunkFailedEvent&) {
        throw std::runtime_error("progress display broke");
    });
    bus.subscribe<ChunkFailedEvent>([](const ChunkFailedEvent&) {
        throw 42;
    });
    bus.subscribe<ChunkFailedEvent>([&](const ChunkFailedEvent&) { ++delivered; });

    ChunkFailedEvent failed;
    failed.job_id = "job-1";
    failed.chunk_index = 6;
    failed.attempt = 3;
    failed.error = cxfer::Error::upload(cxfer::ErrorDetail::Timeout, "stalled");
    failed.terminal = true;

    EXPECT_NO_THROW(bus.emit(failed));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, UnsubscribedObserverStopsReceiving) {
    EventBus bus;
    int progress = 0;
    auto id = bus.subscribe<ChunkProgressEvent>([&](const ChunkProgressEvent&) { ++progress; });

    bus.emit(ChunkProgressEvent{"job-1", 0, 10, 100, 10});
    bus.unsubscribe<ChunkProgressEvent>(id);
    bus.emit(ChunkProgressEvent{"job-1", 0, 20, 100, 20});

    EXPECT_EQ(progress, 1);
    EXPECT_EQ(bus.subscriber_count<ChunkProgressEvent>(), 0u);
}

TEST(EventBus, KeepaliveAndWorkerThreadsEmitConcurrently) {
    EventBus bus;
    std::atomic<std::uint64_t> verified_bytes{0};
    std::atomic<int> refreshes{0};

    bus.subscribe<ChunkVerifiedEvent>([&](const ChunkVerifiedEvent& e) { verified_bytes += e.bytes; });
    bus.subscribe<SessionRefreshedEvent>([&](const SessionRefreshedEvent&) { ++refreshes; });

    std::thread worker([&bus]() {
        for (std::uint32_t i = 0; i < 200; ++i) {
            bus.emit(verified(i, 10));
        }
    });
    std::thread keepalive([&bus]() {
        for (int i = 0; i < 200; ++i) {
            bus.emit(SessionRefreshedEvent{"job-1", "keepalive", true});
        }
    });
    worker.join();
    keepalive.join();

    EXPECT_EQ(verified_bytes.load(), 2000u);
    EXPECT_EQ(refreshes.load(), 200);
}

TEST(EventBus, HandlerMayEmitFollowUpEvent) {
    EventBus bus;
    int refreshes = 0;

    bus.subscribe<ChunkVerifiedEvent>([&bus](const ChunkVerifiedEvent& e) {
        if (e.chunk_index == 2) {
            bus.emit(SessionRefreshedEvent{e.job_id, "periodic", true});
        }
    });
    bus.subscribe<SessionRefreshedEvent>([&](const SessionRefreshedEvent&) { ++refreshes; });

    for (std::uint32_t i = 0; i < 4; ++i) {
        bus.emit(verified(i, 1));
    }
    EXPECT_EQ(refreshes, 1);
}
