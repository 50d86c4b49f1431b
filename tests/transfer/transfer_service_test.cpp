#include "cxfer/transfer/service.hpp"

#include "cxfer/events/events.hpp"

#include "../support/fake_transport.hpp"
#include "../support/scratch_dir.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

using cxfer::CancellationToken;
using cxfer::Error;
using cxfer::ErrorDetail;
using cxfer::ErrorKind;
using cxfer::TransferConfig;
using cxfer::events::EventBus;
using cxfer::events::SpaceCheckedEvent;
using cxfer::events::TransferFinishedEvent;
using cxfer::events::TransferStartedEvent;
using cxfer::fakes::FakeDevice;
using cxfer::fakes::FakeTransport;
using cxfer::fakes::ScratchDir;
using cxfer::remote::RemoteSession;
using cxfer::remote::SessionSettings;
using cxfer::transfer::ChunkStatus;
using cxfer::transfer::JobState;
using cxfer::transfer::JobSummary;
using cxfer::transfer::TransferService;

namespace {

constexpr std::uint64_t kChunk = 1000;

SessionSettings quick_settings() {
    SessionSettings settings;
    settings.connect_attempts = 2;
    settings.connect_backoff = std::chrono::milliseconds(0);
    settings.command_timeout = std::chrono::seconds(5);
    return settings;
}

struct TransferServiceFixture : ::testing::Test {
    ScratchDir scratch{"service"};
    std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>();
    RemoteSession session{std::make_unique<FakeTransport>(device), quick_settings()};
    EventBus bus;
    TransferConfig config;

    std::vector<JobSummary> finished;
    int started = 0;
    int space_checks = 0;

    void SetUp() override {
        config.chunk_size = kChunk;
        config.staging_dir = scratch / "staging";
        config.ledger_dir = scratch / "ledger";
        config.retry_backoff = std::chrono::milliseconds(0);
        config.verify_delay = std::chrono::milliseconds(0);
        config.settle_delay = std::chrono::milliseconds(0);
        config.connect_backoff = std::chrono::milliseconds(0);

        bus.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) { finished.push_back(e.summary); });
        bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) { ++started; });
        bus.subscribe<SpaceCheckedEvent>([this](const SpaceCheckedEvent&) { ++space_checks; });
    }

    std::filesystem::path source(std::uint64_t size) {
        const auto path = scratch / "nxos64.bin";
        cxfer::fakes::write_pattern_file(path, size);
        return path;
    }

    JobSummary transfer(const std::filesystem::path& file, const std::string& target = "") {
        TransferService service(config, session, bus);
        auto job = service.prepare(file, target);
        EXPECT_TRUE(job.is_ok()) << job.error().describe();
        CancellationToken cancel;
        return service.run(job.value(), cancel);
    }
};

} // namespace

TEST(ResolveRemoteTargetTest, FillsInSourceName) {
    using cxfer::transfer::resolve_remote_target;
    const std::filesystem::path src = "/images/nxos64.bin";

    EXPECT_EQ(resolve_remote_target("", src, "bootflash:"), "bootflash:nxos64.bin");
    EXPECT_EQ(resolve_remote_target("usb1:", src, "bootflash:"), "usb1:nxos64.bin");
    EXPECT_EQ(resolve_remote_target("bootflash:images/", src, "bootflash:"), "bootflash:images/nxos64.bin");
    EXPECT_EQ(resolve_remote_target("bootflash:new.bin", src, "bootflash:"), "bootflash:new.bin");
}

TEST_F(TransferServiceFixture, PrepareRejectsMissingAndEmptyFiles) {
    TransferService service(config, session, bus);

    auto missing = service.prepare(scratch / "absent.bin", "");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Usage);

    const auto empty = source(0);
    auto zero = service.prepare(empty, "");
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error().kind, ErrorKind::Usage);
    EXPECT_EQ(device->command_opens.load(), 0);
}

TEST_F(TransferServiceFixture, PreparePlacesChunksBesideTarget) {
    TransferService service(config, session, bus);
    auto job = service.prepare(source(2500), "bootflash:images/");
    ASSERT_TRUE(job.is_ok());

    EXPECT_EQ(job.value().remote_target(), "bootflash:images/nxos64.bin");
    ASSERT_EQ(job.value().chunks().size(), 3u);
    const auto prefix = "bootflash:images/nxos64_" + job.value().id().substr(0, 8) + "_chunk_";
    EXPECT_EQ(job.value().chunks()[0].remote_path, prefix + "000.bin");
    EXPECT_EQ(job.value().chunks()[2].remote_path, prefix + "002.bin");
    EXPECT_EQ(job.value().state(), JobState::Planned);
}

TEST_F(TransferServiceFixture, CompletesAndReportsGuidance) {
    auto summary = transfer(source(4 * kChunk + 1));

    EXPECT_EQ(summary.state, JobState::Completed);
    EXPECT_EQ(summary.verified_count, 5u);
    EXPECT_EQ(summary.verified_bytes, 4 * kChunk + 1);
    EXPECT_TRUE(summary.missing_chunks.empty());
    EXPECT_TRUE(summary.bad_chunks.empty());
    EXPECT_TRUE(summary.reassembly_required);
    EXPECT_FALSE(summary.reassembly_guidance.empty());
    ASSERT_TRUE(summary.space.has_value());
    EXPECT_EQ(summary.space->required_bytes, 4 * kChunk + 1);

    EXPECT_EQ(started, 1);
    EXPECT_EQ(space_checks, 1);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].job_id, summary.job_id);
    EXPECT_EQ(device->count_commands("show version"), 1);
}

TEST_F(TransferServiceFixture, InsufficientSpaceFailsBeforeAnyUpload) {
    device->free_bytes = 500;
    auto summary = transfer(source(3 * kChunk));

    EXPECT_EQ(summary.state, JobState::Failed);
    EXPECT_NE(summary.error.find("SpaceError"), std::string::npos);
    EXPECT_EQ(device->pushes.load(), 0);
    EXPECT_EQ(started, 0);
    EXPECT_EQ(summary.missing_chunks.size(), 3u);
    ASSERT_EQ(finished.size(), 1u);
}

TEST_F(TransferServiceFixture, UnknownSpaceFollowsPolicy) {
    device->free_bytes.reset();
    config.allow_unknown_space = false;
    auto refused = transfer(source(2 * kChunk));
    EXPECT_EQ(refused.state, JobState::Failed);
    EXPECT_EQ(device->pushes.load(), 0);

    config.allow_unknown_space = true;
    auto allowed = transfer(source(2 * kChunk));
    EXPECT_EQ(allowed.state, JobState::Completed);
    ASSERT_TRUE(allowed.space.has_value());
    EXPECT_TRUE(allowed.space->warning);
}

TEST_F(TransferServiceFixture, AuthenticationFailureFailsJob) {
    device->reject_auth = true;
    auto summary = transfer(source(kChunk));

    EXPECT_EQ(summary.state, JobState::Failed);
    EXPECT_NE(summary.error.find("auth-failed"), std::string::npos);
    EXPECT_EQ(device->command_opens.load(), 1);
    EXPECT_EQ(device->pushes.load(), 0);
    ASSERT_EQ(finished.size(), 1u);
}

TEST_F(TransferServiceFixture, RerunAfterCompletionUploadsNothing) {
    const auto file = source(3 * kChunk);
    auto first = transfer(file);
    ASSERT_EQ(first.state, JobState::Completed);
    const int pushes = device->pushes.load();

    auto second = transfer(file);
    EXPECT_EQ(second.state, JobState::Completed);
    EXPECT_EQ(second.job_id, first.job_id);
    EXPECT_EQ(device->pushes.load(), pushes);
    for (const auto& chunk : second.chunks) {
        EXPECT_TRUE(chunk.resumed);
        EXPECT_EQ(chunk.status, ChunkStatus::Verified);
    }
    EXPECT_EQ(space_checks, 1);
}

TEST_F(TransferServiceFixture, ResumeUploadsOnlyUnfinishedChunks) {
    config.max_retries = 0;
    device->push_hook = [](const std::string& path, int) -> std::optional<Error> {
        if (path.find("_chunk_002") != std::string::npos) {
            return Error::upload(ErrorDetail::Timeout, "link dropped");
        }
        return std::nullopt;
    };
    const auto file = source(4 * kChunk);

    auto first = transfer(file);
    ASSERT_EQ(first.state, JobState::Failed);
    EXPECT_EQ(first.bad_chunks, std::vector<std::uint32_t>{2});
    EXPECT_EQ(first.missing_chunks, std::vector<std::uint32_t>{3});

    device->push_hook = nullptr;
    auto second = transfer(file);
    EXPECT_EQ(second.state, JobState::Completed);
    EXPECT_TRUE(second.chunks[0].resumed);
    EXPECT_TRUE(second.chunks[1].resumed);
    EXPECT_FALSE(second.chunks[2].resumed);
    EXPECT_EQ(device->pushes_of(second.chunks[0].remote_path), 1);
    EXPECT_EQ(device->pushes_of(second.chunks[2].remote_path), 2);
    EXPECT_EQ(device->pushes_of(second.chunks[3].remote_path), 1);
    ASSERT_TRUE(second.space.has_value());
    EXPECT_EQ(second.space->required_bytes, 2 * kChunk);
}

TEST_F(TransferServiceFixture, UnwritableLedgerDirectoryStillCompletes) {
    const auto blocker = scratch / "ledger_blocker";
    {
        std::ofstream out(blocker);
        out << "file in the way";
    }
    config.ledger_dir = blocker / "ledgers";

    auto summary = transfer(source(3 * kChunk));

    EXPECT_EQ(summary.state, JobState::Completed);
    EXPECT_EQ(summary.verified_count, 3u);
    for (const auto& chunk : summary.chunks) {
        EXPECT_EQ(chunk.status, ChunkStatus::Verified);
    }
    EXPECT_TRUE(summary.error.empty());
    EXPECT_EQ(device->pushes.load(), 3);
    EXPECT_TRUE(std::filesystem::is_regular_file(blocker));
}

TEST_F(TransferServiceFixture, UnreadableLedgerStartsWithoutResume) {
    const auto file = source(2 * kChunk);
    {
        TransferService service(config, session, bus);
        auto job = service.prepare(file, "");
        ASSERT_TRUE(job.is_ok());
        std::filesystem::create_directories(config.ledger_dir / (job.value().id() + ".ledger.jsonl"));
    }

    auto summary = transfer(file);

    EXPECT_EQ(summary.state, JobState::Completed);
    EXPECT_EQ(summary.verified_count, 2u);
    for (const auto& chunk : summary.chunks) {
        EXPECT_FALSE(chunk.resumed);
    }
    EXPECT_EQ(device->pushes.load(), 2);
}

TEST_F(TransferServiceFixture, KeepaliveNeverOverlapsTransferCommands) {
    config.keepalive_interval = std::chrono::milliseconds(5);
    device->push_delay = std::chrono::milliseconds(25);
    device->command_delay = std::chrono::milliseconds(2);

    auto summary = transfer(source(4 * kChunk));

    EXPECT_EQ(summary.state, JobState::Completed);
    EXPECT_FALSE(device->overlapping_commands.load());
    EXPECT_GT(device->count_commands("show clock"), 0);
    ASSERT_NE(session.keepalive(), nullptr);
    EXPECT_FALSE(session.keepalive()->running());
}

TEST_F(TransferServiceFixture, CancelledBeforeStartIsAborted) {
    TransferService service(config, session, bus);
    auto job = service.prepare(source(2 * kChunk), "");
    ASSERT_TRUE(job.is_ok());

    CancellationToken cancel;
    cancel.cancel();
    auto summary = service.run(job.value(), cancel);

    EXPECT_EQ(summary.state, JobState::Aborted);
    EXPECT_EQ(device->pushes.load(), 0);
    ASSERT_EQ(finished.size(), 1u);
}
