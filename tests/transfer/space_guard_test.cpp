#include "cxfer/transfer/space_guard.hpp"

#include "../support/fake_transport.hpp"

#include <gtest/gtest.h>

#include <memory>

using cxfer::ErrorKind;
using cxfer::fakes::FakeDevice;
using cxfer::fakes::FakeTransport;
using cxfer::remote::RemoteSession;
using cxfer::remote::SessionSettings;
using cxfer::transfer::SpaceGuard;
using cxfer::transfer::SpaceGuardOptions;

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

struct SpaceGuardFixture : ::testing::Test {
    std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>();
    RemoteSession session{std::make_unique<FakeTransport>(device), SessionSettings{}};

    SpaceGuard guard(double margin) {
        return SpaceGuard(session, SpaceGuardOptions{"bootflash:", "dir {path}", margin});
    }
};

} // namespace

TEST_F(SpaceGuardFixture, InsufficientSpaceIsRejected) {
    device->free_bytes = 500 * kMiB;
    const std::uint64_t required = 1126 * kMiB;  // 1.1 GiB

    auto report = guard(1.1).check(required);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::Space);
    EXPECT_EQ(device->pushes.load(), 0);
}

TEST_F(SpaceGuardFixture, SufficientSpacePasses) {
    device->free_bytes = 2048 * kMiB;

    auto report = guard(1.15).check(1000 * kMiB);
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_TRUE(report.value().free_known());
    EXPECT_TRUE(report.value().sufficient());
    EXPECT_FALSE(report.value().warning);
    EXPECT_EQ(report.value().budget(), static_cast<std::uint64_t>(1000 * kMiB * 1.15));
    EXPECT_EQ(device->count_commands("dir bootflash:"), 1);
}

TEST_F(SpaceGuardFixture, MarginIsApplied) {
    device->free_bytes = 1100;

    EXPECT_TRUE(guard(1.0).check(1100).is_ok());
    EXPECT_TRUE(guard(1.1).check(1000).is_ok());
    EXPECT_TRUE(guard(1.2).check(1000).is_error());
}

TEST_F(SpaceGuardFixture, UnknownFreeSpaceIsFlagged) {
    device->free_bytes.reset();

    auto report = guard(1.15).check(10 * kMiB);
    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().free_known());
    EXPECT_TRUE(report.value().warning);
}

TEST_F(SpaceGuardFixture, ConnectionErrorsPropagate) {
    device->reject_auth = true;

    auto report = guard(1.15).check(10);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::Connection);
}
