#include "cxfer/remote/session.hpp"

#include "../support/fake_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

using cxfer::Error;
using cxfer::ErrorDetail;
using cxfer::ErrorKind;
using cxfer::fakes::FakeDevice;
using cxfer::fakes::FakeTransport;
using cxfer::remote::RemoteSession;
using cxfer::remote::SessionHealth;
using cxfer::remote::SessionSettings;

namespace {

SessionSettings fast_settings(int attempts = 3) {
    SessionSettings settings;
    settings.connect_attempts = attempts;
    settings.connect_backoff = std::chrono::milliseconds(0);
    settings.command_timeout = std::chrono::seconds(5);
    return settings;
}

std::unique_ptr<RemoteSession> make_session(const std::shared_ptr<FakeDevice>& device, int attempts = 3,
                                            const cxfer::CancellationToken* cancel = nullptr) {
    return std::make_unique<RemoteSession>(std::make_unique<FakeTransport>(device), fast_settings(attempts), cancel);
}

} // namespace

TEST(RemoteSessionTest, ConnectRetriesTransientFailures) {
    auto device = std::make_shared<FakeDevice>();
    device->connect_failures.push_back(Error::connection(ErrorDetail::Timeout, "timed out"));
    device->connect_failures.push_back(Error::connection(ErrorDetail::Unreachable, "no route"));
    auto session = make_session(device);

    auto connected = session->connect();
    ASSERT_TRUE(connected.is_ok()) << connected.error().describe();
    EXPECT_EQ(device->command_opens.load(), 3);
    EXPECT_EQ(session->health(), SessionHealth::Healthy);
}

TEST(RemoteSessionTest, ConnectGivesUpAfterBoundedAttempts) {
    auto device = std::make_shared<FakeDevice>();
    for (int i = 0; i < 5; ++i) {
        device->connect_failures.push_back(Error::connection(ErrorDetail::Timeout, "timed out"));
    }
    auto session = make_session(device, 2);

    auto connected = session->connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error().detail, ErrorDetail::Timeout);
    EXPECT_EQ(device->command_opens.load(), 2);
    EXPECT_EQ(session->health(), SessionHealth::Disconnected);
}

TEST(RemoteSessionTest, AuthenticationFailureIsNeverRetried) {
    auto device = std::make_shared<FakeDevice>();
    device->reject_auth = true;
    auto session = make_session(device);

    auto connected = session->connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error().detail, ErrorDetail::AuthFailed);
    EXPECT_EQ(device->command_opens.load(), 1);
}

TEST(RemoteSessionTest, ConnectBackoffIsCancellable) {
    auto device = std::make_shared<FakeDevice>();
    device->connect_failures.push_back(Error::connection(ErrorDetail::Timeout, "timed out"));
    cxfer::CancellationToken cancel;
    cancel.cancel();

    SessionSettings settings = fast_settings();
    settings.connect_backoff = std::chrono::seconds(60);
    RemoteSession session(std::make_unique<FakeTransport>(device), settings, &cancel);

    auto connected = session.connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error().kind, ErrorKind::Cancelled);
}

TEST(RemoteSessionTest, CommandReconnectsOnDemand) {
    auto device = std::make_shared<FakeDevice>();
    auto session = make_session(device);

    auto output = session->command("show clock");
    ASSERT_TRUE(output.is_ok());
    EXPECT_NE(output.value().find("UTC"), std::string::npos);
    EXPECT_EQ(device->command_opens.load(), 1);
    EXPECT_EQ(session->health(), SessionHealth::Healthy);
}

TEST(RemoteSessionTest, IdentifyReadsDeviceName) {
    auto device = std::make_shared<FakeDevice>();
    auto session = make_session(device);
    ASSERT_TRUE(session->connect().is_ok());

    auto identity = session->identify("show version");
    ASSERT_TRUE(identity.is_ok());
    ASSERT_TRUE(identity.value().has_value());
    EXPECT_EQ(*identity.value(), "fake-switch");
}

TEST(RemoteSessionTest, BulkChannelIsClosedBeforeReplacement) {
    auto device = std::make_shared<FakeDevice>();
    auto session = make_session(device);
    ASSERT_TRUE(session->connect().is_ok());

    ASSERT_TRUE(session->ensure_bulk_channel().is_ok());
    ASSERT_TRUE(session->ensure_bulk_channel().is_ok());
    EXPECT_EQ(device->bulk_opens.load(), 1);

    ASSERT_TRUE(session->refresh("show clock").is_ok());
    ASSERT_TRUE(session->refresh("show clock").is_ok());
    EXPECT_EQ(device->bulk_opens.load(), 3);
    EXPECT_EQ(device->bulk_closes.load(), 2);
    EXPECT_FALSE(device->bulk_open_while_open.load());
    EXPECT_EQ(device->command_opens.load(), 1);
}

TEST(RemoteSessionTest, UploadPushesFileToDevice) {
    auto device = std::make_shared<FakeDevice>();
    auto session = make_session(device);
    ASSERT_TRUE(session->connect().is_ok());

    const auto local = std::filesystem::temp_directory_path() / "cxfer_session_upload.bin";
    {
        std::ofstream out(local, std::ios::binary);
        out << "0123456789";
    }

    std::uint64_t last_sent = 0;
    auto pushed = session->upload(local, "bootflash:x.bin", 10, std::chrono::seconds(5),
                                  [&](std::uint64_t sent, std::uint64_t) { last_sent = sent; });
    std::filesystem::remove(local);

    ASSERT_TRUE(pushed.is_ok());
    EXPECT_EQ(last_sent, 10u);
    EXPECT_EQ(device->file("bootflash:x.bin").value_or(""), "0123456789");
}

TEST(RemoteSessionTest, CloseStopsKeepaliveAndRejectsCommands) {
    auto device = std::make_shared<FakeDevice>();
    auto session = make_session(device);
    ASSERT_TRUE(session->connect().is_ok());

    session->start_keepalive("show clock", std::chrono::milliseconds(5));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    session->close();

    ASSERT_NE(session->keepalive(), nullptr);
    EXPECT_FALSE(session->keepalive()->running());
    const int probes = device->count_commands("show clock");
    EXPECT_GT(probes, 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(device->count_commands("show clock"), probes);

    EXPECT_EQ(session->health(), SessionHealth::Closed);
    EXPECT_TRUE(session->command("show clock").is_error());
    EXPECT_FALSE(device->overlapping_commands.load());
}
