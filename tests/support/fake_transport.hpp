#pragma once

#include "cxfer/remote/listing.hpp"
#include "cxfer/remote/transport.hpp"
#include "cxfer/transfer/checksum.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace cxfer::fakes {

/**
 * @brief In-memory appliance answering the NX-OS style commands the transfer uses
 *
 * Shared between a test and the FakeTransport the session owns, so the test
 * can script failures and inspect the device after the run.
 */
class FakeDevice {
public:
    /// Return an error to fail the push; `push_number` counts pushes of this path from 1
    using PushHook = std::function<std::optional<Error>(const std::string& remote_path, int push_number)>;
    /// Return text to replace the normal response to `command`
    using CommandHook = std::function<std::optional<std::string>(const std::string& command)>;

    std::string filesystem = "bootflash:";
    std::optional<std::uint64_t> free_bytes = 8ULL * 1024 * 1024 * 1024;

    PushHook push_hook;
    CommandHook command_hook;
    std::deque<Error> connect_failures;
    bool reject_auth = false;
    std::chrono::milliseconds push_delay{0};
    std::chrono::milliseconds command_delay{0};

    std::atomic<int> command_opens{0};
    std::atomic<int> command_closes{0};
    std::atomic<int> bulk_opens{0};
    std::atomic<int> bulk_closes{0};
    std::atomic<int> pushes{0};
    std::atomic<bool> overlapping_commands{false};
    std::atomic<bool> bulk_open_while_open{false};

    void put_file(const std::string& remote_path, std::string content) {
        std::lock_guard lock(mutex_);
        files_[remote_path] = std::move(content);
    }

    bool has_file(const std::string& remote_path) const {
        std::lock_guard lock(mutex_);
        return files_.count(remote_path) != 0;
    }

    std::optional<std::string> file(const std::string& remote_path) const {
        std::lock_guard lock(mutex_);
        auto it = files_.find(remote_path);
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t file_count() const {
        std::lock_guard lock(mutex_);
        return files_.size();
    }

    std::vector<std::string> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    int count_commands(const std::string& prefix) const {
        std::lock_guard lock(mutex_);
        int count = 0;
        for (const auto& command : commands_) {
            if (command.rfind(prefix, 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    int pushes_of(const std::string& remote_path) const {
        std::lock_guard lock(mutex_);
        auto it = push_counts_.find(remote_path);
        return it == push_counts_.end() ? 0 : it->second;
    }

    std::string respond(const std::string& command) {
        {
            std::lock_guard lock(mutex_);
            commands_.push_back(command);
        }
        if (command_hook) {
            if (auto scripted = command_hook(command)) {
                return *scripted;
            }
        }

        std::lock_guard lock(mutex_);
        if (command == "show clock") {
            return "12:00:00.000 UTC Mon Jan 01 2024\n";
        }
        if (command == "show version") {
            return "Cisco Nexus Operating System (NX-OS) Software\n"
                   "  NXOS: version 9.3(10)\n"
                   "  Device name: fake-switch\n";
        }
        if (starts_with(command, "dir ")) {
            return listing(command.substr(4));
        }
        if (starts_with(command, "delete ")) {
            auto path = command.substr(7);
            path = path.substr(0, path.find(' '));
            if (files_.erase(path) == 0) {
                return "No such file or directory\n";
            }
            return "";
        }
        if (starts_with(command, "show file ")) {
            auto rest = command.substr(10);
            const auto path = rest.substr(0, rest.find(' '));
            auto it = files_.find(path);
            if (it == files_.end()) {
                return "% No such file or directory\n";
            }
            if (rest.find("md5sum") != std::string::npos) {
                transfer::Md5Digest digest;
                if (digest.update(it->second.data(), it->second.size()).is_error()) {
                    return "% Error computing checksum\n";
                }
                auto md5 = digest.finish();
                return md5.is_ok() ? md5.value() + "\n" : std::string("% Error computing checksum\n");
            }
            return it->second.substr(0, 64) + "\n";
        }
        return "% Invalid command\n";
    }

    Result<void> push(const std::filesystem::path& local_file, const std::string& remote_path,
                      std::uint64_t size, const remote::ProgressCallback& progress) {
        ++pushes;
        int number = 0;
        {
            std::lock_guard lock(mutex_);
            number = ++push_counts_[remote_path];
        }
        if (push_delay.count() > 0) {
            std::this_thread::sleep_for(push_delay);
        }
        if (push_hook) {
            if (auto error = push_hook(remote_path, number)) {
                return Err<void>(*error);
            }
        }

        std::ifstream input(local_file, std::ios::binary);
        if (!input) {
            return Err<void>(Error::io("fake push cannot read " + local_file.string()));
        }
        std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        if (content.size() != size) {
            return Err<void>(Error::io("fake push size mismatch for " + local_file.string()));
        }
        if (progress) {
            for (int quarter = 1; quarter <= 4; ++quarter) {
                progress(size * static_cast<std::uint64_t>(quarter) / 4, size);
            }
        }
        std::lock_guard lock(mutex_);
        files_[remote_path] = std::move(content);
        return Ok();
    }

private:
    static bool starts_with(const std::string& text, const std::string& prefix) {
        return text.rfind(prefix, 0) == 0;
    }

    std::string listing(const std::string& path) const {
        std::ostringstream out;
        if (path == filesystem) {
            for (const auto& [name, content] : files_) {
                out << "   " << content.size() << "    Jan 01 00:00:00 2024  "
                    << remote::split_remote_path(name).second << "\n";
            }
        } else {
            auto it = files_.find(path);
            if (it == files_.end()) {
                return "No such file or directory\n";
            }
            out << "   " << it->second.size() << "    Jan 01 00:00:00 2024  "
                << remote::split_remote_path(path).second << "\n";
        }
        out << "\nUsage for " << filesystem << "//sup-local\n";
        if (free_bytes) {
            out << "  1000000000 bytes used\n"
                << "  " << *free_bytes << " bytes free\n";
        }
        return out.str();
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::map<std::string, int> push_counts_;
    std::vector<std::string> commands_;
};

/**
 * @brief RemoteTransport backed by a FakeDevice
 */
class FakeTransport : public remote::RemoteTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeDevice> device) : device_(std::move(device)) {}

    Result<void> open_command_channel() override {
        ++device_->command_opens;
        if (device_->reject_auth) {
            return Err<void>(Error::auth_failed("fake device rejected credentials"));
        }
        if (!device_->connect_failures.empty()) {
            auto error = device_->connect_failures.front();
            device_->connect_failures.pop_front();
            return Err<void>(error);
        }
        command_open_ = true;
        return Ok();
    }

    void close_command_channel() noexcept override {
        if (command_open_.exchange(false)) {
            ++device_->command_closes;
        }
    }

    bool command_channel_open() const override { return command_open_; }

    Result<std::string> execute(const std::string& command, std::chrono::milliseconds) override {
        if (!command_open_) {
            return Err<std::string>(Error::connection(ErrorDetail::ChannelLost, "fake command channel closed"));
        }
        if (in_flight_.fetch_add(1) > 0) {
            device_->overlapping_commands = true;
        }
        if (device_->command_delay.count() > 0) {
            std::this_thread::sleep_for(device_->command_delay);
        }
        auto output = device_->respond(command);
        in_flight_.fetch_sub(1);
        return Ok(std::move(output));
    }

    Result<void> open_bulk_channel() override {
        if (device_->reject_auth) {
            return Err<void>(Error::auth_failed("fake device rejected credentials"));
        }
        if (bulk_open_) {
            device_->bulk_open_while_open = true;
        }
        ++device_->bulk_opens;
        bulk_open_ = true;
        return Ok();
    }

    void close_bulk_channel() noexcept override {
        if (bulk_open_.exchange(false)) {
            ++device_->bulk_closes;
        }
    }

    bool bulk_channel_active() const override { return bulk_open_; }

    Result<void> push_file(const std::filesystem::path& local_file,
                           const std::string& remote_path,
                           std::uint64_t size,
                           std::chrono::milliseconds,
                           const remote::ProgressCallback& progress) override {
        if (!bulk_open_) {
            return Err<void>(Error::upload(ErrorDetail::ChannelLost, "fake bulk channel closed"));
        }
        return device_->push(local_file, remote_path, size, progress);
    }

    std::string endpoint() const override { return "fake@device:22"; }

private:
    std::shared_ptr<FakeDevice> device_;
    std::atomic<bool> command_open_{false};
    std::atomic<bool> bulk_open_{false};
    std::atomic<int> in_flight_{0};
};

} // namespace cxfer::fakes
