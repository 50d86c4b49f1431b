#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cxfer::remote {

/**
 * @brief What a `dir <file>` listing says about one file
 */
struct FileListing {
    enum class Kind {
        Found,       ///< Line with the file name and a size
        Missing,     ///< "No such file" or an error banner
        Unparsable   ///< Output present but no size could be extracted
    };

    Kind kind = Kind::Unparsable;
    std::optional<std::uint64_t> size;
};

/**
 * @brief Extract the "<N> bytes free" figure from a filesystem listing
 */
std::optional<std::uint64_t> parse_bytes_free(const std::string& listing);

/**
 * @brief Locate `file_name` in a listing and read the size column
 *
 * The size is the first all-digit token on the line naming the file, which
 * matches `<size> <month> <day> <time> <year> <name>` style output. A listing
 * with no such line is Missing when it carries an error banner.
 */
FileListing parse_file_listing(const std::string& listing, const std::string& file_name);

/**
 * @brief True when `line` starts with a CLI error banner
 *
 * Banners are a leading '%', "No such file", "Invalid command",
 * "Invalid path" or "Error:". Text elsewhere on the line is not inspected,
 * so file names never trigger a match.
 */
bool is_error_banner(const std::string& line);

/**
 * @brief True when any line of CLI output starts with an error banner
 */
bool reports_error(const std::string& output);

/**
 * @brief First 32-character hex run in noisy command output, lowercased
 */
std::optional<std::string> parse_md5(const std::string& output);

/**
 * @brief Extract the value of the "Device name:" line of `show version`
 */
std::optional<std::string> parse_device_name(const std::string& version_output);

/**
 * @brief Split "bootflash:dir/file.bin" or "/a/b/file.bin" into directory and name
 *
 * The directory keeps its trailing ':' or '/' so it can be prefixed directly.
 */
std::pair<std::string, std::string> split_remote_path(const std::string& remote_path);

/**
 * @brief Join a remote directory (filesystem prefix or path) and a file name
 */
std::string join_remote_path(const std::string& directory, const std::string& file_name);

} // namespace cxfer::remote
