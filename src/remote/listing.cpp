#include "cxfer/remote/listing.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <sstream>
#include <vector>

namespace cxfer::remote {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_all_digits(const std::string& token) {
    return !token.empty() &&
           std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> split_tokens(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool names_file(const std::string& token, const std::string& file_name) {
    if (token == file_name) {
        return true;
    }
    if (token.size() <= file_name.size()) {
        return false;
    }
    const char separator = token[token.size() - file_name.size() - 1];
    return (separator == ':' || separator == '/') &&
           token.compare(token.size() - file_name.size(), file_name.size(), file_name) == 0;
}

std::optional<std::uint64_t> to_u64(const std::string& digits) {
    try {
        return static_cast<std::uint64_t>(std::stoull(digits));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<std::uint64_t> parse_bytes_free(const std::string& listing) {
    static const std::regex pattern(R"((\d+)\s+bytes\s+free)", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(listing, match, pattern)) {
        return std::nullopt;
    }
    return to_u64(match[1].str());
}

bool is_error_banner(const std::string& line) {
    static const char* const kBanners[] = {"no such file", "invalid command", "invalid path", "error:"};

    const auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    if (line[first] == '%') {
        return true;
    }
    const auto lower = to_lower(line.substr(first));
    return std::any_of(std::begin(kBanners), std::end(kBanners),
                       [&lower](const char* banner) { return lower.rfind(banner, 0) == 0; });
}

bool reports_error(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (is_error_banner(line)) {
            return true;
        }
    }
    return false;
}

FileListing parse_file_listing(const std::string& listing, const std::string& file_name) {
    FileListing result;
    if (listing.find_first_not_of(" \t\r\n") == std::string::npos) {
        result.kind = FileListing::Kind::Unparsable;
        return result;
    }

    std::istringstream lines(listing);
    std::string line;
    while (std::getline(lines, line)) {
        if (is_error_banner(line)) {
            continue;
        }
        const auto tokens = split_tokens(line);
        const bool mentions = std::any_of(tokens.begin(), tokens.end(),
            [&file_name](const std::string& token) { return names_file(token, file_name); });
        if (!mentions) {
            continue;
        }
        for (const auto& token : tokens) {
            if (is_all_digits(token)) {
                if (auto size = to_u64(token)) {
                    result.kind = FileListing::Kind::Found;
                    result.size = size;
                    return result;
                }
            }
        }
    }

    result.kind = reports_error(listing) ? FileListing::Kind::Missing : FileListing::Kind::Unparsable;
    return result;
}

std::optional<std::string> parse_md5(const std::string& output) {
    static const std::regex pattern(R"((^|[^0-9a-fA-F])([0-9a-fA-F]{32})($|[^0-9a-fA-F]))");
    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    return to_lower(match[2].str());
}

std::optional<std::string> parse_device_name(const std::string& version_output) {
    static const std::string marker = "Device name:";
    std::istringstream lines(version_output);
    std::string line;
    while (std::getline(lines, line)) {
        const auto pos = line.find(marker);
        if (pos == std::string::npos) {
            continue;
        }
        auto value = line.substr(pos + marker.size());
        const auto first = value.find_first_not_of(" \t");
        const auto last = value.find_last_not_of(" \t\r");
        if (first == std::string::npos) {
            return std::nullopt;
        }
        return value.substr(first, last - first + 1);
    }
    return std::nullopt;
}

std::pair<std::string, std::string> split_remote_path(const std::string& remote_path) {
    const auto pos = remote_path.find_last_of(":/");
    if (pos == std::string::npos) {
        return {std::string(), remote_path};
    }
    return {remote_path.substr(0, pos + 1), remote_path.substr(pos + 1)};
}

std::string join_remote_path(const std::string& directory, const std::string& file_name) {
    if (directory.empty()) {
        return file_name;
    }
    const char last = directory.back();
    if (last == ':' || last == '/') {
        return directory + file_name;
    }
    return directory + "/" + file_name;
}

} // namespace cxfer::remote
