/**
 * @file data_path.cpp
 * @brief Implementation of path classification and URI helpers
 */

#include <kcenon/bulk_copy/core/data_path.h>

#include <array>
#include <cstdio>

namespace kcenon::bulk_copy {

auto data_path::to_uri() const -> std::string {
    if (scheme.empty()) {
        return path;
    }
    return scheme + std::string(scheme_separator) + path;
}

auto parse_data_path(std::string_view value) -> data_path {
    data_path parsed;
    auto pos = value.find(scheme_separator);
    if (pos == std::string_view::npos) {
        parsed.path = std::string(value);
        return parsed;
    }
    parsed.scheme = std::string(value.substr(0, pos));
    parsed.path = std::string(value.substr(pos + scheme_separator.size()));
    return parsed;
}

auto classify_path(std::string_view value) -> path_kind {
    return parse_data_path(value).is_remote() ? path_kind::remote : path_kind::local;
}

auto strip_file_scheme(std::string_view value) -> std::string {
    constexpr std::string_view file_prefix = "file://";
    if (value.substr(0, file_prefix.size()) == file_prefix) {
        return std::string(value.substr(file_prefix.size()));
    }
    return std::string(value);
}

auto remote_basename(std::string_view uri) -> std::string {
    auto path = parse_data_path(uri).path;

    auto end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return {};
    }

    auto start = path.find_last_of('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

auto join_remote(std::string_view dir_uri, std::string_view child) -> std::string {
    std::string joined(dir_uri);
    if (!joined.empty() && joined.back() != '/') {
        joined += '/';
    }
    joined += child;
    return joined;
}

auto format_size(uint64_t bytes) -> std::string {
    if (bytes < 1024) {
        return std::to_string(bytes);
    }

    constexpr std::array<char, 4> suffixes = {'K', 'M', 'G', 'T'};
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t index = 0;
    while (value >= 1024.0 && index + 1 < suffixes.size()) {
        value /= 1024.0;
        ++index;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%c", value, suffixes[index]);
    return buf;
}

}  // namespace kcenon::bulk_copy
