/**
 * @file data_path.h
 * @brief Path classification and URI helpers for local and remote items
 */

#ifndef KCENON_BULK_COPY_CORE_DATA_PATH_H
#define KCENON_BULK_COPY_CORE_DATA_PATH_H

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::bulk_copy {

/**
 * @brief Where a path string points
 */
enum class path_kind {
    local,   ///< Local filesystem (no scheme, or file://)
    remote   ///< Remote object store (any other scheme)
};

[[nodiscard]] constexpr auto to_string(path_kind kind) -> const char* {
    switch (kind) {
        case path_kind::local: return "local";
        case path_kind::remote: return "remote";
        default: return "unknown";
    }
}

/**
 * @brief Scheme separator used by remote URIs ("data://foo")
 */
inline constexpr std::string_view scheme_separator = "://";

/**
 * @brief A path split at its scheme
 *
 * For local paths without a prefix the scheme is empty.
 */
struct data_path {
    std::string scheme;
    std::string path;

    [[nodiscard]] auto is_remote() const -> bool {
        return !scheme.empty() && scheme != "file";
    }

    /**
     * @brief Render back to the string form ("scheme://path" or "path")
     */
    [[nodiscard]] auto to_uri() const -> std::string;
};

/**
 * @brief Split a path string at the first "://"
 */
[[nodiscard]] auto parse_data_path(std::string_view value) -> data_path;

/**
 * @brief Classify a path string as local or remote
 *
 * No "://" separator, or an explicit "file://" prefix, means local.
 * Every other scheme means remote. The empty string is local.
 */
[[nodiscard]] auto classify_path(std::string_view value) -> path_kind;

/**
 * @brief Remove a leading "file://" prefix, if any
 */
[[nodiscard]] auto strip_file_scheme(std::string_view value) -> std::string;

/**
 * @brief Last non-empty segment of a remote URI
 *
 * Trailing slashes are ignored. Returns an empty string when the URI names
 * the root of its scheme ("data://").
 */
[[nodiscard]] auto remote_basename(std::string_view uri) -> std::string;

/**
 * @brief Append a child name to a remote directory URI
 */
[[nodiscard]] auto join_remote(std::string_view dir_uri, std::string_view child) -> std::string;

/**
 * @brief Byte count with a binary suffix for progress lines
 *
 * Values below 1024 are printed as-is ("512"); larger values get one
 * decimal and K, M, G or T ("1.5K").
 */
[[nodiscard]] auto format_size(uint64_t bytes) -> std::string;

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_CORE_DATA_PATH_H
