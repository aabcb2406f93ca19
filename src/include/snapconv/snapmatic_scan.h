#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file snapmatic_scan.h
 * \brief Discovery of Snapmatic container files in a source directory.
 */

namespace snapconv {

/// File name prefix written by the game client for Snapmatic pictures.
inline constexpr std::string_view kSnapmaticNamePrefix = "PGTA";

/// Status for container file discovery.
enum class DiscoveryStatus : uint8_t {
    Ok,
    /// Empty directory path or a requested name that is not a plain entry name.
    InvalidInput,
    /// The source directory does not exist.
    NotFound,
    NotADirectory,
    IoFailure,
    /// The source directory exists but holds no container with that name.
    NoSuchEntry,
};

const char*
discovery_status_name(DiscoveryStatus status) noexcept;

/// True if \p name starts with \p prefix.
bool
is_snapmatic_name(std::string_view name, std::string_view prefix) noexcept;

/**
 * \brief True if \p name is a single directory entry name.
 *
 * Rejects empty names, `.`/`..` and anything holding a path separator or NUL.
 */
bool
is_plain_file_name(std::string_view name) noexcept;

/**
 * \brief Lists regular files in \p src_dir whose names start with \p prefix.
 *
 * Names are appended in directory iteration order (not sorted). \p names is
 * cleared first.
 */
DiscoveryStatus
list_snapmatic_files(const std::string& src_dir, std::string_view prefix,
                     std::vector<std::string>* names);

/**
 * \brief Intersects the discovered containers with \p requested.
 *
 * \p found keeps discovery order and holds each name once. Requested names
 * that were not discovered go to \p missing (optional) in request order.
 */
DiscoveryStatus
select_snapmatic_files(const std::string& src_dir, std::string_view prefix,
                       std::span<const std::string> requested,
                       std::vector<std::string>* found,
                       std::vector<std::string>* missing);

/**
 * \brief Resolves one container by name among the discovered files.
 *
 * Returns NotFound when \p src_dir itself is missing and NoSuchEntry when
 * the directory lists no container called \p name.
 */
DiscoveryStatus
find_snapmatic_file(const std::string& src_dir, std::string_view prefix,
                    std::string_view name);

}  // namespace snapconv
