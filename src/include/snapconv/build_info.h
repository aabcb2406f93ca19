#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how SnapConv was built.
 */

namespace snapconv {

/// Values compiled into the binary at configure time.
struct BuildInfo final {
    /// SnapConv version string (e.g. "1.0.0").
    std::string_view version;
    /// Configure timestamp in UTC (ISO-8601), or empty.
    std::string_view build_timestamp_utc;
    /// "Release", "Debug", ...
    std::string_view build_type;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    bool linkage_static = false;
    bool linkage_shared = false;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a two-line build header.
 *
 * - `SnapConv vX.Y.Z <build_type> <linkage>`
 * - `built with <compiler>-<version> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

/// Same as above for the linked library.
void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace snapconv
