#pragma once

#include "snapconv/jpeg_extract.h"
#include "snapconv/snapmatic_scan.h"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

/**
 * \file converter_config.h
 * \brief Explicit configuration for \ref SnapmaticConverter.
 */

namespace snapconv {

/// Default base directory when none is given.
inline constexpr std::string_view kDefaultBaseDir = ".";

/**
 * \brief Paths, naming and limits for one converter instance.
 *
 * Built by the caller and handed to the converter at construction; there is
 * no process-wide default instance.
 */
struct ConverterConfig final {
    /// Directory holding Snapmatic containers.
    std::string src_dir;
    /// Directory receiving `<name>.jpg` outputs.
    std::string dst_dir;
    std::string name_prefix = std::string(kSnapmaticNamePrefix);

    /// Emit progress diagnostics to \ref log.
    bool debug = false;
    /// Not owned. nullptr disables diagnostics even when \ref debug is set.
    std::FILE* log = stdout;

    /// Cap for a source container file (0 = unlimited).
    uint64_t max_file_bytes = 0;
    JpegExtractOptions extract;
};

/// Lexically normalizes a directory path (`a//b/./c/` -> `a/b/c`).
std::string
normalize_dir_path(std::string_view path);

/**
 * \brief Returns a config rooted at \p base_dir.
 *
 * Uses `<base_dir>/source` and `<base_dir>/converted`; an empty
 * \p base_dir means \ref kDefaultBaseDir.
 */
ConverterConfig
make_converter_config(std::string_view base_dir);

}  // namespace snapconv
