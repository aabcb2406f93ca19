#pragma once

#include "snapconv/converter_config.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file snapmatic_convert.h
 * \brief Snapmatic container to JPEG conversion (single file, subset, all).
 */

namespace snapconv {

/// Conversion outcome.
enum class ConvertStatus : uint8_t {
    Ok,
    /// Empty name list, or a name that is not a plain directory entry.
    InvalidInput,
    /// Source directory missing, or the named container was not discovered.
    NotFound,
    /// Read, write or directory creation failed.
    IoFailure,
    /// The container holds no JPEG SOI marker (only with
    /// \ref MissingMarkerPolicy::Fail).
    MarkerNotFound,
    /// Source file or extracted JPEG exceeds the configured cap.
    LimitExceeded,
};

const char*
convert_status_name(ConvertStatus status) noexcept;

/// Per-file conversion outcome.
struct ConvertFileResult final {
    std::string file_name;
    ConvertStatus status = ConvertStatus::Ok;
    /// `<dst_dir>/<file_name>.jpg`; set once the name was resolved.
    std::string output_path;
    bool marker_found    = false;
    uint64_t jpeg_offset = 0;
    uint64_t jpeg_size   = 0;
    /// Context message on failure (e.g. "Error writing file: ..."), else empty.
    std::string message;
};

/**
 * \brief Outcome of a multi-file conversion.
 *
 * \ref status covers the batch itself (arguments, discovery, destination
 * directory). Per-file failures do not stop the batch; they are listed in
 * \ref files and counted in \ref failed.
 */
struct BatchConvertResult final {
    ConvertStatus status = ConvertStatus::Ok;
    std::string message;
    std::vector<ConvertFileResult> files;
    uint32_t converted = 0;
    uint32_t failed    = 0;
};

/**
 * \brief Converts Snapmatic containers from a source to a destination
 * directory.
 *
 * Each conversion reads the container, cuts it at the first JPEG SOI marker
 * and writes `<dst_dir>/<name>.jpg`, replacing any previous output.
 */
class SnapmaticConverter final {
public:
    explicit SnapmaticConverter(ConverterConfig config);

    const ConverterConfig& config() const noexcept;
    const std::string& src_dir() const noexcept;
    const std::string& dst_dir() const noexcept;

    /// Replaces the source directory (normalized).
    void set_src_dir(std::string_view dir);
    void set_dst_dir(std::string_view dir);

    /// Converts one container by name.
    ConvertFileResult convert_file(std::string_view name);

    /// Converts every container discovered in the source directory.
    BatchConvertResult convert_all();

    /**
     * \brief Converts the requested containers.
     *
     * Results follow request order; duplicate names are converted once and
     * names that were not discovered are reported as \ref ConvertStatus::NotFound.
     */
    BatchConvertResult convert_some(std::span<const std::string> names);

    /// Creates the destination directory if it does not exist yet.
    ConvertStatus ensure_destination_dir(std::string* message);

    std::string output_path_for(std::string_view name) const;

private:
    void convert_discovered(ConvertFileResult* res);
    void log_line(std::string_view line) const noexcept;

    ConverterConfig config_;
};

}  // namespace snapconv
