#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file jpeg_extract.h
 * \brief Locates and copies the JPEG stream embedded in a container blob.
 */

namespace snapconv {

/// JPEG Start-Of-Image marker (`FF D8`).
inline constexpr std::array<std::byte, 2> kJpegSoiMarker = {
    std::byte { 0xFF },
    std::byte { 0xD8 },
};

/// What to do when the input holds no SOI marker.
enum class MissingMarkerPolicy : uint8_t {
    /// Report \ref JpegExtractStatus::MarkerNotFound.
    Fail,
    /// Treat the whole input as the image (empty input stays empty).
    PassThrough,
};

/// Status for embedded JPEG extraction.
enum class JpegExtractStatus : uint8_t {
    Ok,
    MarkerNotFound,
    LimitExceeded,
};

/// Options for embedded JPEG extraction.
struct JpegExtractOptions final {
    MissingMarkerPolicy on_missing_marker = MissingMarkerPolicy::Fail;
    /// Refuse results larger than this (0 = unlimited).
    uint64_t max_output_bytes = 0;
};

/// Result for embedded JPEG extraction.
struct JpegExtractResult final {
    JpegExtractStatus status = JpegExtractStatus::Ok;
    bool marker_found        = false;
    /// Cut point within the input (0 for pass-through).
    uint64_t offset = 0;
    /// Bytes from \ref offset through the end of the input.
    uint64_t size = 0;
};

/**
 * \brief Finds the first `FF D8` pair in \p bytes.
 *
 * Returns false when no pair exists; a trailing lone `FF` is not a match.
 */
bool
find_jpeg_soi(std::span<const std::byte> bytes, uint64_t* offset) noexcept;

/**
 * \brief Computes the embedded JPEG range without copying.
 *
 * The range is `[offset, bytes.size())`. Later marker pairs inside the
 * payload never move the cut point.
 */
JpegExtractResult
locate_embedded_jpeg(std::span<const std::byte> bytes,
                     const JpegExtractOptions& options) noexcept;

/**
 * \brief Copies the embedded JPEG stream into \p out.
 *
 * \p out is replaced on success and cleared on failure. No JPEG structure is
 * validated beyond the leading marker.
 */
JpegExtractResult
extract_embedded_jpeg(std::span<const std::byte> bytes,
                      std::vector<std::byte>* out,
                      const JpegExtractOptions& options);

}  // namespace snapconv
