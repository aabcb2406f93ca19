#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file file_io.h
 * \brief Whole-file read/write helpers.
 */

namespace snapconv {

/// Status code for file read/write helpers.
enum class FileIoStatus : uint8_t {
    Ok,
    NotFound,
    OpenFailed,
    ReadFailed,
    WriteFailed,
    TooLarge,
};

/// Returns a short lowercase name for \p status (e.g. "open_failed").
const char*
file_io_status_name(FileIoStatus status) noexcept;

/**
 * \brief Reads all of \p path into \p out.
 *
 * \p max_file_bytes is a hard cap (0 = unlimited). \p out is cleared on
 * failure.
 */
FileIoStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out);

/// Creates or truncates \p path and writes \p bytes to it.
FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept;

}  // namespace snapconv
