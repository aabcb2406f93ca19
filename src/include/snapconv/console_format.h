#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace snapconv {

// Returns a terminal-safe copy of `s` for diagnostics (file names, paths).
//
// - Control bytes, DEL and non-ASCII become `\xNN`
// - `\n`, `\r`, `\t` become their two-character escapes
// - At most `max_bytes` input bytes are kept (0 = unlimited); "..." marks a cut
std::string
console_safe(std::string_view s, uint32_t max_bytes = 0);

// Uppercase hex of `bytes` without separators ("FFD8"), cut at `max_bytes`
// (0 = unlimited) with a trailing "...".
std::string
hex_preview(std::span<const std::byte> bytes, uint32_t max_bytes);

}  // namespace snapconv
