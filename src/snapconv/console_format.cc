#include "snapconv/console_format.h"

namespace snapconv {
namespace {

    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    static void append_hex_u8(std::string* out, uint8_t v)
    {
        out->push_back(kHexDigits[(v >> 4) & 0x0FU]);
        out->push_back(kHexDigits[v & 0x0FU]);
    }


    static size_t clamp_len(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return size;
        }
        return static_cast<size_t>(max_bytes);
    }

}  // namespace

std::string
console_safe(std::string_view s, uint32_t max_bytes)
{
    const size_t n = clamp_len(s.size(), max_bytes);

    std::string out;
    out.reserve(n + 3U);
    for (size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\n': out.append("\\n"); continue;
        case '\r': out.append("\\r"); continue;
        case '\t': out.append("\\t"); continue;
        case '\\': out.append("\\\\"); continue;
        default: break;
        }
        if (c < 0x20U || c >= 0x7FU) {
            out.append("\\x");
            append_hex_u8(&out, static_cast<uint8_t>(c));
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out.append("...");
    }
    return out;
}


std::string
hex_preview(std::span<const std::byte> bytes, uint32_t max_bytes)
{
    const size_t n = clamp_len(bytes.size(), max_bytes);

    std::string out;
    out.reserve(n * 2U + 3U);
    for (size_t i = 0; i < n; ++i) {
        append_hex_u8(&out, static_cast<uint8_t>(bytes[i]));
    }
    if (n < bytes.size()) {
        out.append("...");
    }
    return out;
}

}  // namespace snapconv
