#include "snapconv/jpeg_extract.h"

namespace snapconv {

bool
find_jpeg_soi(std::span<const std::byte> bytes, uint64_t* offset) noexcept
{
    if (bytes.size() < kJpegSoiMarker.size()) {
        return false;
    }
    const size_t last = bytes.size() - kJpegSoiMarker.size();
    for (size_t i = 0; i <= last; ++i) {
        if (bytes[i] == kJpegSoiMarker[0] && bytes[i + 1] == kJpegSoiMarker[1]) {
            if (offset) {
                *offset = static_cast<uint64_t>(i);
            }
            return true;
        }
    }
    return false;
}


JpegExtractResult
locate_embedded_jpeg(std::span<const std::byte> bytes,
                     const JpegExtractOptions& options) noexcept
{
    JpegExtractResult res;
    const uint64_t total = static_cast<uint64_t>(bytes.size());

    uint64_t offset = 0;
    if (find_jpeg_soi(bytes, &offset)) {
        res.marker_found = true;
    } else if (options.on_missing_marker == MissingMarkerPolicy::Fail) {
        res.status = JpegExtractStatus::MarkerNotFound;
        return res;
    }

    res.offset = offset;
    res.size   = total - offset;
    if (options.max_output_bytes != 0U && res.size > options.max_output_bytes) {
        res.status = JpegExtractStatus::LimitExceeded;
    }
    return res;
}


JpegExtractResult
extract_embedded_jpeg(std::span<const std::byte> bytes,
                      std::vector<std::byte>* out,
                      const JpegExtractOptions& options)
{
    const JpegExtractResult res = locate_embedded_jpeg(bytes, options);
    if (!out) {
        return res;
    }
    out->clear();
    if (res.status != JpegExtractStatus::Ok) {
        return res;
    }

    const std::span<const std::byte> tail
        = bytes.subspan(static_cast<size_t>(res.offset));
    out->assign(tail.begin(), tail.end());
    return res;
}

}  // namespace snapconv
