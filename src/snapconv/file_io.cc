#include "snapconv/file_io.h"

#include <cerrno>
#include <cstdio>
#include <limits>

namespace snapconv {
namespace {

    class FileCloser final {
    public:
        explicit FileCloser(std::FILE* f) noexcept
            : f_(f)
        {
        }
        ~FileCloser() noexcept
        {
            if (f_) {
                (void)std::fclose(f_);
            }
        }

        FileCloser(const FileCloser&)            = delete;
        FileCloser& operator=(const FileCloser&) = delete;

        // Closes explicitly so buffered write errors are reported.
        bool close() noexcept
        {
            if (!f_) {
                return true;
            }
            const int rc = std::fclose(f_);
            f_           = nullptr;
            return rc == 0;
        }

    private:
        std::FILE* f_ = nullptr;
    };


    static bool file_size(std::FILE* f, uint64_t* out) noexcept
    {
        if (std::fseek(f, 0, SEEK_END) != 0) {
            return false;
        }
        const long end = std::ftell(f);
        if (end < 0) {
            return false;
        }
        if (std::fseek(f, 0, SEEK_SET) != 0) {
            return false;
        }
        *out = static_cast<uint64_t>(end);
        return true;
    }

}  // namespace

const char*
file_io_status_name(FileIoStatus status) noexcept
{
    switch (status) {
    case FileIoStatus::Ok: return "ok";
    case FileIoStatus::NotFound: return "not_found";
    case FileIoStatus::OpenFailed: return "open_failed";
    case FileIoStatus::ReadFailed: return "read_failed";
    case FileIoStatus::WriteFailed: return "write_failed";
    case FileIoStatus::TooLarge: return "too_large";
    }
    return "unknown";
}


FileIoStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out)
{
    if (!out) {
        return FileIoStatus::ReadFailed;
    }
    out->clear();
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }

    errno        = 0;
    std::FILE* f = std::fopen(path, "rb");
    if (!f) {
        return errno == ENOENT ? FileIoStatus::NotFound
                               : FileIoStatus::OpenFailed;
    }
    FileCloser closer(f);

    uint64_t size = 0;
    if (!file_size(f, &size)) {
        return FileIoStatus::ReadFailed;
    }
    if (max_file_bytes != 0U && size > max_file_bytes) {
        return FileIoStatus::TooLarge;
    }
    if (size > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        return FileIoStatus::TooLarge;
    }

    out->resize(static_cast<size_t>(size));
    size_t got = 0;
    if (!out->empty()) {
        got = std::fread(out->data(), 1, out->size(), f);
    }
    if (got != out->size() || std::ferror(f) != 0) {
        out->clear();
        return FileIoStatus::ReadFailed;
    }
    return FileIoStatus::Ok;
}


FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept
{
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }
    std::FILE* f = std::fopen(path, "wb");
    if (!f) {
        return FileIoStatus::OpenFailed;
    }
    FileCloser closer(f);

    size_t written = 0;
    if (!bytes.empty()) {
        written = std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
    if (written != bytes.size()) {
        return FileIoStatus::WriteFailed;
    }
    return closer.close() ? FileIoStatus::Ok : FileIoStatus::WriteFailed;
}

}  // namespace snapconv
