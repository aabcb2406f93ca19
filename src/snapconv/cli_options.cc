#include "snapconv/cli_options.h"

#include "snapconv/console_format.h"
#include "snapconv/snapmatic_convert.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <span>
#include <utility>

namespace snapconv {
namespace {

    static bool is_value_option(const char* arg) noexcept
    {
        static constexpr const char* kValueOptions[] = {
            "--base-dir", "--src",            "--dst",
            "--prefix",   "--max-file-bytes", "--max-jpeg-bytes",
        };
        for (const char* opt : kValueOptions) {
            if (std::strcmp(arg, opt) == 0) {
                return true;
            }
        }
        return false;
    }


    static bool report_file(const ConvertFileResult& res, std::FILE* out,
                            std::FILE* err)
    {
        const std::string name = console_safe(res.file_name);
        if (res.status != ConvertStatus::Ok) {
            std::fprintf(err, "snapconv: %s: %s: %s\n", name.c_str(),
                         convert_status_name(res.status), res.message.c_str());
            return false;
        }
        std::fprintf(out, "  %s -> %s (offset=%llu size=%llu%s)\n",
                     name.c_str(), console_safe(res.output_path).c_str(),
                     static_cast<unsigned long long>(res.jpeg_offset),
                     static_cast<unsigned long long>(res.jpeg_size),
                     res.marker_found ? "" : " pass-through");
        return true;
    }


    static bool report_batch(const BatchConvertResult& batch, std::FILE* out,
                             std::FILE* err)
    {
        if (batch.status != ConvertStatus::Ok) {
            std::fprintf(err, "snapconv: %s: %s\n",
                         convert_status_name(batch.status),
                         batch.message.c_str());
            return false;
        }
        for (const ConvertFileResult& res : batch.files) {
            (void)report_file(res, out, err);
        }
        std::fprintf(out, "converted=%u failed=%u\n", batch.converted,
                     batch.failed);
        return batch.failed == 0U;
    }

}  // namespace

bool
parse_u64_arg(const char* s, uint64_t* out) noexcept
{
    if (!s || !out || *s < '0' || *s > '9') {
        return false;
    }
    errno                = 0;
    char* end            = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (!end || *end != '\0' || errno == ERANGE) {
        return false;
    }
    *out = static_cast<uint64_t>(v);
    return true;
}


CliAction
parse_cli_args(int argc, const char* const* argv, CliOptions* out)
{
    if (!out) {
        return CliAction::UsageError;
    }
    *out = CliOptions();

    bool debug        = false;
    bool pass_through = false;
    std::string base_dir;
    std::string src_dir;
    std::string dst_dir;
    std::string prefix(kSnapmaticNamePrefix);
    uint64_t max_file_bytes = 0;
    uint64_t max_jpeg_bytes = 0;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            return CliAction::Help;
        }
        if (std::strcmp(arg, "--version") == 0) {
            return CliAction::Version;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            out->show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--debug") == 0) {
            debug = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--pass-through") == 0) {
            pass_through = true;
            first_path += 1;
            continue;
        }
        if (is_value_option(arg)) {
            if (i + 1 >= argc || !argv[i + 1]) {
                out->error = "missing value for ";
                out->error.append(arg);
                return CliAction::UsageError;
            }
            const char* value = argv[i + 1];
            if (std::strcmp(arg, "--base-dir") == 0) {
                base_dir = value;
            } else if (std::strcmp(arg, "--src") == 0) {
                src_dir = value;
            } else if (std::strcmp(arg, "--dst") == 0) {
                dst_dir = value;
            } else if (std::strcmp(arg, "--prefix") == 0) {
                prefix = value;
            } else {
                uint64_t* dst = std::strcmp(arg, "--max-file-bytes") == 0
                                    ? &max_file_bytes
                                    : &max_jpeg_bytes;
                if (!parse_u64_arg(value, dst)) {
                    out->error = "invalid ";
                    out->error.append(arg);
                    out->error.append(" value: ");
                    out->error.append(console_safe(value));
                    return CliAction::UsageError;
                }
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (arg[0] == '-' && arg[1] == '-') {
            out->error = "unknown option ";
            out->error.append(console_safe(arg));
            return CliAction::UsageError;
        }
        break;
    }

    for (int i = first_path; i < argc; ++i) {
        if (argv[i] && argv[i][0] != '\0') {
            out->names.emplace_back(argv[i]);
        }
    }

    ConverterConfig config = make_converter_config(base_dir);
    if (!src_dir.empty()) {
        config.src_dir = src_dir;
    }
    if (!dst_dir.empty()) {
        config.dst_dir = dst_dir;
    }
    config.name_prefix               = std::move(prefix);
    config.debug                     = debug;
    config.log                       = stdout;
    config.max_file_bytes            = max_file_bytes;
    config.extract.max_output_bytes  = max_jpeg_bytes;
    config.extract.on_missing_marker = pass_through
                                           ? MissingMarkerPolicy::PassThrough
                                           : MissingMarkerPolicy::Fail;
    out->config = std::move(config);
    return CliAction::Convert;
}


ConvertMode
convert_mode_for(size_t name_count) noexcept
{
    if (name_count == 0U) {
        return ConvertMode::All;
    }
    return name_count == 1U ? ConvertMode::One : ConvertMode::Some;
}


int
run_cli_conversion(const CliOptions& options, std::FILE* out, std::FILE* err)
{
    SnapmaticConverter converter(options.config);
    std::fprintf(out, "== %s -> %s\n", console_safe(converter.src_dir()).c_str(),
                 console_safe(converter.dst_dir()).c_str());

    bool ok = false;
    switch (convert_mode_for(options.names.size())) {
    case ConvertMode::All:
        ok = report_batch(converter.convert_all(), out, err);
        break;
    case ConvertMode::One:
        ok = report_file(converter.convert_file(options.names[0]), out, err);
        break;
    case ConvertMode::Some:
        ok = report_batch(converter.convert_some(std::span<const std::string>(
                              options.names.data(), options.names.size())),
                          out, err);
        break;
    }
    return ok ? kExitOk : kExitFailed;
}

}  // namespace snapconv
