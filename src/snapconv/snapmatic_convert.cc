#include "snapconv/snapmatic_convert.h"

#include "snapconv/console_format.h"
#include "snapconv/file_io.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>

namespace snapconv {
namespace {

    namespace fs = std::filesystem;

    // Header bytes shown in debug output.
    static constexpr uint32_t kHeaderPreviewBytes = 16U;

    static ConvertStatus from_discovery(DiscoveryStatus status) noexcept
    {
        switch (status) {
        case DiscoveryStatus::Ok: return ConvertStatus::Ok;
        case DiscoveryStatus::InvalidInput: return ConvertStatus::InvalidInput;
        case DiscoveryStatus::NotFound:
        case DiscoveryStatus::NoSuchEntry: return ConvertStatus::NotFound;
        case DiscoveryStatus::NotADirectory:
        case DiscoveryStatus::IoFailure: return ConvertStatus::IoFailure;
        }
        return ConvertStatus::IoFailure;
    }


    static ConvertStatus from_file_io(FileIoStatus status) noexcept
    {
        switch (status) {
        case FileIoStatus::Ok: return ConvertStatus::Ok;
        case FileIoStatus::NotFound: return ConvertStatus::NotFound;
        case FileIoStatus::TooLarge: return ConvertStatus::LimitExceeded;
        case FileIoStatus::OpenFailed:
        case FileIoStatus::ReadFailed:
        case FileIoStatus::WriteFailed: return ConvertStatus::IoFailure;
        }
        return ConvertStatus::IoFailure;
    }


    static std::string discovery_message(DiscoveryStatus status,
                                         const std::string& src_dir)
    {
        std::string msg = "Error getting Snapmatic files: ";
        switch (status) {
        case DiscoveryStatus::NotFound:
            msg.append("Source directory does not exist: ");
            break;
        case DiscoveryStatus::NotADirectory:
            msg.append("Source path is not a directory: ");
            break;
        case DiscoveryStatus::InvalidInput:
            msg.append("Invalid source directory: ");
            break;
        default: msg.append("Cannot list source directory: "); break;
        }
        msg.append(console_safe(src_dir));
        return msg;
    }


    static std::string missing_entry_message(std::string_view name)
    {
        std::string msg
            = "Error getting Snapmatic file: no Snapmatic picture named ";
        msg.append(console_safe(name));
        return msg;
    }


    static bool contains(const std::vector<std::string>& names,
                         std::string_view name) noexcept
    {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

}  // namespace

const char*
convert_status_name(ConvertStatus status) noexcept
{
    switch (status) {
    case ConvertStatus::Ok: return "ok";
    case ConvertStatus::InvalidInput: return "invalid_input";
    case ConvertStatus::NotFound: return "not_found";
    case ConvertStatus::IoFailure: return "io_failure";
    case ConvertStatus::MarkerNotFound: return "marker_not_found";
    case ConvertStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


SnapmaticConverter::SnapmaticConverter(ConverterConfig config)
    : config_(std::move(config))
{
    config_.src_dir = normalize_dir_path(config_.src_dir);
    config_.dst_dir = normalize_dir_path(config_.dst_dir);
}


const ConverterConfig&
SnapmaticConverter::config() const noexcept
{
    return config_;
}


const std::string&
SnapmaticConverter::src_dir() const noexcept
{
    return config_.src_dir;
}


const std::string&
SnapmaticConverter::dst_dir() const noexcept
{
    return config_.dst_dir;
}


void
SnapmaticConverter::set_src_dir(std::string_view dir)
{
    config_.src_dir = normalize_dir_path(dir);
}


void
SnapmaticConverter::set_dst_dir(std::string_view dir)
{
    config_.dst_dir = normalize_dir_path(dir);
}


std::string
SnapmaticConverter::output_path_for(std::string_view name) const
{
    std::string file(name);
    file.append(".jpg");
    return (fs::path(config_.dst_dir) / file).string();
}


void
SnapmaticConverter::log_line(std::string_view line) const noexcept
{
    if (!config_.debug || !config_.log) {
        return;
    }
    std::fprintf(config_.log, "%.*s\n", static_cast<int>(line.size()),
                 line.data());
}


ConvertStatus
SnapmaticConverter::ensure_destination_dir(std::string* message)
{
    if (message) {
        message->clear();
    }
    if (config_.dst_dir.empty()) {
        if (message) {
            *message = "Error creating directory: empty destination path";
        }
        return ConvertStatus::InvalidInput;
    }

    log_line("Creating destination folder if it does not exist.");
    const fs::path dir(config_.dst_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    // An existing directory (ours or a concurrent writer's) is success.
    std::error_code type_ec;
    if (fs::is_directory(dir, type_ec)) {
        return ConvertStatus::Ok;
    }
    if (message) {
        *message = "Error creating directory: ";
        message->append(console_safe(config_.dst_dir));
        message->append(": ");
        message->append(ec ? ec.message() : std::string("not a directory"));
    }
    return ConvertStatus::IoFailure;
}


void
SnapmaticConverter::convert_discovered(ConvertFileResult* res)
{
    const std::string src_path
        = (fs::path(config_.src_dir) / res->file_name).string();
    res->output_path = output_path_for(res->file_name);

    log_line("Converting Snapmatic file to JPEG: "
             + console_safe(res->file_name));

    std::vector<std::byte> container;
    const FileIoStatus read = read_file_bytes(src_path.c_str(),
                                              config_.max_file_bytes,
                                              &container);
    if (read != FileIoStatus::Ok) {
        res->status  = from_file_io(read);
        res->message = "Error generating file buffer: ";
        res->message.append(console_safe(src_path));
        res->message.append(": ");
        res->message.append(file_io_status_name(read));
        return;
    }

    std::vector<std::byte> jpeg;
    const JpegExtractResult extracted
        = extract_embedded_jpeg(std::span<const std::byte>(container.data(),
                                                           container.size()),
                                &jpeg, config_.extract);
    res->marker_found = extracted.marker_found;
    res->jpeg_offset  = extracted.offset;
    res->jpeg_size    = extracted.size;
    if (extracted.status == JpegExtractStatus::MarkerNotFound) {
        res->status  = ConvertStatus::MarkerNotFound;
        res->message = "Error converting file: no JPEG start-of-image marker in ";
        res->message.append(console_safe(src_path));
        return;
    }
    if (extracted.status == JpegExtractStatus::LimitExceeded) {
        res->status  = ConvertStatus::LimitExceeded;
        res->message = "Error converting file: embedded JPEG of ";
        res->message.append(std::to_string(extracted.size));
        res->message.append(" bytes exceeds limit in ");
        res->message.append(console_safe(src_path));
        return;
    }

    if (config_.debug) {
        if (extracted.marker_found) {
            std::string line = "  header=";
            line.append(std::to_string(extracted.offset));
            line.append(" bytes [");
            line.append(hex_preview(
                std::span<const std::byte>(container.data(),
                                           static_cast<size_t>(
                                               extracted.offset)),
                kHeaderPreviewBytes));
            line.append("] jpeg=");
            line.append(std::to_string(extracted.size));
            line.append(" bytes");
            log_line(line);
        } else {
            log_line("  no JPEG marker, passing the container through");
        }
    }

    const FileIoStatus wrote
        = write_file_bytes(res->output_path.c_str(),
                           std::span<const std::byte>(jpeg.data(),
                                                      jpeg.size()));
    if (wrote != FileIoStatus::Ok) {
        res->status  = ConvertStatus::IoFailure;
        res->message = "Error writing file: ";
        res->message.append(console_safe(res->output_path));
        res->message.append(": ");
        res->message.append(file_io_status_name(wrote));
        return;
    }

    res->status = ConvertStatus::Ok;
    log_line("Successfully converted the " + console_safe(src_path)
             + " image in " + console_safe(res->output_path) + ".");
}


ConvertFileResult
SnapmaticConverter::convert_file(std::string_view name)
{
    ConvertFileResult res;
    res.file_name = std::string(name);
    if (!is_plain_file_name(name)) {
        res.status  = ConvertStatus::InvalidInput;
        res.message = "Error processing file: Invalid file name: ";
        res.message.append(console_safe(name));
        return res;
    }

    log_line("Analyzing Snapmatic file in folder.");
    const DiscoveryStatus ds = find_snapmatic_file(config_.src_dir,
                                                   config_.name_prefix, name);
    if (ds == DiscoveryStatus::NoSuchEntry) {
        log_line("No Snapmatic picture found matching that name.");
        res.status  = from_discovery(ds);
        res.message = missing_entry_message(name);
        return res;
    }
    if (ds != DiscoveryStatus::Ok) {
        res.status  = from_discovery(ds);
        res.message = discovery_message(ds, config_.src_dir);
        return res;
    }

    std::string dir_message;
    const ConvertStatus dir_status = ensure_destination_dir(&dir_message);
    if (dir_status != ConvertStatus::Ok) {
        res.status  = dir_status;
        res.message = std::move(dir_message);
        return res;
    }

    convert_discovered(&res);
    log_line("Done.");
    return res;
}


BatchConvertResult
SnapmaticConverter::convert_all()
{
    BatchConvertResult batch;

    log_line("Analyzing Snapmatic files in folder.");
    std::vector<std::string> names;
    const DiscoveryStatus ds = list_snapmatic_files(config_.src_dir,
                                                    config_.name_prefix,
                                                    &names);
    if (ds != DiscoveryStatus::Ok) {
        batch.status  = from_discovery(ds);
        batch.message = discovery_message(ds, config_.src_dir);
        return batch;
    }
    if (names.empty()) {
        log_line("No Snapmatic pictures found.");
        return batch;
    }

    const ConvertStatus dir_status = ensure_destination_dir(&batch.message);
    if (dir_status != ConvertStatus::Ok) {
        batch.status = dir_status;
        return batch;
    }

    batch.files.reserve(names.size());
    for (std::string& name : names) {
        ConvertFileResult res;
        res.file_name = std::move(name);
        convert_discovered(&res);
        if (res.status == ConvertStatus::Ok) {
            batch.converted += 1U;
        } else {
            batch.failed += 1U;
        }
        batch.files.push_back(std::move(res));
    }
    log_line("Done.");
    return batch;
}


BatchConvertResult
SnapmaticConverter::convert_some(std::span<const std::string> names)
{
    BatchConvertResult batch;
    if (names.empty()) {
        batch.status  = ConvertStatus::InvalidInput;
        batch.message = "Error processing some files: Missing list of files.";
        return batch;
    }
    for (const std::string& name : names) {
        if (!is_plain_file_name(name)) {
            batch.status  = ConvertStatus::InvalidInput;
            batch.message = "Error processing some files: Invalid file name: ";
            batch.message.append(console_safe(name));
            return batch;
        }
    }

    log_line("Analyzing Snapmatic files in folder.");
    std::vector<std::string> found;
    const DiscoveryStatus ds = select_snapmatic_files(config_.src_dir,
                                                      config_.name_prefix,
                                                      names, &found, nullptr);
    if (ds != DiscoveryStatus::Ok) {
        batch.status  = from_discovery(ds);
        batch.message = discovery_message(ds, config_.src_dir);
        return batch;
    }

    if (found.empty()) {
        log_line("No Snapmatic pictures found.");
    } else {
        const ConvertStatus dir_status = ensure_destination_dir(
            &batch.message);
        if (dir_status != ConvertStatus::Ok) {
            batch.status = dir_status;
            return batch;
        }
    }

    std::vector<std::string> seen;
    for (const std::string& name : names) {
        if (contains(seen, name)) {
            continue;
        }
        seen.push_back(name);

        ConvertFileResult res;
        res.file_name = name;
        if (contains(found, name)) {
            convert_discovered(&res);
        } else {
            res.status  = ConvertStatus::NotFound;
            res.message = missing_entry_message(name);
        }
        if (res.status == ConvertStatus::Ok) {
            batch.converted += 1U;
        } else {
            batch.failed += 1U;
        }
        batch.files.push_back(std::move(res));
    }
    log_line("Done.");
    return batch;
}

}  // namespace snapconv
