#include "snapconv/snapmatic_scan.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace snapconv {
namespace {

    namespace fs = std::filesystem;

    static DiscoveryStatus check_source_dir(const fs::path& dir) noexcept
    {
        std::error_code ec;
        const fs::file_status st = fs::status(dir, ec);
        if (st.type() == fs::file_type::not_found) {
            return DiscoveryStatus::NotFound;
        }
        if (ec) {
            return DiscoveryStatus::IoFailure;
        }
        if (!fs::is_directory(st)) {
            return DiscoveryStatus::NotADirectory;
        }
        return DiscoveryStatus::Ok;
    }


    static bool contains(std::span<const std::string> names,
                         std::string_view name) noexcept
    {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

}  // namespace

const char*
discovery_status_name(DiscoveryStatus status) noexcept
{
    switch (status) {
    case DiscoveryStatus::Ok: return "ok";
    case DiscoveryStatus::InvalidInput: return "invalid_input";
    case DiscoveryStatus::NotFound: return "not_found";
    case DiscoveryStatus::NotADirectory: return "not_a_directory";
    case DiscoveryStatus::IoFailure: return "io_failure";
    case DiscoveryStatus::NoSuchEntry: return "no_such_entry";
    }
    return "unknown";
}


bool
is_snapmatic_name(std::string_view name, std::string_view prefix) noexcept
{
    return name.size() >= prefix.size()
           && name.substr(0, prefix.size()) == prefix;
}


bool
is_plain_file_name(std::string_view name) noexcept
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}


DiscoveryStatus
list_snapmatic_files(const std::string& src_dir, std::string_view prefix,
                     std::vector<std::string>* names)
{
    if (!names) {
        return DiscoveryStatus::InvalidInput;
    }
    names->clear();
    if (src_dir.empty()) {
        return DiscoveryStatus::InvalidInput;
    }

    const fs::path dir(src_dir);
    const DiscoveryStatus st = check_source_dir(dir);
    if (st != DiscoveryStatus::Ok) {
        return st;
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return DiscoveryStatus::IoFailure;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (is_snapmatic_name(name, prefix)) {
            names->push_back(std::move(name));
        }
    }
    if (ec) {
        names->clear();
        return DiscoveryStatus::IoFailure;
    }
    return DiscoveryStatus::Ok;
}


DiscoveryStatus
select_snapmatic_files(const std::string& src_dir, std::string_view prefix,
                       std::span<const std::string> requested,
                       std::vector<std::string>* found,
                       std::vector<std::string>* missing)
{
    if (!found) {
        return DiscoveryStatus::InvalidInput;
    }
    found->clear();
    if (missing) {
        missing->clear();
    }

    std::vector<std::string> all;
    const DiscoveryStatus st = list_snapmatic_files(src_dir, prefix, &all);
    if (st != DiscoveryStatus::Ok) {
        return st;
    }

    for (std::string& name : all) {
        if (contains(requested, name) && !contains(*found, name)) {
            found->push_back(std::move(name));
        }
    }
    if (missing) {
        for (const std::string& name : requested) {
            if (!contains(*found, name) && !contains(*missing, name)) {
                missing->push_back(name);
            }
        }
    }
    return DiscoveryStatus::Ok;
}


DiscoveryStatus
find_snapmatic_file(const std::string& src_dir, std::string_view prefix,
                    std::string_view name)
{
    if (!is_plain_file_name(name)) {
        return DiscoveryStatus::InvalidInput;
    }

    std::vector<std::string> all;
    const DiscoveryStatus st = list_snapmatic_files(src_dir, prefix, &all);
    if (st != DiscoveryStatus::Ok) {
        return st;
    }
    return contains(all, name) ? DiscoveryStatus::Ok
                               : DiscoveryStatus::NoSuchEntry;
}

}  // namespace snapconv
