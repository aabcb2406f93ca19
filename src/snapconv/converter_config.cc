#include "snapconv/converter_config.h"

#include <filesystem>

namespace snapconv {

std::string
normalize_dir_path(std::string_view path)
{
    if (path.empty()) {
        return std::string();
    }
    std::filesystem::path p
        = std::filesystem::path(std::string(path)).lexically_normal();
    // lexically_normal() keeps a trailing separator ("a/b/").
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    std::string out = p.string();
    return out.empty() ? std::string(".") : out;
}


ConverterConfig
make_converter_config(std::string_view base_dir)
{
    const std::filesystem::path base(
        std::string(base_dir.empty() ? kDefaultBaseDir : base_dir));

    ConverterConfig config;
    config.src_dir = normalize_dir_path((base / "source").string());
    config.dst_dir = normalize_dir_path((base / "converted").string());
    return config;
}

}  // namespace snapconv
