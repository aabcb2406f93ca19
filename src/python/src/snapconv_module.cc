#include "snapconv/build_info.h"
#include "snapconv/converter_config.h"
#include "snapconv/jpeg_extract.h"
#include "snapconv/snapmatic_convert.h"
#include "snapconv/snapmatic_scan.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace snapconv {
namespace {

    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static nb::bytes extract_to_python(nb::bytes data,
                                       const JpegExtractOptions& options)
    {
        std::vector<std::byte> out;
        JpegExtractResult res;
        {
            nb::gil_scoped_release gil_release;
            res = extract_embedded_jpeg(bytes_view(data), &out, options);
        }
        if (res.status == JpegExtractStatus::MarkerNotFound) {
            throw std::invalid_argument("no JPEG start-of-image marker");
        }
        if (res.status != JpegExtractStatus::Ok) {
            throw std::length_error("embedded JPEG exceeds max_output_bytes");
        }
        return nb::bytes(reinterpret_cast<const char*>(out.data()), out.size());
    }


    static std::vector<std::string> list_files(const std::string& src_dir,
                                               const std::string& prefix)
    {
        std::vector<std::string> names;
        const DiscoveryStatus st = list_snapmatic_files(src_dir, prefix,
                                                        &names);
        if (st != DiscoveryStatus::Ok) {
            throw std::runtime_error(std::string("list_snapmatic_files: ")
                                     + discovery_status_name(st));
        }
        return names;
    }


    static ConverterConfig config_for_python(ConverterConfig config)
    {
        // stdout diagnostics only with debug.
        config.log = config.debug ? stdout : nullptr;
        return config;
    }

}  // namespace
}  // namespace snapconv


NB_MODULE(_snapconv, m)
{
    using namespace snapconv;

    m.doc()               = "SnapConv Snapmatic to JPEG bindings (nanobind).";
    m.attr("__version__") = std::string(build_info().version);

    nb::enum_<MissingMarkerPolicy>(m, "MissingMarkerPolicy")
        .value("Fail", MissingMarkerPolicy::Fail)
        .value("PassThrough", MissingMarkerPolicy::PassThrough);

    nb::enum_<JpegExtractStatus>(m, "JpegExtractStatus")
        .value("Ok", JpegExtractStatus::Ok)
        .value("MarkerNotFound", JpegExtractStatus::MarkerNotFound)
        .value("LimitExceeded", JpegExtractStatus::LimitExceeded);

    nb::enum_<ConvertStatus>(m, "ConvertStatus")
        .value("Ok", ConvertStatus::Ok)
        .value("InvalidInput", ConvertStatus::InvalidInput)
        .value("NotFound", ConvertStatus::NotFound)
        .value("IoFailure", ConvertStatus::IoFailure)
        .value("MarkerNotFound", ConvertStatus::MarkerNotFound)
        .value("LimitExceeded", ConvertStatus::LimitExceeded);

    nb::class_<JpegExtractOptions>(m, "JpegExtractOptions")
        .def(nb::init<>())
        .def_rw("on_missing_marker", &JpegExtractOptions::on_missing_marker)
        .def_rw("max_output_bytes", &JpegExtractOptions::max_output_bytes);

    nb::class_<ConverterConfig>(m, "ConverterConfig")
        .def(nb::init<>())
        .def_rw("src_dir", &ConverterConfig::src_dir)
        .def_rw("dst_dir", &ConverterConfig::dst_dir)
        .def_rw("name_prefix", &ConverterConfig::name_prefix)
        .def_rw("debug", &ConverterConfig::debug)
        .def_rw("max_file_bytes", &ConverterConfig::max_file_bytes)
        .def_rw("extract", &ConverterConfig::extract);

    nb::class_<ConvertFileResult>(m, "ConvertFileResult")
        .def_ro("file_name", &ConvertFileResult::file_name)
        .def_ro("status", &ConvertFileResult::status)
        .def_ro("output_path", &ConvertFileResult::output_path)
        .def_ro("marker_found", &ConvertFileResult::marker_found)
        .def_ro("jpeg_offset", &ConvertFileResult::jpeg_offset)
        .def_ro("jpeg_size", &ConvertFileResult::jpeg_size)
        .def_ro("message", &ConvertFileResult::message);

    nb::class_<BatchConvertResult>(m, "BatchConvertResult")
        .def_ro("status", &BatchConvertResult::status)
        .def_ro("message", &BatchConvertResult::message)
        .def_ro("files", &BatchConvertResult::files)
        .def_ro("converted", &BatchConvertResult::converted)
        .def_ro("failed", &BatchConvertResult::failed);

    nb::class_<SnapmaticConverter>(m, "SnapmaticConverter")
        .def(
            "__init__",
            [](SnapmaticConverter* self, const ConverterConfig& config) {
                new (self) SnapmaticConverter(config_for_python(config));
            },
            "config"_a)
        .def_prop_rw(
            "src_dir", &SnapmaticConverter::src_dir,
            [](SnapmaticConverter& c, const std::string& dir) {
                c.set_src_dir(dir);
            })
        .def_prop_rw(
            "dst_dir", &SnapmaticConverter::dst_dir,
            [](SnapmaticConverter& c, const std::string& dir) {
                c.set_dst_dir(dir);
            })
        .def("convert_file", &SnapmaticConverter::convert_file, "name"_a,
             nb::call_guard<nb::gil_scoped_release>())
        .def("convert_all", &SnapmaticConverter::convert_all,
             nb::call_guard<nb::gil_scoped_release>())
        .def(
            "convert_some",
            [](SnapmaticConverter& c, const std::vector<std::string>& names) {
                nb::gil_scoped_release gil_release;
                return c.convert_some(
                    std::span<const std::string>(names.data(), names.size()));
            },
            "names"_a);

    m.def("make_converter_config", [](const std::string& base_dir) {
        return make_converter_config(base_dir);
    }, "base_dir"_a = std::string());

    m.def(
        "extract_embedded_jpeg",
        [](nb::bytes data, MissingMarkerPolicy policy,
           uint64_t max_output_bytes) {
            JpegExtractOptions options;
            options.on_missing_marker = policy;
            options.max_output_bytes  = max_output_bytes;
            return extract_to_python(std::move(data), options);
        },
        "data"_a, "on_missing_marker"_a = MissingMarkerPolicy::Fail,
        "max_output_bytes"_a = 0U);

    m.def("list_snapmatic_files", &list_files, "src_dir"_a,
          "prefix"_a = std::string(kSnapmaticNamePrefix));

    m.def("build_info_lines", &info_lines);
}
