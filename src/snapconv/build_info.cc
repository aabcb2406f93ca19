#include "snapconv/build_info.h"

#include "snapconv/build_info_generated.h"

namespace snapconv {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/SNAPCONV_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/SNAPCONV_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/SNAPCONV_BUILDINFO_BUILD_TYPE,
        /*system_name=*/SNAPCONV_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/SNAPCONV_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/SNAPCONV_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/SNAPCONV_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage_static=*/static_cast<bool>(SNAPCONV_BUILDINFO_LINKAGE_STATIC),
        /*linkage_shared=*/static_cast<bool>(SNAPCONV_BUILDINFO_LINKAGE_SHARED),
    };


    static std::string_view linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->assign("SnapConv v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type.empty() ? std::string_view("unknown")
                                            : bi.build_type);
        line1->append(" ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->assign("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace snapconv
