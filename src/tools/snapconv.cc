#include "snapconv/build_info.h"
#include "snapconv/cli_options.h"

#include <cstdio>
#include <string>

namespace snapconv {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] [file...]\n"
            "\n"
            "Extracts the JPEG image embedded in Snapmatic (PGTA*) files.\n"
            "Without file names every Snapmatic file in the source directory\n"
            "is converted.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print SnapConv build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --base-dir <dir>       Base directory (default: .); sets\n"
            "                         <dir>/source and <dir>/converted\n"
            "  --src <dir>            Source directory (overrides --base-dir)\n"
            "  --dst <dir>            Destination directory (overrides --base-dir)\n"
            "  --prefix <str>         Container file name prefix (default: PGTA)\n"
            "  --debug                Print progress diagnostics\n"
            "  --pass-through         Copy files without a JPEG marker unchanged\n"
            "                         (default: report marker_not_found)\n"
            "  --max-file-bytes N     Refuse source files larger than N bytes\n"
            "                         (default: 0=unlimited)\n"
            "  --max-jpeg-bytes N     Refuse embedded images larger than N bytes\n"
            "                         (default: 0=unlimited)\n",
            argv0 ? argv0 : "snapconv");
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }

}  // namespace
}  // namespace snapconv


int
main(int argc, char** argv)
{
    using namespace snapconv;

    CliOptions options;
    switch (parse_cli_args(argc, argv, &options)) {
    case CliAction::Help: usage(argv[0]); return kExitOk;
    case CliAction::Version: print_build_info_header(); return kExitOk;
    case CliAction::UsageError:
        std::fprintf(stderr, "snapconv: %s\n", options.error.c_str());
        usage(argv[0]);
        return kExitUsageError;
    case CliAction::Convert: break;
    }

    if (options.show_build_info) {
        print_build_info_header();
    }
    return run_cli_conversion(options, stdout, stderr);
}
