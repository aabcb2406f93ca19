#pragma once

#include "snapconv/converter_config.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

/**
 * \file cli_options.h
 * \brief Command line parsing and dispatch for the `snapconv` tool.
 */

namespace snapconv {

/// Process exit status of `snapconv`.
inline constexpr int kExitOk         = 0;
inline constexpr int kExitFailed     = 1;
inline constexpr int kExitUsageError = 2;

/// What `main` should do after \ref parse_cli_args.
enum class CliAction : uint8_t {
    Convert,
    Help,
    Version,
    /// Unknown option, missing or malformed value. See \ref CliOptions::error.
    UsageError,
};

/// Which converter entry point handles the positional names.
enum class ConvertMode : uint8_t {
    All,
    One,
    Some,
};

struct CliOptions final {
    bool show_build_info = true;
    ConverterConfig config;
    /// Positional container names, in command line order.
    std::vector<std::string> names;
    /// One-line reason for \ref CliAction::UsageError.
    std::string error;
};

/**
 * \brief Parses a decimal unsigned 64-bit value.
 *
 * Only digits are accepted: signs, whitespace and values past UINT64_MAX
 * are rejected.
 */
bool
parse_u64_arg(const char* s, uint64_t* out) noexcept;

/**
 * \brief Builds \p out from `argv`.
 *
 * Options come first; the first argument that is not an option starts the
 * list of container names. Defaults come from \ref make_converter_config,
 * and `--src`/`--dst` override the paths derived from `--base-dir`.
 */
CliAction
parse_cli_args(int argc, const char* const* argv, CliOptions* out);

/// No names converts all, one uses convert-one, several use convert-subset.
ConvertMode
convert_mode_for(size_t name_count) noexcept;

/**
 * \brief Runs the conversion described by \p options.
 *
 * Progress goes to \p out and failures to \p err. Returns \ref kExitOk when
 * every file converted and \ref kExitFailed otherwise.
 */
int
run_cli_conversion(const CliOptions& options, std::FILE* out, std::FILE* err);

}  // namespace snapconv
