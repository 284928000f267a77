//! # CLI Options
//!
//! Command-line parsing for the `lispscan` tool. Logging options are
//! recognized here only so they can be skipped; `log::parse_log_options`
//! interprets them.

#ifndef LISPSCAN_CLI_OPTIONS_HPP
#define LISPSCAN_CLI_OPTIONS_HPP

#include "lispscan/common.hpp"
#include "lispscan/scanner/mode.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace lispscan::cli {

/// Settings for one run of the tool.
struct Options {
    uint32_t mode = scanner::LISP_TOKENS;
    std::string input = "-";    ///< Path, or "-" for stdin
    std::string filename;       ///< Overrides the name shown in positions
    bool show_help = false;
    bool show_version = false;
};

/// Parses a comma-separated list of token class names into mode bits.
///
/// Names: `idents`, `ints`, `floats`, `strings`, `keywords`,
/// `raw-strings`, `comments`, `skip-comments`, or `all`.
[[nodiscard]] auto parse_mode_list(std::string_view list) -> Result<uint32_t, std::string>;

/// Parses the tool's arguments. Returns an error message on bad usage.
[[nodiscard]] auto parse_options(int argc, char* argv[]) -> Result<Options, std::string>;

void print_usage();
void print_version();

} // namespace lispscan::cli

#endif // LISPSCAN_CLI_OPTIONS_HPP
