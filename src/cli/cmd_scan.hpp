#ifndef LISPSCAN_CLI_CMD_SCAN_HPP
#define LISPSCAN_CLI_CMD_SCAN_HPP

#include "cli/options.hpp"
#include "lispscan/scanner/byte_source.hpp"

#include <ostream>

namespace lispscan::cli {

/// Writes one `position: (Kind) text` line per token of `source` to `out`.
///
/// Returns the process exit code: 0 on a clean scan, 1 if the input had
/// lexical errors or could not be read.
auto run_scan(scanner::ByteSource& source, const Options& opts, std::ostream& out) -> int;

/// Opens `opts.input` (or stdin) and runs `run_scan` on it.
auto run_scan_command(const Options& opts) -> int;

} // namespace lispscan::cli

#endif // LISPSCAN_CLI_CMD_SCAN_HPP
