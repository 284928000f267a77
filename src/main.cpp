//! # lispscan Entry Point

#include "cli/cmd_scan.hpp"
#include "cli/options.hpp"
#include "lispscan/log/log.hpp"

#include <iostream>

auto main(int argc, char* argv[]) -> int {
    using namespace lispscan;

    std::ios::sync_with_stdio(false);
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = cli::parse_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "lispscan: " << unwrap_err(parsed) << "\n";
        std::cerr << "Try 'lispscan --help' for more information.\n";
        return 2;
    }
    const auto& opts = unwrap(parsed);

    if (opts.show_help) {
        cli::print_usage();
        return 0;
    }
    if (opts.show_version) {
        cli::print_version();
        return 0;
    }

    int code = cli::run_scan_command(opts);
    log::Logger::instance().flush();
    return code;
}
