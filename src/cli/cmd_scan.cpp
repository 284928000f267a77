//! # Scan Command
//!
//! Dumps the token stream of one input:
//!
//! ```text
//! core.lisp:1:1: ("(") (
//! core.lisp:1:2: (Ident) def
//! core.lisp:1:6: (Int) 10
//! ```

#include "cli/cmd_scan.hpp"

#include "lispscan/log/log.hpp"
#include "lispscan/scanner/scanner.hpp"

#include <fstream>
#include <iostream>

namespace lispscan::cli {

auto run_scan(scanner::ByteSource& source, const Options& opts, std::ostream& out) -> int {
    scanner::Scanner scan(source);
    scan.set_mode(opts.mode);
    scan.set_filename(opts.filename.empty() && opts.input != "-" ? opts.input : opts.filename);
    scan.set_error_handler([](const scanner::Scanner& s, std::string_view message) {
        LISPSCAN_LOG_ERROR("scanner", s.pos() << ": " << message);
    });

    size_t count = 0;
    for (;;) {
        auto result = scan.scan();
        if (is_err(result)) {
            LISPSCAN_LOG_ERROR("cli", scan.filename() << ": " << unwrap_err(result).message);
            return 1;
        }
        auto tok = unwrap(result);
        if (tok.is_eof()) {
            break;
        }
        out << scan.position() << ": (" << tok << ") " << scan.token_text() << "\n";
        ++count;
    }

    LISPSCAN_LOG_INFO("cli", "scanned " << count << " tokens, " << scan.error_count() << " errors");
    return scan.error_count() > 0 ? 1 : 0;
}

auto run_scan_command(const Options& opts) -> int {
    if (opts.input == "-") {
        scanner::StreamSource source(std::cin);
        return run_scan(source, opts, std::cout);
    }

    std::ifstream file(opts.input, std::ios::binary);
    if (!file) {
        LISPSCAN_LOG_ERROR("cli", "cannot open " << opts.input);
        return 1;
    }
    scanner::StreamSource source(file);
    return run_scan(source, opts, std::cout);
}

} // namespace lispscan::cli
