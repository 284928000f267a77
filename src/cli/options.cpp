#include "cli/options.hpp"

#include "lispscan/log/log.hpp"

#include <iostream>
#include <utility>

namespace lispscan::cli {

namespace {

constexpr std::pair<std::string_view, uint32_t> MODE_NAMES[] = {
    {"idents", scanner::SCAN_IDENTS},
    {"ints", scanner::SCAN_INTS},
    {"floats", scanner::SCAN_FLOATS},
    {"strings", scanner::SCAN_STRINGS},
    {"keywords", scanner::SCAN_KEYWORDS},
    {"raw-strings", scanner::SCAN_RAW_STRINGS},
    {"comments", scanner::SCAN_COMMENTS},
    {"skip-comments", scanner::SCAN_COMMENTS | scanner::SKIP_COMMENTS},
    {"all", scanner::LISP_TOKENS},
};

} // namespace

auto parse_mode_list(std::string_view list) -> Result<uint32_t, std::string> {
    uint32_t mode = 0;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = list.size();
        }
        auto name = list.substr(pos, comma - pos);
        pos = comma + 1;
        if (name.empty()) {
            continue;
        }

        bool found = false;
        for (const auto& [mode_name, bits] : MODE_NAMES) {
            if (name == mode_name) {
                mode |= bits;
                found = true;
                break;
            }
        }
        if (!found) {
            return "unknown token class '" + std::string(name) + "'";
        }
    }
    return mode;
}

auto parse_options(int argc, char* argv[]) -> Result<Options, std::string> {
    Options opts;
    bool keep_comments = false;
    bool have_input = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            opts.show_version = true;
        } else if (arg.starts_with("--mode=")) {
            auto mode = parse_mode_list(arg.substr(7));
            if (is_err(mode)) {
                return unwrap_err(mode);
            }
            opts.mode = unwrap(mode);
        } else if (arg == "--keep-comments") {
            keep_comments = true;
        } else if (arg.starts_with("--filename=")) {
            opts.filename = std::string(arg.substr(11));
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg != "-" && arg.starts_with("-")) {
            return "unknown option '" + std::string(arg) + "'";
        } else if (have_input) {
            return std::string("only one input file may be given");
        } else {
            opts.input = std::string(arg);
            have_input = true;
        }
    }

    if (keep_comments) {
        opts.mode = (opts.mode | scanner::SCAN_COMMENTS) & ~scanner::SKIP_COMMENTS;
    }
    return opts;
}

void print_usage() {
    std::cout << "lispscan " << VERSION << "\n\n";
    std::cout << "Usage: lispscan [options] [file]\n\n";
    std::cout << "Prints the tokens of a Lisp source file, one per line.\n";
    std::cout << "Reads standard input when file is '-' or missing.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --mode=<list>       Token classes to recognize (default: all)\n";
    std::cout << "                      idents,ints,floats,strings,keywords,\n";
    std::cout << "                      raw-strings,comments,skip-comments\n";
    std::cout << "  --keep-comments     Report comments instead of skipping them\n";
    std::cout << "  --filename=<name>   Name shown in positions\n";
    std::cout << "  --help, -h          Show this help\n";
    std::cout << "  --version, -V       Show version\n\n";
    std::cout << "Logging:\n";
    std::cout << "  --log-level=<lvl>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec> Per-module levels, e.g. scanner=debug,*=warn\n";
    std::cout << "  --log-file=<path>   Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>  text or json\n";
    std::cout << "  -q, -v, -vv, -vvv   Quieter or more verbose logging\n";
}

void print_version() {
    std::cout << "lispscan " << VERSION << "\n";
}

} // namespace lispscan::cli
