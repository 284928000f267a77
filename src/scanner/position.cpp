#include "lispscan/scanner/position.hpp"

namespace lispscan::scanner {

auto Position::to_string() const -> std::string {
    std::string out = filename.empty() ? "<input>" : filename;
    if (is_valid()) {
        out += ':' + std::to_string(line) + ':' + std::to_string(column);
    }
    return out;
}

auto operator<<(std::ostream& os, const Position& pos) -> std::ostream& {
    return os << pos.to_string();
}

} // namespace lispscan::scanner
