//! # Source Positions
//!
//! A `Position` snapshots where a token starts: the caller-supplied
//! filename, the byte offset from the start of input, and a 1-based line
//! and column. Columns count runes, not bytes, so `本語` occupies columns 1
//! and 2.
//!
//! ## Example
//!
//! ```cpp
//! Position pos{.filename = "core.lisp", .offset = 12, .line = 2, .column = 5};
//! pos.to_string(); // "core.lisp:2:5"
//! ```

#ifndef LISPSCAN_SCANNER_POSITION_HPP
#define LISPSCAN_SCANNER_POSITION_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace lispscan::scanner {

/// A source position.
///
/// A position is valid if `line > 0`. The scanner invalidates its token
/// position when `next_char()` consumes a rune outside of `scan()`.
struct Position {
    /// Filename metadata; never checked against the filesystem.
    std::string filename;

    /// Byte offset from the start of input (0-based).
    size_t offset = 0;

    /// Line number (1-based, 0 if invalid).
    uint32_t line = 0;

    /// Column number in runes (1-based, 0 if invalid).
    uint32_t column = 0;

    /// Reports whether the position is valid.
    [[nodiscard]] auto is_valid() const -> bool {
        return line > 0;
    }

    /// Formats as `file:line:column`, or just `file` for an invalid position.
    ///
    /// An empty filename prints as `<input>`.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const Position& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const Position& pos) -> std::ostream&;

} // namespace lispscan::scanner

#endif // LISPSCAN_SCANNER_POSITION_HPP
