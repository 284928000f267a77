//! # Scanner Configuration
//!
//! Mode bits select which token classes the scanner recognizes; anything
//! whose class is disabled falls back to single `Char` tokens. The
//! whitespace mask selects which characters below 64 are skipped between
//! tokens. The identifier predicate decides which runes may start and
//! continue an identifier or keyword.
//!
//! ## Mode Bits
//!
//! Each bit is `1 << -code` of the matching token kind, so the bit for
//! `Ident` (code -2) is `1 << 2`. `SKIP_COMMENTS` reuses the slot after
//! `Comment` and has no token kind of its own.
//!
//! ```cpp
//! scanner.set_mode(SCAN_IDENTS | SCAN_INTS);     // 3.5 scans as Int, '.', Int
//! scanner.set_whitespace(LISP_WHITESPACE & ~(uint64_t{1} << '\n'));
//! ```

#ifndef LISPSCAN_SCANNER_MODE_HPP
#define LISPSCAN_SCANNER_MODE_HPP

#include "lispscan/scanner/token.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace lispscan::scanner {

namespace detail {
constexpr auto mode_bit(TokenKind kind) -> uint32_t {
    return uint32_t{1} << -static_cast<int32_t>(kind);
}
} // namespace detail

// ============================================================================
// Mode Bits
// ============================================================================

constexpr uint32_t SCAN_IDENTS = detail::mode_bit(TokenKind::Ident);
constexpr uint32_t SCAN_INTS = detail::mode_bit(TokenKind::Int);
/// Also recognizes integers.
constexpr uint32_t SCAN_FLOATS = detail::mode_bit(TokenKind::Float);
constexpr uint32_t SCAN_STRINGS = detail::mode_bit(TokenKind::String);
constexpr uint32_t SCAN_KEYWORDS = detail::mode_bit(TokenKind::Keyword);
constexpr uint32_t SCAN_RAW_STRINGS = detail::mode_bit(TokenKind::RawString);
constexpr uint32_t SCAN_COMMENTS = detail::mode_bit(TokenKind::Comment);
/// Recognized comments are dropped instead of returned.
constexpr uint32_t SKIP_COMMENTS = SCAN_COMMENTS << 1;

/// Every token class, with comments skipped.
constexpr uint32_t LISP_TOKENS = SCAN_IDENTS | SCAN_INTS | SCAN_FLOATS | SCAN_STRINGS |
                                 SCAN_KEYWORDS | SCAN_RAW_STRINGS | SCAN_COMMENTS | SKIP_COMMENTS;

static_assert(SCAN_IDENTS == 1u << 2 && SKIP_COMMENTS == 1u << 9);

// ============================================================================
// Whitespace
// ============================================================================

/// Tab, newline, carriage return and space.
constexpr uint64_t LISP_WHITESPACE =
    (uint64_t{1} << '\t') | (uint64_t{1} << '\n') | (uint64_t{1} << '\r') | (uint64_t{1} << ' ');

/// Checks whether `r` is in the whitespace mask. Runes >= 64 never are.
[[nodiscard]] constexpr auto is_whitespace(uint64_t mask, Rune r) -> bool {
    return r < 64 && (mask & (uint64_t{1} << r)) != 0;
}

// ============================================================================
// Identifiers
// ============================================================================

/// Decides whether `rune` may appear at position `index` of an identifier.
///
/// Index 0 is the first rune. For keywords the index counts from the rune
/// after the colon.
using IdentPredicate = std::function<bool(Rune rune, size_t index)>;

/// The default Lisp identifier predicate.
///
/// Any index accepts Unicode letters and `_ $ * + / ? ! < > =`; indices
/// after the first also accept `-` and Unicode numbers (Nd, Nl, No).
[[nodiscard]] auto is_lisp_ident_rune(Rune rune, size_t index) -> bool;

/// Default raw-string delimiter, U+00AC NOT SIGN.
constexpr Rune DEFAULT_RAW_DELIMITER = 0x00AC;

} // namespace lispscan::scanner

#endif // LISPSCAN_SCANNER_MODE_HPP
