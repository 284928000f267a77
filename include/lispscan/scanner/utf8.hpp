//! # UTF-8 Helpers
//!
//! Minimal UTF-8 decoding and encoding used by the rune reader and by the
//! string recognizers.
//!
//! Decoding is strict: overlong forms, surrogate code points, values past
//! U+10FFFF and stray continuation bytes are all rejected. A rejected
//! sequence decodes as `REPLACEMENT_RUNE` with a width of one byte, so the
//! caller resynchronizes on the next byte.

#ifndef LISPSCAN_SCANNER_UTF8_HPP
#define LISPSCAN_SCANNER_UTF8_HPP

#include "lispscan/scanner/token.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace lispscan::scanner::utf8 {

/// Maximum number of bytes in one encoded rune.
constexpr size_t MAX_BYTES = 4;

/// Result of decoding one rune.
struct Decoded {
    Rune rune;   ///< The decoded rune, or `REPLACEMENT_RUNE` when invalid.
    size_t size; ///< Bytes consumed (1 for an invalid sequence).
    bool valid;  ///< False if the bytes were not well-formed UTF-8.
};

/// Decodes the first rune of `bytes`.
///
/// `bytes` must not be empty.
[[nodiscard]] auto decode(std::string_view bytes) -> Decoded;

/// Reports whether `bytes` begins with a complete rune.
///
/// An invalid sequence counts as complete, since decoding it will not
/// change when more bytes arrive.
[[nodiscard]] auto full_rune(std::string_view bytes) -> bool;

/// Appends the UTF-8 encoding of `r` to `out`.
///
/// Surrogates and values past U+10FFFF are encoded as `REPLACEMENT_RUNE`.
void encode(std::string& out, Rune r);

/// Returns true if `r` is a Unicode scalar value.
[[nodiscard]] constexpr auto is_scalar(Rune r) -> bool {
    return r <= 0x10FFFF && (r < 0xD800 || r > 0xDFFF);
}

} // namespace lispscan::scanner::utf8

#endif // LISPSCAN_SCANNER_UTF8_HPP
