//! # Token Definitions
//!
//! This module defines the tokens produced by the lispscan scanner.
//!
//! ## Encoding
//!
//! A token is either one of the named classes below or a single character.
//! Every token has a stable integer code: the named classes occupy the
//! negative range, and a character token's code is the character's own
//! Unicode code point. Downstream readers that switch on raw integers
//! (`'('`, `')'`, `'\''`) keep working through `Token::code()`.
//!
//! | Kind        | Code | Example text      |
//! |-------------|------|-------------------|
//! | `Eof`       | -1   |                   |
//! | `Ident`     | -2   | `read-string`     |
//! | `Int`       | -3   | `0x2A`            |
//! | `Float`     | -4   | `1.5e-3`          |
//! | `String`    | -5   | `"a\nb"`          |
//! | `Keyword`   | -6   | `:hello-world`    |
//! | `RawString` | -7   | `¬C:\path¬`       |
//! | `Comment`   | -8   | `;; note`         |
//! | `Char`      | rune | `(`               |

#ifndef LISPSCAN_SCANNER_TOKEN_HPP
#define LISPSCAN_SCANNER_TOKEN_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace lispscan::scanner {

/// One decoded Unicode scalar value.
using Rune = char32_t;

/// Rune value the reader uses internally for end of input.
///
/// Outside the Unicode range, so it never collides with a real character.
constexpr Rune EOF_RUNE = 0xFFFFFFFF;

/// The Unicode replacement character, produced for malformed input.
constexpr Rune REPLACEMENT_RUNE = 0xFFFD;

/// Token classes.
///
/// The enumerator values are the token codes of the reference encoding.
/// `Char` is the only class with a payload (the rune itself).
enum class TokenKind : int32_t {
    Char = 0,       ///< Single character; the code is the rune
    Eof = -1,       ///< End of input
    Ident = -2,     ///< Identifier: `def`, `*host-language*`, `-`
    Int = -3,       ///< Integer literal: `42`, `0x1F`, `0b101`, `017`
    Float = -4,     ///< Floating-point literal: `3.14`, `.5`, `0x1.fp+3`
    String = -5,    ///< Double-quoted string literal
    Keyword = -6,   ///< Colon-prefixed keyword: `:a`
    RawString = -7, ///< Delimited raw string literal
    Comment = -8,   ///< Line comment starting with `;`
};

/// A classified lexical unit.
///
/// Tokens are small values; the text and position of the most recent token
/// live in the scanner.
struct Token {
    /// The token class.
    TokenKind kind = TokenKind::Eof;

    /// The character for `TokenKind::Char`, zero otherwise.
    Rune rune = 0;

    /// Creates a single-character token.
    [[nodiscard]] static constexpr auto character(Rune r) -> Token {
        return Token{.kind = TokenKind::Char, .rune = r};
    }

    /// Rebuilds a token from its integer code.
    ///
    /// Non-negative codes are characters; unknown negative codes map to `Eof`.
    [[nodiscard]] static constexpr auto from_code(int32_t code) -> Token {
        if (code >= 0) {
            return character(static_cast<Rune>(code));
        }
        if (code < static_cast<int32_t>(TokenKind::Comment)) {
            return Token{};
        }
        return Token{.kind = static_cast<TokenKind>(code)};
    }

    /// Returns the integer code of this token.
    [[nodiscard]] constexpr auto code() const -> int32_t {
        return kind == TokenKind::Char ? static_cast<int32_t>(rune) : static_cast<int32_t>(kind);
    }

    /// Checks if this token is of the given kind.
    [[nodiscard]] constexpr auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    /// Checks if this token is the given single character.
    [[nodiscard]] constexpr auto is_char(Rune r) const -> bool {
        return kind == TokenKind::Char && rune == r;
    }

    /// Checks if this is an end-of-file token.
    [[nodiscard]] constexpr auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] constexpr auto operator==(const Token& other) const -> bool = default;
};

/// Returns a printable string for a token.
///
/// Named classes print as `EOF`, `Ident`, `Int`, `Float`, `String`,
/// `Keyword`, `RawString`, `Comment`; characters print quoted, e.g. `"("`.
[[nodiscard]] auto token_string(Token tok) -> std::string;

auto operator<<(std::ostream& os, Token tok) -> std::ostream&;

} // namespace lispscan::scanner

#endif // LISPSCAN_SCANNER_TOKEN_HPP
