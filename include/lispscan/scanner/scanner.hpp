//! # lispscan Scanner
//!
//! A single-pass scanner that turns a UTF-8 byte stream into Lisp tokens:
//! identifiers, keywords, integer and float literals in several radixes,
//! string and raw-string literals, line comments and single characters.
//!
//! ## Features
//!
//! - **Pull interface**: callers ask for one token at a time via `scan()`
//! - **One rune of lookahead**: `peek()` never consumes input
//! - **Positions**: every token records filename, byte offset, line and column
//! - **Configurable classes**: mode bits turn token classes on and off
//! - **Pluggable identifiers**: any `(rune, index) -> bool` predicate
//!
//! ## Error Recovery
//!
//! Malformed input never stops the scan. Each problem increments
//! `error_count()` and is reported to the installed error handler, or logged
//! under the `scanner` module when there is none; the scanner still returns
//! a token covering the offending text. Only a failing byte source ends a
//! scan early, and it surfaces as an `IoError` result.
//!
//! ## Example
//!
//! ```cpp
//! StringSource source("(def a 10) ; the answer");
//! Scanner scanner(source);
//!
//! for (;;) {
//!     auto result = scanner.scan();
//!     if (is_err(result) || unwrap(result).is_eof()) {
//!         break;
//!     }
//!     std::cout << scanner.position() << ": " << scanner.token_text() << "\n";
//! }
//! ```

#ifndef LISPSCAN_SCANNER_SCANNER_HPP
#define LISPSCAN_SCANNER_SCANNER_HPP

#include "lispscan/common.hpp"
#include "lispscan/scanner/byte_source.hpp"
#include "lispscan/scanner/mode.hpp"
#include "lispscan/scanner/position.hpp"
#include "lispscan/scanner/token.hpp"
#include "lispscan/scanner/utf8.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lispscan::scanner {

/// Lexical scanner for Lisp source.
///
/// One scanner reads one byte source. The source is borrowed and must
/// outlive the scanner. Scanners are not thread-safe; use one per input.
///
/// # Defaults
///
/// | Setting            | Default                |
/// |--------------------|------------------------|
/// | mode               | `LISP_TOKENS`          |
/// | whitespace         | `LISP_WHITESPACE`      |
/// | identifier runes   | `is_lisp_ident_rune`   |
/// | raw delimiter      | `¬` (U+00AC)           |
/// | filename           | empty                  |
class Scanner {
public:
    /// Receives each lexical error as it happens.
    ///
    /// `scanner.pos()` is the position just past the offending rune.
    using ErrorHandler = std::function<void(const Scanner& scanner, std::string_view message)>;

    /// Size of the internal read buffer.
    static constexpr size_t BUFFER_SIZE = 1024;

    /// Constructs a scanner reading from `source`.
    explicit Scanner(ByteSource& source);

    Scanner(const Scanner&) = delete;
    auto operator=(const Scanner&) -> Scanner& = delete;

    // ========================================================================
    // Scanning
    // ========================================================================

    /// Scans the next token.
    ///
    /// Skips whitespace (and comments with `SKIP_COMMENTS`), then returns
    /// the next token. At end of input returns `Eof`, on every call. The
    /// text and position of the token are available until the next call.
    ///
    /// A byte source failure is returned in place of the token being
    /// scanned when it happened, so a token still waiting for bytes at
    /// that point is never returned.
    [[nodiscard]] auto scan() -> Result<Token, IoError>;

    /// Consumes and returns the next character, or `Eof`.
    ///
    /// Does not skip whitespace. Clears the token text and invalidates
    /// `position()`.
    [[nodiscard]] auto next_char() -> Result<Token, IoError>;

    /// Returns the next character, or `Eof`, without consuming it.
    [[nodiscard]] auto peek() -> Result<Token, IoError>;

    // ========================================================================
    // Last Token
    // ========================================================================

    /// Verbatim source text of the last token scanned.
    ///
    /// Quotes and escapes are kept. Malformed UTF-8 appears as U+FFFD.
    [[nodiscard]] auto token_text() const -> std::string_view {
        return text_;
    }

    /// Decoded value of the last token scanned.
    ///
    /// For `String` and `RawString` tokens, the contents without delimiters
    /// and with escapes (or doubled delimiters) resolved. Otherwise the same
    /// as `token_text()`.
    [[nodiscard]] auto token_value() const -> std::string_view {
        return (kind_ == TokenKind::String || kind_ == TokenKind::RawString) ? value_ : text_;
    }

    /// Start position of the last token scanned.
    ///
    /// Invalid (line 0) after `next_char()`.
    [[nodiscard]] auto position() const -> const Position& {
        return position_;
    }

    /// Position immediately after the last rune or token consumed.
    [[nodiscard]] auto pos() const -> Position;

    /// Number of lexical errors seen so far.
    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Sets the filename recorded in positions.
    void set_filename(std::string filename);

    [[nodiscard]] auto filename() const -> const std::string& {
        return position_.filename;
    }

    /// Selects the recognized token classes (`SCAN_*` bits).
    void set_mode(uint32_t mode);

    [[nodiscard]] auto mode() const -> uint32_t {
        return mode_;
    }

    /// Selects the characters below 64 skipped between tokens.
    void set_whitespace(uint64_t whitespace);

    [[nodiscard]] auto whitespace() const -> uint64_t {
        return whitespace_;
    }

    /// Replaces the identifier predicate. An empty function restores the
    /// default `is_lisp_ident_rune`.
    void set_ident_predicate(IdentPredicate predicate);

    /// Sets the rune that opens and closes raw strings.
    void set_raw_string_delimiter(Rune delimiter);

    [[nodiscard]] auto raw_string_delimiter() const -> Rune {
        return raw_delimiter_;
    }

    /// Installs an error handler. An empty function restores logging.
    void set_error_handler(ErrorHandler handler);

private:
    // ========================================================================
    // Input State
    // ========================================================================

    ByteSource& source_;
    std::array<char, BUFFER_SIZE> buf_{}; ///< Bytes read but not yet decoded.
    size_t buf_pos_ = 0;                  ///< Next undecoded byte.
    size_t buf_end_ = 0;                  ///< End of valid bytes.
    bool source_done_ = false;            ///< Source reported end of input or failed.
    std::optional<IoError> io_error_;     ///< First read failure; sticky.

    // ========================================================================
    // Lookahead and Position Counters
    // ========================================================================

    Rune ch_ = 0;            ///< Lookahead rune, valid once `started_`.
    bool started_ = false;   ///< First rune has been read.
    std::array<char, utf8::MAX_BYTES> ch_bytes_{}; ///< Encoding of `ch_`.
    size_t ch_len_ = 0;      ///< Bytes in `ch_bytes_`, 0 at end of input.
    size_t offset_ = 0;      ///< Bytes consumed, lookahead included.
    uint32_t line_ = 1;      ///< Line of the lookahead.
    uint32_t column_ = 0;    ///< Column of the lookahead, 0 right after a newline.
    uint32_t last_line_len_ = 0; ///< Length of the previous line, newline included.
    size_t last_char_len_ = 0;   ///< Bytes in the lookahead rune.

    // ========================================================================
    // Token State
    // ========================================================================

    bool recording_ = false;
    std::string text_;
    std::string value_;
    TokenKind kind_ = TokenKind::Eof;
    Position position_;
    size_t error_count_ = 0;

    // ========================================================================
    // Configuration
    // ========================================================================

    uint32_t mode_ = LISP_TOKENS;
    uint64_t whitespace_ = LISP_WHITESPACE;
    IdentPredicate ident_predicate_;
    Rune raw_delimiter_ = DEFAULT_RAW_DELIMITER;
    ErrorHandler error_handler_;

    // ========================================================================
    // Rune Reader (scanner_reader.cpp)
    // ========================================================================

    /// Consumes the lookahead and reads the following rune.
    auto next() -> Rune;

    /// Refills the buffer until it holds a full rune or the source is done.
    void fill();

    /// Reads the first rune on first use, dropping a leading BOM.
    auto lookahead() -> Rune;

    /// Current line and column of the lookahead, for positions.
    [[nodiscard]] auto line_column() const -> std::pair<uint32_t, uint32_t>;

    /// Wraps a rune as a token and attaches any pending read failure.
    [[nodiscard]] auto finish(Token tok) const -> Result<Token, IoError>;

    // ========================================================================
    // Recognizers
    // ========================================================================

    void error(std::string_view message);

    [[nodiscard]] auto is_ident_rune(Rune ch, size_t index) const -> bool;

    auto scan_identifier(Rune ch, size_t index) -> Rune;
    auto scan_comment(Rune ch) -> Rune;

    /// Scans a number whose first rune is `ch`. With `seen_dot`, the `.` is
    /// already consumed and `ch` is the first fraction digit.
    auto scan_number(Rune ch, bool seen_dot) -> std::pair<TokenKind, Rune>;
    auto scan_digits(Rune ch, int base, Rune& invalid, int& digsep) -> Rune;

    /// Scans a string body; returns with the closing quote as lookahead.
    void scan_string(Rune quote);
    auto scan_escape(Rune quote) -> Rune;
    auto scan_fixed_escape(Rune ch, char letter, int base, size_t count) -> Rune;
    auto scan_raw_string() -> Rune;
};

} // namespace lispscan::scanner

#endif // LISPSCAN_SCANNER_SCANNER_HPP
