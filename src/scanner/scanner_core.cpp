//! # Scanner Core
//!
//! Construction, configuration, error reporting and the token dispatcher.
//!
//! ## Dispatch
//!
//! After skipping whitespace, the first rune of a token selects the
//! recognizer:
//!
//! | First rune              | Token                          |
//! |-------------------------|--------------------------------|
//! | `0`-`9`                 | `Int` / `Float`                |
//! | `.` + digit             | `Float`                        |
//! | identifier start        | `Ident`                        |
//! | `-`                     | `Ident` (`-`, `-x`) or number  |
//! | `"`                     | `String`                       |
//! | raw delimiter           | `RawString`                    |
//! | `:` + identifier start  | `Keyword`                      |
//! | `;`                     | `Comment` (or skipped)         |
//! | `~@`, `#{`              | `Ident`                        |
//! | anything else           | `Char`                         |
//!
//! A class whose mode bit is off falls through to `Char`.

#include "lispscan/log/log.hpp"
#include "lispscan/scanner/scanner.hpp"

namespace lispscan::scanner {

namespace {

auto is_decimal(Rune ch) -> bool {
    return ch >= '0' && ch <= '9';
}

} // namespace

Scanner::Scanner(ByteSource& source) : source_(source), ident_predicate_(is_lisp_ident_rune) {}

// ============================================================================
// Configuration
// ============================================================================

void Scanner::set_filename(std::string filename) {
    position_.filename = std::move(filename);
}

void Scanner::set_mode(uint32_t mode) {
    LISPSCAN_LOG_DEBUG("scanner", "mode: 0x" << std::hex << mode_ << " -> 0x" << mode);
    mode_ = mode;
}

void Scanner::set_whitespace(uint64_t whitespace) {
    LISPSCAN_LOG_DEBUG("scanner", "whitespace: 0x" << std::hex << whitespace);
    whitespace_ = whitespace;
}

void Scanner::set_ident_predicate(IdentPredicate predicate) {
    ident_predicate_ = predicate ? std::move(predicate) : IdentPredicate(is_lisp_ident_rune);
}

void Scanner::set_raw_string_delimiter(Rune delimiter) {
    LISPSCAN_LOG_DEBUG("scanner", "raw string delimiter: U+" << std::hex
                                                             << static_cast<uint32_t>(delimiter));
    raw_delimiter_ = delimiter;
}

void Scanner::set_error_handler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

// ============================================================================
// Errors
// ============================================================================

void Scanner::error(std::string_view message) {
    ++error_count_;
    if (error_handler_) {
        error_handler_(*this, message);
        return;
    }
    LISPSCAN_LOG_WARN("scanner", pos() << ": " << message);
}

auto Scanner::is_ident_rune(Rune ch, size_t index) const -> bool {
    return ch != EOF_RUNE && ident_predicate_(ch, index);
}

// ============================================================================
// Dispatch
// ============================================================================

auto Scanner::scan() -> Result<Token, IoError> {
    Rune ch = lookahead();
    Token tok;

    for (;;) {
        text_.clear();
        value_.clear();

        while (is_whitespace(whitespace_, ch)) {
            ch = next();
        }

        // Token text starts with the current lookahead
        recording_ = true;
        auto [line, column] = line_column();
        position_.offset = offset_ - last_char_len_;
        position_.line = line;
        position_.column = column;

        tok = Token::character(ch);

        if (ch == EOF_RUNE) {
            tok = Token{};
        } else if (is_decimal(ch)) {
            if ((mode_ & (SCAN_INTS | SCAN_FLOATS)) != 0) {
                auto [kind, after] = scan_number(ch, false);
                tok = Token{.kind = kind};
                ch = after;
            } else {
                ch = next();
            }
        } else if (ch == '.') {
            ch = next();
            if (is_decimal(ch) && (mode_ & SCAN_FLOATS) != 0) {
                auto [kind, after] = scan_number(ch, true);
                tok = Token{.kind = kind};
                ch = after;
            } else if ((mode_ & SCAN_IDENTS) != 0 && is_ident_rune('.', 0)) {
                tok = Token{.kind = TokenKind::Ident};
                ch = scan_identifier(ch, 1);
            }
        } else if (is_ident_rune(ch, 0)) {
            if ((mode_ & SCAN_IDENTS) != 0) {
                tok = Token{.kind = TokenKind::Ident};
                ch = scan_identifier(next(), 1);
            } else {
                ch = next();
            }
        } else if (ch == '-') {
            ch = next();
            if (is_ident_rune(ch, 0)) {
                // -minus
                if ((mode_ & SCAN_IDENTS) != 0) {
                    tok = Token{.kind = TokenKind::Ident};
                    ch = scan_identifier(next(), 1);
                }
            } else if (is_decimal(ch)) {
                // -9, -3.14
                if ((mode_ & (SCAN_INTS | SCAN_FLOATS)) != 0) {
                    auto [kind, after] = scan_number(ch, false);
                    tok = Token{.kind = kind};
                    ch = after;
                }
            } else if ((mode_ & SCAN_IDENTS) != 0) {
                tok = Token{.kind = TokenKind::Ident};
            }
        } else if (ch == raw_delimiter_) {
            if ((mode_ & SCAN_RAW_STRINGS) != 0) {
                tok = Token{.kind = TokenKind::RawString};
                ch = scan_raw_string();
            } else {
                ch = next();
            }
        } else {
            switch (ch) {
            case '"':
                if ((mode_ & SCAN_STRINGS) != 0) {
                    scan_string('"');
                    tok = Token{.kind = TokenKind::String};
                }
                ch = next();
                break;
            case ':':
                ch = next();
                if ((mode_ & SCAN_KEYWORDS) != 0 && is_ident_rune(ch, 0)) {
                    tok = Token{.kind = TokenKind::Keyword};
                    ch = scan_identifier(next(), 1);
                }
                break;
            case ';':
                ch = next();
                if ((mode_ & SCAN_COMMENTS) != 0) {
                    ch = scan_comment(ch);
                    if ((mode_ & SKIP_COMMENTS) != 0) {
                        recording_ = false;
                        continue;
                    }
                    tok = Token{.kind = TokenKind::Comment};
                }
                break;
            case '~':
                ch = next();
                if ((mode_ & SCAN_IDENTS) != 0 && ch == '@') {
                    tok = Token{.kind = TokenKind::Ident};
                    ch = next();
                }
                break;
            case '#':
                ch = next();
                if ((mode_ & SCAN_IDENTS) != 0 && ch == '{') {
                    tok = Token{.kind = TokenKind::Ident};
                    ch = next();
                }
                break;
            default:
                ch = next();
                break;
            }
        }
        break;
    }

    recording_ = false;
    ch_ = ch;
    kind_ = tok.kind;
    return finish(tok);
}

} // namespace lispscan::scanner
