//! # String Scanning
//!
//! String literals, raw strings, identifiers and comments.
//!
//! ## Escape Sequences
//!
//! | Escape       | Meaning                      |
//! |--------------|------------------------------|
//! | `\a` `\b` `\f` `\n` `\r` `\t` `\v` | control characters |
//! | `\\` `\"`    | backslash, quote             |
//! | `\0`         | NUL                          |
//! | `\NNN`       | octal code point, 3 digits   |
//! | `\xHH`       | hex code point, 2 digits     |
//! | `\uHHHH`     | Unicode scalar, 4 digits     |
//! | `\UHHHHHHHH` | Unicode scalar, 8 digits     |
//!
//! An unknown or truncated escape is an error and stays in the decoded
//! value as written. An escape naming a surrogate or a value past U+10FFFF
//! decodes to U+FFFD.
//!
//! ## Raw Strings
//!
//! Everything between two delimiters is taken literally, newlines
//! included. A doubled delimiter stands for one delimiter character.

#include "lispscan/scanner/scanner.hpp"

#include <string>

namespace lispscan::scanner {

namespace {

auto digit_value(Rune ch) -> int {
    if (ch >= '0' && ch <= '9') {
        return static_cast<int>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<int>(ch - 'a') + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<int>(ch - 'A') + 10;
    }
    return 16;
}

} // namespace

// ============================================================================
// Identifiers and Comments
// ============================================================================

auto Scanner::scan_identifier(Rune ch, size_t index) -> Rune {
    while (is_ident_rune(ch, index)) {
        ch = next();
        ++index;
    }
    return ch;
}

auto Scanner::scan_comment(Rune ch) -> Rune {
    while (ch != '\n' && ch != EOF_RUNE) {
        ch = next();
    }
    return ch;
}

// ============================================================================
// String Literals
// ============================================================================

void Scanner::scan_string(Rune quote) {
    Rune ch = next();
    while (ch != quote) {
        if (ch == '\n' || ch == EOF_RUNE) {
            error("literal not terminated");
            return;
        }
        if (ch == '\\') {
            ch = scan_escape(quote);
        } else {
            utf8::encode(value_, ch);
            ch = next();
        }
    }
}

auto Scanner::scan_escape(Rune quote) -> Rune {
    Rune ch = next();
    switch (ch) {
    case 'a':
        value_ += '\a';
        return next();
    case 'b':
        value_ += '\b';
        return next();
    case 'f':
        value_ += '\f';
        return next();
    case 'n':
        value_ += '\n';
        return next();
    case 'r':
        value_ += '\r';
        return next();
    case 't':
        value_ += '\t';
        return next();
    case 'v':
        value_ += '\v';
        return next();
    case '\\':
        value_ += '\\';
        return next();
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
        return scan_fixed_escape(ch, '\0', 8, 3);
    case 'x':
        return scan_fixed_escape(next(), 'x', 16, 2);
    case 'u':
        return scan_fixed_escape(next(), 'u', 16, 4);
    case 'U':
        return scan_fixed_escape(next(), 'U', 16, 8);
    default:
        break;
    }

    if (ch == quote) {
        utf8::encode(value_, quote);
        return next();
    }

    // Keep the backslash; the rune after it is scanned normally
    error("invalid char escape");
    value_ += '\\';
    return ch;
}

auto Scanner::scan_fixed_escape(Rune ch, char letter, int base, size_t count) -> Rune {
    std::string digits;
    while (digits.size() < count && digit_value(ch) < base) {
        digits += static_cast<char>(ch);
        ch = next();
    }

    if (digits.size() == count) {
        uint32_t code = 0;
        for (char d : digits) {
            code = code * static_cast<uint32_t>(base) +
                   static_cast<uint32_t>(digit_value(static_cast<unsigned char>(d)));
        }
        utf8::encode(value_, static_cast<Rune>(code));
    } else if (letter == '\0' && digits == "0") {
        value_ += '\0';
    } else {
        error("invalid char escape");
        value_ += '\\';
        if (letter != '\0') {
            value_ += letter;
        }
        value_ += digits;
    }
    return ch;
}

// ============================================================================
// Raw Strings
// ============================================================================

auto Scanner::scan_raw_string() -> Rune {
    Rune ch = next();
    for (;;) {
        if (ch == EOF_RUNE) {
            error("literal not terminated");
            return ch;
        }
        if (ch == raw_delimiter_) {
            ch = next();
            if (ch != raw_delimiter_) {
                return ch;
            }
        }
        utf8::encode(value_, ch);
        ch = next();
    }
}

} // namespace lispscan::scanner
