//! # Number Scanning
//!
//! Integer and floating-point literals.
//!
//! ## Supported Formats
//!
//! | Format      | Example        | Token   |
//! |-------------|----------------|---------|
//! | Decimal     | `42`, `1_000`  | `Int`   |
//! | Hexadecimal | `0xFF`         | `Int`   |
//! | Octal       | `0o17`, `017`  | `Int`   |
//! | Binary      | `0b1010`       | `Int`   |
//! | Fraction    | `3.14`, `.5`   | `Float` |
//! | Exponent    | `1e10`, `2E-3` | `Float` |
//! | Hex float   | `0x1.fp+3`     | `Float` |
//!
//! The radix is fixed once a prefix is read and the scanner never backs
//! up: a malformed literal is reported and still returned as one token.

#include "lispscan/scanner/scanner.hpp"

#include <string>

namespace lispscan::scanner {

namespace {

constexpr Rune NO_INVALID_DIGIT = 0;

// digsep bits: 1 = saw a digit, 2 = saw a '_' separator
constexpr int SAW_DIGIT = 1;
constexpr int SAW_SEPARATOR = 2;

auto lower(Rune ch) -> Rune {
    return (ch >= 'A' && ch <= 'Z') ? ch - 'A' + 'a' : ch;
}

auto is_decimal(Rune ch) -> bool {
    return ch >= '0' && ch <= '9';
}

auto is_hex(Rune ch) -> bool {
    Rune l = lower(ch);
    return is_decimal(ch) || (l >= 'a' && l <= 'f');
}

auto literal_name(char prefix) -> std::string {
    switch (prefix) {
    case 'x':
        return "hexadecimal literal";
    case 'o':
    case '0':
        return "octal literal";
    case 'b':
        return "binary literal";
    default:
        return "decimal literal";
    }
}

// Returns true if some '_' in `text` does not sit between two digits
// (the radix prefix counts as a digit).
auto has_misplaced_separator(std::string_view text) -> bool {
    char radix = ' ';
    char prev_class = '.'; // '0' digit, '_' separator, '.' anything else
    size_t i = 0;

    if (!text.empty() && text[0] == '-') {
        text.remove_prefix(1);
    }
    if (text.size() >= 2 && text[0] == '0') {
        radix = static_cast<char>(lower(static_cast<unsigned char>(text[1])));
        if (radix == 'x' || radix == 'o' || radix == 'b') {
            prev_class = '0';
            i = 2;
        }
    }

    for (; i < text.size(); ++i) {
        char c = text[i];
        char cls;
        if (c == '_') {
            if (prev_class != '0') {
                return true;
            }
            cls = '_';
        } else if (is_decimal(static_cast<unsigned char>(c)) ||
                   (radix == 'x' && is_hex(static_cast<unsigned char>(c)))) {
            cls = '0';
        } else {
            if (prev_class == '_') {
                return true;
            }
            cls = '.';
        }
        prev_class = cls;
    }
    return prev_class == '_';
}

auto quote_ascii(Rune ch) -> std::string {
    std::string out = "'";
    utf8::encode(out, ch);
    out += '\'';
    return out;
}

} // namespace

auto Scanner::scan_digits(Rune ch, int base, Rune& invalid, int& digsep) -> Rune {
    if (base <= 10) {
        Rune max = '0' + static_cast<Rune>(base);
        while (is_decimal(ch) || ch == '_') {
            if (ch == '_') {
                digsep |= SAW_SEPARATOR;
            } else {
                if (ch >= max && invalid == NO_INVALID_DIGIT) {
                    invalid = ch;
                }
                digsep |= SAW_DIGIT;
            }
            ch = next();
        }
    } else {
        while (is_hex(ch) || ch == '_') {
            digsep |= (ch == '_') ? SAW_SEPARATOR : SAW_DIGIT;
            ch = next();
        }
    }
    return ch;
}

auto Scanner::scan_number(Rune ch, bool seen_dot) -> std::pair<TokenKind, Rune> {
    int base = 10;
    char prefix = '\0';
    int digsep = 0;
    Rune invalid = NO_INVALID_DIGIT;
    TokenKind kind = TokenKind::Int;

    // Integer part
    if (!seen_dot) {
        if (ch == '0') {
            ch = next();
            switch (lower(ch)) {
            case 'x':
                ch = next();
                base = 16;
                prefix = 'x';
                break;
            case 'o':
                ch = next();
                base = 8;
                prefix = 'o';
                break;
            case 'b':
                ch = next();
                base = 2;
                prefix = 'b';
                break;
            default:
                // Legacy octal; the leading 0 is itself a digit
                base = 8;
                prefix = '0';
                digsep = SAW_DIGIT;
                break;
            }
        }
        ch = scan_digits(ch, base, invalid, digsep);
        if (ch == '.' && (mode_ & SCAN_FLOATS) != 0) {
            ch = next();
            seen_dot = true;
        }
    }

    // Fractional part
    if (seen_dot) {
        kind = TokenKind::Float;
        if (prefix == 'o' || prefix == 'b') {
            error("invalid radix point in " + literal_name(prefix));
        }
        ch = scan_digits(ch, base, invalid, digsep);
    }

    if ((digsep & SAW_DIGIT) == 0) {
        error(literal_name(prefix) + " has no digits");
    }

    // Exponent
    Rune e = lower(ch);
    if ((e == 'e' || e == 'p') && (mode_ & SCAN_FLOATS) != 0) {
        if (e == 'e' && prefix != '\0' && prefix != '0') {
            error(quote_ascii(ch) + " exponent requires decimal mantissa");
        } else if (e == 'p' && prefix != 'x') {
            error(quote_ascii(ch) + " exponent requires hexadecimal mantissa");
        }
        ch = next();
        kind = TokenKind::Float;
        if (ch == '+' || ch == '-') {
            ch = next();
        }
        Rune ignored = NO_INVALID_DIGIT;
        int exp_digsep = 0;
        ch = scan_digits(ch, 10, ignored, exp_digsep);
        digsep |= exp_digsep;
        if ((exp_digsep & SAW_DIGIT) == 0) {
            error("exponent has no digits");
        }
    } else if (prefix == 'x' && kind == TokenKind::Float) {
        error("hexadecimal mantissa requires a 'p' exponent");
    }

    if (kind == TokenKind::Int && invalid != NO_INVALID_DIGIT) {
        error("invalid digit " + quote_ascii(invalid) + " in " + literal_name(prefix));
    }

    // text_ now holds exactly the literal
    if ((digsep & SAW_SEPARATOR) != 0 && has_misplaced_separator(text_)) {
        error("'_' must separate successive digits");
    }

    return {kind, ch};
}

} // namespace lispscan::scanner
