//! # Identifier Runes
//!
//! The default identifier predicate. ASCII takes a fast path; everything
//! else is classified with ICU's Unicode property tables.

#include "lispscan/scanner/mode.hpp"

#include <unicode/uchar.h>

namespace lispscan::scanner {

namespace {

auto is_symbol_rune(Rune r) -> bool {
    switch (r) {
    case '_':
    case '$':
    case '*':
    case '+':
    case '/':
    case '?':
    case '!':
    case '<':
    case '>':
    case '=':
        return true;
    default:
        return false;
    }
}

auto is_alphabetic(Rune r) -> bool {
    if (r < 0x80) {
        return (r >= 'a' && r <= 'z') || (r >= 'A' && r <= 'Z');
    }
    return u_isUAlphabetic(static_cast<UChar32>(r)) != 0;
}

auto is_numeric(Rune r) -> bool {
    if (r < 0x80) {
        return r >= '0' && r <= '9';
    }
    switch (u_charType(static_cast<UChar32>(r))) {
    case U_DECIMAL_DIGIT_NUMBER:
    case U_LETTER_NUMBER:
    case U_OTHER_NUMBER:
        return true;
    default:
        return false;
    }
}

} // namespace

auto is_lisp_ident_rune(Rune rune, size_t index) -> bool {
    if (rune == EOF_RUNE) {
        return false;
    }
    if (is_alphabetic(rune) || is_symbol_rune(rune)) {
        return true;
    }
    return index > 0 && (rune == '-' || is_numeric(rune));
}

} // namespace lispscan::scanner
