//! # Token Utilities
//!
//! Printable names for tokens, used by the `lispscan` tool, by log
//! messages and by test failure output.

#include "lispscan/scanner/token.hpp"

#include "lispscan/scanner/utf8.hpp"

#include <sstream>

namespace lispscan::scanner {

namespace {

// Quotes a character the way a debug printer would: "(" or "\n".
auto quote_rune(Rune r) -> std::string {
    std::string out = "\"";
    switch (r) {
    case '"':
        out += "\\\"";
        break;
    case '\\':
        out += "\\\\";
        break;
    case '\n':
        out += "\\n";
        break;
    case '\r':
        out += "\\r";
        break;
    case '\t':
        out += "\\t";
        break;
    default:
        if (r < 0x20 || r == 0x7F || !utf8::is_scalar(r)) {
            std::ostringstream oss;
            oss << "\\u{" << std::hex << static_cast<uint32_t>(r) << "}";
            out += oss.str();
        } else {
            utf8::encode(out, r);
        }
    }
    out += '"';
    return out;
}

} // namespace

auto token_string(Token tok) -> std::string {
    switch (tok.kind) {
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::Ident:
        return "Ident";
    case TokenKind::Int:
        return "Int";
    case TokenKind::Float:
        return "Float";
    case TokenKind::String:
        return "String";
    case TokenKind::Keyword:
        return "Keyword";
    case TokenKind::RawString:
        return "RawString";
    case TokenKind::Comment:
        return "Comment";
    case TokenKind::Char:
        return quote_rune(tok.rune);
    }
    return "Token(" + std::to_string(tok.code()) + ")";
}

auto operator<<(std::ostream& os, Token tok) -> std::ostream& {
    return os << token_string(tok);
}

} // namespace lispscan::scanner
