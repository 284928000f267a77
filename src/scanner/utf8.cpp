#include "lispscan/scanner/utf8.hpp"

namespace lispscan::scanner::utf8 {

namespace {

auto is_continuation(unsigned char b) -> bool {
    return (b & 0xC0) == 0x80;
}

// Expected sequence length for a lead byte, 0 if it cannot start a rune.
auto sequence_length(unsigned char lead) -> size_t {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

constexpr Decoded INVALID{.rune = REPLACEMENT_RUNE, .size = 1, .valid = false};

} // namespace

auto decode(std::string_view bytes) -> Decoded {
    auto lead = static_cast<unsigned char>(bytes[0]);
    size_t len = sequence_length(lead);
    if (len == 1) {
        return Decoded{.rune = lead, .size = 1, .valid = true};
    }
    if (len == 0 || bytes.size() < len) {
        return INVALID;
    }

    Rune r = lead & (0x7F >> len);
    for (size_t i = 1; i < len; ++i) {
        auto b = static_cast<unsigned char>(bytes[i]);
        if (!is_continuation(b)) {
            return INVALID;
        }
        r = (r << 6) | (b & 0x3F);
    }

    // Overlong forms and out-of-range values
    static constexpr Rune MIN_FOR_LENGTH[] = {0, 0, 0x80, 0x800, 0x10000};
    if (r < MIN_FOR_LENGTH[len] || !is_scalar(r)) {
        return INVALID;
    }
    return Decoded{.rune = r, .size = len, .valid = true};
}

auto full_rune(std::string_view bytes) -> bool {
    if (bytes.empty()) {
        return false;
    }
    size_t len = sequence_length(static_cast<unsigned char>(bytes[0]));
    if (len <= 1 || bytes.size() >= len) {
        return true;
    }
    // A short sequence is already complete if it is known to be broken.
    for (size_t i = 1; i < bytes.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(bytes[i]))) {
            return true;
        }
    }
    return false;
}

void encode(std::string& out, Rune r) {
    if (!is_scalar(r)) {
        r = REPLACEMENT_RUNE;
    }
    if (r < 0x80) {
        out += static_cast<char>(r);
    } else if (r < 0x800) {
        out += static_cast<char>(0xC0 | (r >> 6));
        out += static_cast<char>(0x80 | (r & 0x3F));
    } else if (r < 0x10000) {
        out += static_cast<char>(0xE0 | (r >> 12));
        out += static_cast<char>(0x80 | ((r >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (r & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (r >> 18));
        out += static_cast<char>(0x80 | ((r >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((r >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (r & 0x3F));
    }
}

} // namespace lispscan::scanner::utf8
