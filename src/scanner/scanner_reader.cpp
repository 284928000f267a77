//! # Rune Reader
//!
//! Buffered UTF-8 decoding with one rune of lookahead.
//!
//! ## Buffering
//!
//! Bytes are pulled from the source into a 1024-byte buffer. The buffer is
//! refilled only when the undecoded bytes left in it do not form a complete
//! rune, so a scanner over an interactive stream never blocks waiting for
//! bytes beyond the current token.
//!
//! ## Token Text
//!
//! The lookahead rune's bytes are kept in `ch_bytes_`. While a token is
//! being recorded, consuming the lookahead appends those bytes to the token
//! text, so the text ends exactly before the new lookahead.

#include "lispscan/log/log.hpp"
#include "lispscan/scanner/scanner.hpp"

#include <cstring>

namespace lispscan::scanner {

namespace {

constexpr Rune BYTE_ORDER_MARK = 0xFEFF;

// U+FFFD, stored as the text of a malformed byte.
constexpr char REPLACEMENT_BYTES[] = "\xEF\xBF\xBD";

} // namespace

void Scanner::fill() {
    while (!source_done_) {
        std::string_view pending(buf_.data() + buf_pos_, buf_end_ - buf_pos_);
        if (pending.size() >= utf8::MAX_BYTES || utf8::full_rune(pending)) {
            return;
        }

        // Move the partial rune to the front and read after it
        std::memmove(buf_.data(), pending.data(), pending.size());
        buf_pos_ = 0;
        buf_end_ = pending.size();

        auto result = source_.read(std::span<char>(buf_.data() + buf_end_, buf_.size() - buf_end_));
        if (is_err(result)) {
            io_error_ = unwrap_err(result);
            source_done_ = true;
            LISPSCAN_LOG_ERROR("reader", pos() << ": read failed: " << io_error_->message);
            return;
        }
        size_t n = unwrap(result);
        if (n == 0) {
            source_done_ = true;
            return;
        }
        buf_end_ += n;
        LISPSCAN_LOG_TRACE("reader", "refill: " << n << " bytes at offset " << offset_);
    }
}

auto Scanner::next() -> Rune {
    if (recording_) {
        text_.append(ch_bytes_.data(), ch_len_);
    }

    if (buf_end_ - buf_pos_ < utf8::MAX_BYTES) {
        fill();
    }

    if (buf_pos_ == buf_end_) {
        // End of input: the column moves past the last rune once
        if (last_char_len_ > 0) {
            ++column_;
        }
        last_char_len_ = 0;
        ch_len_ = 0;
        return EOF_RUNE;
    }

    auto decoded = utf8::decode(std::string_view(buf_.data() + buf_pos_, buf_end_ - buf_pos_));
    if (decoded.valid) {
        std::memcpy(ch_bytes_.data(), buf_.data() + buf_pos_, decoded.size);
        ch_len_ = decoded.size;
    } else {
        std::memcpy(ch_bytes_.data(), REPLACEMENT_BYTES, 3);
        ch_len_ = 3;
    }

    buf_pos_ += decoded.size;
    offset_ += decoded.size;
    last_char_len_ = decoded.size;
    ++column_;

    if (!decoded.valid) {
        error("invalid UTF-8 encoding");
    } else if (decoded.rune == 0) {
        error("invalid character NUL");
    } else if (decoded.rune == '\n') {
        ++line_;
        last_line_len_ = column_;
        column_ = 0;
    }
    return decoded.rune;
}

auto Scanner::lookahead() -> Rune {
    if (!started_) {
        started_ = true;
        ch_ = next();
        if (ch_ == BYTE_ORDER_MARK) {
            // Positions start after the mark
            offset_ = 0;
            column_ = 0;
            last_char_len_ = 0;
            ch_len_ = 0;
            ch_ = next();
        }
    }
    return ch_;
}

auto Scanner::line_column() const -> std::pair<uint32_t, uint32_t> {
    if (column_ > 0) {
        return {line_, column_};
    }
    if (line_ > 1) {
        return {line_ - 1, last_line_len_};
    }
    return {1, 1};
}

auto Scanner::pos() const -> Position {
    auto [line, column] = line_column();
    return Position{.filename = position_.filename,
                    .offset = offset_ - last_char_len_,
                    .line = line,
                    .column = column};
}

auto Scanner::finish(Token tok) const -> Result<Token, IoError> {
    if (io_error_) {
        return *io_error_;
    }
    return tok;
}

auto Scanner::next_char() -> Result<Token, IoError> {
    recording_ = false;
    text_.clear();
    value_.clear();
    kind_ = TokenKind::Eof;
    position_.line = 0;
    position_.column = 0;

    Rune ch = lookahead();
    if (ch == EOF_RUNE) {
        return finish(Token{});
    }
    ch_ = next();
    return finish(Token::character(ch));
}

auto Scanner::peek() -> Result<Token, IoError> {
    Rune ch = lookahead();
    return finish(ch == EOF_RUNE ? Token{} : Token::character(ch));
}

} // namespace lispscan::scanner
