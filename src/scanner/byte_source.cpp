#include "lispscan/scanner/byte_source.hpp"

#include <algorithm>
#include <cstring>

namespace lispscan::scanner {

auto StringSource::read(std::span<char> buffer) -> Result<size_t, IoError> {
    size_t n = std::min(buffer.size(), content_.size() - pos_);
    std::memcpy(buffer.data(), content_.data() + pos_, n);
    pos_ += n;
    return n;
}

auto StreamSource::read(std::span<char> buffer) -> Result<size_t, IoError> {
    if (buffer.empty()) {
        return size_t{0};
    }
    if (in_.bad()) {
        return IoError{"input stream is in a bad state"};
    }

    // Block for the first byte, then take only what is already buffered so
    // that an interactive stream is never asked for more than it has.
    in_.read(buffer.data(), 1);
    if (in_.bad()) {
        return IoError{"read from input stream failed"};
    }
    if (in_.gcount() == 0) {
        return size_t{0};
    }

    std::streamsize more = in_.readsome(buffer.data() + 1, static_cast<std::streamsize>(buffer.size() - 1));
    if (in_.bad()) {
        return IoError{"read from input stream failed"};
    }
    return static_cast<size_t>(1 + more);
}

} // namespace lispscan::scanner
