//! # Byte Sources
//!
//! The scanner pulls its input through a `ByteSource`: a sequential byte
//! supplier that is never sought or reread. Two implementations are
//! provided:
//!
//! - `StringSource`: owns an in-memory buffer (tests, REPL lines, snippets)
//! - `StreamSource`: wraps any `std::istream` (files, pipes, stdin)
//!
//! A read returns the number of bytes delivered, `0` at end of input, or an
//! `IoError`. End of input and failure are deliberately different results:
//! the scanner turns the first into an `Eof` token and propagates the
//! second to its caller.
//!
//! ## Example
//!
//! ```cpp
//! std::ifstream file("core.lisp", std::ios::binary);
//! StreamSource source(file);
//! Scanner scanner(source);
//! ```

#ifndef LISPSCAN_SCANNER_BYTE_SOURCE_HPP
#define LISPSCAN_SCANNER_BYTE_SOURCE_HPP

#include "lispscan/common.hpp"

#include <cstddef>
#include <istream>
#include <span>
#include <string>

namespace lispscan::scanner {

/// A failure of the underlying byte source.
struct IoError {
    std::string message; ///< Human-readable description.

    [[nodiscard]] auto operator==(const IoError& other) const -> bool = default;
};

/// Sequential byte supplier consumed by the scanner.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads up to `buffer.size()` bytes into `buffer`.
    ///
    /// Returns the number of bytes read; `0` means end of input. May return
    /// fewer bytes than requested, but blocks until at least one byte or
    /// end of input is available.
    [[nodiscard]] virtual auto read(std::span<char> buffer) -> Result<size_t, IoError> = 0;
};

/// In-memory byte source.
class StringSource : public ByteSource {
public:
    explicit StringSource(std::string content) : content_(std::move(content)) {}

    [[nodiscard]] auto read(std::span<char> buffer) -> Result<size_t, IoError> override;

private:
    std::string content_;
    size_t pos_ = 0;
};

/// Byte source over a `std::istream`.
///
/// The stream must outlive the source. A stream that enters the `bad`
/// state reports an `IoError`; reaching end of file is end of input.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}

    [[nodiscard]] auto read(std::span<char> buffer) -> Result<size_t, IoError> override;

private:
    std::istream& in_;
};

} // namespace lispscan::scanner

#endif // LISPSCAN_SCANNER_BYTE_SOURCE_HPP
