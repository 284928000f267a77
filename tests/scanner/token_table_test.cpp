//! # Token Table Tests
//!
//! Every entry of a broad token table is placed on its own line as
//! `" \t<text>\n"` and scanned back, checking the token, its text and the
//! line it starts on.

#include "scan_fixture.hpp"

#include <algorithm>

using namespace lispscan;
using namespace lispscan::scanner;
using lispscan::scanner::testing::ScanTest;

namespace {

struct TableEntry {
    Token tok;
    std::string text;
};

auto tk(TokenKind kind, std::string text) -> TableEntry {
    return TableEntry{Token{.kind = kind}, std::move(text)};
}

auto ch(Rune r, std::string text) -> TableEntry {
    return TableEntry{Token::character(r), std::move(text)};
}

const std::string F100(100, 'f');

auto token_table() -> std::vector<TableEntry> {
    using K = TokenKind;
    return {
        tk(K::Comment, ";; line comments"),
        tk(K::Comment, ";;"),
        tk(K::Comment, ";;//"),
        tk(K::Comment, ";; comment"),
        tk(K::Comment, ";; ;* comment *;"),
        tk(K::Comment, ";; // comment //"),
        tk(K::Comment, ";;" + F100),
        tk(K::Comment, ";; " + F100),
        tk(K::Comment, "; single semi-colon comment"),
        tk(K::Comment, ";"),
        tk(K::Comment, "; " + F100),

        tk(K::Comment, ";; identifiers"),
        tk(K::Ident, "a"),
        tk(K::Ident, "a0"),
        tk(K::Ident, "foobar"),
        tk(K::Ident, "abc123"),
        tk(K::Ident, "LGTM"),
        tk(K::Ident, "_"),
        tk(K::Ident, "_abc123"),
        tk(K::Ident, "abc123_"),
        tk(K::Ident, "_abc_123_"),
        tk(K::Ident, "_äöü"),
        tk(K::Ident, "_本"),
        tk(K::Ident, "äöü"),
        tk(K::Ident, "本"),
        tk(K::Ident, "a۰۱۸"),
        tk(K::Ident, "foo६४"),
        tk(K::Ident, "bar９８７６"),
        tk(K::Ident, F100),
        tk(K::Ident, "~@"),
        ch('~', "~"),
        ch('@', "@"),
        tk(K::Ident, "#{"),
        ch('#', "#"),
        tk(K::Ident, "$"),
        tk(K::Ident, "$A"),
        tk(K::Ident, "$0"),
        tk(K::Ident, "def"),
        tk(K::Ident, "*host-language*"),
        tk(K::Ident, "read-string"),
        tk(K::Ident, "true?"),
        tk(K::Ident, "def!"),
        tk(K::Ident, "="),
        tk(K::Ident, "<="),
        tk(K::Ident, "****"),

        tk(K::Comment, ";; decimal ints"),
        tk(K::Int, "0"),
        tk(K::Int, "1"),
        tk(K::Int, "9"),
        tk(K::Int, "42"),
        tk(K::Int, "1234567890"),

        tk(K::Comment, ";; octal ints"),
        tk(K::Int, "00"),
        tk(K::Int, "01"),
        tk(K::Int, "07"),
        tk(K::Int, "042"),
        tk(K::Int, "01234567"),
        tk(K::Int, "0o17"),

        tk(K::Comment, ";; hexadecimal and binary ints"),
        tk(K::Int, "0x0"),
        tk(K::Int, "0x1"),
        tk(K::Int, "0xf"),
        tk(K::Int, "0x42"),
        tk(K::Int, "0x123456789abcDEF"),
        tk(K::Int, "0x" + F100),
        tk(K::Int, "0X0"),
        tk(K::Int, "0X1"),
        tk(K::Int, "0XF"),
        tk(K::Int, "0X42"),
        tk(K::Int, "0X123456789abcDEF"),
        tk(K::Int, "0X" + F100),
        tk(K::Int, "0b1010"),
        tk(K::Int, "1_000_000"),

        tk(K::Comment, ";; floats"),
        tk(K::Float, "0."),
        tk(K::Float, "1."),
        tk(K::Float, "42."),
        tk(K::Float, "01234567890."),
        tk(K::Float, ".0"),
        tk(K::Float, ".1"),
        tk(K::Float, ".42"),
        tk(K::Float, ".0123456789"),
        tk(K::Float, "0.0"),
        tk(K::Float, "1.0"),
        tk(K::Float, "42.0"),
        tk(K::Float, "01234567890.0"),
        tk(K::Float, "0e0"),
        tk(K::Float, "1e0"),
        tk(K::Float, "42e0"),
        tk(K::Float, "01234567890e0"),
        tk(K::Float, "0E0"),
        tk(K::Float, "1E0"),
        tk(K::Float, "42E0"),
        tk(K::Float, "01234567890E0"),
        tk(K::Float, "0e+10"),
        tk(K::Float, "1e-10"),
        tk(K::Float, "42e+10"),
        tk(K::Float, "01234567890e-10"),
        tk(K::Float, "0E+10"),
        tk(K::Float, "1E-10"),
        tk(K::Float, "42E+10"),
        tk(K::Float, "01234567890E-10"),
        tk(K::Float, "0x1.fp+3"),
        tk(K::Float, "0x1p-2"),

        tk(K::Comment, ";; strings"),
        tk(K::String, R"(" ")"),
        tk(K::String, R"("a")"),
        tk(K::String, R"("本")"),
        tk(K::String, R"("\a")"),
        tk(K::String, R"("\b")"),
        tk(K::String, R"("\f")"),
        tk(K::String, R"("\n")"),
        tk(K::String, R"("\r")"),
        tk(K::String, R"("\t")"),
        tk(K::String, R"("\v")"),
        tk(K::String, R"("\"")"),
        tk(K::String, R"("\000")"),
        tk(K::String, R"("\777")"),
        tk(K::String, R"("\x00")"),
        tk(K::String, R"("\xff")"),
        tk(K::String, R"("\u0000")"),
        tk(K::String, R"("\ufA16")"),
        tk(K::String, R"("\U00000000")"),
        tk(K::String, R"("\U0000ffAB")"),
        tk(K::String, "\"" + F100 + "\""),

        tk(K::Comment, ";; raw strings"),
        tk(K::RawString, "¬¬"),
        tk(K::RawString, "¬\\¬"),
        tk(K::RawString, "¬\\\\¬"),
        tk(K::RawString, "¬hello¬"),
        tk(K::RawString, "¬hel¬¬lo¬"),
        tk(K::RawString, "¬¬¬¬"),
        tk(K::RawString, "¬\n\n;; foobar ;;\n\n¬"),
        tk(K::RawString, "¬" + F100 + "¬"),

        tk(K::Comment, ";; keywords"),
        tk(K::Keyword, ":a"),
        tk(K::Keyword, ":hello-world"),
        tk(K::Keyword, ":*?"),

        tk(K::Comment, ";; individual characters"),
        ch(0x01, "\x01"),
        ch(0x1F, "\x1F"),
        ch('.', "."),
        ch('(', "("),
        ch(')', ")"),
        ch('{', "{"),
        ch('}', "}"),
        ch('[', "["),
        ch(']', "]"),
        ch('\'', "'"),
        ch('`', "`"),
        ch('~', "~"),
        ch('@', "@"),
        ch(':', ":"),

        tk(K::Comment, ";; hyphen symbol cases"),
        tk(K::Ident, "-"),
        tk(K::Ident, "-minus"),
        tk(K::Ident, "hello-world"),
        tk(K::Int, "-9"),
        tk(K::Int, "-1984"),
        tk(K::Int, "-1_984"),
        tk(K::Float, "-3.141592"),
    };
}

auto make_source(const std::vector<TableEntry>& table) -> std::string {
    std::string src;
    for (const auto& entry : table) {
        src += " \t" + entry.text + "\n";
    }
    return src;
}

} // namespace

class TokenTableTest : public ScanTest {
protected:
    void run_table(uint32_t mode) {
        auto table = token_table();
        auto& s = init(make_source(table));
        s.set_mode(mode);

        uint32_t line = 1;
        for (const auto& entry : table) {
            bool skipped = entry.tok.is(TokenKind::Comment) && (mode & SKIP_COMMENTS) != 0;
            if (!skipped) {
                auto tok = next();
                EXPECT_EQ(tok, entry.tok) << "for " << entry.text;
                EXPECT_EQ(s.position().line, line) << "for " << entry.text;
                EXPECT_EQ(s.position().column, 3u) << "for " << entry.text;
                EXPECT_EQ(s.token_text(), entry.text);
            }
            line += static_cast<uint32_t>(std::count(entry.text.begin(), entry.text.end(), '\n'));
            ++line;
        }

        expect_eof();
        EXPECT_EQ(s.error_count(), 0u);
        EXPECT_EQ(errors_, std::vector<std::string>{});
    }
};

TEST_F(TokenTableTest, SkippingComments) {
    run_table(LISP_TOKENS);
}

TEST_F(TokenTableTest, KeepingComments) {
    run_table(LISP_TOKENS & ~SKIP_COMMENTS);
}

TEST_F(TokenTableTest, ByteAtATimeSource) {
    // A source that hands out one byte per read exercises partial runes
    class TrickleSource : public ByteSource {
    public:
        explicit TrickleSource(std::string s) : inner_(std::move(s)) {}
        auto read(std::span<char> buffer) -> Result<size_t, IoError> override {
            return inner_.read(buffer.first(std::min<size_t>(1, buffer.size())));
        }

    private:
        StringSource inner_;
    };

    auto table = token_table();
    TrickleSource source(make_source(table));
    Scanner s(source);
    s.set_mode(LISP_TOKENS & ~SKIP_COMMENTS);

    for (const auto& entry : table) {
        auto result = s.scan();
        ASSERT_TRUE(is_ok(result));
        EXPECT_EQ(unwrap(result), entry.tok) << "for " << entry.text;
        EXPECT_EQ(s.token_text(), entry.text);
    }
    auto last = s.scan();
    ASSERT_TRUE(is_ok(last));
    EXPECT_TRUE(unwrap(last).is_eof());
    EXPECT_EQ(s.error_count(), 0u);
}
