#include "scan_fixture.hpp"

#include "lispscan/log/log.hpp"

#include <sstream>

using namespace lispscan;
using namespace lispscan::scanner;
using lispscan::scanner::testing::ScanTest;

class ScannerTest : public ScanTest {};

// ============================================================================
// Basic Forms
// ============================================================================

TEST_F(ScannerTest, SimpleForm) {
    init("(def a 10)");
    expect_char('(');
    expect(TokenKind::Ident, "def");
    expect(TokenKind::Ident, "a");
    expect(TokenKind::Int, "10");
    expect_char(')');
    expect_eof();
    EXPECT_EQ(scanner_->error_count(), 0u);
}

TEST_F(ScannerTest, NegativeNumbers) {
    init("(- -1 -1 -.5)");
    expect_char('(');
    expect(TokenKind::Ident, "-");
    expect(TokenKind::Int, "-1");
    expect(TokenKind::Int, "-1");
    expect(TokenKind::Ident, "-");
    expect(TokenKind::Float, ".5");
    expect_char(')');
    expect_eof();
}

TEST_F(ScannerTest, Keywords) {
    init(":a :hello-world :*?");
    expect(TokenKind::Keyword, ":a");
    expect(TokenKind::Keyword, ":hello-world");
    expect(TokenKind::Keyword, ":*?");
    expect_eof();
}

TEST_F(ScannerTest, LoneColonIsChar) {
    init(": :1");
    expect_char(':');
    expect_char(':');
    expect(TokenKind::Int, "1");
    expect_eof();
}

TEST_F(ScannerTest, SpecialIdentifiers) {
    init("~@ #{ - -minus hello-world");
    expect(TokenKind::Ident, "~@");
    expect(TokenKind::Ident, "#{");
    expect(TokenKind::Ident, "-");
    expect(TokenKind::Ident, "-minus");
    expect(TokenKind::Ident, "hello-world");
    expect_eof();
}

TEST_F(ScannerTest, ReaderMacroCharacters) {
    init("'(a) `b ~c #d @e");
    expect_char('\'');
    expect_char('(');
    expect(TokenKind::Ident, "a");
    expect_char(')');
    expect_char('`');
    expect(TokenKind::Ident, "b");
    expect_char('~');
    expect(TokenKind::Ident, "c");
    expect_char('#');
    expect(TokenKind::Ident, "d");
    expect_char('@');
    expect(TokenKind::Ident, "e");
    expect_eof();
}

TEST_F(ScannerTest, IdentifierStopsAtDelimiters) {
    init("(read-string\"x\")");
    expect_char('(');
    expect(TokenKind::Ident, "read-string");
    expect(TokenKind::String, "\"x\"");
    expect_char(')');
    expect_eof();
}

TEST_F(ScannerTest, DigitsAfterIdentifierStartStayInIdentifier) {
    init("x86 9lives");
    expect(TokenKind::Ident, "x86");
    expect(TokenKind::Int, "9");
    expect(TokenKind::Ident, "lives");
    expect_eof();
}

// ============================================================================
// End of Input
// ============================================================================

TEST_F(ScannerTest, EmptyInput) {
    init("");
    expect_eof();
    EXPECT_EQ(scanner_->position().line, 1u);
    EXPECT_EQ(scanner_->position().column, 1u);
    EXPECT_EQ(scanner_->position().offset, 0u);
}

TEST_F(ScannerTest, WhitespaceOnlyInputRepeatsEof) {
    init(" \t\r\n  \n");
    expect_eof();
    expect_eof();
    expect_eof();
    EXPECT_EQ(scanner_->error_count(), 0u);
}

TEST_F(ScannerTest, EofPositionFollowsLastToken) {
    init("abc");
    expect(TokenKind::Ident, "abc");
    expect_eof();
    EXPECT_EQ(scanner_->position().line, 1u);
    EXPECT_EQ(scanner_->position().column, 4u);
    EXPECT_EQ(scanner_->position().offset, 3u);
}

// ============================================================================
// Comments
// ============================================================================

TEST_F(ScannerTest, CommentsSkippedByDefault) {
    init("; This is a comment\n(def a 10) ;; another comment");
    expect_char('(');
    expect(TokenKind::Ident, "def");
    expect(TokenKind::Ident, "a");
    expect(TokenKind::Int, "10");
    expect_char(')');
    expect_eof();
}

TEST_F(ScannerTest, CommentsReported) {
    auto& s = init("; first\n;; second\nx ;last");
    s.set_mode(LISP_TOKENS & ~SKIP_COMMENTS);
    expect(TokenKind::Comment, "; first");
    EXPECT_EQ(s.position().line, 1u);
    expect(TokenKind::Comment, ";; second");
    EXPECT_EQ(s.position().line, 2u);
    expect(TokenKind::Ident, "x");
    expect(TokenKind::Comment, ";last");
    expect_eof();
    EXPECT_EQ(s.error_count(), 0u);
}

TEST_F(ScannerTest, CommentsDisabledGiveSemicolonChars) {
    auto& s = init(";; x");
    s.set_mode(SCAN_IDENTS);
    expect_char(';');
    expect_char(';');
    expect(TokenKind::Ident, "x");
    expect_eof();
}

// ============================================================================
// Mode Gating
// ============================================================================

TEST_F(ScannerTest, KeywordsDisabled) {
    auto& s = init(":hello-world");
    s.set_mode(LISP_TOKENS & ~SCAN_KEYWORDS);
    expect_char(':');
    expect(TokenKind::Ident, "hello-world");
    expect_eof();
}

TEST_F(ScannerTest, IdentsDisabled) {
    auto& s = init("ab -x ~@");
    s.set_mode(SCAN_INTS);
    expect_char('a');
    expect_char('b');
    expect_char('-');
    expect_char('x');
    expect_char('~');
    expect_char('@');
    expect_eof();
}

TEST_F(ScannerTest, StringsDisabled) {
    auto& s = init("\"a\"");
    s.set_mode(SCAN_IDENTS);
    expect_char('"');
    expect(TokenKind::Ident, "a");
    expect_char('"');
    expect_eof();
}

TEST_F(ScannerTest, RawStringsDisabled) {
    auto& s = init("¬a¬");
    s.set_mode(SCAN_IDENTS);
    expect_char(0x00AC);
    expect(TokenKind::Ident, "a");
    expect_char(0x00AC);
    expect_eof();
}

TEST_F(ScannerTest, NumbersDisabled) {
    auto& s = init("42 -7");
    s.set_mode(SCAN_IDENTS);
    expect_char('4');
    expect_char('2');
    expect_char('-');
    expect_char('7');
    expect_eof();
}

TEST_F(ScannerTest, NoModeGivesOnlyChars) {
    auto& s = init("(a \"b\")");
    s.set_mode(0);
    expect_char('(');
    expect_char('a');
    expect_char('"');
    expect_char('b');
    expect_char('"');
    expect_char(')');
    expect_eof();
}

TEST_F(ScannerTest, CustomWhitespace) {
    auto& s = init("a,b c");
    s.set_whitespace(LISP_WHITESPACE | (uint64_t{1} << ','));
    expect(TokenKind::Ident, "a");
    expect(TokenKind::Ident, "b");
    expect(TokenKind::Ident, "c");
    expect_eof();
}

TEST_F(ScannerTest, NoWhitespaceGivesSpaceChars) {
    auto& s = init("a b");
    s.set_whitespace(0);
    expect(TokenKind::Ident, "a");
    expect_char(' ');
    expect(TokenKind::Ident, "b");
    expect_eof();
}

// ============================================================================
// Identifier Predicate
// ============================================================================

TEST_F(ScannerTest, CustomPredicateAlphaOnly) {
    auto& s = init("*host-language*");
    s.set_ident_predicate([](Rune r, size_t) {
        return (r >= 'a' && r <= 'z') || (r >= 'A' && r <= 'Z');
    });
    expect_char('*');
    expect(TokenKind::Ident, "host");
    expect(TokenKind::Ident, "-language");
    expect_char('*');
    expect_eof();
}

TEST_F(ScannerTest, PredicateSeesContinuationIndex) {
    std::vector<size_t> seen;
    auto& s = init("abc)");
    s.set_ident_predicate([&seen](Rune r, size_t i) {
        seen.push_back(i);
        return r >= 'a' && r <= 'z';
    });
    expect(TokenKind::Ident, "abc");
    // 'a' at 0, 'b' at 1, 'c' at 2, ')' rejected at 3
    ASSERT_GE(seen.size(), 4u);
    EXPECT_EQ(seen[seen.size() - 4], 0u);
    EXPECT_EQ(seen.back(), 3u);
}

TEST_F(ScannerTest, PredicateAcceptingDot) {
    auto& s = init(".foo .5");
    s.set_ident_predicate([](Rune r, size_t i) { return r == '.' || is_lisp_ident_rune(r, i); });
    expect(TokenKind::Ident, ".foo");
    expect(TokenKind::Float, ".5");
    expect_eof();
}

TEST_F(ScannerTest, DigitsAlwaysStartNumbers) {
    auto& s = init("42");
    s.set_ident_predicate([](Rune, size_t) { return true; });
    expect(TokenKind::Int, "42");
}

TEST_F(ScannerTest, EmptyPredicateRestoresDefault) {
    auto& s = init("a-b");
    s.set_ident_predicate([](Rune, size_t) { return false; });
    s.set_ident_predicate(nullptr);
    expect(TokenKind::Ident, "a-b");
}

TEST_F(ScannerTest, DefaultPredicate) {
    EXPECT_TRUE(is_lisp_ident_rune('a', 0));
    EXPECT_TRUE(is_lisp_ident_rune('*', 0));
    EXPECT_TRUE(is_lisp_ident_rune(U'本', 0));
    EXPECT_TRUE(is_lisp_ident_rune(U'ä', 0));
    EXPECT_FALSE(is_lisp_ident_rune('-', 0));
    EXPECT_TRUE(is_lisp_ident_rune('-', 1));
    EXPECT_FALSE(is_lisp_ident_rune('7', 0));
    EXPECT_TRUE(is_lisp_ident_rune('7', 1));
    EXPECT_TRUE(is_lisp_ident_rune(U'६', 1)); // Devanagari digit, Nd
    EXPECT_TRUE(is_lisp_ident_rune(U'Ⅻ', 0)); // Roman numeral, Nl and alphabetic
    EXPECT_TRUE(is_lisp_ident_rune(U'½', 1)); // No
    EXPECT_FALSE(is_lisp_ident_rune(U'½', 0));
    EXPECT_FALSE(is_lisp_ident_rune('(', 1));
    EXPECT_FALSE(is_lisp_ident_rune('.', 0));
    EXPECT_FALSE(is_lisp_ident_rune(EOF_RUNE, 1));
}

// ============================================================================
// Positions
// ============================================================================

TEST_F(ScannerTest, PositionsAcrossLinesAndWideRunes) {
    auto& s = init("abc\n本語\n\nx");
    s.set_mode(0);
    s.set_whitespace(0);

    struct Want {
        Rune r;
        uint32_t line;
        uint32_t column;
        size_t offset;
    };
    const Want wants[] = {
        {'a', 1, 1, 0},  {'b', 1, 2, 1},  {'c', 1, 3, 2},  {'\n', 1, 4, 3},
        {U'本', 2, 1, 4}, {U'語', 2, 2, 7}, {'\n', 2, 3, 10}, {'\n', 3, 1, 11},
        {'x', 4, 1, 12},
    };
    for (const auto& want : wants) {
        EXPECT_EQ(next(), Token::character(want.r));
        EXPECT_EQ(s.position().line, want.line);
        EXPECT_EQ(s.position().column, want.column);
        EXPECT_EQ(s.position().offset, want.offset);
    }
    expect_eof();
}

TEST_F(ScannerTest, TokenPositionsWithFilename) {
    auto& s = init("(def\n  :key)");
    s.set_filename("core.lisp");
    expect_char('(');
    expect(TokenKind::Ident, "def");
    EXPECT_EQ(s.position().to_string(), "core.lisp:1:2");
    expect(TokenKind::Keyword, ":key");
    EXPECT_EQ(s.position().to_string(), "core.lisp:2:3");
    EXPECT_EQ(s.position().offset, 7u);
}

TEST_F(ScannerTest, PosIsAfterLastToken) {
    auto& s = init("ab cd");
    EXPECT_EQ(s.pos().line, 1u);
    EXPECT_EQ(s.pos().column, 1u);
    expect(TokenKind::Ident, "ab");
    EXPECT_EQ(s.pos().column, 3u);
    EXPECT_EQ(s.pos().offset, 2u);
}

TEST(PositionTest, Formatting) {
    Position pos{.filename = "a.lisp", .offset = 4, .line = 2, .column = 3};
    EXPECT_TRUE(pos.is_valid());
    EXPECT_EQ(pos.to_string(), "a.lisp:2:3");

    Position anon{.offset = 0, .line = 1, .column = 1};
    EXPECT_EQ(anon.to_string(), "<input>:1:1");

    Position invalid{.filename = "a.lisp"};
    EXPECT_FALSE(invalid.is_valid());
    EXPECT_EQ(invalid.to_string(), "a.lisp");

    std::ostringstream oss;
    oss << pos;
    EXPECT_EQ(oss.str(), "a.lisp:2:3");
}

// ============================================================================
// Lookahead
// ============================================================================

TEST_F(ScannerTest, PeekDoesNotConsume) {
    auto& s = init("ab");
    auto peeked = s.peek();
    ASSERT_TRUE(is_ok(peeked));
    EXPECT_EQ(unwrap(peeked), Token::character('a'));
    EXPECT_EQ(unwrap(s.peek()), Token::character('a'));
    expect(TokenKind::Ident, "ab");
    EXPECT_TRUE(unwrap(s.peek()).is_eof());
}

TEST_F(ScannerTest, NextCharReadsRunes) {
    auto& s = init("a本 ");
    EXPECT_EQ(unwrap(s.next_char()), Token::character('a'));
    EXPECT_FALSE(s.position().is_valid());
    EXPECT_EQ(s.token_text(), "");
    EXPECT_EQ(unwrap(s.next_char()), Token::character(U'本'));
    EXPECT_EQ(unwrap(s.next_char()), Token::character(' '));
    EXPECT_TRUE(unwrap(s.next_char()).is_eof());
    EXPECT_TRUE(unwrap(s.next_char()).is_eof());
}

TEST_F(ScannerTest, NextCharThenScan) {
    auto& s = init("(foo bar)");
    EXPECT_EQ(unwrap(s.next_char()), Token::character('('));
    expect(TokenKind::Ident, "foo");
    EXPECT_EQ(s.position().column, 2u);
    EXPECT_EQ(unwrap(s.next_char()), Token::character(' '));
    expect(TokenKind::Ident, "bar");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ScannerTest, ErrorHandlerReceivesMessages) {
    auto& s = init("0x 08");
    std::vector<std::string> where;
    s.set_error_handler([&where](const Scanner& sc, std::string_view msg) {
        where.push_back(sc.pos().to_string() + " " + std::string(msg));
    });
    expect(TokenKind::Int, "0x");
    expect(TokenKind::Int, "08");
    EXPECT_EQ(s.error_count(), 2u);
    ASSERT_EQ(where.size(), 2u);
    EXPECT_EQ(where[0], "<input>:1:3 hexadecimal literal has no digits");
    EXPECT_EQ(where[1], "<input>:1:6 invalid digit '8' in octal literal");
}

TEST_F(ScannerTest, ErrorsLoggedWithoutHandler) {
    auto& s = init("\"open");
    s.set_filename("repl");
    s.set_error_handler(nullptr);

    std::ostringstream captured;
    auto& logger = log::Logger::instance();
    logger.clear_sinks();
    logger.set_level(log::LogLevel::Warn);
    logger.add_sink(std::make_unique<log::ConsoleSink>(captured));

    expect(TokenKind::String, "\"open");
    logger.clear_sinks();

    EXPECT_EQ(s.error_count(), 1u);
    EXPECT_NE(captured.str().find("WARN"), std::string::npos);
    EXPECT_NE(captured.str().find("[scanner] repl:1:6: literal not terminated"), std::string::npos);
}

TEST_F(ScannerTest, ErrorCountIsCumulative) {
    auto& s = init("\"a\\q\" 0b \"x");
    expect(TokenKind::String, "\"a\\q\"");
    EXPECT_EQ(s.error_count(), 1u);
    expect(TokenKind::Int, "0b");
    EXPECT_EQ(s.error_count(), 2u);
    expect(TokenKind::String, "\"x");
    EXPECT_EQ(s.error_count(), 3u);
    expect_eof();
    EXPECT_EQ(s.error_count(), 3u);
}
