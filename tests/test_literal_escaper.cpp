#include <catch2/catch_test_macros.hpp>
#include "codegen/literal_escaper.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace uisanitizer;

// ============================================================================
// Python repr
// ============================================================================

TEST_CASE("Literal: python picks the quote that avoids escaping", "[literal][python]") {
    CHECK(escape_literal("He said \"hi\"", "python") == "'He said \"hi\"'");
    CHECK(escape_literal("it's", "python") == "\"it's\"");
    CHECK(escape_literal("both ' and \"", "python") == "'both \\' and \"'");
    CHECK(escape_literal("", "python") == "''");
}

TEST_CASE("Literal: python escapes backslash and control characters", "[literal][python]") {
    CHECK(escape_literal("a\\b\nc\rd", "python") == "'a\\\\b\\nc\\rd'");
    CHECK(escape_literal("tab\there\x01\x7f", "python") == "'tab\\there\\x01\\x7f'");
    CHECK(escape_literal(std::string("nul\0end", 7), "python") == "'nul\\x00end'");
}

TEST_CASE("Literal: python keeps printable non-ASCII, escapes the rest", "[literal][python]") {
    // é printable; NBSP and LINE SEPARATOR are not; emoji is printable
    CHECK(escape_literal("\xc3\xa9", "python") == "'\xc3\xa9'");
    CHECK(escape_literal("\xc2\xa0", "python") == "'\\xa0'");
    CHECK(escape_literal("\xe2\x80\xa8", "python") == "'\\u2028'");
    CHECK(escape_literal("\xf0\x9f\x98\x80", "python") == "'\xf0\x9f\x98\x80'");
    CHECK(escape_literal("\xf3\xb0\x80\x80", "python") == "'\\U000f0000'");
}

TEST_CASE("Literal: python escapes bytes that are not UTF-8", "[literal][python]") {
    CHECK(escape_literal("a\xff" "b", "python") == "'a\\xffb'");
    CHECK(escape_literal("\xc3", "python") == "'\\xc3'");
}

// ============================================================================
// Double-quote families
// ============================================================================

TEST_CASE("Literal: javascript and java escape \\r and \\n", "[literal][java]") {
    for (const char* lang : {"javascript", "js", "java"}) {
        INFO(lang);
        CHECK(escape_literal("He said \"hi\"", lang) == "\"He said \\\"hi\\\"\"");
        CHECK(escape_literal("a\\b\nc\rd", lang) == "\"a\\\\b\\nc\\rd\"");
        CHECK(escape_literal("it's", lang) == "\"it's\"");
    }
}

TEST_CASE("Literal: C family escapes \\n but leaves \\r", "[literal][c]") {
    for (const char* lang : {"c", "go", "csharp", "cs", "php", "ruby", "rust", "swift"}) {
        INFO(lang);
        CHECK(escape_literal("He said \"hi\"", lang) == "\"He said \\\"hi\\\"\"");
        CHECK(escape_literal("a\\b\nc\rd", lang) == "\"a\\\\b\\nc\rd\"");
    }
}

TEST_CASE("Literal: double-quote families copy other control characters", "[literal][c]") {
    CHECK(escape_literal("tab\there\x01", "c") == "\"tab\there\x01\"");
}

// ============================================================================
// Shell
// ============================================================================

TEST_CASE("Literal: bash wraps in single quotes", "[literal][bash]") {
    CHECK(escape_literal("He said \"hi\"", "bash") == "'He said \"hi\"'");
    CHECK(escape_literal("$HOME `x`", "bash") == "'$HOME `x`'");
    CHECK(escape_literal("", "bash") == "''");
}

TEST_CASE("Literal: bash closes and reopens around single quotes", "[literal][bash]") {
    CHECK(escape_literal("it's", "bash") == "'it'\\''s'");
    CHECK(escape_literal("'", "bash") == "''\\'''");
}

// ============================================================================
// Lookup
// ============================================================================

TEST_CASE("Literal: language names are case-insensitive", "[literal]") {
    CHECK(escape_literal("a\nb", "JS") == escape_literal("a\nb", "js"));
    CHECK(escape_literal("it's", "BASH") == "'it'\\''s'");
    CHECK(escape_literal("x", "Python") == "'x'");
}

TEST_CASE("Literal: unknown language falls back to python", "[literal]") {
    const std::vector<std::string> samples = {"He said \"hi\"", "it's", "a\\b\nc", "", "\xc2\xa0"};
    for (const auto& s : samples) {
        CHECK(escape_literal(s, "unknownlang") == escape_literal(s, "python"));
        CHECK(escape_literal(s, "") == escape_literal(s, "python"));
    }
}

TEST_CASE("Literal: table introspection", "[literal]") {
    CHECK(LiteralEscaper::is_known_language("python"));
    CHECK(LiteralEscaper::is_known_language("Rust"));
    CHECK_FALSE(LiteralEscaper::is_known_language("cobol"));

    const auto names = LiteralEscaper::known_languages();
    CHECK(names.size() == 13);
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(std::find(names.begin(), names.end(), "bash") != names.end());
}

TEST_CASE("Literal: escape_for is an alias", "[literal]") {
    CHECK(escape_for("He said \"hi\"", "javascript") == escape_literal("He said \"hi\"", "javascript"));
}
