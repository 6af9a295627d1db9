#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

#include <string>

using namespace uisanitizer;

// ============================================================================
// MaskingEngine::mask_part tests
// ============================================================================

TEST_CASE("Masking part keeps first and last character", "[masking]") {
    CHECK(MaskingEngine::mask_part("").empty());
    CHECK(MaskingEngine::mask_part("a") == "a*");
    CHECK(MaskingEngine::mask_part("ab") == "a*");
    CHECK(MaskingEngine::mask_part("abc") == "a*c");
    CHECK(MaskingEngine::mask_part("alice") == "a***e");
}

TEST_CASE("Masking part counts code points, not bytes", "[masking]") {
    // "é" is two bytes in UTF-8
    CHECK(MaskingEngine::mask_part("\xc3\xa9") == "\xc3\xa9*");
    CHECK(MaskingEngine::mask_part("\xc3\xa9t\xc3\xa9") == "\xc3\xa9*\xc3\xa9");
}

// ============================================================================
// mask_email tests
// ============================================================================

TEST_CASE("Masking email masks local part and each domain label", "[masking][email]") {
    CHECK(mask_email("alice@example.com") == "a***e@e*****e.c*m");
    CHECK(mask_email("bob@example.com") == "b*b@e*****e.c*m");
    CHECK(mask_email("a@b.co") == "a*@b*.c*");
    CHECK(mask_email("ab@cd.e") == "a*@c*.e*");
}

TEST_CASE("Masking email uses the first address found in the text", "[masking][email]") {
    // Only the masked address is returned; the surrounding text is dropped
    CHECK(mask_email("contact: jo@x.io today") == "j*@x*.i*");
    CHECK(mask_email("x@y z@w.com") == "z*@w*.c*m");
}

TEST_CASE("Masking email leaves text without an address unchanged", "[masking][email]") {
    CHECK(mask_email("no email here") == "no email here");
    CHECK(mask_email("user@localhost") == "user@localhost");
    CHECK(mask_email("").empty());
}

TEST_CASE("Masking email hides the input address", "[masking][email]") {
    const auto masked = mask_email("user@example.com");
    CHECK(masked != "user@example.com");
    CHECK(masked.find("user") == std::string::npos);
    CHECK(masked.find('@') != std::string::npos);
}

// ============================================================================
// mask_phone tests
// ============================================================================

TEST_CASE("Masking phone keeps layout and the last two digits", "[masking][phone]") {
    const std::string input = "+1 (555) 123-4567";
    const auto masked = mask_phone(input);
    CHECK(masked == "+* (***) ***-**67");

    REQUIRE(masked.size() == input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        const bool digit = input[i] >= '0' && input[i] <= '9';
        if (!digit) {
            CHECK(masked[i] == input[i]);
        }
    }
}

TEST_CASE("Masking phone with exactly four digits", "[masking][phone]") {
    CHECK(mask_phone("1234") == "**34");
    CHECK(mask_phone("555-1234") == "***-**34");
}

TEST_CASE("Masking phone with fewer than four digits drops delimiters", "[masking][phone]") {
    CHECK(mask_phone("12") == "**");
    CHECK(mask_phone("1-2-3") == "***");
    CHECK(mask_phone("no digits").empty());
}

// ============================================================================
// strip_url_query tests
// ============================================================================

TEST_CASE("Masking url strips the query string", "[masking][url]") {
    CHECK(strip_url_query("https://example.com/path?token=abc") == "https://example.com/path");
    CHECK(strip_url_query("http://example.com?a=1&b=2#frag") == "http://example.com");
}

TEST_CASE("Masking url without query is unchanged", "[masking][url]") {
    CHECK(strip_url_query("https://example.com/path") == "https://example.com/path");
    CHECK(strip_url_query("plain text?") == "plain text?");
    CHECK(strip_url_query("http://?x") == "http://?x");
}

TEST_CASE("Masking url cuts the rest of the line after the first query", "[masking][url]") {
    const std::string input =
        "see https://a.com/x?y=1 and https://b.com?z=2\nnext http://c.org/p?q=3 end";
    CHECK(strip_url_query(input) == "see https://a.com/x\nnext http://c.org/p");
}

// ============================================================================
// Long inputs
// ============================================================================

TEST_CASE("Masking handles megabyte-long values", "[masking][large]") {
    const size_t n = 1 << 20;

    const auto email = mask_email(std::string(n, 'a') + "@example.com");
    CHECK(email == "a" + std::string(n - 2, '*') + "a@e*****e.c*m");

    const auto phone = mask_phone(std::string(n, '5'));
    CHECK(phone == std::string(n - 2, '*') + "55");

    CHECK(strip_url_query("https://a.com/?" + std::string(n, 'x')) == "https://a.com/");

    const std::string no_query = "https://a.com/" + std::string(n, 'x');
    CHECK(strip_url_query(no_query) == no_query);
}
