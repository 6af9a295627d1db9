#include <catch2/catch_test_macros.hpp>
#include "core/json_document.hpp"

#include <string>

using namespace uisanitizer;

namespace {

std::string nested_arrays(size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // anonymous namespace

TEST_CASE("JsonDocument: parse and serialize keep member order", "[json]") {
    auto doc = JsonDocument::parse(R"({"z":1,"a":[true,null,"x"],"m":{}})");
    REQUIRE(doc.is_ok());
    CHECK(JsonDocument::serialize(doc.value()) == R"({"z": 1, "a": [true, null, "x"], "m": {}})");
}

TEST_CASE("JsonDocument: repeated key keeps first position and last value", "[json]") {
    auto doc = JsonDocument::parse(R"({"a":1,"b":2,"a":{"c":3}})");
    REQUIRE(doc.is_ok());
    CHECK(JsonDocument::serialize(doc.value()) == R"({"a": {"c": 3}, "b": 2})");
}

TEST_CASE("JsonDocument: wide integers are kept as written", "[json][numbers]") {
    auto doc = JsonDocument::parse("[123456789012345678901234567890, -18446744073709551617, 42]");
    REQUIRE(doc.is_ok());
    CHECK(doc.value()[0].is_binary());
    CHECK(doc.value()[2].is_number_integer());
    CHECK(JsonDocument::serialize(doc.value()) ==
          "[123456789012345678901234567890, -18446744073709551617, 42]");
}

TEST_CASE("JsonDocument: wide integer as the whole document", "[json][numbers]") {
    auto doc = JsonDocument::parse("18446744073709551616");
    REQUIRE(doc.is_ok());
    CHECK(JsonDocument::serialize(doc.value()) == "18446744073709551616");
}

TEST_CASE("JsonDocument: nesting up to the limit is accepted", "[json][depth]") {
    const auto text = nested_arrays(JsonDocument::kMaxDepth);
    auto doc = JsonDocument::parse(text);
    REQUIRE(doc.is_ok());
    CHECK(JsonDocument::serialize(doc.value()) == text);
}

TEST_CASE("JsonDocument: nesting past the limit is rejected", "[json][depth]") {
    CHECK(JsonDocument::parse(nested_arrays(JsonDocument::kMaxDepth + 1)).is_error());
    CHECK(JsonDocument::parse(nested_arrays(100000)).is_error());

    std::string objects;
    for (size_t i = 0; i < 100000; ++i) objects += "{\"k\":";
    objects += "1";
    objects += std::string(100000, '}');
    CHECK(JsonDocument::parse(objects).is_error());
}

TEST_CASE("JsonDocument: malformed text is a parse error", "[json]") {
    for (const char* text : {"", "{", "[1,]", "{\"a\"}", "[1] 2", "1e400", "nul"}) {
        INFO(text);
        auto doc = JsonDocument::parse(text);
        CHECK(doc.is_error());
        CHECK(doc.error_category() == ErrorCategory::PARSE_ERROR);
    }
}

TEST_CASE("JsonDocument: invalid UTF-8 in strings is replaced on output", "[json]") {
    // The parser rejects invalid UTF-8 inside JSON strings
    CHECK(JsonDocument::parse("[\"a\xff\"]").is_error());

    nlohmann::ordered_json doc = nlohmann::ordered_json::array({std::string("a\xff")});
    CHECK(JsonDocument::serialize(doc) == "[\"a\xef\xbf\xbd\"]");
}
