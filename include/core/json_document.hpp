#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace uisanitizer {

/**
 * @brief JSON text <-> ordered DOM, keeping what a round trip must not change
 *
 * - Object members keep their source order; a repeated key keeps its first
 *   position and its last value.
 * - Integer literals too wide for 64 bits are kept digit for digit. They are
 *   held as a binary node carrying the literal text, which no JSON input can
 *   otherwise produce.
 * - Documents nested deeper than kMaxDepth containers are rejected, so every
 *   later walk over the tree has bounded recursion.
 */
class JsonDocument {
public:
    static constexpr size_t kMaxDepth = 1000;

    /**
     * @brief Parse a complete JSON text (trailing garbage is an error)
     * @return The document, or PARSE_ERROR
     */
    [[nodiscard]] static Result<nlohmann::ordered_json> parse(std::string_view text);

    /**
     * @brief Serialize on one line with ", " and ": " separators
     *
     * Non-ASCII text is written as UTF-8; invalid UTF-8 becomes U+FFFD.
     */
    [[nodiscard]] static std::string serialize(const nlohmann::ordered_json& doc);
};

} // namespace uisanitizer
