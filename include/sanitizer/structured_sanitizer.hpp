#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace uisanitizer {

/**
 * @brief Sanitizes structured inputs by re-classifying their leaves
 *
 * JSON: every string leaf is detected and sanitized on its own (a leaf that
 * holds JSON or an env block recurses). Keys, array order, numbers,
 * booleans and null are kept. Object key order is preserved.
 *
 * Env: KEY=VALUE lines get their (trimmed) value sanitized; the key, blank
 * lines, comments and lines without '=' pass through verbatim.
 */
class StructuredSanitizer {
public:
    /**
     * @brief Parse, sanitize string leaves, serialize on one line
     * @return Sanitized JSON text, or PARSE_ERROR if input is not JSON
     */
    [[nodiscard]] static Result<std::string> sanitize_json(std::string_view input);

    /**
     * @brief Rewrite the value side of each KEY=VALUE line
     * @return Lines joined with '\n'
     */
    [[nodiscard]] static std::string sanitize_env(std::string_view input);

private:
    static void sanitize_node(nlohmann::ordered_json& node);
};

} // namespace uisanitizer
