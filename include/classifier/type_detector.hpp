#pragma once

#include "core/types.hpp"

#include <string_view>

namespace uisanitizer {

/**
 * @brief Classifies a string into exactly one Kind
 *
 * Ordered decision list, first match wins:
 * 1. JSON container ({...} or [...]) that parses as JSON, nested at most
 *    JsonDocument::kMaxDepth deep
 * 2. env block: every non-blank, non-comment line has '='
 * 3. email, 4. phone, 5. URL (full match of the trimmed input)
 * 6. text
 *
 * A bracketed value that fails to parse continues down the list.
 */
class TypeDetector {
public:
    [[nodiscard]] static Kind detect(std::string_view input);

    [[nodiscard]] static bool is_json_document(std::string_view trimmed);
    [[nodiscard]] static bool is_env_block(std::string_view trimmed);
};

[[nodiscard]] inline Kind detect_type(std::string_view input) {
    return TypeDetector::detect(input);
}

} // namespace uisanitizer
