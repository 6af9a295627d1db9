#include "classifier/type_detector.hpp"
#include "classifier/patterns.hpp"
#include "core/json_document.hpp"
#include "core/utils.hpp"

namespace uisanitizer {

bool TypeDetector::is_json_document(std::string_view trimmed) {
    if (trimmed.empty()) return false;
    const bool object_shape = trimmed.front() == '{' && trimmed.back() == '}';
    const bool array_shape = trimmed.front() == '[' && trimmed.back() == ']';
    if (!object_shape && !array_shape) return false;

    return JsonDocument::parse(trimmed).is_ok();
}

bool TypeDetector::is_env_block(std::string_view trimmed) {
    if (trimmed.find('=') == std::string_view::npos) return false;

    size_t assignments = 0;
    for (const auto& line : utils::split_lines(trimmed)) {
        const std::string stripped = utils::trim(line);
        if (stripped.empty() || stripped.front() == '#') continue;
        if (line.find('=') == std::string::npos) return false;
        ++assignments;
    }
    return assignments > 0;
}

Kind TypeDetector::detect(std::string_view input) {
    const std::string v = utils::trim(input);

    if (is_json_document(v)) {
        return Kind::JSON;
    }
    if (is_env_block(v)) {
        return Kind::ENV;
    }

    if (patterns::is_email(v)) return Kind::EMAIL;
    if (patterns::is_phone(v)) return Kind::PHONE;
    if (patterns::is_url(v)) return Kind::URL;

    return Kind::TEXT;
}

} // namespace uisanitizer
