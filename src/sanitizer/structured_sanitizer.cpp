#include "sanitizer/structured_sanitizer.hpp"
#include "sanitizer/sanitizer.hpp"
#include "core/json_document.hpp"
#include "core/utils.hpp"

#include <vector>

namespace uisanitizer {

using json = nlohmann::ordered_json;

void StructuredSanitizer::sanitize_node(json& node) {
    if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            sanitize_node(child);
        }
    } else if (node.is_string()) {
        node = Sanitizer::sanitize(node.get_ref<const std::string&>()).value;
    }
}

Result<std::string> StructuredSanitizer::sanitize_json(std::string_view input) {
    auto parsed = JsonDocument::parse(input);
    if (parsed.is_error()) {
        return Result<std::string>::error(parsed.error_category(), parsed.error_message());
    }

    json& doc = parsed.value();
    sanitize_node(doc);
    return Result<std::string>::ok(JsonDocument::serialize(doc));
}

std::string StructuredSanitizer::sanitize_env(std::string_view input) {
    std::vector<std::string> lines;

    for (auto& line : utils::split_lines(input)) {
        const std::string stripped = utils::trim(line);
        if (stripped.empty() || stripped.front() == '#') {
            lines.emplace_back(std::move(line));
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            lines.emplace_back(std::move(line));
            continue;
        }

        const std::string value = utils::trim(std::string_view(line).substr(eq + 1));
        std::string rewritten = line.substr(0, eq);
        rewritten += '=';
        rewritten += Sanitizer::sanitize(value).value;
        lines.emplace_back(std::move(rewritten));
    }

    return utils::join(lines, "\n");
}

} // namespace uisanitizer
