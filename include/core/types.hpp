#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace uisanitizer {

namespace keys {
    inline constexpr std::string_view EMAIL = "email";
    inline constexpr std::string_view PHONE = "phone";
    inline constexpr std::string_view URL = "url";
    inline constexpr std::string_view JSON = "json";
    inline constexpr std::string_view ENV = "env";
    inline constexpr std::string_view TEXT = "text";
}

/**
 * @brief Semantic kind assigned to an input value
 */
enum class Kind {
    EMAIL,
    PHONE,
    URL,
    JSON,
    ENV,
    TEXT
};

[[nodiscard]] inline std::string_view kind_to_string(Kind kind) {
    switch (kind) {
        case Kind::EMAIL: return keys::EMAIL;
        case Kind::PHONE: return keys::PHONE;
        case Kind::URL:   return keys::URL;
        case Kind::JSON:  return keys::JSON;
        case Kind::ENV:   return keys::ENV;
        case Kind::TEXT:  return keys::TEXT;
    }
    return keys::TEXT;
}

/**
 * @brief Parse a lower-case kind name (email|phone|url|json|env|text)
 * @return The kind, or nullopt for any other spelling
 */
[[nodiscard]] inline std::optional<Kind> parse_kind(std::string_view name) {
    static const std::unordered_map<std::string_view, Kind> lookup = {
        {keys::EMAIL, Kind::EMAIL},
        {keys::PHONE, Kind::PHONE},
        {keys::URL,   Kind::URL},
        {keys::JSON,  Kind::JSON},
        {keys::ENV,   Kind::ENV},
        {keys::TEXT,  Kind::TEXT},
    };

    if (const auto it = lookup.find(name); it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

/**
 * @brief Outcome of one sanitization call
 */
struct SanitizeResult {
    Kind kind = Kind::TEXT;
    std::string value;

    SanitizeResult() = default;
    SanitizeResult(Kind k, std::string v) : kind(k), value(std::move(v)) {}
};

} // namespace uisanitizer
