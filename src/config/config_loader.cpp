#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string_view>

using namespace std::string_literals;

namespace uisanitizer {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Replace each ${VAR_NAME} with the environment variable's value.
 */
std::string expand_env_vars(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    size_t pos = 0;
    for (size_t open = input.find("${"); open != std::string_view::npos;
         open = input.find("${", pos)) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                "Unclosed env var substitution at position " + std::to_string(open));
        }
        result.append(input.substr(pos, open - pos));

        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            result += value;
        }
        pos = close + 1;
    }
    result.append(input.substr(pos));
    return result;
}

// Walks tables and arrays alike; every string leaf is expanded in place
void expand_env_vars_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        str->get() = expand_env_vars(str->get());
    } else if (auto* table = node.as_table()) {
        for (auto& [key, child] : *table) {
            expand_env_vars_in(child);
        }
    } else if (auto* array = node.as_array()) {
        for (auto& child : *array) {
            expand_env_vars_in(child);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_in(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("warn"s);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    if (const auto* arr = o["languages"].as_array()) {
        std::vector<std::string> languages;
        languages.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                languages.emplace_back(s->get());
            } else {
                throw std::runtime_error("output.languages must contain only strings");
            }
        }
        cfg.languages = std::move(languages);
    }
    cfg.literal_header = o["literal_header"].value_or(true);
    return cfg;
}

InputConfig extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;

    cfg.max_bytes = (*input)["max_bytes"].value_or(cfg.max_bytes);
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.logging = extract_logging(tbl);
    config.output = extract_output(tbl);
    config.input = extract_input(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error("Failed to load config: "s + e.what());
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error("Failed to parse config: "s + e.what());
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level).has_value()) {
        errors.push_back("logging.level must be one of debug, info, warn, error; got '" +
                         config.logging.level + "'");
    }

    if (config.input.max_bytes <= 0) {
        errors.push_back("input.max_bytes must be > 0, got " +
                         std::to_string(config.input.max_bytes));
    }

    if (config.output.languages) {
        const auto& languages = *config.output.languages;
        for (size_t i = 0; i < languages.size(); ++i) {
            if (utils::trim(languages[i]).empty()) {
                errors.push_back("output.languages[" + std::to_string(i) + "] must not be empty");
            }
        }
    }

    return errors;
}

} // namespace uisanitizer
