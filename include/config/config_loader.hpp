#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace uisanitizer {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "warn";
};

// ============================================================================
// Output Config
// ============================================================================

struct OutputConfig {
    // Languages to render literals for when --languages is not given
    std::optional<std::vector<std::string>> languages;
    bool literal_header = true;
};

// ============================================================================
// Input Config
// ============================================================================

struct InputConfig {
    int64_t max_bytes = 10 * 1024 * 1024;
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    LoggingConfig logging;
    OutputConfig output;
    InputConfig input;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * @brief Loads the optional uisanitizer.toml
 *
 * Recognised sections:
 * - [logging] level = "debug" | "info" | "warn" | "error"
 * - [output]  languages = ["python", ...], literal_header = true
 * - [input]   max_bytes = 10485760
 *
 * ${VAR} inside string values is replaced by the environment variable
 * (unset variables expand to ""). Unknown keys are ignored.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to uisanitizer.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per violation (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace uisanitizer
