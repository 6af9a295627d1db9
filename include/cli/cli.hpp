#pragma once

#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uisanitizer::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

enum class Command {
    NONE,
    SANITIZE_STDIN,
    SANITIZE_FILE
};

struct Options {
    Command command = Command::NONE;
    std::string path;                                   // sanitize-file only; "-" = stdin
    std::optional<Kind> kind;                           // --type
    std::optional<std::vector<std::string>> languages;  // --languages (possibly empty)
    std::optional<std::string> config_path;             // --config
    bool verbose = false;
    bool help = false;
};

/**
 * @brief Parse command-line arguments (program name excluded)
 * @return Options, or USAGE_ERROR with a message for the user
 */
[[nodiscard]] Result<Options> parse_args(const std::vector<std::string>& args);

/**
 * @brief Load the --config file, or the defaults when none was given
 * @return AppConfig, or CONFIG_ERROR with the loader's message
 */
[[nodiscard]] Result<AppConfig> load_config(const std::optional<std::string>& config_path);

/**
 * @brief Read a stream to the end, failing once more than max_bytes arrive
 */
[[nodiscard]] Result<std::string> read_stream(std::istream& in, int64_t max_bytes);

[[nodiscard]] Result<std::string> read_file(const std::string& path, int64_t max_bytes);

/// "\r\n" and lone "\r" become "\n"
[[nodiscard]] std::string normalize_newlines(std::string_view text);

/**
 * @brief Write the detected kind, the sanitized value and, when languages
 *        are given, one "<language>: <literal>" line per language
 */
void print_result(std::ostream& out,
                  const SanitizeResult& result,
                  const std::vector<std::string>& languages,
                  bool literal_header);

void print_usage(std::ostream& out);

/**
 * @brief Run the tool
 * @return Process exit status (kExitOk, kExitFailure, kExitUsage)
 */
[[nodiscard]] int run(const std::vector<std::string>& args,
                      std::istream& in,
                      std::ostream& out,
                      std::ostream& err);

} // namespace uisanitizer::cli
