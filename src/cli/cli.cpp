#include "cli/cli.hpp"
#include "codegen/literal_escaper.hpp"
#include "core/utils.hpp"
#include "sanitizer/sanitizer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <istream>
#include <ostream>
#include <utility>

namespace uisanitizer::cli {

namespace {

constexpr std::string_view kProgramName = "uisanitizer";
constexpr std::string_view kCmdSanitizeStdin = "sanitize-stdin";
constexpr std::string_view kCmdSanitizeFile = "sanitize-file";
constexpr std::string_view kStdinPath = "-";

Result<Options> usage_error(std::string message) {
    return Result<Options>::error(ErrorCategory::USAGE_ERROR, std::move(message));
}

// Splits "--name=value" into name and value; plain tokens have no value
std::pair<std::string, std::optional<std::string>> split_option(const std::string& token) {
    if (token.starts_with("--")) {
        const size_t eq = token.find('=');
        if (eq != std::string::npos) {
            return {token.substr(0, eq), token.substr(eq + 1)};
        }
    }
    return {token, std::nullopt};
}

void strip_trailing_newlines(std::string& text) {
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
}

} // anonymous namespace

// ============================================================================
// Argument Parsing
// ============================================================================

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    bool have_path = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto split = split_option(args[i]);
        const std::string& name = split.first;
        const std::optional<std::string>& inline_value = split.second;

        // Fetches the option's value: "--opt=value" or the next argument
        auto take_value = [&](std::string& out) -> bool {
            if (inline_value) {
                out = *inline_value;
                return true;
            }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (name == "-h" || name == "--help") {
            opts.help = true;
        } else if (name == "-v" || name == "--verbose") {
            opts.verbose = true;
        } else if (name == "--config") {
            std::string path;
            if (!take_value(path)) {
                return usage_error("argument --config: expected one argument");
            }
            opts.config_path = std::move(path);
        } else if (name == "--type") {
            std::string kind_name;
            if (!take_value(kind_name)) {
                return usage_error("argument --type: expected one argument");
            }
            const auto kind = parse_kind(kind_name);
            if (!kind) {
                return usage_error("argument --type: invalid choice: '" + kind_name +
                                   "' (choose from email, phone, url, json, env, text)");
            }
            opts.kind = *kind;
        } else if (name == "--languages") {
            std::vector<std::string> languages;
            if (inline_value) {
                languages.push_back(*inline_value);
            }
            while (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
                languages.push_back(args[++i]);
            }
            opts.languages = std::move(languages);
        } else if (name.size() > 1 && name.starts_with("-")) {
            return usage_error("unrecognized argument: " + args[i]);
        } else if (opts.command == Command::NONE) {
            if (name == kCmdSanitizeStdin) {
                opts.command = Command::SANITIZE_STDIN;
            } else if (name == kCmdSanitizeFile) {
                opts.command = Command::SANITIZE_FILE;
            } else {
                return usage_error("invalid command: '" + name +
                                   "' (choose from sanitize-stdin, sanitize-file)");
            }
        } else if (opts.command == Command::SANITIZE_FILE && !have_path) {
            opts.path = args[i];
            have_path = true;
        } else {
            return usage_error("unrecognized argument: " + args[i]);
        }
    }

    if (opts.command == Command::SANITIZE_FILE && !have_path && !opts.help) {
        return usage_error("sanitize-file: the following arguments are required: path");
    }

    return Result<Options>::ok(std::move(opts));
}

// ============================================================================
// Configuration
// ============================================================================

Result<AppConfig> load_config(const std::optional<std::string>& config_path) {
    if (!config_path) {
        return Result<AppConfig>::ok(AppConfig{});
    }

    auto loaded = ConfigLoader::load_from_file(*config_path);
    if (!loaded.success) {
        return Result<AppConfig>::error(ErrorCategory::CONFIG_ERROR, std::move(loaded.error_message));
    }
    return Result<AppConfig>::ok(std::move(loaded.config));
}

// ============================================================================
// Input
// ============================================================================

Result<std::string> read_stream(std::istream& in, int64_t max_bytes) {
    std::string data;
    char buf[8192];

    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        data.append(buf, static_cast<size_t>(in.gcount()));
        if (static_cast<int64_t>(data.size()) > max_bytes) {
            return Result<std::string>::error(ErrorCategory::IO_ERROR,
                "input exceeds " + std::to_string(max_bytes) + " bytes");
        }
    }

    if (in.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR, "read failed");
    }
    return Result<std::string>::ok(std::move(data));
}

Result<std::string> read_file(const std::string& path, int64_t max_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            "cannot open '" + path + "': " + std::strerror(errno));
    }

    auto result = read_stream(file, max_bytes);
    if (result.is_error()) {
        return Result<std::string>::error(result.error_category(),
            path + ": " + result.error_message());
    }
    return result;
}

std::string normalize_newlines(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            result += text[i];
        }
    }
    return result;
}

// ============================================================================
// Output
// ============================================================================

void print_result(std::ostream& out,
                  const SanitizeResult& result,
                  const std::vector<std::string>& languages,
                  bool literal_header) {
    out << "# detected: " << kind_to_string(result.kind) << '\n';
    out << result.value << '\n';

    if (languages.empty()) return;

    if (literal_header) {
        out << "\n# language literals:\n";
    }
    for (const auto& lang : languages) {
        out << lang << ": " << escape_literal(result.value, lang) << '\n';
    }
}

void print_usage(std::ostream& out) {
    out << "usage: " << kProgramName << " [-h] [-v] [--config FILE] {sanitize-stdin,sanitize-file} ...\n"
        << "\n"
        << "Universal Input Sanitizer\n"
        << "\n"
        << "commands:\n"
        << "  sanitize-stdin              Sanitize a single value from stdin\n"
        << "  sanitize-file PATH          Sanitize contents of a file (use \"-\" to read stdin)\n"
        << "\n"
        << "command options:\n"
        << "  --type KIND                 Override detected type (email|phone|url|json|env|text)\n"
        << "  --languages [LANG ...]      Languages to print escaped literals for\n"
        << "\n"
        << "options:\n"
        << "  -h, --help                  Show this help message and exit\n"
        << "  -v, --verbose               Log diagnostics to stderr\n"
        << "  --config FILE               Load settings from a TOML file\n";
}

// ============================================================================
// Entry Point
// ============================================================================

int run(const std::vector<std::string>& args,
        std::istream& in,
        std::ostream& out,
        std::ostream& err) {
    auto parsed = parse_args(args);
    if (parsed.is_error()) {
        print_usage(err);
        err << kProgramName << ": error: " << parsed.error_message() << '\n';
        return kExitUsage;
    }
    const Options& opts = parsed.value();

    if (opts.help) {
        print_usage(out);
        return kExitOk;
    }

    auto loaded = load_config(opts.config_path);
    if (loaded.is_error()) {
        utils::log::error(std::string(error_category_to_string(loaded.error_category())) +
                          ": " + loaded.error_message());
        return kExitFailure;
    }
    const AppConfig& config = loaded.value();

    if (opts.verbose) {
        utils::log::set_level(utils::log::Level::DEBUG);
    } else if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    if (opts.config_path) {
        utils::log::info("Loaded configuration from " + *opts.config_path);
    }

    if (opts.command == Command::NONE) {
        print_usage(out);
        return kExitFailure;
    }

    const bool from_stdin = opts.command == Command::SANITIZE_STDIN || opts.path == kStdinPath;
    utils::log::debug("Reading input from " + (from_stdin ? std::string("stdin") : opts.path));
    auto input = from_stdin ? read_stream(in, config.input.max_bytes)
                            : read_file(opts.path, config.input.max_bytes);

    if (input.is_error()) {
        utils::log::error(std::string(error_category_to_string(input.error_category())) +
                          ": " + input.error_message());
        return kExitFailure;
    }

    std::string data = normalize_newlines(input.value());
    if (from_stdin) {
        strip_trailing_newlines(data);
    }

    const auto result = Sanitizer::sanitize(data, opts.kind);
    utils::log::debug("Detected kind: " + std::string(kind_to_string(result.kind)) +
                      " (" + std::to_string(data.size()) + " bytes in, " +
                      std::to_string(result.value.size()) + " bytes out)");

    const std::vector<std::string> languages =
        opts.languages.value_or(config.output.languages.value_or(std::vector<std::string>{}));

    for (const auto& lang : languages) {
        if (!LiteralEscaper::is_known_language(lang)) {
            utils::log::warn("Unknown language '" + lang + "', using python literal");
        }
    }

    print_result(out, result, languages, config.output.literal_header);
    return kExitOk;
}

} // namespace uisanitizer::cli
