#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uisanitizer::utils {

// ============================================================================
// String Utilities
// ============================================================================

// ASCII whitespace plus the file/group/record/unit separators, which the
// classic str.strip() family treats as whitespace too. Only single bytes are
// stripped: Unicode spaces such as U+0085, U+00A0 and U+3000, which Python's
// str.strip() also removes, are kept.
inline constexpr std::string_view kWhitespace = " \t\n\r\v\f\x1c\x1d\x1e\x1f";

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(kWhitespace);
    return std::string(str.substr(start, end - start + 1));
}

[[nodiscard]] inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * @brief Split text into lines, dropping the terminators.
 *
 * Recognises \n, \r\n, \r, \v, \f and \x1c-\x1e as line boundaries.
 * A terminator at the very end does not yield a trailing empty line.
 */
[[nodiscard]] inline std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t begin = 0;
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (c == '\n' || c == '\r' || c == '\v' || c == '\f' ||
            c == '\x1c' || c == '\x1d' || c == '\x1e') {
            lines.emplace_back(text.substr(begin, i - begin));
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            begin = ++i;
        } else {
            ++i;
        }
    }
    if (begin < text.size()) {
        lines.emplace_back(text.substr(begin));
    }
    return lines;
}

[[nodiscard]] inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

[[nodiscard]] inline std::string to_hex(uint32_t value, int width) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(static_cast<size_t>(width), '0');
    for (int i = width - 1; i >= 0 && value != 0; --i) {
        out[static_cast<size_t>(i)] = kDigits[value & 0xF];
        value >>= 4;
    }
    return out;
}

// ============================================================================
// UTF-8 Decoding
// ============================================================================

/**
 * @brief One decoded unit of a UTF-8 string.
 *
 * Invalid sequences decode to a single-byte unit with valid == false and
 * code_point set to that byte.
 */
struct Utf8Unit {
    char32_t code_point = 0;
    std::string_view bytes;
    bool valid = true;
};

[[nodiscard]] inline std::vector<Utf8Unit> decode_utf8(std::string_view text) {
    std::vector<Utf8Unit> units;
    units.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;

        if (lead < 0x80) {
            units.push_back({lead, text.substr(i, 1), true});
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; min_cp = 0x10000;
        }

        bool ok = len != 0 && i + len <= text.size();
        for (size_t k = 1; ok && k < len; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                ok = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        if (ok && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            ok = false;
        }

        if (ok) {
            units.push_back({cp, text.substr(i, len), true});
            i += len;
        } else {
            units.push_back({lead, text.substr(i, 1), false});
            ++i;
        }
    }
    return units;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::WARN};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < threshold().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        char ms_buf[8];
        std::snprintf(ms_buf, sizeof(ms_buf), "%03d", static_cast<int>(ms.count()));

        std::string formatted;
        formatted.reserve(msg.size() + 32);
        formatted.append(time_buf).append(".").append(ms_buf);
        formatted.append(" [").append(tag).append("] ").append(msg).append("\n");

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::threshold().load(std::memory_order_relaxed);
}

[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace uisanitizer::utils
