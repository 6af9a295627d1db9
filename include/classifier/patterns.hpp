#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace uisanitizer::patterns {

/**
 * @brief Shape recognizers for email, phone number and URL values
 *
 * Each recognizer is a single forward scan over the input, so cost grows
 * linearly with its length and no input size can exhaust the stack.
 *
 * Whitespace means the ASCII set " \t\n\r\v\f". The is_* predicates are
 * anchored: the whole input must have the shape.
 *
 *   email  <local>@<domain>, no whitespace, one '@', domain has a '.' with
 *          at least one character on each side
 *   phone  optional '+', then 8+ chars of digits, '-', '(', ')', ' ', with a
 *          digit at both ends
 *   url    "http://" or "https://" followed by one or more non-whitespace
 */

/// Local part and domain of an email-shaped substring (views into the input)
struct EmailMatch {
    std::string_view local;
    std::string_view domain;
};

/**
 * @brief A URL carrying a query string
 *
 * [begin, query) is the URL up to (excluding) the '?'. [query, end) is the
 * query and the rest of its line, without the line's '\n'.
 */
struct UrlQueryMatch {
    size_t begin;
    size_t query;
    size_t end;
};

[[nodiscard]] bool is_space(char c);

[[nodiscard]] bool is_email(std::string_view value);
[[nodiscard]] bool is_phone(std::string_view value);
[[nodiscard]] bool is_url(std::string_view value);

/**
 * @brief Find the leftmost email-shaped substring of text
 *
 * The local part runs back from the '@' to the previous whitespace or '@';
 * the domain runs forward to the next one.
 */
[[nodiscard]] std::optional<EmailMatch> find_email(std::string_view text);

/**
 * @brief Find the first query-carrying URL starting at or after `from`
 */
[[nodiscard]] std::optional<UrlQueryMatch> find_url_query(std::string_view text, size_t from = 0);

} // namespace uisanitizer::patterns
