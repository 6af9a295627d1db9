#include "classifier/patterns.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace uisanitizer::patterns {

namespace {

constexpr std::string_view kHttp = "http://";
constexpr std::string_view kHttps = "https://";
constexpr size_t kMinPhoneBody = 8;

bool is_address_char(char c) {
    return c != '@' && !is_space(c);
}

// A '.' with at least one character on each side
bool is_dotted_domain(std::string_view domain) {
    if (domain.size() < 3) return false;
    return domain.substr(1, domain.size() - 2).find('.') != std::string_view::npos;
}

bool is_phone_char(char c) {
    return utils::is_digit(c) || c == '-' || c == '(' || c == ')' || c == ' ';
}

// Length of the http(s) scheme at the start of text, 0 if there is none
size_t scheme_length(std::string_view text) {
    if (text.starts_with(kHttps)) return kHttps.size();
    if (text.starts_with(kHttp)) return kHttp.size();
    return 0;
}

} // anonymous namespace

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_email(std::string_view value) {
    const size_t at = value.find('@');
    if (at == std::string_view::npos || at == 0) return false;

    const auto domain = value.substr(at + 1);
    if (domain.find('@') != std::string_view::npos) return false;
    if (std::any_of(value.begin(), value.end(), is_space)) return false;

    return is_dotted_domain(domain);
}

bool is_phone(std::string_view value) {
    std::string_view body = value;
    if (body.starts_with('+')) body.remove_prefix(1);

    if (body.size() < kMinPhoneBody) return false;
    if (!utils::is_digit(body.front()) || !utils::is_digit(body.back())) return false;
    return std::all_of(body.begin(), body.end(), is_phone_char);
}

bool is_url(std::string_view value) {
    const size_t scheme = scheme_length(value);
    if (scheme == 0 || value.size() == scheme) return false;
    return std::none_of(value.begin(), value.end(), is_space);
}

std::optional<EmailMatch> find_email(std::string_view text) {
    // Each scan stops at the neighbouring '@', so every character is
    // visited at most twice overall.
    for (size_t at = text.find('@'); at != std::string_view::npos; at = text.find('@', at + 1)) {
        size_t begin = at;
        while (begin > 0 && is_address_char(text[begin - 1])) --begin;
        if (begin == at) continue;

        size_t end = at + 1;
        while (end < text.size() && is_address_char(text[end])) ++end;

        const auto domain = text.substr(at + 1, end - at - 1);
        if (is_dotted_domain(domain)) {
            return EmailMatch{text.substr(begin, at - begin), domain};
        }
    }
    return std::nullopt;
}

std::optional<UrlQueryMatch> find_url_query(std::string_view text, size_t from) {
    size_t i = from;
    while (i < text.size()) {
        const size_t scheme = scheme_length(text.substr(i));
        if (scheme == 0) {
            ++i;
            continue;
        }

        const size_t path = i + scheme;
        size_t stop = path;
        while (stop < text.size() && text[stop] != '?' && !is_space(text[stop])) ++stop;

        if (stop > path && stop < text.size() && text[stop] == '?') {
            const size_t line_end = std::min(text.find('\n', stop), text.size());
            return UrlQueryMatch{i, stop, line_end};
        }
        // A scheme starting inside this run would stop at the same place
        i = std::max(stop, i + 1);
    }
    return std::nullopt;
}

} // namespace uisanitizer::patterns
