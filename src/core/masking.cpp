#include "core/masking.hpp"
#include "classifier/patterns.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <vector>

namespace uisanitizer {

static constexpr char kMaskChar = '*';

std::string MaskingEngine::mask_part(std::string_view part) {
    if (part.empty()) return "";

    const auto units = utils::decode_utf8(part);
    const auto& first = units.front().bytes;

    if (units.size() <= 2) {
        return std::string(first) + kMaskChar;
    }

    const auto& last = units.back().bytes;
    std::string result;
    result.reserve(first.size() + units.size() - 2 + last.size());
    result.append(first);
    result.append(units.size() - 2, kMaskChar);
    result.append(last);
    return result;
}

std::string MaskingEngine::mask_email(std::string_view value) {
    const auto match = patterns::find_email(value);
    if (!match) {
        return std::string(value);
    }

    // Split on every '.', keeping empty labels ("a..b" has three)
    const std::string_view domain = match->domain;
    std::vector<std::string> labels;
    size_t begin = 0;
    while (true) {
        const size_t dot = domain.find('.', begin);
        if (dot == std::string_view::npos) {
            labels.push_back(mask_part(domain.substr(begin)));
            break;
        }
        labels.push_back(mask_part(domain.substr(begin, dot - begin)));
        begin = dot + 1;
    }

    return mask_part(match->local) + "@" + utils::join(labels, ".");
}

std::string MaskingEngine::mask_phone(std::string_view value) {
    const auto digit_count = static_cast<size_t>(
        std::count_if(value.begin(), value.end(), utils::is_digit));

    if (digit_count < kMinPhoneDigits) {
        return std::string(digit_count, kMaskChar);
    }

    const size_t masked_count = digit_count - kVisiblePhoneDigits;
    size_t seen = 0;

    std::string result;
    result.reserve(value.size());
    for (const char c : value) {
        if (utils::is_digit(c)) {
            result += (seen < masked_count) ? kMaskChar : c;
            ++seen;
        } else {
            result += c;
        }
    }
    return result;
}

std::string MaskingEngine::strip_url_query(std::string_view value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (const auto match = patterns::find_url_query(value, pos)) {
        result.append(value.substr(pos, match->query - pos));
        pos = match->end;
    }
    result.append(value.substr(pos));
    return result;
}

} // namespace uisanitizer
