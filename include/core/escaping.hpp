#pragma once

#include <string>
#include <string_view>

namespace uisanitizer {

/**
 * @brief Double every single quote ("O'Brien" -> "O''Brien")
 *
 * Quote doubling only; this is not protection for untrusted queries.
 */
[[nodiscard]] std::string escape_sql(std::string_view value);

/**
 * @brief Escape & < > " ' as &amp; &lt; &gt; &quot; &#x27;
 *
 * Single pass. Running it twice escapes the entities it produced.
 */
[[nodiscard]] std::string escape_html(std::string_view value);

} // namespace uisanitizer
