#pragma once

#include <string>
#include <string_view>

namespace namesake::normalize {

/**
 * @brief American Soundex code (letter plus three digits)
 *
 * Characters outside A-Z are ignored; returns an empty string when no letter
 * remains.
 */
std::string soundex(std::string_view word);

/**
 * @brief Original Metaphone key, truncated to maxLength
 *
 * Follows the widely used Apache Commons Codec rules. Characters outside A-Z
 * do not contribute.
 */
std::string metaphone(std::string_view word, size_t maxLength = 4);

} // namespace namesake::normalize
