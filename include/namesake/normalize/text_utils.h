#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace namesake::normalize {

/**
 * @brief Drop punctuation and symbols, keep letters, digits and single spaces
 *
 * Bytes outside ASCII are kept as-is so that normalized non-Latin text
 * survives. Input is expected to be normalized already.
 */
std::string stripPunctuation(std::string_view text);

/**
 * @brief Like stripPunctuation, but punctuation becomes a word break
 */
std::string punctuationToSpace(std::string_view text);

/**
 * @brief Split on ASCII whitespace, skipping empty tokens
 */
std::vector<std::string> tokenize(std::string_view text);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

/**
 * @brief Maximal runs of ASCII digits
 */
std::vector<std::string> extractNumbers(std::string_view text);

std::string removeWhitespace(std::string_view text);

/**
 * @brief Number of code points in UTF-8 text
 */
size_t codepointLength(std::string_view text);

} // namespace namesake::normalize
