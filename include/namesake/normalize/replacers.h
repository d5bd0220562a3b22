#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace namesake::normalize {

/**
 * @brief Whole-word dictionary replacement, leftmost-longest
 *
 * A pattern only matches when delimited by the text boundaries or by
 * non-alphanumeric characters. Patterns are matched against lowercase text.
 */
class WordReplacer {
public:
    explicit WordReplacer(std::vector<std::pair<std::string, std::string>> table);

    std::string apply(std::string_view text) const;

    size_t size() const { return table_.size(); }

private:
    std::vector<std::pair<std::string, std::string>> table_; // longest pattern first
};

/// Legal-form words mapped to their common abbreviation ("limited liability company" -> "llc")
const WordReplacer& organizationTypes();

/// Honorifics and person-name prefixes, removed
const WordReplacer& personNamePrefixes();

/// Street-type and direction words mapped to abbreviations
const WordReplacer& addressForms();

/// Spelled-out and suffixed ordinals mapped to digits
const WordReplacer& ordinals();

} // namespace namesake::normalize
