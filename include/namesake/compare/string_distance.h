#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace namesake::compare {

/**
 * @brief Edit-distance metric interface
 */
class IDistanceMetric {
public:
    virtual ~IDistanceMetric() = default;
    virtual size_t distance(std::string_view s1, std::string_view s2) const = 0;
};

/**
 * @brief Levenshtein distance metric
 */
class LevenshteinDistance : public IDistanceMetric {
public:
    size_t distance(std::string_view s1, std::string_view s2) const override;
};

size_t levenshtein(std::string_view s1, std::string_view s2);

/**
 * @brief Jaro similarity in [0,1]
 */
double jaro(std::string_view s1, std::string_view s2);

/**
 * @brief Jaro-Winkler similarity in [0,1]
 *
 * The common-prefix boost (up to 4 characters) applies only above a Jaro
 * similarity of 0.7.
 */
double jaroWinkler(std::string_view s1, std::string_view s2);

/**
 * @brief Edit-budgeted Levenshtein similarity
 *
 * 0 when either side is empty, 1 when equal. The budget is
 * min(maxEdits, ceil(0.2 * shorter length)); beyond it the similarity is 0,
 * otherwise 1 - distance / longer length.
 */
double levenshteinSimilarity(std::string_view lhs, std::string_view rhs, size_t maxEdits = 4);

/**
 * @brief Distance of lowercased strings within min(4, ceil(0.2 * shorter length))
 */
bool isLevenshteinPlausible(std::string_view lhs, std::string_view rhs);

/**
 * @brief Greedy Jaro-Winkler pairing of name parts
 *
 * Returns the product of the paired scores, or 0 when some query part stays
 * unpaired or the joined alignment is implausible.
 */
double alignNameParts(const std::vector<std::string>& query,
                      const std::vector<std::string>& candidate);

/**
 * @brief True when no value appears on both sides
 */
bool isDisjoint(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs);

} // namespace namesake::compare
