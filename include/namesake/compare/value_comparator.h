#pragma once

#include <namesake/compare/identifier_validators.h>
#include <namesake/model/schema_catalog.h>
#include <namesake/normalize/normalizer.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace namesake::compare {

using model::PropertyType;

/**
 * @brief Outcome of comparing two scalar values
 *
 * `ignored` marks values that could not be interpreted; their similarity is 0
 * and they never fail the request.
 */
struct Comparison {
    double similarity = 0.0;
    bool ignored = false;
};

/**
 * @brief Separately exposed name sub-scores, each in [0,1]
 */
struct NameScores {
    double literal = 0.0;
    double tokenOverlap = 0.0;
    double jaroWinkler = 0.0;
    double jaroParts = 0.0;
    double levenshtein = 0.0;
    double phonetic = 0.0;
    double soundex = 0.0;
    bool ignored = false;
};

/**
 * @brief Linear blend of name sub-scores, declared by each scoring algorithm
 *
 * With `literalOverrides`, an exact literal match scores 1 regardless of the
 * weights. The blended value is clamped to [0,1].
 */
struct NameBlend {
    double literal = 0.0;
    double tokenOverlap = 0.0;
    double jaroWinkler = 0.0;
    double jaroParts = 0.0;
    double levenshtein = 0.0;
    double phonetic = 0.0;
    double soundex = 0.0;
    bool literalOverrides = true;

    double apply(const NameScores& scores) const;
};

/**
 * @brief Name value with its normalized forms computed once
 */
struct PreparedName {
    std::string raw;
    std::string cleaned;                   // normalized, punctuation removed
    std::vector<std::string> tokens;       // words of `cleaned`
    std::vector<std::string> parts;        // tokens longer than one character
    std::vector<std::string> metaphones;   // per token of length >= 2; empty when shorter than 3
    std::vector<std::string> phoneticTokens;
    std::vector<std::string> soundexes;    // per entry of `parts`
    std::string fingerprint;               // stopwords and legal forms abbreviated

    bool empty() const { return cleaned.empty(); }
};

/**
 * @brief Parsed date with optional month and day
 */
struct PartialDate {
    int year = 0;
    std::optional<int> month;
    std::optional<int> day;
};

std::optional<PartialDate> parsePartialDate(std::string_view value);

/**
 * @brief Granularity at which two dates are compared
 *
 * Year compares only the years. Day requires full dates on both sides and
 * ignores the pair otherwise.
 */
enum class DatePrecision { Any, Year, Day };

struct CompareOptions {
    NameBlend nameBlend{};
    DatePrecision datePrecision = DatePrecision::Any;
    IdentifierFormat identifierFormat = IdentifierFormat::Any;
    size_t minIdentifierLength = 1;
};

/**
 * @brief Canonical comparator for each value type
 *
 * Every method is pure, total and deterministic for a given normalizer.
 */
class ValueComparator {
public:
    explicit ValueComparator(std::shared_ptr<const normalize::INormalizer> normalizer);

    const normalize::INormalizer& normalizer() const { return *normalizer_; }

    /**
     * @brief Generic entry point; names use options.nameBlend
     */
    Comparison compare(PropertyType type, std::string_view query, std::string_view candidate,
                       const CompareOptions& options = {}) const;

    PreparedName prepareName(std::string_view value) const;

    NameScores compareNames(const PreparedName& query, const PreparedName& candidate) const;
    NameScores compareNames(std::string_view query, std::string_view candidate) const;

    /**
     * @brief Exact 1, year and month 0.85, year only 0.7, proven difference 0
     *
     * A full date with swapped day and month scores 0.5.
     */
    Comparison compareDates(std::string_view query, std::string_view candidate,
                            DatePrecision precision = DatePrecision::Any) const;

    /**
     * @brief Equal codes 1, membership in a known region or parent code 0.5, otherwise 0
     */
    Comparison compareCountries(std::string_view query, std::string_view candidate) const;

    /**
     * @brief Separator- and case-insensitive exact match, no partial credit
     */
    Comparison compareIdentifiers(std::string_view query, std::string_view candidate,
                                  IdentifierFormat format = IdentifierFormat::Any,
                                  size_t minLength = 1) const;

    Comparison compareText(std::string_view query, std::string_view candidate) const;

    /**
     * @brief Token overlap after street-form and ordinal normalization
     */
    Comparison compareAddresses(std::string_view query, std::string_view candidate) const;

    Comparison compareGender(std::string_view query, std::string_view candidate) const;

private:
    Comparison compareTokenSets(std::string_view query, std::string_view candidate,
                                bool addressForms) const;

    std::shared_ptr<const normalize::INormalizer> normalizer_;
};

/**
 * @brief Canonical lowercase country code, or nullopt when malformed
 */
std::optional<std::string> canonicalCountry(std::string_view value);

/**
 * @brief "male", "female", "other", or nullopt when unrecognised
 */
std::optional<std::string> canonicalGender(std::string_view value);

/**
 * @brief Upper-case alphanumerics only
 */
std::string cleanIdentifier(std::string_view value);

} // namespace namesake::compare
