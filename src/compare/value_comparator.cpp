#include <namesake/compare/string_distance.h>
#include <namesake/compare/value_comparator.h>
#include <namesake/normalize/phonetic.h>
#include <namesake/normalize/replacers.h>
#include <namesake/normalize/text_utils.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace namesake::compare {

namespace {

std::string trimmedLower(std::string_view value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    std::string out(value.substr(start, end - start));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::optional<int> twoDigits(std::string_view value, size_t pos) {
    if (pos + 2 > value.size() || !isDigit(value[pos]) || !isDigit(value[pos + 1])) {
        return std::nullopt;
    }
    return (value[pos] - '0') * 10 + (value[pos + 1] - '0');
}

const std::unordered_map<std::string, std::unordered_set<std::string>>& countryRegions() {
    static const std::unordered_map<std::string, std::unordered_set<std::string>> regions = {
        {"su",
         {"ru", "ua", "by", "kz", "uz", "ge", "az", "lt", "lv", "ee", "md", "kg", "tj", "am", "tm"}},
        {"yu", {"rs", "me", "hr", "si", "ba", "mk"}},
        {"yucs", {"rs", "me"}},
        {"csxx", {"rs", "me"}},
        {"cshh", {"cz", "sk"}},
        {"ddde", {"de"}},
        {"eu", {"at", "be", "bg", "hr", "cy", "cz", "dk", "ee", "fi", "fr", "de", "gr", "hu",
                "ie", "it", "lv", "lt", "lu", "mt", "nl", "pl", "pt", "ro", "sk", "si", "es",
                "se"}},
    };
    return regions;
}

// Fingerprint Levenshtein over a single pair of cleaned names
double fingerprintLevenshtein(const PreparedName& q, const PreparedName& c) {
    if (q.cleaned.size() < 2 || c.cleaned.size() < 2) {
        return 0.0;
    }
    double score = levenshteinSimilarity(q.cleaned, c.cleaned);

    const auto qfp = normalize::removeWhitespace(q.fingerprint);
    const auto cfp = normalize::removeWhitespace(c.fingerprint);
    if (!qfp.empty() && !cfp.empty()) {
        score = std::max(score, levenshteinSimilarity(qfp, cfp));
    }

    auto unique = [](std::vector<std::string> tokens) {
        std::vector<std::string> out;
        for (auto& t : tokens) {
            if (std::find(out.begin(), out.end(), t) == out.end()) {
                out.push_back(std::move(t));
            }
        }
        return out;
    };
    const auto qtokens = unique(normalize::tokenize(q.fingerprint));
    const auto ctokens = unique(normalize::tokenize(c.fingerprint));
    if (qtokens.empty() || ctokens.empty()) {
        return score;
    }

    struct TokenScore {
        size_t qi;
        size_t ci;
        double score;
    };
    std::vector<TokenScore> tokenScores;
    tokenScores.reserve(qtokens.size() * ctokens.size());
    for (size_t qi = 0; qi < qtokens.size(); ++qi) {
        for (size_t ci = 0; ci < ctokens.size(); ++ci) {
            tokenScores.push_back({qi, ci, levenshteinSimilarity(qtokens[qi], ctokens[ci])});
        }
    }
    std::stable_sort(tokenScores.begin(), tokenScores.end(),
                     [](const TokenScore& a, const TokenScore& b) { return a.score > b.score; });

    std::string alignedQ;
    std::string alignedC;
    std::vector<bool> usedQ(qtokens.size(), false);
    std::vector<bool> usedC(ctokens.size(), false);
    for (const auto& ts : tokenScores) {
        if (!usedQ[ts.qi] && !usedC[ts.ci]) {
            usedQ[ts.qi] = true;
            usedC[ts.ci] = true;
            alignedQ += qtokens[ts.qi];
            alignedC += ctokens[ts.ci];
        }
    }
    if (std::find(usedQ.begin(), usedQ.end(), false) != usedQ.end()) {
        return score;
    }
    return std::max(score, levenshteinSimilarity(alignedQ, alignedC));
}

double personJaroWinkler(const PreparedName& q, const PreparedName& c) {
    size_t qlen = 0;
    size_t clen = 0;
    for (const auto& t : q.tokens) {
        qlen += t.size();
    }
    for (const auto& t : c.tokens) {
        clen += t.size();
    }

    double score = 0.0;
    if (qlen > 0 && clen > 0) {
        const double ratio =
            static_cast<double>(std::min(qlen, clen)) / static_cast<double>(std::max(qlen, clen));
        if (ratio >= 0.5) {
            const auto qjoined = normalize::join(q.tokens, "");
            const auto cjoined = normalize::join(c.tokens, "");
            if (isLevenshteinPlausible(qjoined, cjoined)) {
                score = std::pow(jaroWinkler(qjoined, cjoined), static_cast<double>(qjoined.size()));
            }
        }
    }
    return std::max(score, alignNameParts(q.tokens, c.tokens));
}

double jaroNameParts(const PreparedName& q, const PreparedName& c) {
    if (q.parts.empty() || c.parts.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& part : q.parts) {
        double best = 0.0;
        for (const auto& other : c.parts) {
            const double similarity = jaroWinkler(part, other);
            if (similarity > 0.6) {
                best = std::max(best, similarity);
                if (best >= 1.0) {
                    break;
                }
            }
        }
        total += best;
    }
    return total / static_cast<double>(q.parts.size());
}

double phoneticMatch(const PreparedName& q, const PreparedName& c) {
    if (q.phoneticTokens.empty() || c.phoneticTokens.empty()) {
        return 0.0;
    }
    size_t matched = 0;
    std::vector<bool> used(c.phoneticTokens.size(), false);
    for (size_t i = 0; i < q.phoneticTokens.size(); ++i) {
        for (size_t j = 0; j < c.phoneticTokens.size(); ++j) {
            if (used[j]) {
                continue;
            }
            bool same = false;
            if (q.metaphones[i].empty() || c.metaphones[j].empty()) {
                same = q.phoneticTokens[i] == c.phoneticTokens[j];
            } else if (q.metaphones[i] == c.metaphones[j]) {
                same = isLevenshteinPlausible(q.phoneticTokens[i], c.phoneticTokens[j]);
            }
            if (same) {
                ++matched;
                used[j] = true;
                break;
            }
        }
    }
    return static_cast<double>(matched) / static_cast<double>(q.phoneticTokens.size());
}

double soundexParts(const PreparedName& q, const PreparedName& c) {
    if (q.soundexes.empty()) {
        return 0.0;
    }
    std::unordered_set<std::string> codes(c.soundexes.begin(), c.soundexes.end());
    size_t hits = 0;
    for (const auto& code : q.soundexes) {
        if (!code.empty() && codes.contains(code)) {
            ++hits;
        }
    }
    return static_cast<double>(hits) / static_cast<double>(q.soundexes.size());
}

double tokenOverlap(const PreparedName& q, const PreparedName& c) {
    std::set<std::string> qset(q.tokens.begin(), q.tokens.end());
    std::unordered_set<std::string> cset(c.tokens.begin(), c.tokens.end());
    if (qset.empty()) {
        return 0.0;
    }
    size_t shared = 0;
    for (const auto& token : qset) {
        if (cset.contains(token)) {
            ++shared;
        }
    }
    return static_cast<double>(shared) / static_cast<double>(qset.size());
}

} // namespace

double NameBlend::apply(const NameScores& s) const {
    if (s.ignored) {
        return 0.0;
    }
    if (literalOverrides && s.literal >= 1.0) {
        return 1.0;
    }
    const double blended = literal * s.literal + tokenOverlap * s.tokenOverlap +
                           jaroWinkler * s.jaroWinkler + jaroParts * s.jaroParts +
                           levenshtein * s.levenshtein + phonetic * s.phonetic +
                           soundex * s.soundex;
    return std::clamp(blended, 0.0, 1.0);
}

std::optional<PartialDate> parsePartialDate(std::string_view value) {
    const auto text = trimmedLower(value);
    if (text.size() < 4 || !std::all_of(text.begin(), text.begin() + 4, isDigit)) {
        return std::nullopt;
    }
    if (text.size() > 4 && isDigit(text[4])) {
        // Five or more leading digits is not a year
        return std::nullopt;
    }

    PartialDate date;
    date.year = std::stoi(text.substr(0, 4));
    auto month = twoDigits(text, 5);
    if (text.size() >= 7 && month && *month >= 1 && *month <= 12) {
        date.month = month;
        auto day = twoDigits(text, 8);
        if (text.size() >= 10 && day && *day >= 1 && *day <= 31) {
            date.day = day;
        }
    }
    return date;
}

std::optional<std::string> canonicalCountry(std::string_view value) {
    auto code = trimmedLower(value);
    if (code.size() < 2) {
        return std::nullopt;
    }
    auto dash = code.find('-');
    auto head = code.substr(0, dash);
    if (head.empty() || !std::all_of(head.begin(), head.end(), [](unsigned char c) {
            return std::isalpha(c) != 0;
        })) {
        return std::nullopt;
    }
    if (dash != std::string::npos) {
        auto tail = code.substr(dash + 1);
        if (head.size() != 2 || tail.empty() ||
            !std::all_of(tail.begin(), tail.end(),
                         [](unsigned char c) { return std::isalnum(c) != 0; })) {
            return std::nullopt;
        }
    } else if (head.size() != 2 && !countryRegions().contains(head)) {
        return std::nullopt;
    }
    if (code == "uk") {
        return std::string("gb");
    }
    return code;
}

std::optional<std::string> canonicalGender(std::string_view value) {
    static const std::unordered_map<std::string, std::string> genders = {
        {"male", "male"},     {"m", "male"},       {"man", "male"},
        {"female", "female"}, {"f", "female"},     {"woman", "female"},
        {"other", "other"},   {"x", "other"},      {"diverse", "other"},
    };
    auto it = genders.find(trimmedLower(value));
    if (it == genders.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string cleanIdentifier(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isalnum(c)) {
            out.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return out;
}

ValueComparator::ValueComparator(std::shared_ptr<const normalize::INormalizer> normalizer)
    : normalizer_(std::move(normalizer)) {
    if (!normalizer_) {
        normalizer_ = std::make_shared<normalize::BasicNormalizer>();
    }
}

Comparison ValueComparator::compare(PropertyType type, std::string_view query,
                                    std::string_view candidate,
                                    const CompareOptions& options) const {
    switch (type) {
        case PropertyType::Name: {
            auto scores = compareNames(query, candidate);
            return {options.nameBlend.apply(scores), scores.ignored};
        }
        case PropertyType::Date:
            return compareDates(query, candidate, options.datePrecision);
        case PropertyType::Country:
            return compareCountries(query, candidate);
        case PropertyType::Identifier:
            return compareIdentifiers(query, candidate, options.identifierFormat,
                                      options.minIdentifierLength);
        case PropertyType::Text:
            return compareText(query, candidate);
        case PropertyType::Gender:
            return compareGender(query, candidate);
        case PropertyType::Address:
            return compareAddresses(query, candidate);
    }
    return {0.0, true};
}

PreparedName ValueComparator::prepareName(std::string_view value) const {
    PreparedName name;
    name.raw = std::string(value);
    name.cleaned = normalize::stripPunctuation(normalizer_->normalize(value));
    name.tokens = normalize::tokenize(name.cleaned);
    for (const auto& token : name.tokens) {
        if (token.size() > 1) {
            name.parts.push_back(token);
            name.soundexes.push_back(normalize::soundex(token));
            name.phoneticTokens.push_back(token);
            auto code = normalize::metaphone(token);
            name.metaphones.push_back(code.size() < 3 ? std::string() : std::move(code));
        }
    }
    name.fingerprint = normalize::stripPunctuation(normalize::organizationTypes().apply(
        normalize::personNamePrefixes().apply(name.cleaned)));
    return name;
}

NameScores ValueComparator::compareNames(const PreparedName& q, const PreparedName& c) const {
    NameScores scores;
    if (q.empty() || c.empty()) {
        scores.ignored = true;
        return scores;
    }
    scores.literal = q.cleaned == c.cleaned ? 1.0 : 0.0;
    scores.tokenOverlap = tokenOverlap(q, c);
    scores.jaroWinkler = personJaroWinkler(q, c);
    scores.jaroParts = jaroNameParts(q, c);
    scores.levenshtein = fingerprintLevenshtein(q, c);
    scores.phonetic = phoneticMatch(q, c);
    scores.soundex = soundexParts(q, c);
    return scores;
}

NameScores ValueComparator::compareNames(std::string_view query, std::string_view candidate) const {
    return compareNames(prepareName(query), prepareName(candidate));
}

Comparison ValueComparator::compareDates(std::string_view query, std::string_view candidate,
                                         DatePrecision precision) const {
    auto q = parsePartialDate(query);
    auto c = parsePartialDate(candidate);
    if (!q || !c) {
        return {0.0, true};
    }
    if (precision == DatePrecision::Day && (!q->day || !c->day)) {
        return {0.0, true};
    }
    if (q->year != c->year) {
        return {0.0, false};
    }
    if (precision == DatePrecision::Year) {
        return {1.0, false};
    }
    if (!q->month || !c->month) {
        return {0.7, false};
    }
    if (*q->month != *c->month) {
        const bool swapped = q->day && c->day && *q->day == *c->month && *q->month == *c->day;
        return {swapped ? 0.5 : 0.0, false};
    }
    if (!q->day || !c->day) {
        return {0.85, false};
    }
    return {*q->day == *c->day ? 1.0 : 0.0, false};
}

Comparison ValueComparator::compareCountries(std::string_view query,
                                             std::string_view candidate) const {
    auto q = canonicalCountry(query);
    auto c = canonicalCountry(candidate);
    if (!q || !c) {
        return {0.0, true};
    }
    if (*q == *c) {
        return {1.0, false};
    }

    auto parentOf = [](const std::string& code) { return code.substr(0, code.find('-')); };
    if (parentOf(*q) == *c || parentOf(*c) == *q) {
        return {0.5, false};
    }

    const auto& regions = countryRegions();
    auto within = [&](const std::string& region, const std::string& member) {
        auto it = regions.find(region);
        return it != regions.end() && it->second.contains(parentOf(member));
    };
    if (within(*q, *c) || within(*c, *q)) {
        return {0.5, false};
    }
    return {0.0, false};
}

Comparison ValueComparator::compareIdentifiers(std::string_view query, std::string_view candidate,
                                               IdentifierFormat format, size_t minLength) const {
    auto q = cleanIdentifier(query);
    auto c = cleanIdentifier(candidate);
    if (q.empty() || c.empty() || q.size() < minLength || c.size() < minLength) {
        return {0.0, true};
    }
    if (!validateIdentifier(format, q) || !validateIdentifier(format, c)) {
        return {0.0, true};
    }
    return {q == c ? 1.0 : 0.0, false};
}

Comparison ValueComparator::compareText(std::string_view query, std::string_view candidate) const {
    return compareTokenSets(query, candidate, false);
}

Comparison ValueComparator::compareAddresses(std::string_view query,
                                             std::string_view candidate) const {
    return compareTokenSets(query, candidate, true);
}

Comparison ValueComparator::compareGender(std::string_view query, std::string_view candidate) const {
    auto q = canonicalGender(query);
    auto c = canonicalGender(candidate);
    if (!q || !c) {
        return {0.0, true};
    }
    return {*q == *c ? 1.0 : 0.0, false};
}

Comparison ValueComparator::compareTokenSets(std::string_view query, std::string_view candidate,
                                             bool addressForms) const {
    auto tokenSet = [&](std::string_view value) {
        auto text = normalize::punctuationToSpace(normalizer_->normalize(value));
        if (addressForms) {
            text = normalize::ordinals().apply(normalize::addressForms().apply(text));
        }
        auto tokens = normalize::tokenize(text);
        return std::set<std::string>(tokens.begin(), tokens.end());
    };

    const auto q = tokenSet(query);
    const auto c = tokenSet(candidate);
    if (q.empty() || c.empty()) {
        return {0.0, true};
    }

    std::vector<std::string> overlap;
    std::set_intersection(q.begin(), q.end(), c.begin(), c.end(), std::back_inserter(overlap));
    if (overlap.size() == q.size() || overlap.size() == c.size()) {
        return {1.0, false};
    }

    std::vector<std::string> qRemainder;
    std::vector<std::string> cRemainder;
    std::set_difference(q.begin(), q.end(), overlap.begin(), overlap.end(),
                        std::back_inserter(qRemainder));
    std::set_difference(c.begin(), c.end(), overlap.begin(), overlap.end(),
                        std::back_inserter(cRemainder));

    const auto qr = normalize::join(qRemainder, " ");
    const auto cr = normalize::join(cRemainder, " ");
    const double lev = levenshteinSimilarity(qr, cr, std::max(qr.size(), cr.size()));
    const double remainder = static_cast<double>(std::max(qRemainder.size(), cRemainder.size()));
    const double shared = static_cast<double>(overlap.size());
    return {(shared + remainder * lev) / (remainder + shared), false};
}

} // namespace namesake::compare
