#include <namesake/compare/string_distance.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <unordered_set>

namespace namesake::compare {

size_t LevenshteinDistance::distance(std::string_view s1, std::string_view s2) const {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    // Use two rows instead of full matrix for space efficiency
    std::vector<size_t> prevRow(n + 1);
    std::vector<size_t> currRow(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prevRow[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        currRow[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            size_t cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;

            currRow[j] = std::min({
                prevRow[j] + 1,       // deletion
                currRow[j - 1] + 1,   // insertion
                prevRow[j - 1] + cost // substitution
            });
        }

        std::swap(prevRow, currRow);
    }

    return prevRow[n];
}

size_t levenshtein(std::string_view s1, std::string_view s2) {
    static const LevenshteinDistance metric;
    return metric.distance(s1, s2);
}

double jaro(std::string_view s1, std::string_view s2) {
    if (s1.empty() && s2.empty()) {
        return 1.0;
    }
    if (s1.empty() || s2.empty()) {
        return 0.0;
    }
    if (s1 == s2) {
        return 1.0;
    }

    const size_t len1 = s1.size();
    const size_t len2 = s2.size();
    const size_t window = std::max(len1, len2) / 2 > 0 ? std::max(len1, len2) / 2 - 1 : 0;

    std::vector<bool> matched1(len1, false);
    std::vector<bool> matched2(len2, false);
    size_t matches = 0;

    for (size_t i = 0; i < len1; ++i) {
        size_t lo = i > window ? i - window : 0;
        size_t hi = std::min(i + window + 1, len2);
        for (size_t j = lo; j < hi; ++j) {
            if (!matched2[j] && s1[i] == s2[j]) {
                matched1[i] = true;
                matched2[j] = true;
                ++matches;
                break;
            }
        }
    }

    if (matches == 0) {
        return 0.0;
    }

    size_t transpositions = 0;
    size_t k = 0;
    for (size_t i = 0; i < len1; ++i) {
        if (!matched1[i]) {
            continue;
        }
        while (!matched2[k]) {
            ++k;
        }
        if (s1[i] != s2[k]) {
            ++transpositions;
        }
        ++k;
    }

    const double m = static_cast<double>(matches);
    const double t = static_cast<double>(transpositions) / 2.0;
    return (m / static_cast<double>(len1) + m / static_cast<double>(len2) + (m - t) / m) / 3.0;
}

double jaroWinkler(std::string_view s1, std::string_view s2) {
    const double sim = jaro(s1, s2);
    if (sim <= 0.7) {
        return sim;
    }
    size_t prefix = 0;
    const size_t maxPrefix = std::min({s1.size(), s2.size(), size_t{4}});
    while (prefix < maxPrefix && s1[prefix] == s2[prefix]) {
        ++prefix;
    }
    return std::min(1.0, sim + 0.1 * static_cast<double>(prefix) * (1.0 - sim));
}

double levenshteinSimilarity(std::string_view lhs, std::string_view rhs, size_t maxEdits) {
    if (lhs.empty() || rhs.empty()) {
        return 0.0;
    }
    if (lhs == rhs) {
        return 1.0;
    }

    const double pctEdits = std::ceil(static_cast<double>(std::min(lhs.size(), rhs.size())) * 0.2);
    const double budget = std::min(static_cast<double>(maxEdits), pctEdits);

    const double lengthGap =
        std::abs(static_cast<double>(lhs.size()) - static_cast<double>(rhs.size()));
    if (lengthGap > budget) {
        return 0.0;
    }

    const double distance = static_cast<double>(levenshtein(lhs, rhs));
    if (distance > budget) {
        return 0.0;
    }

    return 1.0 - distance / static_cast<double>(std::max(lhs.size(), rhs.size()));
}

bool isLevenshteinPlausible(std::string_view lhs, std::string_view rhs) {
    if (lhs == rhs) {
        return true;
    }
    const double pct = std::ceil(static_cast<double>(std::min(lhs.size(), rhs.size())) * 0.2);
    const size_t threshold = std::min<size_t>(4, static_cast<size_t>(pct));

    auto lower = [](std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    };
    return levenshtein(lower(lhs), lower(rhs)) <= threshold;
}

double alignNameParts(const std::vector<std::string>& query,
                      const std::vector<std::string>& candidate) {
    if (query.empty() || candidate.empty()) {
        return 0.0;
    }

    std::map<std::string, size_t> queryCounts;
    std::map<std::string, size_t> candidateCounts;
    for (const auto& part : query) {
        ++queryCounts[part];
    }
    for (const auto& part : candidate) {
        ++candidateCounts[part];
    }

    struct Scored {
        const std::string* q;
        const std::string* c;
        double score;
    };
    std::vector<Scored> scores;
    for (const auto& [qn, qc] : queryCounts) {
        for (const auto& [cn, cc] : candidateCounts) {
            double score = jaroWinkler(qn, cn);
            if (score > 0.0 && isLevenshteinPlausible(qn, cn)) {
                scores.push_back({&qn, &cn, score});
            }
        }
    }
    std::stable_sort(scores.begin(), scores.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });

    double product = 1.0;
    std::vector<std::pair<const std::string*, const std::string*>> pairs;
    for (const auto& s : scores) {
        auto& qLeft = queryCounts[*s.q];
        auto& cLeft = candidateCounts[*s.c];
        while (qLeft > 0 && cLeft > 0) {
            --qLeft;
            --cLeft;
            product *= s.score;
            pairs.emplace_back(s.q, s.c);
        }
    }

    if (pairs.size() < query.size()) {
        return 0.0;
    }

    std::reverse(pairs.begin(), pairs.end());
    std::string queryAligned;
    std::string candidateAligned;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (i > 0) {
            queryAligned.push_back(' ');
            candidateAligned.push_back(' ');
        }
        queryAligned += *pairs[i].first;
        candidateAligned += *pairs[i].second;
    }

    if (!isLevenshteinPlausible(queryAligned, candidateAligned)) {
        return 0.0;
    }
    return product;
}

bool isDisjoint(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs) {
    const auto& bigger = lhs.size() > rhs.size() ? lhs : rhs;
    const auto& smaller = lhs.size() > rhs.size() ? rhs : lhs;
    std::unordered_set<std::string_view> set(smaller.begin(), smaller.end());
    return std::none_of(bigger.begin(), bigger.end(),
                        [&](const std::string& value) { return set.contains(value); });
}

} // namespace namesake::compare
