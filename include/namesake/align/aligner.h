#pragma once

#include <functional>
#include <vector>

namespace namesake::align {

struct AlignedPair {
    size_t queryIndex = 0;
    size_t candidateIndex = 0;
    double similarity = 0.0;
};

/**
 * @brief Partial injective pairing between query and candidate values
 *
 * Pairs are listed in selection order (strongest first). Indices that were not
 * paired are listed explicitly on each side.
 */
struct AlignmentResult {
    std::vector<AlignedPair> pairs;
    std::vector<size_t> unmatchedQuery;
    std::vector<size_t> unmatchedCandidate;
    double aggregate = 0.0;

    [[nodiscard]] bool empty() const { return pairs.empty(); }
    [[nodiscard]] double best() const { return pairs.empty() ? 0.0 : pairs.front().similarity; }
};

struct AlignerOptions {
    // Pairs below this similarity are never selected
    double floor = 0.05;
    // Share of the remaining headroom that the weaker pairs can fill, in [0,1]
    double support = 0.5;
};

/**
 * @brief Greedy best-first aligner for multi-valued properties
 *
 * Repeatedly takes the highest remaining pair, ties broken by query index then
 * candidate index, until a side is exhausted or the best remaining similarity
 * falls below the floor. The aggregate starts from the strongest pair and lets
 * the mean of the weaker pairs fill part of the headroom above it:
 * best + (1 - best) * support * mean(rest). Weaker pairs never pull it below
 * the strongest pair, and it is non-decreasing in every pair.
 */
class MultiValueAligner {
public:
    using SimilarityFn = std::function<double(size_t queryIndex, size_t candidateIndex)>;

    explicit MultiValueAligner(AlignerOptions options = {});

    AlignmentResult align(size_t querySize, size_t candidateSize,
                          const SimilarityFn& similarity) const;

    /**
     * @brief Align a precomputed matrix indexed [query][candidate]
     */
    AlignmentResult align(const std::vector<std::vector<double>>& matrix) const;

    double aggregate(const std::vector<AlignedPair>& pairs) const;

    const AlignerOptions& options() const { return options_; }

private:
    AlignerOptions options_;
};

} // namespace namesake::align
