#include <namesake/align/aligner.h>

#include <algorithm>

namespace namesake::align {

MultiValueAligner::MultiValueAligner(AlignerOptions options) : options_(options) {
    options_.floor = std::clamp(options_.floor, 0.0, 1.0);
    options_.support = std::clamp(options_.support, 0.0, 1.0);
}

AlignmentResult MultiValueAligner::align(size_t querySize, size_t candidateSize,
                                         const SimilarityFn& similarity) const {
    std::vector<AlignedPair> cells;
    cells.reserve(querySize * candidateSize);
    for (size_t q = 0; q < querySize; ++q) {
        for (size_t c = 0; c < candidateSize; ++c) {
            const double s = std::clamp(similarity(q, c), 0.0, 1.0);
            if (s > 0.0 && s >= options_.floor) {
                cells.push_back({q, c, s});
            }
        }
    }

    // Cells are generated in (query, candidate) order; a stable sort keeps that order for ties
    std::stable_sort(cells.begin(), cells.end(), [](const AlignedPair& a, const AlignedPair& b) {
        return a.similarity > b.similarity;
    });

    AlignmentResult result;
    std::vector<bool> usedQuery(querySize, false);
    std::vector<bool> usedCandidate(candidateSize, false);
    const size_t maxPairs = std::min(querySize, candidateSize);
    for (const auto& cell : cells) {
        if (result.pairs.size() == maxPairs) {
            break;
        }
        if (usedQuery[cell.queryIndex] || usedCandidate[cell.candidateIndex]) {
            continue;
        }
        usedQuery[cell.queryIndex] = true;
        usedCandidate[cell.candidateIndex] = true;
        result.pairs.push_back(cell);
    }

    for (size_t q = 0; q < querySize; ++q) {
        if (!usedQuery[q]) {
            result.unmatchedQuery.push_back(q);
        }
    }
    for (size_t c = 0; c < candidateSize; ++c) {
        if (!usedCandidate[c]) {
            result.unmatchedCandidate.push_back(c);
        }
    }
    result.aggregate = aggregate(result.pairs);
    return result;
}

AlignmentResult MultiValueAligner::align(const std::vector<std::vector<double>>& matrix) const {
    const size_t rows = matrix.size();
    const size_t cols = rows == 0 ? 0 : matrix.front().size();
    return align(rows, cols, [&](size_t q, size_t c) {
        return c < matrix[q].size() ? matrix[q][c] : 0.0;
    });
}

double MultiValueAligner::aggregate(const std::vector<AlignedPair>& pairs) const {
    if (pairs.empty()) {
        return 0.0;
    }
    auto strongest = std::max_element(
        pairs.begin(), pairs.end(),
        [](const AlignedPair& a, const AlignedPair& b) { return a.similarity < b.similarity; });
    const double best = std::clamp(strongest->similarity, 0.0, 1.0);
    if (pairs.size() == 1) {
        return best;
    }

    double rest = 0.0;
    for (auto it = pairs.begin(); it != pairs.end(); ++it) {
        if (it != strongest) {
            rest += std::clamp(it->similarity, 0.0, 1.0);
        }
    }
    rest /= static_cast<double>(pairs.size() - 1);
    return std::clamp(best + (1.0 - best) * options_.support * rest, 0.0, 1.0);
}

} // namespace namesake::align
