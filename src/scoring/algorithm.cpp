#include <namesake/scoring/algorithm.h>

namespace namesake::scoring {

namespace {
template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

ScoringAlgorithm makeAlgorithm(AlgorithmId id) {
    switch (id) {
        case AlgorithmId::NameBased:
            return NameBased{};
        case AlgorithmId::NameQualified:
            return NameQualified{};
        case AlgorithmId::LogicV1:
            return LogicV1{};
    }
    return LogicV1{};
}

AlgorithmId algorithmId(const ScoringAlgorithm& algorithm) {
    return std::visit([](const auto& a) { return std::decay_t<decltype(a)>::kId; }, algorithm);
}

std::span<const features::FeatureDefinition> declaredFeatures(const ScoringAlgorithm& algorithm) {
    return std::visit(overloaded{
                          [](const NameBased&) { return NameBased::features(); },
                          [](const NameQualified&) { return NameQualified::features(); },
                          [](const LogicV1&) { return LogicV1::features(); },
                      },
                      algorithm);
}

ScoreOutcome score(const ScoringAlgorithm& algorithm, const features::FeatureVector& vector) {
    return std::visit([&](const auto& a) { return a.score(vector); }, algorithm);
}

} // namespace namesake::scoring
