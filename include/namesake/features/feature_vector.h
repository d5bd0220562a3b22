#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace namesake::features {

/**
 * @brief Whether a feature carries evidence
 *
 * Missing: a side lacks the property or the feature does not apply to the
 * schemas. Ignored: values exist but none could be interpreted.
 */
enum class FeatureStatus { Present, Missing, Ignored };

constexpr const char* featureStatusToString(FeatureStatus status) {
    switch (status) {
        case FeatureStatus::Present:
            return "present";
        case FeatureStatus::Missing:
            return "missing";
        case FeatureStatus::Ignored:
            return "ignored";
    }
    return "unknown";
}

struct Feature {
    std::string name;
    double value = 0.0;
    FeatureStatus status = FeatureStatus::Missing;
    size_t alignedPairs = 0;

    [[nodiscard]] bool present() const { return status == FeatureStatus::Present; }
};

/**
 * @brief Named feature values in the order the algorithm declared them
 */
class FeatureVector {
public:
    FeatureVector() = default;
    explicit FeatureVector(std::vector<Feature> features) : features_(std::move(features)) {}

    void add(Feature feature) { features_.push_back(std::move(feature)); }

    const Feature* find(std::string_view name) const;

    /**
     * @brief Value of a present feature, otherwise the fallback
     */
    double valueOr(std::string_view name, double fallback) const;

    bool present(std::string_view name) const;

    const std::vector<Feature>& features() const { return features_; }
    size_t size() const { return features_.size(); }
    auto begin() const { return features_.begin(); }
    auto end() const { return features_.end(); }

private:
    std::vector<Feature> features_;
};

} // namespace namesake::features
