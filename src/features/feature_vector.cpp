#include <namesake/features/feature_vector.h>

#include <algorithm>

namespace namesake::features {

const Feature* FeatureVector::find(std::string_view name) const {
    auto it = std::find_if(features_.begin(), features_.end(),
                           [&](const Feature& f) { return f.name == name; });
    return it == features_.end() ? nullptr : &*it;
}

double FeatureVector::valueOr(std::string_view name, double fallback) const {
    const auto* feature = find(name);
    return feature && feature->present() ? feature->value : fallback;
}

bool FeatureVector::present(std::string_view name) const {
    const auto* feature = find(name);
    return feature && feature->present();
}

} // namespace namesake::features
