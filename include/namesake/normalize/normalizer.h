#pragma once

#include <namesake/core/types.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace namesake::normalize {

enum class NormalizerVariant { Basic, Full };

[[nodiscard]] constexpr const char* normalizerVariantToString(NormalizerVariant v) noexcept {
    switch (v) {
        case NormalizerVariant::Basic:
            return "basic";
        case NormalizerVariant::Full:
            return "full";
    }
    return "unknown";
}

std::optional<NormalizerVariant> parseNormalizerVariant(std::string_view name);

/**
 * @brief Text normalization capability used by every comparator
 *
 * Implementations are stateless from the caller's point of view and safe to
 * call from many threads at once.
 */
class INormalizer {
public:
    virtual ~INormalizer() = default;

    /**
     * @brief Case-fold and strip diacritics; the full variant also transliterates to Latin
     */
    virtual std::string normalize(std::string_view text) const = 0;

    virtual NormalizerVariant variant() const noexcept = 0;
};

/**
 * @brief Compatibility decomposition, nonspacing-mark removal and case folding
 *
 * Non-Latin scripts pass through unchanged apart from case folding.
 */
class BasicNormalizer : public INormalizer {
public:
    std::string normalize(std::string_view text) const override;
    NormalizerVariant variant() const noexcept override { return NormalizerVariant::Basic; }
};

/**
 * @brief Script-to-Latin transliteration followed by the basic steps
 *
 * Requires ICU transliteration data; create() reports NotSupported when the
 * transliterator cannot be built on this system.
 */
class FullNormalizer : public INormalizer {
public:
    static Result<std::shared_ptr<const FullNormalizer>> create();

    std::string normalize(std::string_view text) const override;
    NormalizerVariant variant() const noexcept override { return NormalizerVariant::Full; }

    static constexpr const char* kRules =
        "Any-Latin; NFKD; [:Nonspacing Mark:] Remove; Accents-Any; [:Symbol:] Remove; "
        "[:Nonspacing Mark:] Remove; Latin-ASCII";

private:
    FullNormalizer() = default;

    BasicNormalizer basic_;
};

/**
 * @brief Build the configured variant
 */
Result<std::shared_ptr<const INormalizer>> makeNormalizer(NormalizerVariant variant);

} // namespace namesake::normalize
