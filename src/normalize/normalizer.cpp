#include <namesake/normalize/normalizer.h>

#include <spdlog/spdlog.h>
#include <unicode/normalizer2.h>
#include <unicode/translit.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <algorithm>
#include <cctype>

namespace namesake::normalize {

namespace {

bool isAscii(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

std::string asciiLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

icu::UnicodeString fromUtf8(std::string_view text) {
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

std::string toUtf8(const icu::UnicodeString& text) {
    std::string out;
    text.toUTF8String(out);
    return out;
}

// NFKD, drop nonspacing marks, fold case
icu::UnicodeString decomposeAndFold(const icu::UnicodeString& input) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    icu::UnicodeString decomposed = input;
    if (U_SUCCESS(status) && nfkd) {
        icu::UnicodeString normalized = nfkd->normalize(input, status);
        if (U_SUCCESS(status)) {
            decomposed = std::move(normalized);
        }
    }

    icu::UnicodeString stripped;
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 c = decomposed.char32At(i);
        if (u_charType(c) != U_NON_SPACING_MARK) {
            stripped.append(c);
        }
        i += U16_LENGTH(c);
    }
    stripped.foldCase();
    return stripped;
}

std::unique_ptr<icu::Transliterator> buildTransliterator() {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> transliterator(icu::Transliterator::createInstance(
        icu::UnicodeString::fromUTF8(FullNormalizer::kRules), UTRANS_FORWARD, status));
    if (U_FAILURE(status)) {
        spdlog::debug("Transliterator creation failed: {}", u_errorName(status));
        return nullptr;
    }
    return transliterator;
}

// Transliterator instances are not shared across threads
icu::Transliterator* threadTransliterator() {
    thread_local std::unique_ptr<icu::Transliterator> instance = buildTransliterator();
    return instance.get();
}

} // namespace

std::optional<NormalizerVariant> parseNormalizerVariant(std::string_view name) {
    if (name == "basic") {
        return NormalizerVariant::Basic;
    }
    if (name == "full") {
        return NormalizerVariant::Full;
    }
    return std::nullopt;
}

std::string BasicNormalizer::normalize(std::string_view text) const {
    if (isAscii(text)) {
        return asciiLower(text);
    }
    return toUtf8(decomposeAndFold(fromUtf8(text)));
}

Result<std::shared_ptr<const FullNormalizer>> FullNormalizer::create() {
    if (!threadTransliterator()) {
        return Error{ErrorCode::NotSupported, "ICU transliterator for Latin conversion unavailable"};
    }
    return std::shared_ptr<const FullNormalizer>(new FullNormalizer());
}

std::string FullNormalizer::normalize(std::string_view text) const {
    if (isAscii(text)) {
        return asciiLower(text);
    }
    auto* transliterator = threadTransliterator();
    if (!transliterator) {
        return basic_.normalize(text);
    }
    icu::UnicodeString value = fromUtf8(text);
    transliterator->transliterate(value);
    return toUtf8(decomposeAndFold(value));
}

Result<std::shared_ptr<const INormalizer>> makeNormalizer(NormalizerVariant variant) {
    switch (variant) {
        case NormalizerVariant::Basic:
            return std::shared_ptr<const INormalizer>(std::make_shared<BasicNormalizer>());
        case NormalizerVariant::Full: {
            auto full = FullNormalizer::create();
            if (!full) {
                return full.error();
            }
            return std::shared_ptr<const INormalizer>(full.value());
        }
    }
    return Error{ErrorCode::InvalidArgument, "unknown normalizer variant"};
}

} // namespace namesake::normalize
