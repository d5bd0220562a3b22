#include <gtest/gtest.h>
#include <namesake/normalize/normalizer.h>

using namespace namesake;
using namespace namesake::normalize;

TEST(BasicNormalizerTest, LowercasesAscii) {
    BasicNormalizer normalizer;
    EXPECT_EQ(normalizer.normalize("ACME Corp"), "acme corp");
    EXPECT_EQ(normalizer.normalize(""), "");
}

TEST(BasicNormalizerTest, StripsDiacritics) {
    BasicNormalizer normalizer;
    EXPECT_EQ(normalizer.normalize("Zoë MÜLLER"), "zoe muller");
    EXPECT_EQ(normalizer.normalize("Ángel Pérez"), "angel perez");
}

TEST(BasicNormalizerTest, KeepsNonLatinScripts) {
    BasicNormalizer normalizer;
    EXPECT_EQ(normalizer.normalize("Светлана"), "светлана");
}

TEST(FullNormalizerTest, TransliteratesToLatin) {
    auto created = FullNormalizer::create();
    ASSERT_TRUE(created) << created.error().message;
    const auto& normalizer = *created.value();
    EXPECT_EQ(normalizer.normalize("Светлана"), "svetlana");
    EXPECT_EQ(normalizer.normalize("Владимир Путин"), "vladimir putin");
    EXPECT_EQ(normalizer.normalize("Zoë"), "zoe");
    EXPECT_EQ(normalizer.variant(), NormalizerVariant::Full);
}

TEST(NormalizerFactoryTest, BuildsRequestedVariant) {
    auto basic = makeNormalizer(NormalizerVariant::Basic);
    ASSERT_TRUE(basic);
    EXPECT_EQ(basic.value()->variant(), NormalizerVariant::Basic);

    auto full = makeNormalizer(NormalizerVariant::Full);
    ASSERT_TRUE(full) << full.error().message;
    EXPECT_EQ(full.value()->variant(), NormalizerVariant::Full);
}

TEST(NormalizerFactoryTest, ParsesVariantNames) {
    EXPECT_EQ(parseNormalizerVariant("basic"), NormalizerVariant::Basic);
    EXPECT_EQ(parseNormalizerVariant("full"), NormalizerVariant::Full);
    EXPECT_FALSE(parseNormalizerVariant("Full").has_value());
    EXPECT_STREQ(normalizerVariantToString(NormalizerVariant::Full), "full");
}
