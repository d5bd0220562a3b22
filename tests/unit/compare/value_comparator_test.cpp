#include <gtest/gtest.h>
#include <namesake/compare/value_comparator.h>

#include <memory>

using namespace namesake;
using namespace namesake::compare;

class ValueComparatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        comparator_ = std::make_unique<ValueComparator>(
            std::make_shared<normalize::BasicNormalizer>());
    }

    std::unique_ptr<ValueComparator> comparator_;
};

TEST_F(ValueComparatorTest, DateGranularity) {
    EXPECT_DOUBLE_EQ(comparator_->compareDates("1975-03-05", "1975-03-05").similarity, 1.0);
    EXPECT_DOUBLE_EQ(comparator_->compareDates("1975-03-05", "1975-03").similarity, 0.85);
    EXPECT_DOUBLE_EQ(comparator_->compareDates("1975", "1975-03-05").similarity, 0.7);
    EXPECT_DOUBLE_EQ(comparator_->compareDates("1975-03-05", "1976-03-05").similarity, 0.0);
    EXPECT_DOUBLE_EQ(comparator_->compareDates("1975-03-05", "1975-03-06").similarity, 0.0);
    EXPECT_DOUBLE_EQ(comparator_->compareDates("1975-03-05", "1975-05-03").similarity, 0.5);
}

TEST_F(ValueComparatorTest, MalformedDatesAreIgnored) {
    auto result = comparator_->compareDates("unknown", "1975-03-05");
    EXPECT_TRUE(result.ignored);
    EXPECT_DOUBLE_EQ(result.similarity, 0.0);
    EXPECT_TRUE(comparator_->compareDates("19750", "1975").ignored);
    EXPECT_FALSE(parsePartialDate("75-03-05").has_value());

    auto parsed = parsePartialDate("1975-13-40");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->year, 1975);
    EXPECT_FALSE(parsed->month.has_value());
}

TEST_F(ValueComparatorTest, DatePrecision) {
    EXPECT_DOUBLE_EQ(
        comparator_->compareDates("1975-03-05", "1975-11-20", DatePrecision::Year).similarity,
        1.0);
    EXPECT_DOUBLE_EQ(
        comparator_->compareDates("1975-03-05", "1980", DatePrecision::Year).similarity, 0.0);
    EXPECT_TRUE(comparator_->compareDates("1975", "1975-03-05", DatePrecision::Day).ignored);
    EXPECT_DOUBLE_EQ(
        comparator_->compareDates("1975-03-05", "1975-03-06", DatePrecision::Day).similarity,
        0.0);
}

TEST_F(ValueComparatorTest, Countries) {
    EXPECT_DOUBLE_EQ(comparator_->compareCountries("RU", "ru").similarity, 1.0);
    EXPECT_DOUBLE_EQ(comparator_->compareCountries("uk", "gb").similarity, 1.0);
    EXPECT_DOUBLE_EQ(comparator_->compareCountries("su", "ru").similarity, 0.5);
    EXPECT_DOUBLE_EQ(comparator_->compareCountries("us-ca", "us").similarity, 0.5);
    EXPECT_DOUBLE_EQ(comparator_->compareCountries("ru", "ua").similarity, 0.0);
    EXPECT_TRUE(comparator_->compareCountries("r", "ru").ignored);
    EXPECT_TRUE(comparator_->compareCountries("12", "ru").ignored);
}

TEST_F(ValueComparatorTest, Gender) {
    EXPECT_DOUBLE_EQ(comparator_->compareGender("M", "male").similarity, 1.0);
    EXPECT_DOUBLE_EQ(comparator_->compareGender("female", "male").similarity, 0.0);
    EXPECT_TRUE(comparator_->compareGender("unknown", "male").ignored);
}

TEST_F(ValueComparatorTest, IdentifiersIgnoreSeparatorsAndCase) {
    EXPECT_DOUBLE_EQ(comparator_->compareIdentifiers("AB-123", "ab 123").similarity, 1.0);
    auto different = comparator_->compareIdentifiers("AB123", "AB124");
    EXPECT_FALSE(different.ignored);
    EXPECT_DOUBLE_EQ(different.similarity, 0.0);
    EXPECT_TRUE(comparator_->compareIdentifiers("AB12", "AB12", IdentifierFormat::Any, 5).ignored);
}

TEST_F(ValueComparatorTest, IdentifierFormatsAreValidated) {
    EXPECT_DOUBLE_EQ(comparator_
                         ->compareIdentifiers("529900T8BM49AURSDO55", "5299-00t8 bm49aursdo55",
                                              IdentifierFormat::Lei)
                         .similarity,
                     1.0);
    EXPECT_TRUE(comparator_
                    ->compareIdentifiers("529900T8BM49AURSDO56", "529900T8BM49AURSDO56",
                                         IdentifierFormat::Lei)
                    .ignored);
}

TEST_F(ValueComparatorTest, Addresses) {
    EXPECT_DOUBLE_EQ(comparator_->compareAddresses("12 Main Street", "12 main st").similarity,
                     1.0);
    EXPECT_NEAR(comparator_->compareAddresses("12 Main St, Springfield", "99 Elm St").similarity,
                0.25, 1e-12);
    EXPECT_TRUE(comparator_->compareAddresses("", "12 main st").ignored);
    EXPECT_TRUE(comparator_->compareText(" , ", "x").ignored);
}

TEST_F(ValueComparatorTest, NameSubScoresIgnoreTokenOrder) {
    auto scores = comparator_->compareNames("Vladimir Putin", "Putin, Vladimir");
    EXPECT_FALSE(scores.ignored);
    EXPECT_DOUBLE_EQ(scores.literal, 0.0);
    EXPECT_DOUBLE_EQ(scores.tokenOverlap, 1.0);
    EXPECT_DOUBLE_EQ(scores.jaroParts, 1.0);
    EXPECT_DOUBLE_EQ(scores.soundex, 1.0);
    EXPECT_DOUBLE_EQ(scores.jaroWinkler, 1.0);
}

TEST_F(ValueComparatorTest, NameLiteralIsCaseAndPunctuationInsensitive) {
    auto scores = comparator_->compareNames("ACME, Inc.", "acme inc");
    EXPECT_DOUBLE_EQ(scores.literal, 1.0);
    EXPECT_TRUE(comparator_->compareNames("", "acme").ignored);
    EXPECT_TRUE(comparator_->compareNames("...", "acme").ignored);
}

TEST_F(ValueComparatorTest, FingerprintAbbreviatesLegalForms) {
    auto scores = comparator_->compareNames("Google LLC", "Gogole LIMITED LIABILITY COMPANY");
    EXPECT_NEAR(scores.levenshtein, 7.0 / 9.0, 1e-12);
}

TEST_F(ValueComparatorTest, NameBlend) {
    NameScores scores;
    scores.literal = 1.0;
    scores.tokenOverlap = 0.2;

    NameBlend blend;
    blend.tokenOverlap = 1.0;
    EXPECT_DOUBLE_EQ(blend.apply(scores), 1.0);

    blend.literalOverrides = false;
    EXPECT_DOUBLE_EQ(blend.apply(scores), 0.2);

    blend.tokenOverlap = 10.0;
    EXPECT_DOUBLE_EQ(blend.apply(scores), 1.0);

    scores.ignored = true;
    EXPECT_DOUBLE_EQ(blend.apply(scores), 0.0);
}

TEST_F(ValueComparatorTest, GenericDispatch) {
    CompareOptions options;
    options.nameBlend.literal = 1.0;
    EXPECT_DOUBLE_EQ(comparator_->compare(PropertyType::Name, "ACME", "acme", options).similarity,
                     1.0);
    EXPECT_DOUBLE_EQ(
        comparator_->compare(PropertyType::Date, "1975-03-05", "1975-03-05").similarity, 1.0);
    options.datePrecision = DatePrecision::Day;
    EXPECT_TRUE(comparator_->compare(PropertyType::Date, "1975", "1975", options).ignored);
}

TEST(ValueComparatorHelpersTest, Canonicalisation) {
    EXPECT_EQ(cleanIdentifier("ab-12 c"), "AB12C");
    EXPECT_EQ(canonicalGender(" Woman "), std::optional<std::string>("female"));
    EXPECT_EQ(canonicalCountry("UK"), std::optional<std::string>("gb"));
    EXPECT_FALSE(canonicalCountry("u").has_value());
}
