#include <gtest/gtest.h>
#include <namesake/compare/identifier_validators.h>

using namespace namesake::compare;

TEST(IdentifierValidatorTest, Ogrn) {
    EXPECT_TRUE(validateOgrn("1027700132195"));
    EXPECT_TRUE(validateOgrn("2022200525818"));
    EXPECT_FALSE(validateOgrn("1027700132194"));
    EXPECT_FALSE(validateOgrn("102770013219"));
}

TEST(IdentifierValidatorTest, Inn) {
    EXPECT_TRUE(validateInn("7707083893"));
    EXPECT_TRUE(validateInn("500100732259"));
    EXPECT_FALSE(validateInn("7707083894"));
    EXPECT_FALSE(validateInn("77070838"));
}

TEST(IdentifierValidatorTest, Isin) {
    EXPECT_TRUE(validateIsin("US0378331005"));
    EXPECT_TRUE(validateIsin("GB0002634946"));
    EXPECT_FALSE(validateIsin("US0378331006"));
    EXPECT_FALSE(validateIsin("US037833100"));
}

TEST(IdentifierValidatorTest, Lei) {
    EXPECT_TRUE(validateLei("529900T8BM49AURSDO55"));
    EXPECT_TRUE(validateLei("5493001KJTIIGC8Y1R12"));
    EXPECT_FALSE(validateLei("529900T8BM49AURSDO56"));
    EXPECT_FALSE(validateLei("529900T8BM49"));
}

TEST(IdentifierValidatorTest, VesselNumbers) {
    EXPECT_TRUE(validateImo("9074729"));
    EXPECT_TRUE(validateImo("IMO9074729"));
    EXPECT_FALSE(validateImo("9074728"));
    EXPECT_TRUE(validateMmsi("366123456"));
    EXPECT_FALSE(validateMmsi("36612345"));
    EXPECT_TRUE(validateIdentifier(IdentifierFormat::ImoOrMmsi, "9074729"));
    EXPECT_TRUE(validateIdentifier(IdentifierFormat::ImoOrMmsi, "366123456"));
}

TEST(IdentifierValidatorTest, Bic) {
    EXPECT_TRUE(validateBic("DEUTDEFF"));
    EXPECT_TRUE(validateBic("DEUTDEFF500"));
    EXPECT_FALSE(validateBic("DEUTDEF"));
}

TEST(IdentifierValidatorTest, AnyAcceptsEverything) {
    EXPECT_TRUE(validateIdentifier(IdentifierFormat::Any, "whatever"));
    EXPECT_STREQ(identifierFormatToString(IdentifierFormat::ImoOrMmsi), "imo_mmsi");
}
