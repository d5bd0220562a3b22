#include <namesake/scoring/algorithm.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace namesake::scoring {

namespace {

using compare::DatePrecision;
using compare::IdentifierFormat;
using features::FeatureDefinition;
using features::FeatureMode;
using features::SchemaScope;
using model::PropertyType;

// Keeps the logistic strictly inside (0,1) in double precision
constexpr double kMaxLogit = 30.0;

const std::vector<std::string> kNameProperties = {"name", "alias", "previousName"};

FeatureDefinition nameFeature(std::string name, SchemaScope scope,
                              void (*blend)(compare::NameBlend&)) {
    FeatureDefinition def;
    def.name = std::move(name);
    def.type = PropertyType::Name;
    def.properties = kNameProperties;
    def.scope = std::move(scope);
    blend(def.options.nameBlend);
    return def;
}

FeatureDefinition identifierFeature(std::string name, std::vector<std::string> properties,
                                    IdentifierFormat format, size_t minLength = 1) {
    FeatureDefinition def;
    def.name = std::move(name);
    def.type = PropertyType::Identifier;
    def.properties = std::move(properties);
    def.options.identifierFormat = format;
    def.options.minIdentifierLength = minLength;
    return def;
}

FeatureDefinition disagreement(std::string name, PropertyType type,
                               std::vector<std::string> properties,
                               SchemaScope scope = SchemaScope::any()) {
    FeatureDefinition def;
    def.name = std::move(name);
    def.type = type;
    def.properties = std::move(properties);
    def.mode = FeatureMode::Disagreement;
    def.scope = std::move(scope);
    return def;
}

std::vector<FeatureDefinition> buildDefinitions() {
    std::vector<FeatureDefinition> defs;
    defs.push_back(nameFeature("name.literal", SchemaScope::any(),
                               [](compare::NameBlend& b) { b.literal = 1.0; }));
    defs.push_back(nameFeature("name.jaro_winkler", SchemaScope::eitherIs("Person"),
                               [](compare::NameBlend& b) { b.jaroWinkler = 1.0; }));
    defs.push_back(nameFeature("name.phonetic", SchemaScope::eitherIs("Person"),
                               [](compare::NameBlend& b) { b.phonetic = 1.0; }));
    defs.push_back(nameFeature("name.fingerprint", SchemaScope::neitherIs("Person"),
                               [](compare::NameBlend& b) { b.levenshtein = 1.0; }));

    auto weakAlias = nameFeature("name.weak_alias", SchemaScope::any(),
                                 [](compare::NameBlend& b) { b.literal = 1.0; });
    weakAlias.properties = {"name", "alias"};
    weakAlias.candidateProperties = {"weakAlias"};
    defs.push_back(std::move(weakAlias));

    FeatureDefinition address;
    address.name = "address.match";
    address.type = PropertyType::Address;
    address.properties = {"full"};
    address.scope = SchemaScope::bothAre("Address");
    defs.push_back(std::move(address));

    auto wallet = identifierFeature("crypto.wallet", {"publicKey"}, IdentifierFormat::Any, 10);
    wallet.scope = SchemaScope::bothAre("CryptoWallet");
    defs.push_back(std::move(wallet));

    defs.push_back(identifierFeature("identifier.isin", {"isin"}, IdentifierFormat::Isin));
    defs.push_back(identifierFeature("identifier.lei", {"leiCode"}, IdentifierFormat::Lei));
    defs.push_back(identifierFeature("identifier.ogrn", {"ogrnCode"}, IdentifierFormat::Ogrn));
    defs.push_back(identifierFeature("identifier.inn", {"innCode"}, IdentifierFormat::Inn));
    defs.push_back(identifierFeature("identifier.bic", {"bicCode"}, IdentifierFormat::Bic));
    defs.push_back(identifierFeature("identifier.vessel", {"imoNumber", "mmsi"},
                                     IdentifierFormat::ImoOrMmsi));
    defs.push_back(identifierFeature("identifier.match",
                                     {"registrationNumber", "taxNumber", "passportNumber"},
                                     IdentifierFormat::Any, 5));

    defs.push_back(disagreement("country.mismatch", PropertyType::Country, {}));

    auto lastName = disagreement("last_name.mismatch", PropertyType::Name, {"lastName"},
                                 SchemaScope::eitherIs("Person"));
    lastName.options.nameBlend.tokenOverlap = 1.0;
    defs.push_back(std::move(lastName));

    auto year = disagreement("dob.year_mismatch", PropertyType::Date, {"birthDate"},
                             SchemaScope::eitherIs("Person"));
    year.options.datePrecision = DatePrecision::Year;
    defs.push_back(std::move(year));

    auto day = disagreement("dob.day_mismatch", PropertyType::Date, {"birthDate"},
                            SchemaScope::eitherIs("Person"));
    day.options.datePrecision = DatePrecision::Day;
    defs.push_back(std::move(day));

    defs.push_back(disagreement("gender.mismatch", PropertyType::Gender, {"gender"}));
    defs.push_back(disagreement("orgid.mismatch", PropertyType::Identifier,
                                {"registrationNumber", "taxNumber", "leiCode", "innCode",
                                 "ogrnCode", "bicCode"},
                                SchemaScope::bothAre("Organization")));

    FeatureDefinition numbers;
    numbers.name = "name.numbers_mismatch";
    numbers.type = PropertyType::Name;
    numbers.properties = {"name", "alias"};
    numbers.mode = FeatureMode::NumbersMismatch;
    defs.push_back(std::move(numbers));
    return defs;
}

// Version 1 weight table. Changing a value requires a new algorithm version.
constexpr std::array<LogicV1::Weight, 21> kWeights = {{
    {"name.literal", 4.0},
    {"name.jaro_winkler", 3.0},
    {"name.phonetic", 1.5},
    {"name.fingerprint", 3.5},
    {"name.weak_alias", 2.5},
    {"address.match", 5.5},
    {"crypto.wallet", 7.0},
    {"identifier.isin", 6.0},
    {"identifier.lei", 5.5},
    {"identifier.ogrn", 5.5},
    {"identifier.inn", 5.5},
    {"identifier.bic", 5.5},
    {"identifier.vessel", 5.5},
    {"identifier.match", 3.0},
    {"country.mismatch", -1.5},
    {"last_name.mismatch", -1.5},
    {"dob.year_mismatch", -1.2},
    {"dob.day_mismatch", -1.0},
    {"gender.mismatch", -1.5},
    {"orgid.mismatch", -1.5},
    {"name.numbers_mismatch", -0.8},
}};

} // namespace

std::span<const FeatureDefinition> LogicV1::features() {
    static const std::vector<FeatureDefinition> definitions = buildDefinitions();
    return definitions;
}

std::span<const LogicV1::Weight> LogicV1::weights() {
    return kWeights;
}

ScoreOutcome LogicV1::score(const features::FeatureVector& vector) const {
    ScoreOutcome outcome;
    double logit = kBias;
    bool evidence = false;

    for (const auto& w : kWeights) {
        const auto* f = vector.find(w.feature);
        FeatureContribution line{w.feature, 0.0, w.weight, 0.0,
                                 f ? f->status : features::FeatureStatus::Missing};
        if (f && f->present()) {
            line.value = std::clamp(f->value, 0.0, 1.0);
            line.contribution = w.weight * line.value;
            logit += line.contribution;
            evidence = evidence || w.weight > 0.0;
        }
        outcome.breakdown.push_back(std::move(line));
    }

    // Without positive evidence there is nothing to score
    if (!evidence) {
        outcome.noEvidence = true;
        outcome.score = 0.0;
        return outcome;
    }

    logit = std::clamp(logit, -kMaxLogit, kMaxLogit);
    outcome.score = 1.0 / (1.0 + std::exp(-logit));
    return outcome;
}

} // namespace namesake::scoring
