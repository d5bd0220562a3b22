#include <namesake/model/schema_catalog.h>

namespace namesake::model {

// Subset of the FollowTheMoney schema model relevant to watch-list screening.
std::vector<SchemaDef> SchemaCatalog::builtinDefinitions() {
    std::vector<SchemaDef> defs;

    defs.push_back({"Thing",
                    {},
                    false,
                    {
                        {"name", "name", {}},
                        {"alias", "name", {}},
                        {"previousName", "name", {}},
                        {"weakAlias", "name", {"logic-v1"}},
                        {"country", "country", {}},
                        {"address", "text", {}},
                        {"notes", "text", {}},
                    }});

    defs.push_back({"LegalEntity",
                    {"Thing"},
                    true,
                    {
                        {"registrationNumber", "identifier", {}},
                        {"taxNumber", "identifier", {}},
                        {"innCode", "identifier", {}},
                        {"ogrnCode", "identifier", {}},
                        {"jurisdiction", "country", {}},
                        {"mainCountry", "country", {}},
                        {"email", "identifier", {}},
                    }});

    defs.push_back({"Person",
                    {"LegalEntity"},
                    true,
                    {
                        {"firstName", "name", {}},
                        {"secondName", "name", {}},
                        {"middleName", "name", {}},
                        {"fatherName", "name", {}},
                        {"lastName", "name", {}},
                        {"birthDate", "date", {}},
                        {"deathDate", "date", {}},
                        {"gender", "gender", {}},
                        {"nationality", "country", {}},
                        {"citizenship", "country", {}},
                        {"birthPlace", "text", {}},
                        {"passportNumber", "identifier", {}},
                    }});

    defs.push_back({"Organization",
                    {"LegalEntity"},
                    true,
                    {
                        {"leiCode", "identifier", {}},
                        {"bicCode", "identifier", {}},
                        {"incorporationDate", "date", {}},
                        {"dissolutionDate", "date", {}},
                    }});

    defs.push_back({"Company", {"Organization"}, true, {{"isin", "identifier", {}}}});
    defs.push_back({"PublicBody", {"Organization"}, true, {}});

    defs.push_back({"Vessel",
                    {"Thing"},
                    true,
                    {
                        {"imoNumber", "identifier", {}},
                        {"mmsi", "identifier", {}},
                        {"callSign", "identifier", {}},
                        {"flag", "country", {}},
                        {"buildDate", "date", {}},
                        {"registrationNumber", "identifier", {}},
                    }});

    defs.push_back({"Airplane",
                    {"Thing"},
                    true,
                    {
                        {"registrationNumber", "identifier", {}},
                        {"serialNumber", "identifier", {}},
                        {"buildDate", "date", {}},
                    }});

    defs.push_back({"Address",
                    {"Thing"},
                    true,
                    {
                        {"full", "address", {}},
                        {"street", "text", {}},
                        {"city", "text", {}},
                        {"postalCode", "identifier", {}},
                    }});

    defs.push_back({"CryptoWallet",
                    {"Thing"},
                    true,
                    {
                        {"publicKey", "identifier", {}},
                        {"currency", "text", {}},
                    }});

    defs.push_back({"Security",
                    {"Thing"},
                    true,
                    {
                        {"isin", "identifier", {}},
                        {"ticker", "identifier", {}},
                    }});

    return defs;
}

} // namespace namesake::model
