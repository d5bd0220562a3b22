#pragma once

#include <optional>
#include <string_view>

namespace namesake::compare {

/**
 * @brief Identifier formats with a checkable structure
 */
enum class IdentifierFormat { Any, Lei, Isin, Ogrn, Inn, Bic, Imo, Mmsi, ImoOrMmsi };

[[nodiscard]] constexpr const char* identifierFormatToString(IdentifierFormat f) noexcept {
    switch (f) {
        case IdentifierFormat::Any:
            return "any";
        case IdentifierFormat::Lei:
            return "lei";
        case IdentifierFormat::Isin:
            return "isin";
        case IdentifierFormat::Ogrn:
            return "ogrn";
        case IdentifierFormat::Inn:
            return "inn";
        case IdentifierFormat::Bic:
            return "bic";
        case IdentifierFormat::Imo:
            return "imo";
        case IdentifierFormat::Mmsi:
            return "mmsi";
        case IdentifierFormat::ImoOrMmsi:
            return "imo_mmsi";
    }
    return "unknown";
}

/// Russian primary state registration number, 13 digits, mod-11 check digit
bool validateOgrn(std::string_view code);

/// Russian taxpayer number, 10 or 12 digits with weighted check digits
bool validateInn(std::string_view code);

/// Maritime mobile service identity, 9 digits
bool validateMmsi(std::string_view code);

/// IMO ship number, 7 digits with a weighted check digit, optional "IMO" prefix
bool validateImo(std::string_view code);

/// SWIFT/BIC, 8 or 11 characters
bool validateBic(std::string_view code);

/// ISIN, 12 characters with a Luhn check over the digit-expanded form
bool validateIsin(std::string_view code);

/// Legal entity identifier, 20 characters, ISO 7064 mod 97-10
bool validateLei(std::string_view code);

/**
 * @brief Validate against a format; Any accepts every value
 */
bool validateIdentifier(IdentifierFormat format, std::string_view code);

} // namespace namesake::compare
