#include <namesake/compare/identifier_validators.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace namesake::compare {

namespace {

bool allDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

bool allAlpha(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c < 0x80 && std::isalpha(c) != 0;
    });
}

bool allAlnum(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c < 0x80 && std::isalnum(c) != 0;
    });
}

int digitAt(std::string_view s, size_t i) {
    return s[i] - '0';
}

int innCheckDigit(std::string_view digits, const int* coeffs, size_t count) {
    int sum = 0;
    for (size_t i = 0; i < count; ++i) {
        sum += digitAt(digits, i) * coeffs[i];
    }
    return (sum % 11) % 10;
}

bool luhnValid(std::string_view digits) {
    int sum = 0;
    bool doubleIt = false;
    for (size_t i = digits.size(); i > 0; --i) {
        int d = digitAt(digits, i - 1);
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

} // namespace

bool validateOgrn(std::string_view code) {
    if (code.size() != 13 || !allDigits(code)) {
        return false;
    }
    const unsigned long long number = std::stoull(std::string(code.substr(0, 12)));
    const int check = static_cast<int>((number % 11) % 10);
    return check == digitAt(code, 12);
}

bool validateInn(std::string_view code) {
    if (!allDigits(code)) {
        return false;
    }
    if (code.size() == 10) {
        static constexpr int kCoeffs[] = {2, 4, 10, 3, 5, 9, 4, 6, 8};
        return innCheckDigit(code, kCoeffs, 9) == digitAt(code, 9);
    }
    if (code.size() == 12) {
        static constexpr int kCoeffs1[] = {7, 2, 4, 10, 3, 5, 9, 4, 6, 8};
        static constexpr int kCoeffs2[] = {3, 7, 2, 4, 10, 3, 5, 9, 4, 6, 8};
        return innCheckDigit(code, kCoeffs1, 10) == digitAt(code, 10) &&
               innCheckDigit(code, kCoeffs2, 11) == digitAt(code, 11);
    }
    return false;
}

bool validateMmsi(std::string_view code) {
    return code.size() == 9 && allDigits(code);
}

bool validateImo(std::string_view code) {
    if (code.size() > 3 && (code.substr(0, 3) == "IMO" || code.substr(0, 3) == "imo")) {
        code.remove_prefix(3);
    }
    if (code.size() != 7 || !allDigits(code)) {
        return false;
    }
    int sum = 0;
    for (size_t i = 0; i < 6; ++i) {
        sum += digitAt(code, i) * static_cast<int>(7 - i);
    }
    return sum % 10 == digitAt(code, 6);
}

bool validateBic(std::string_view code) {
    if (code.size() != 8 && code.size() != 11) {
        return false;
    }
    return allAlpha(code.substr(0, 6)) && allAlnum(code.substr(6));
}

bool validateIsin(std::string_view code) {
    if (code.size() != 12) {
        return false;
    }
    if (!allAlpha(code.substr(0, 2)) || !allAlnum(code.substr(2, 9)) ||
        !std::isdigit(static_cast<unsigned char>(code[11]))) {
        return false;
    }

    // Letters expand to two digits (A=10 ... Z=35)
    std::string expanded;
    for (char ch : code) {
        auto c = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(ch)));
        if (std::isdigit(c)) {
            expanded.push_back(static_cast<char>(c));
        } else {
            expanded += std::to_string(c - 'A' + 10);
        }
    }
    return luhnValid(expanded);
}

bool validateLei(std::string_view code) {
    if (code.size() != 20 || !allAlnum(code) || !allDigits(code.substr(18))) {
        return false;
    }
    int remainder = 0;
    for (char ch : code) {
        auto c = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(ch)));
        int value = std::isdigit(c) ? c - '0' : c - 'A' + 10;
        remainder = value >= 10 ? (remainder * 100 + value) % 97 : (remainder * 10 + value) % 97;
    }
    return remainder == 1;
}

bool validateIdentifier(IdentifierFormat format, std::string_view code) {
    switch (format) {
        case IdentifierFormat::Any:
            return true;
        case IdentifierFormat::Lei:
            return validateLei(code);
        case IdentifierFormat::Isin:
            return validateIsin(code);
        case IdentifierFormat::Ogrn:
            return validateOgrn(code);
        case IdentifierFormat::Inn:
            return validateInn(code);
        case IdentifierFormat::Bic:
            return validateBic(code);
        case IdentifierFormat::Imo:
            return validateImo(code);
        case IdentifierFormat::Mmsi:
            return validateMmsi(code);
        case IdentifierFormat::ImoOrMmsi:
            return validateImo(code) || validateMmsi(code);
    }
    return false;
}

} // namespace namesake::compare
