#include <namesake/normalize/phonetic.h>

#include <cctype>
#include <utility>

namespace namesake::normalize {

namespace {

char soundexDigit(char c) {
    switch (c) {
        case 'B':
        case 'F':
        case 'P':
        case 'V':
            return '1';
        case 'C':
        case 'G':
        case 'J':
        case 'K':
        case 'Q':
        case 'S':
        case 'X':
        case 'Z':
            return '2';
        case 'D':
        case 'T':
            return '3';
        case 'L':
            return '4';
        case 'M':
        case 'N':
            return '5';
        case 'R':
            return '6';
        default:
            return '0';
    }
}

std::string upperLetters(std::string_view word) {
    std::string out;
    out.reserve(word.size());
    for (char ch : word) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isalpha(c)) {
            out.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return out;
}

constexpr std::string_view kVowels = "AEIOU";
constexpr std::string_view kFrontVowels = "EIY";
constexpr std::string_view kVarson = "CSPTG";

bool isVowel(char c) {
    return kVowels.find(c) != std::string_view::npos;
}

bool isFrontVowel(char c) {
    return kFrontVowels.find(c) != std::string_view::npos;
}

class MetaphoneWord {
public:
    explicit MetaphoneWord(std::string text) : text_(std::move(text)) {}

    size_t size() const { return text_.size(); }
    char at(size_t n) const { return n < text_.size() ? text_[n] : '\0'; }

    bool isLast(size_t n) const { return n + 1 == text_.size(); }
    bool next(size_t n, char c) const { return n + 1 < text_.size() && text_[n + 1] == c; }
    bool previous(size_t n, char c) const {
        return n > 0 && n < text_.size() && text_[n - 1] == c;
    }
    bool region(size_t n, std::string_view test) const {
        return n + test.size() <= text_.size() && text_.compare(n, test.size(), test) == 0;
    }

private:
    std::string text_;
};

// Initial-letter exceptions: KN, GN, PN, AE, WR drop the first letter; WH becomes W; X becomes S
std::string applyInitialRules(std::string in) {
    if (in.size() < 2) {
        return in;
    }
    switch (in[0]) {
        case 'K':
        case 'G':
        case 'P':
            if (in[1] == 'N') {
                return in.substr(1);
            }
            break;
        case 'A':
            if (in[1] == 'E') {
                return in.substr(1);
            }
            break;
        case 'W':
            if (in[1] == 'R') {
                return in.substr(1);
            }
            if (in[1] == 'H') {
                std::string out = in.substr(1);
                out[0] = 'W';
                return out;
            }
            break;
        case 'X':
            in[0] = 'S';
            break;
        default:
            break;
    }
    return in;
}

} // namespace

std::string soundex(std::string_view word) {
    std::string letters = upperLetters(word);
    if (letters.empty()) {
        return {};
    }

    std::string code(1, letters[0]);
    char last = soundexDigit(letters[0]);
    for (size_t i = 1; i < letters.size() && code.size() < 4; ++i) {
        char c = letters[i];
        char digit = soundexDigit(c);
        if (digit != '0' && digit != last) {
            code.push_back(digit);
        }
        // H and W do not separate letters with the same code
        if (c != 'H' && c != 'W') {
            last = digit;
        }
    }
    code.append(4 - code.size(), '0');
    return code;
}

std::string metaphone(std::string_view input, size_t maxLength) {
    std::string letters = upperLetters(input);
    if (letters.empty()) {
        return {};
    }
    if (letters.size() == 1) {
        return letters;
    }

    MetaphoneWord w(applyInitialRules(std::move(letters)));
    std::string code;
    const size_t size = w.size();

    for (size_t n = 0; n < size && code.size() < maxLength; ++n) {
        char symb = w.at(n);
        // Doubled letters collapse, except C
        if (symb != 'C' && w.previous(n, symb)) {
            continue;
        }
        switch (symb) {
            case 'A':
            case 'E':
            case 'I':
            case 'O':
            case 'U':
                if (n == 0) {
                    code.push_back(symb);
                }
                break;
            case 'B':
                // Silent after M at the end, as in "dumb"
                if (!(w.previous(n, 'M') && w.isLast(n))) {
                    code.push_back('B');
                }
                break;
            case 'C':
                if (w.previous(n, 'S') && !w.isLast(n) && isFrontVowel(w.at(n + 1))) {
                    break;
                }
                if (w.region(n, "CIA")) {
                    code.push_back('X');
                    break;
                }
                if (!w.isLast(n) && isFrontVowel(w.at(n + 1))) {
                    code.push_back('S');
                    break;
                }
                if (w.previous(n, 'S') && w.next(n, 'H')) {
                    code.push_back('K');
                    break;
                }
                if (w.next(n, 'H')) {
                    if (n == 0 && size >= 3 && isVowel(w.at(2))) {
                        code.push_back('K');
                    } else {
                        code.push_back('X');
                    }
                } else {
                    code.push_back('K');
                }
                break;
            case 'D':
                if (n + 2 < size && w.next(n, 'G') && isFrontVowel(w.at(n + 2))) {
                    code.push_back('J');
                    n += 2;
                } else {
                    code.push_back('T');
                }
                break;
            case 'G':
                if (n + 2 == size && w.next(n, 'H')) {
                    break;
                }
                if (n + 2 < size && w.next(n, 'H') && !isVowel(w.at(n + 2))) {
                    break;
                }
                if (n > 0 && (w.region(n, "GN") || w.region(n, "GNED"))) {
                    break;
                }
                if (!w.isLast(n) && isFrontVowel(w.at(n + 1)) && !w.previous(n, 'G')) {
                    code.push_back('J');
                } else {
                    code.push_back('K');
                }
                break;
            case 'H':
                if (w.isLast(n)) {
                    break;
                }
                if (n > 0 && kVarson.find(w.at(n - 1)) != std::string_view::npos) {
                    break;
                }
                if (isVowel(w.at(n + 1))) {
                    code.push_back('H');
                }
                break;
            case 'F':
            case 'J':
            case 'L':
            case 'M':
            case 'N':
            case 'R':
                code.push_back(symb);
                break;
            case 'K':
                if (n == 0 || !w.previous(n, 'C')) {
                    code.push_back('K');
                }
                break;
            case 'P':
                code.push_back(w.next(n, 'H') ? 'F' : 'P');
                break;
            case 'Q':
                code.push_back('K');
                break;
            case 'S':
                if (w.region(n, "SH") || w.region(n, "SIO") || w.region(n, "SIA")) {
                    code.push_back('X');
                } else {
                    code.push_back('S');
                }
                break;
            case 'T':
                if (w.region(n, "TIA") || w.region(n, "TIO")) {
                    code.push_back('X');
                    break;
                }
                if (w.region(n, "TCH")) {
                    break;
                }
                code.push_back(w.region(n, "TH") ? '0' : 'T');
                break;
            case 'V':
                code.push_back('F');
                break;
            case 'W':
            case 'Y':
                if (!w.isLast(n) && isVowel(w.at(n + 1))) {
                    code.push_back(symb);
                }
                break;
            case 'X':
                code.push_back('K');
                code.push_back('S');
                break;
            case 'Z':
                code.push_back('S');
                break;
            default:
                break;
        }
    }

    if (code.size() > maxLength) {
        code.resize(maxLength);
    }
    return code;
}

} // namespace namesake::normalize
