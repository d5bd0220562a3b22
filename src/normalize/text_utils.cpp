#include <namesake/normalize/text_utils.h>

#include <cctype>

namespace namesake::normalize {

namespace {

bool isWordByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c) != 0;
}

std::string clean(std::string_view text, bool breakOnPunctuation) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isWordByte(c)) {
            if (pendingSpace && !out.empty()) {
                out.push_back(' ');
            }
            pendingSpace = false;
            out.push_back(ch);
        } else if (std::isspace(c) || breakOnPunctuation) {
            pendingSpace = true;
        }
    }
    return out;
}

} // namespace

std::string stripPunctuation(std::string_view text) {
    return clean(text, false);
}

std::string punctuationToSpace(std::string_view text) {
    return clean(text, true);
}

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(text.substr(start, i - start));
        }
    }
    return tokens;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out += parts[i];
    }
    return out;
}

std::vector<std::string> extractNumbers(std::string_view text) {
    std::vector<std::string> numbers;
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        numbers.emplace_back(text.substr(start, i - start));
    }
    return numbers;
}

std::string removeWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

size_t codepointLength(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace namesake::normalize
