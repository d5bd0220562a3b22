#include <namesake/normalize/replacers.h>

#include <algorithm>
#include <cctype>

namespace namesake::normalize {

namespace {

bool isBoundary(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return true;
    }
    auto c = static_cast<unsigned char>(text[pos]);
    return c < 0x80 && std::isalnum(c) == 0;
}

} // namespace

WordReplacer::WordReplacer(std::vector<std::pair<std::string, std::string>> table)
    : table_(std::move(table)) {
    std::stable_sort(table_.begin(), table_.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });
}

std::string WordReplacer::apply(std::string_view text) const {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool startsWord = i == 0 || isBoundary(text, i - 1);
        bool replaced = false;
        if (startsWord && !isBoundary(text, i)) {
            for (const auto& [pattern, replacement] : table_) {
                if (text.compare(i, pattern.size(), pattern) == 0 &&
                    isBoundary(text, i + pattern.size())) {
                    out += replacement;
                    i += pattern.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

const WordReplacer& organizationTypes() {
    static const WordReplacer replacer({
        {"limited liability company", "llc"},
        {"limited liability partnership", "llp"},
        {"limited partnership", "lp"},
        {"public limited company", "plc"},
        {"private limited company", "ltd"},
        {"limited", "ltd"},
        {"incorporated", "inc"},
        {"corporation", "corp"},
        {"company", "co"},
        {"general partnership", "gp"},
        {"joint stock company", "jsc"},
        {"open joint stock company", "ojsc"},
        {"closed joint stock company", "cjsc"},
        {"public joint stock company", "pjsc"},
        {"aktsionernoe obshchestvo", "ao"},
        {"otkrytoe aktsionernoe obshchestvo", "oao"},
        {"zakrytoe aktsionernoe obshchestvo", "zao"},
        {"publichnoe aktsionernoe obshchestvo", "pao"},
        {"obshchestvo s ogranichennoy otvetstvennostyu", "ooo"},
        {"obshchestvo s ogranichennoi otvetstvennostiu", "ooo"},
        {"gesellschaft mit beschrankter haftung", "gmbh"},
        {"aktiengesellschaft", "ag"},
        {"kommanditgesellschaft", "kg"},
        {"societe anonyme", "sa"},
        {"sociedad anonima", "sa"},
        {"societe a responsabilite limitee", "sarl"},
        {"sociedad de responsabilidad limitada", "srl"},
        {"societa per azioni", "spa"},
        {"societa a responsabilita limitata", "srl"},
        {"comandita por acciones", "sca"},
        {"besloten vennootschap", "bv"},
        {"naamloze vennootschap", "nv"},
        {"aktiebolag", "ab"},
        {"aksjeselskap", "as"},
        {"andelslag", "anl"},
        {"proprietary limited", "pty ltd"},
        {"free zone establishment", "fze"},
        {"free zone company", "fzco"},
        {"limited liability", "ll"},
    });
    return replacer;
}

const WordReplacer& personNamePrefixes() {
    static const WordReplacer replacer({
        {"mr", ""},       {"mrs", ""},      {"ms", ""},      {"miss", ""},   {"mister", ""},
        {"madam", ""},    {"madame", ""},   {"monsieur", ""}, {"dr", ""},    {"doctor", ""},
        {"prof", ""},     {"professor", ""}, {"sir", ""},     {"dame", ""},  {"lady", ""},
        {"lord", ""},     {"sheikh", ""},   {"shaikh", ""},  {"haji", ""},   {"hajji", ""},
        {"hadji", ""},    {"mullah", ""},   {"imam", ""},    {"herr", ""},   {"frau", ""},
        {"senor", ""},    {"senora", ""},
    });
    return replacer;
}

const WordReplacer& addressForms() {
    static const WordReplacer replacer({
        {"street", "st"},       {"strasse", "str"},     {"avenue", "ave"},
        {"road", "rd"},         {"boulevard", "blvd"},  {"drive", "dr"},
        {"lane", "ln"},         {"square", "sq"},       {"place", "pl"},
        {"court", "ct"},        {"highway", "hwy"},     {"building", "bldg"},
        {"apartment", "apt"},   {"suite", "ste"},       {"floor", "fl"},
        {"office", "ofc"},      {"post office box", "po box"}, {"p o box", "po box"},
        {"north", "n"},         {"south", "s"},         {"east", "e"},
        {"west", "w"},          {"ulitsa", "ul"},       {"prospekt", "pr"},
        {"district", "dist"},   {"province", "prov"},   {"republic", "rep"},
    });
    return replacer;
}

const WordReplacer& ordinals() {
    static const WordReplacer replacer({
        {"first", "1"},   {"1st", "1"},   {"second", "2"},  {"2nd", "2"},  {"third", "3"},
        {"3rd", "3"},     {"fourth", "4"}, {"4th", "4"},    {"fifth", "5"}, {"5th", "5"},
        {"sixth", "6"},   {"6th", "6"},   {"seventh", "7"}, {"7th", "7"},  {"eighth", "8"},
        {"8th", "8"},     {"ninth", "9"}, {"9th", "9"},     {"tenth", "10"}, {"10th", "10"},
    });
    return replacer;
}

} // namespace namesake::normalize
