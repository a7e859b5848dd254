#include "String.h"

#include <cctype>

using std::vector;

namespace StringHelper {
vector<string_view> Split(string_view text, char delim) {
    vector<string_view> tokens;
    size_t start = 0, end;
    while ((end = text.find(delim, start)) != string_view::npos) {
        tokens.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    tokens.push_back(text.substr(start));
    return tokens;
}

string PascalToSentenceCase(string_view str) {
    string sentence_case;
    for (size_t index = 0; index < str.size(); index++) {
        const auto ch = static_cast<unsigned char>(str[index]);
        if (index > 0 && std::isupper(ch) && std::islower(static_cast<unsigned char>(str[index - 1]))) sentence_case += ' ';
        sentence_case += index > 0 ? char(std::tolower(ch)) : char(ch);
    }
    return sentence_case;
}
} // namespace StringHelper
