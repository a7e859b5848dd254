#pragma once

#include <string>
#include <string_view>
#include <vector>

using std::string, std::string_view;

namespace StringHelper {
// Empty segments are kept, so `Split("a::b", ':')` is `{"a", "", "b"}`.
std::vector<string_view> Split(string_view text, char delim);

// Splits words at lower-to-upper transitions and lowercases everything after the first character.
// E.g. 'QueueSelection' => 'Queue selection'
string PascalToSentenceCase(string_view str);
} // namespace StringHelper
