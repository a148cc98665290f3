#pragma once

#include <string>
#include <string_view>

namespace nutrition::util {

// Unicode full case folding of a UTF-8 string ("ÉCLAIR" -> "éclair",
// "STRASSE" and "Straße" both -> "strasse").
// Invalid UTF-8 sequences fold to U+FFFD.
std::string FoldCase(std::string_view utf8);

// Case-insensitive comparison under FoldCase.
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

} // namespace nutrition::util
