#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gps::core {

std::string_view trim(std::string_view text);                               //!< Strip leading and trailing whitespace.
std::vector<std::string_view> split(std::string_view text, char delimiter); //!< Split on every delimiter. Keeps empty fields.
std::vector<std::string_view> splitWords(std::string_view text);            //!< Split on whitespace runs. Drops empty words.
std::string toUpper(std::string_view text);                                 //!< ASCII upper-case copy.

} // namespace gps::core
