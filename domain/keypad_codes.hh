#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace keyrelay::domain {

// Throws UnknownSymbolError on the first symbol that is not on the numeric pad
void validate_code(std::string_view code);

// The value of the leading digits of a code, e.g. "029A" -> 29. A code without leading digits
// has a numeric part of 0. Throws std::out_of_range if the digits don't fit.
std::uint64_t numeric_part(std::string_view code);

// One code per line. Surrounding whitespace and blank lines are ignored and every code is
// validated against the numeric pad.
std::vector<std::string> parse_codes(std::istream &in);

// Throws std::runtime_error if the file can't be opened
std::vector<std::string> load_codes(const std::filesystem::path &path);

}  // namespace keyrelay::domain
