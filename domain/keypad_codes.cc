
#include "domain/keypad_codes.hh"

#include <cctype>
#include <charconv>
#include <fstream>
#include <stdexcept>

#include "domain/keypad.hh"
#include "fmt/format.h"

namespace keyrelay::domain {
namespace {
std::string_view trim(std::string_view line) {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    return line;
}
}  // namespace

void validate_code(std::string_view code) {
    const Layout &layout = numeric_layout();
    for (const Symbol symbol : code) {
        if (!layout.contains(symbol)) {
            throw UnknownSymbolError(symbol, layout.name());
        }
    }
}

std::uint64_t numeric_part(std::string_view code) {
    std::uint64_t value = 0;
    const auto result = std::from_chars(code.data(), code.data() + code.size(), value);
    if (result.ec == std::errc::invalid_argument) {
        // No leading digits
        return 0;
    } else if (result.ec == std::errc::result_out_of_range) {
        throw std::out_of_range(fmt::format("Numeric part of code {} is too large", code));
    }
    return value;
}

std::vector<std::string> parse_codes(std::istream &in) {
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        const std::string_view code = trim(line);
        if (code.empty()) {
            continue;
        }
        validate_code(code);
        out.emplace_back(code);
    }
    return out;
}

std::vector<std::string> load_codes(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open codes file: " + path.string());
    }
    return parse_codes(in);
}

}  // namespace keyrelay::domain
