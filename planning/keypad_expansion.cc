
#include "planning/keypad_expansion.hh"

#include <optional>
#include <stdexcept>

#include "domain/keypad.hh"
#include "fmt/format.h"
#include "planning/keypad_moves.hh"
#include "planning/transition_cost_table.hh"

namespace keyrelay::planning {
namespace {
// Presses of the hand that make the operator at `layer` type `sequence` on `pad`
std::string expand(const domain::Layout &pad, std::string_view sequence, const int layer) {
    if (layer == 0) {
        return std::string(sequence);
    }

    std::string out;
    domain::Symbol prev = domain::ACTIVATE;
    for (const domain::Symbol symbol : sequence) {
        std::optional<std::string> shortest;
        for (const auto &[grouping, _] : wise_enum::range<Grouping>) {
            const auto maybe_moves = move_sequence(pad, prev, symbol, grouping);
            if (!maybe_moves.has_value()) {
                continue;
            }
            std::string candidate = expand(domain::directional_layout(), *maybe_moves, layer - 1);
            if (!shortest.has_value() || candidate.size() < shortest->size()) {
                shortest = std::move(candidate);
            }
        }
        if (!shortest.has_value()) {
            throw UnreachableTransitionError(prev, symbol, pad.name());
        }
        out += shortest.value();
        prev = symbol;
    }
    return out;
}
}  // namespace

std::string expand_presses(std::string_view target, const int depth,
                           const ExpansionOptions &options) {
    if (depth < 0 || depth > options.max_depth) {
        throw std::invalid_argument(fmt::format(
            "Literal expansion depth must be in [0, {}], got {}", options.max_depth, depth));
    }

    const domain::Layout &numeric = domain::numeric_layout();
    if (depth == 0) {
        for (const domain::Symbol symbol : target) {
            if (!numeric.contains(symbol)) {
                throw domain::UnknownSymbolError(symbol, numeric.name());
            }
        }
    }
    return expand(numeric, target, depth);
}

}  // namespace keyrelay::planning
