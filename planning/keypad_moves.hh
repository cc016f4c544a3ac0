#pragma once

#include <optional>
#include <string>

#include "domain/keypad.hh"
#include "wise_enum.h"

namespace keyrelay::planning {

// Which run of directional presses is typed first when moving between two keys.
WISE_ENUM_CLASS(Grouping, HORIZONTAL_FIRST, VERTICAL_FIRST)

// The cell the arm passes through when it switches from one run to the other.
domain::Position corner(const domain::Position &start, const domain::Position &end,
                        const Grouping grouping);

// Returns the directional presses that move the arm from `start` to `end` on `layout` and press
// `end`, always terminated by an ACTIVATE press. Returns nullopt if either run of the grouping
// steps onto the gap, including turning on it.
// Throws domain::UnknownSymbolError if either symbol is not on the layout.
std::optional<std::string> move_sequence(const domain::Layout &layout, const domain::Symbol start,
                                         const domain::Symbol end, const Grouping grouping);

}  // namespace keyrelay::planning
