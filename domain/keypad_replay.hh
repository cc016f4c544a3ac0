#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/keypad.hh"

namespace keyrelay::domain {

class GapTraversalError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Drives an arm that starts on the activate key of `layout`. Every directional press moves the
// arm by one cell and every activate press emits the symbol under the arm. Returns the emitted
// symbols.
//
// Throws GapTraversalError if the arm enters the gap, std::out_of_range if it leaves the keypad
// and UnknownSymbolError for presses that are not directional symbols.
std::string replay(const Layout &layout, std::string_view presses);

// Feeds the presses of the physical hand through a chain of `depth` layers: depth - 1 directional
// pads followed by the numeric pad. Returns what the outermost operator typed. With depth 0 the
// hand types on the numeric pad itself and the presses are returned as is.
std::string replay_chain(std::string_view presses, const int depth);

}  // namespace keyrelay::domain
