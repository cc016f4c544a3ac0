#pragma once

#include <string>
#include <string_view>

namespace keyrelay::planning {

struct ExpansionOptions {
    // The expansion grows geometrically with depth, deeper requests are rejected
    int max_depth = 6;
};

// Returns a shortest sequence of physical presses that types `target` on the numeric pad through
// a chain of `depth` layers. Every transition is expanded literally through all the layers below
// it with both groupings, keeping the shorter result. Its length equals the table based press
// count but the cost of computing it is exponential in depth.
//
// Throws std::invalid_argument if depth is negative or larger than options.max_depth.
std::string expand_presses(std::string_view target, const int depth,
                           const ExpansionOptions &options = {});

}  // namespace keyrelay::planning
