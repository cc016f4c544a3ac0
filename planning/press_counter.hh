#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "planning/transition_cost_table.hh"

namespace keyrelay::planning {

// Answers press count queries for chains of any depth, extending a single retained table as
// deeper chains are requested.
class PressCounter {
   public:
    explicit PressCounter(const CostTableOptions &options = {});

    // Minimal number of physical presses needed to type `target` on the numeric pad through a
    // chain of `depth` layers. Depth 0 means the hand types on the numeric pad directly.
    PressCount count(std::string_view target, const int depth);

    // count(code, depth) times the numeric part of the code
    PressCount complexity(std::string_view code, const int depth);

    PressCount total_complexity(const std::vector<std::string> &codes, const int depth);

    const TransitionCostTable &table() const { return table_; }

   private:
    TransitionCostTable table_;
};

// Builds a table for this query only
PressCount minimal_press_count(std::string_view target, const int depth);

}  // namespace keyrelay::planning
