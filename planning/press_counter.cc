
#include "planning/press_counter.hh"

#include "common/check.hh"
#include "domain/keypad_codes.hh"

namespace keyrelay::planning {

PressCounter::PressCounter(const CostTableOptions &options)
    : table_(domain::directional_layout(), domain::numeric_layout(), options) {}

PressCount PressCounter::count(std::string_view target, const int depth) {
    KEYRELAY_CHECK(depth >= 0, "Chain depth must be non-negative", depth);
    table_.extend(depth);
    return table_.sequence_cost(depth, Pad::NUMERIC, target);
}

PressCount PressCounter::complexity(std::string_view code, const int depth) {
    return checked_multiply(count(code, depth), domain::numeric_part(code));
}

PressCount PressCounter::total_complexity(const std::vector<std::string> &codes,
                                          const int depth) {
    PressCount total = 0;
    for (const auto &code : codes) {
        total = checked_add(total, complexity(code, depth));
    }
    return total;
}

PressCount minimal_press_count(std::string_view target, const int depth) {
    PressCounter counter;
    return counter.count(target, depth);
}

}  // namespace keyrelay::planning
