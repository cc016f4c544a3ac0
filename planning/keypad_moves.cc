
#include "planning/keypad_moves.hh"

#include <cstdlib>

namespace keyrelay::planning {
namespace {
std::string run(const int delta, const domain::Symbol positive, const domain::Symbol negative) {
    return std::string(std::abs(delta), delta > 0 ? positive : negative);
}

// True if any cell of the straight run from `from` to `to`, both ends included, is the gap
bool run_crosses_gap(const domain::Layout &layout, const domain::Position &from,
                     const domain::Position &to) {
    const domain::Position step = (to - from).cwiseSign();
    for (domain::Position pos = from; pos != to; pos += step) {
        if (layout.is_gap(pos)) {
            return true;
        }
    }
    return layout.is_gap(to);
}
}  // namespace

domain::Position corner(const domain::Position &start, const domain::Position &end,
                        const Grouping grouping) {
    if (grouping == Grouping::HORIZONTAL_FIRST) {
        return domain::Position{end.x(), start.y()};
    }
    return domain::Position{start.x(), end.y()};
}

std::optional<std::string> move_sequence(const domain::Layout &layout, const domain::Symbol start,
                                         const domain::Symbol end, const Grouping grouping) {
    const domain::Position &start_pos = layout.position_of(start);
    const domain::Position &end_pos = layout.position_of(end);

    const domain::Position turn = corner(start_pos, end_pos, grouping);
    if (run_crosses_gap(layout, start_pos, turn) || run_crosses_gap(layout, turn, end_pos)) {
        return std::nullopt;
    }

    const domain::Position delta = end_pos - start_pos;
    const std::string horizontal = run(delta.x(), domain::RIGHT, domain::LEFT);
    const std::string vertical = run(delta.y(), domain::DOWN, domain::UP);

    if (grouping == Grouping::HORIZONTAL_FIRST) {
        return horizontal + vertical + domain::ACTIVATE;
    }
    return vertical + horizontal + domain::ACTIVATE;
}

}  // namespace keyrelay::planning
