
#include "domain/keypad_replay.hh"

#include "common/check.hh"
#include "fmt/format.h"

namespace keyrelay::domain {
namespace {
Position step(const Symbol press) {
    switch (press) {
        case UP:
            return Position{0, -1};
        case DOWN:
            return Position{0, 1};
        case LEFT:
            return Position{-1, 0};
        case RIGHT:
            return Position{1, 0};
        default:
            throw UnknownSymbolError(press, directional_layout().name());
    }
}
}  // namespace

std::string replay(const Layout &layout, std::string_view presses) {
    std::string out;
    Position arm = layout.position_of(ACTIVATE);
    for (int i = 0; i < static_cast<int>(presses.size()); i++) {
        const Symbol press = presses[i];
        if (press == ACTIVATE) {
            out.push_back(layout.symbol_at(arm).value());
            continue;
        }

        arm += step(press);
        if (layout.is_gap(arm)) {
            throw GapTraversalError(
                fmt::format("Press {} ('{}') moves the arm into the gap of the {} layout", i,
                            press, layout.name()));
        }
        if (!layout.symbol_at(arm).has_value()) {
            throw std::out_of_range(fmt::format(
                "Press {} ('{}') moves the arm off the {} layout to ({}, {})", i, press,
                layout.name(), arm.x(), arm.y()));
        }
    }
    return out;
}

std::string replay_chain(std::string_view presses, const int depth) {
    KEYRELAY_CHECK(depth >= 0, "Chain depth must be non-negative", depth);
    if (depth == 0) {
        for (const Symbol symbol : presses) {
            if (!numeric_layout().contains(symbol)) {
                throw UnknownSymbolError(symbol, numeric_layout().name());
            }
        }
        return std::string(presses);
    }

    std::string typed(presses);
    for (int layer = 1; layer < depth; layer++) {
        typed = replay(directional_layout(), typed);
    }
    return replay(numeric_layout(), typed);
}

}  // namespace keyrelay::domain
