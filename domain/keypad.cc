
#include "domain/keypad.hh"

#include <algorithm>
#include <optional>

#include "fmt/format.h"

namespace keyrelay::domain {

UnknownSymbolError::UnknownSymbolError(const Symbol symbol, const std::string &layout_name)
    : std::out_of_range(
          fmt::format("Symbol '{}' is not part of the {} layout", symbol, layout_name)),
      symbol_(symbol) {}

Layout Layout::from_rows(std::string name, const std::vector<std::string_view> &rows) {
    std::vector<Symbol> symbols;
    std::vector<Position> positions;
    std::optional<Position> maybe_gap;

    for (int y = 0; y < static_cast<int>(rows.size()); y++) {
        const std::string_view &row = rows.at(y);
        for (int x = 0; x < static_cast<int>(row.size()); x++) {
            const Symbol symbol = row[x];
            if (symbol == GAP_MARKER) {
                if (maybe_gap.has_value()) {
                    throw std::invalid_argument(fmt::format(
                        "Layout {} has more than one gap cell ({}, {}) and ({}, {})", name,
                        maybe_gap->x(), maybe_gap->y(), x, y));
                }
                maybe_gap = Position{x, y};
                continue;
            }

            if (std::find(symbols.begin(), symbols.end(), symbol) != symbols.end()) {
                throw std::invalid_argument(
                    fmt::format("Layout {} repeats symbol '{}'", name, symbol));
            }
            symbols.push_back(symbol);
            positions.push_back(Position{x, y});
        }
    }

    if (!maybe_gap.has_value()) {
        throw std::invalid_argument(fmt::format("Layout {} has no gap cell", name));
    }

    return Layout(std::move(name), std::move(symbols), std::move(positions), maybe_gap.value());
}

Layout::Layout(std::string name, std::vector<Symbol> symbols, std::vector<Position> positions,
               Position gap)
    : name_(std::move(name)),
      symbols_(std::move(symbols)),
      positions_(std::move(positions)),
      gap_(std::move(gap)) {
    for (int i = 0; i < static_cast<int>(symbols_.size()); i++) {
        index_from_symbol_[symbols_.at(i)] = i;
    }
}

const Position &Layout::position_of(const Symbol symbol) const {
    return positions_.at(index_of(symbol));
}

int Layout::index_of(const Symbol symbol) const {
    const auto iter = index_from_symbol_.find(symbol);
    if (iter == index_from_symbol_.end()) {
        throw UnknownSymbolError(symbol, name_);
    }
    return iter->second;
}

std::optional<Symbol> Layout::symbol_at(const Position &pos) const {
    const auto iter = std::find(positions_.begin(), positions_.end(), pos);
    if (iter == positions_.end()) {
        return std::nullopt;
    }
    return symbols_.at(std::distance(positions_.begin(), iter));
}

const Layout &directional_layout() {
    static const Layout layout = Layout::from_rows("directional", {" ^A", "<v>"});
    return layout;
}

const Layout &numeric_layout() {
    static const Layout layout = Layout::from_rows("numeric", {"789", "456", "123", " 0A"});
    return layout;
}

}  // namespace keyrelay::domain
