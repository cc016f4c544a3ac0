#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Eigen/Core"

namespace keyrelay::domain {

using Symbol = char;
using Position = Eigen::Vector2i;

// The key every arm rests on before the first press and that emits a symbol when pressed
constexpr Symbol ACTIVATE = 'A';
constexpr Symbol UP = '^';
constexpr Symbol DOWN = 'v';
constexpr Symbol LEFT = '<';
constexpr Symbol RIGHT = '>';

// Marks the gap cell in the rows passed to Layout::from_rows
constexpr Symbol GAP_MARKER = ' ';

class UnknownSymbolError : public std::out_of_range {
   public:
    UnknownSymbolError(const Symbol symbol, const std::string &layout_name);
    Symbol symbol() const { return symbol_; }

   private:
    Symbol symbol_;
};

// A keypad: a fixed alphabet of symbols on an integer grid with exactly one forbidden cell.
// x grows to the right and y grows downwards. Symbols are assigned dense indices in row-major
// order so that per-layout tables can be stored as flat arrays.
class Layout {
   public:
    // Each row is read left to right. The GAP_MARKER character marks the gap cell.
    // Throws std::invalid_argument if there isn't exactly one gap or if a symbol repeats.
    static Layout from_rows(std::string name, const std::vector<std::string_view> &rows);

    const std::string &name() const { return name_; }

    // Throws UnknownSymbolError if the symbol is not on this layout
    const Position &position_of(const Symbol symbol) const;

    // Throws UnknownSymbolError if the symbol is not on this layout
    int index_of(const Symbol symbol) const;

    bool contains(const Symbol symbol) const { return index_from_symbol_.contains(symbol); }
    bool is_gap(const int x, const int y) const { return gap_.x() == x && gap_.y() == y; }
    bool is_gap(const Position &pos) const { return pos == gap_; }

    // Returns nullopt for the gap cell and for cells off the keypad
    std::optional<Symbol> symbol_at(const Position &pos) const;

    const Position &gap() const { return gap_; }
    const std::vector<Symbol> &symbols() const { return symbols_; }
    int size() const { return static_cast<int>(symbols_.size()); }

   private:
    Layout(std::string name, std::vector<Symbol> symbols, std::vector<Position> positions,
           Position gap);

    std::string name_;
    std::vector<Symbol> symbols_;
    std::vector<Position> positions_;
    std::unordered_map<Symbol, int> index_from_symbol_;
    Position gap_;
};

//     +---+---+
//     | ^ | A |
// +---+---+---+
// | < | v | > |
// +---+---+---+
const Layout &directional_layout();

// +---+---+---+
// | 7 | 8 | 9 |
// +---+---+---+
// | 4 | 5 | 6 |
// +---+---+---+
// | 1 | 2 | 3 |
// +---+---+---+
//     | 0 | A |
//     +---+---+
const Layout &numeric_layout();

}  // namespace keyrelay::domain
