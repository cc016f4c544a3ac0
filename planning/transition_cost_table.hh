#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common/indexed_array.hh"
#include "domain/keypad.hh"
#include "wise_enum.h"

namespace keyrelay::planning {

using PressCount = std::uint64_t;

// Which keypad an operator types on. Every layer in a chain steers the layer below it with the
// directional pad, except for the outermost layer which types the target on the numeric pad.
WISE_ENUM_CLASS(Pad, DIRECTIONAL, NUMERIC)

class UnreachableTransitionError : public std::runtime_error {
   public:
    UnreachableTransitionError(const domain::Symbol start, const domain::Symbol end,
                               const std::string &layout_name);
};

class PressCountOverflowError : public std::overflow_error {
   public:
    using std::overflow_error::overflow_error;
};

// Throws PressCountOverflowError instead of wrapping
PressCount checked_add(const PressCount a, const PressCount b);
PressCount checked_multiply(const PressCount a, const PressCount b);

struct CostTableOptions {
    // Number of worker threads used to fill the pairs of a layer. 0 fills on the caller.
    int num_threads = 0;
};

// Minimal physical press counts for every ordered pair of keys at every layer of a chain.
//
// cost(L, pad, s, e) is the number of presses the physical hand at layer 0 has to make so that
// the operator at layer L moves its arm from s to e on `pad` and presses e. Layer 0 is the hand
// itself, every transition there costs exactly one press and nothing is stored for it. Layer L
// is computed only from layer L - 1, so layers are filled in increasing order and never change
// afterwards.
//
// Both pads are stored for every layer. A chain of depth N reads the numeric table at layer N,
// so a table extended to some maximum depth answers queries for any shallower chain.
class TransitionCostTable {
   public:
    // Uses the standard directional and numeric layouts
    static TransitionCostTable build(const int max_depth, const CostTableOptions &options = {});

    // `directional` must contain every directional symbol since it is used to steer every layer.
    // Both layouts must outlive the table.
    TransitionCostTable(const domain::Layout &directional, const domain::Layout &numeric,
                        const CostTableOptions &options = {});

    // Computes every layer up to and including `max_depth`. Layers that already exist are left
    // untouched. Throws UnreachableTransitionError or PressCountOverflowError, in which case the
    // layers completed before the failing one are kept.
    void extend(const int max_depth);

    int max_depth() const { return max_depth_; }

    const domain::Layout &layout(const Pad pad) const { return *layouts_[pad]; }

    // Throws domain::UnknownSymbolError if either symbol is not on the pad
    PressCount cost(const int layer, const Pad pad, const domain::Symbol start,
                    const domain::Symbol end) const;

    // Sum of the transition costs along "A" + sequence, i.e. the presses needed for the operator
    // at `layer` to type `sequence` starting with its arm on the activate key.
    PressCount sequence_cost(const int layer, const Pad pad, std::string_view sequence) const;

    // Read only view of a finalized layer, row major by start symbol index
    std::span<const PressCount> layer_view(const int layer, const Pad pad) const;

   private:
    using LayerTables = std::vector<std::vector<PressCount>>;

    PressCount compute_cost(const int layer, const Pad pad, const domain::Symbol start,
                            const domain::Symbol end) const;
    void fill_row(const int layer, const Pad pad, const int start_idx,
                  std::vector<PressCount> &row_major_table) const;

    IndexedArray<const domain::Layout *, Pad> layouts_;
    CostTableOptions options_;
    int max_depth_;
    // tables_[pad][layer - 1] holds |alphabet|^2 entries
    IndexedArray<LayerTables, Pad> tables_;
};

}  // namespace keyrelay::planning
