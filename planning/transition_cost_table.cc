
#include "planning/transition_cost_table.hh"

#include <deque>
#include <exception>
#include <limits>
#include <memory>
#include <optional>

#include "BS_thread_pool.hpp"
#include "common/check.hh"
#include "fmt/format.h"
#include "planning/keypad_moves.hh"

namespace keyrelay::planning {

UnreachableTransitionError::UnreachableTransitionError(const domain::Symbol start,
                                                       const domain::Symbol end,
                                                       const std::string &layout_name)
    : std::runtime_error(fmt::format(
          "Both groupings from '{}' to '{}' on the {} layout cross the gap cell", start, end,
          layout_name)) {}

PressCount checked_add(const PressCount a, const PressCount b) {
    if (a > std::numeric_limits<PressCount>::max() - b) {
        throw PressCountOverflowError(fmt::format("Press count overflow adding {} + {}", a, b));
    }
    return a + b;
}

PressCount checked_multiply(const PressCount a, const PressCount b) {
    if (a != 0 && b > std::numeric_limits<PressCount>::max() / a) {
        throw PressCountOverflowError(
            fmt::format("Press count overflow multiplying {} * {}", a, b));
    }
    return a * b;
}

TransitionCostTable TransitionCostTable::build(const int max_depth,
                                               const CostTableOptions &options) {
    TransitionCostTable table(domain::directional_layout(), domain::numeric_layout(), options);
    table.extend(max_depth);
    return table;
}

TransitionCostTable::TransitionCostTable(const domain::Layout &directional,
                                         const domain::Layout &numeric,
                                         const CostTableOptions &options)
    : layouts_{{Pad::DIRECTIONAL, &directional}, {Pad::NUMERIC, &numeric}},
      options_(options),
      max_depth_(0) {
    for (const domain::Symbol symbol :
         {domain::UP, domain::DOWN, domain::LEFT, domain::RIGHT, domain::ACTIVATE}) {
        KEYRELAY_CHECK(directional.contains(symbol), "Steering layout is missing a symbol",
                       directional.name(), symbol);
    }
    KEYRELAY_CHECK(options_.num_threads >= 0, "num_threads must be non-negative",
                   options_.num_threads);
}

void TransitionCostTable::extend(const int max_depth) {
    KEYRELAY_CHECK(max_depth >= 0, "Depth must be non-negative", max_depth);
    if (max_depth <= max_depth_) {
        return;
    }

    std::unique_ptr<BS::thread_pool> pool;
    if (options_.num_threads > 0) {
        pool = std::make_unique<BS::thread_pool>(static_cast<std::size_t>(options_.num_threads));
    }

    for (int layer = max_depth_ + 1; layer <= max_depth; layer++) {
        IndexedArray<std::vector<PressCount>, Pad> new_layer;
        // One slot per submitted row, set if that row threw. A deque keeps the slots in place
        // while rows are still being submitted.
        std::deque<std::exception_ptr> row_errors;
        for (const auto &pad_and_name : wise_enum::range<Pad>) {
            const Pad pad = pad_and_name.value;
            std::vector<PressCount> &table = new_layer[pad];
            const int num_symbols = layout(pad).size();
            table.resize(num_symbols * num_symbols);
            for (int start_idx = 0; start_idx < num_symbols; start_idx++) {
                if (pool == nullptr) {
                    fill_row(layer, pad, start_idx, table);
                } else {
                    row_errors.emplace_back();
                    pool->detach_task(
                        [this, layer, pad, start_idx, &table, &error = row_errors.back()]() {
                            try {
                                fill_row(layer, pad, start_idx, table);
                            } catch (...) {
                                error = std::current_exception();
                            }
                        });
                }
            }
        }
        if (pool != nullptr) {
            // Every row of this layer has to land before the next layer reads it
            pool->wait();
        }
        for (const std::exception_ptr &error : row_errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }

        // Only publish the layer once it is complete
        for (auto &&[pad, table] : new_layer) {
            tables_[pad].push_back(std::move(table));
        }
        max_depth_ = layer;
    }
}

PressCount TransitionCostTable::cost(const int layer, const Pad pad, const domain::Symbol start,
                                     const domain::Symbol end) const {
    KEYRELAY_CHECK(layer >= 0 && layer <= max_depth_, "Layer has not been computed", layer,
                   max_depth_);
    const domain::Layout &pad_layout = layout(pad);
    const int start_idx = pad_layout.index_of(start);
    const int end_idx = pad_layout.index_of(end);
    if (layer == 0) {
        return 1;
    }
    return tables_[pad].at(layer - 1).at(start_idx * pad_layout.size() + end_idx);
}

PressCount TransitionCostTable::sequence_cost(const int layer, const Pad pad,
                                              std::string_view sequence) const {
    PressCount total = 0;
    domain::Symbol prev = domain::ACTIVATE;
    for (const domain::Symbol symbol : sequence) {
        total = checked_add(total, cost(layer, pad, prev, symbol));
        prev = symbol;
    }
    return total;
}

std::span<const PressCount> TransitionCostTable::layer_view(const int layer, const Pad pad) const {
    KEYRELAY_CHECK(layer >= 1 && layer <= max_depth_, "Layer has no stored table", layer,
                   max_depth_);
    return tables_[pad].at(layer - 1);
}

PressCount TransitionCostTable::compute_cost(const int layer, const Pad pad,
                                             const domain::Symbol start,
                                             const domain::Symbol end) const {
    std::optional<PressCount> best;
    for (const auto &[grouping, _] : wise_enum::range<Grouping>) {
        const std::optional<std::string> maybe_moves =
            move_sequence(layout(pad), start, end, grouping);
        if (!maybe_moves.has_value()) {
            continue;
        }
        // The operator below steers this one with the directional pad
        const PressCount candidate = sequence_cost(layer - 1, Pad::DIRECTIONAL, *maybe_moves);
        if (!best.has_value() || candidate < best.value()) {
            best = candidate;
        }
    }

    if (!best.has_value()) {
        throw UnreachableTransitionError(start, end, layout(pad).name());
    }
    return best.value();
}

void TransitionCostTable::fill_row(const int layer, const Pad pad, const int start_idx,
                                   std::vector<PressCount> &row_major_table) const {
    const domain::Layout &pad_layout = layout(pad);
    const domain::Symbol start = pad_layout.symbols().at(start_idx);
    for (int end_idx = 0; end_idx < pad_layout.size(); end_idx++) {
        const domain::Symbol end = pad_layout.symbols().at(end_idx);
        row_major_table.at(start_idx * pad_layout.size() + end_idx) =
            compute_cost(layer, pad, start, end);
    }
}

}  // namespace keyrelay::planning
