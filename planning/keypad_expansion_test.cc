
#include "planning/keypad_expansion.hh"

#include <algorithm>
#include <string>
#include <vector>

#include "domain/keypad.hh"
#include "domain/keypad_replay.hh"
#include "gtest/gtest.h"
#include "planning/keypad_moves.hh"
#include "planning/press_counter.hh"

namespace keyrelay::planning {
namespace {
const std::vector<std::string> EXAMPLE_CODES = {"029A", "980A", "179A", "456A", "379A"};

// Every way of typing `sequence` on `pad` one layer down, one grouping choice per transition
std::vector<std::string> all_one_layer_expansions(const domain::Layout &pad,
                                                  const std::string &sequence) {
    std::vector<std::string> out = {""};
    domain::Symbol prev = domain::ACTIVATE;
    for (const domain::Symbol symbol : sequence) {
        std::vector<std::string> options;
        for (const auto &[grouping, _] : wise_enum::range<Grouping>) {
            const auto maybe_moves = move_sequence(pad, prev, symbol, grouping);
            if (maybe_moves.has_value() &&
                std::find(options.begin(), options.end(), *maybe_moves) == options.end()) {
                options.push_back(*maybe_moves);
            }
        }
        std::vector<std::string> extended;
        for (const auto &prefix : out) {
            for (const auto &option : options) {
                extended.push_back(prefix + option);
            }
        }
        out = std::move(extended);
        prev = symbol;
    }
    return out;
}

// Enumerates every complete press string through the whole chain and returns the shortest length
std::size_t shortest_exhaustive_expansion(const std::string &target, const int depth) {
    std::vector<std::string> frontier = {target};
    for (int layer = depth; layer >= 1; layer--) {
        const domain::Layout &pad =
            layer == depth ? domain::numeric_layout() : domain::directional_layout();
        std::vector<std::string> next;
        for (const auto &sequence : frontier) {
            const auto expansions = all_one_layer_expansions(pad, sequence);
            next.insert(next.end(), expansions.begin(), expansions.end());
        }
        frontier = std::move(next);
    }
    const auto iter = std::min_element(
        frontier.begin(), frontier.end(),
        [](const std::string &a, const std::string &b) { return a.size() < b.size(); });
    return iter->size();
}
}  // namespace

TEST(KeypadExpansionTest, first_layer_expansion) {
    // Action
    const std::string presses = expand_presses("029A", 1);

    // Verification
    EXPECT_EQ(presses.size(), 12);
    EXPECT_EQ(domain::replay(domain::numeric_layout(), presses), "029A");
}

TEST(KeypadExpansionTest, expansion_length_matches_table_and_types_the_code) {
    // Setup
    constexpr int MAX_DEPTH = 4;
    PressCounter counter;

    // Action + Verification
    for (const auto &code : EXAMPLE_CODES) {
        for (int depth = 0; depth <= MAX_DEPTH; depth++) {
            const std::string presses = expand_presses(code, depth);
            EXPECT_EQ(presses.size(), counter.count(code, depth))
                << "code: " << code << " depth: " << depth;
            EXPECT_EQ(domain::replay_chain(presses, depth), code)
                << "code: " << code << " depth: " << depth;
        }
    }
}

TEST(KeypadExpansionTest, exhaustive_search_agrees_with_table) {
    // Setup
    constexpr int MAX_DEPTH = 3;
    PressCounter counter;

    // Action + Verification
    for (const auto &code : EXAMPLE_CODES) {
        for (int depth = 0; depth <= MAX_DEPTH; depth++) {
            EXPECT_EQ(shortest_exhaustive_expansion(code, depth), counter.count(code, depth))
                << "code: " << code << " depth: " << depth;
        }
    }
}

TEST(KeypadExpansionTest, depth_zero_returns_target) {
    // Action + Verification
    EXPECT_EQ(expand_presses("179A", 0), "179A");
    EXPECT_THROW(expand_presses("1^9A", 0), domain::UnknownSymbolError);
}

TEST(KeypadExpansionTest, rejects_depths_out_of_range) {
    // Action + Verification
    EXPECT_THROW(expand_presses("029A", -1), std::invalid_argument);
    EXPECT_THROW(expand_presses("029A", 7), std::invalid_argument);
    EXPECT_THROW(expand_presses("029A", 3, {.max_depth = 2}), std::invalid_argument);
}

}  // namespace keyrelay::planning
