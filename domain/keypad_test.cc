
#include "domain/keypad.hh"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace keyrelay::domain {

TEST(KeypadTest, directional_layout_positions) {
    // Setup
    const Layout &layout = directional_layout();

    // Action + Verification
    EXPECT_EQ(layout.size(), 5);
    EXPECT_EQ(layout.position_of(UP), Position(1, 0));
    EXPECT_EQ(layout.position_of(ACTIVATE), Position(2, 0));
    EXPECT_EQ(layout.position_of(LEFT), Position(0, 1));
    EXPECT_EQ(layout.position_of(DOWN), Position(1, 1));
    EXPECT_EQ(layout.position_of(RIGHT), Position(2, 1));
    EXPECT_TRUE(layout.is_gap(0, 0));
    EXPECT_FALSE(layout.is_gap(1, 0));
}

TEST(KeypadTest, numeric_layout_positions) {
    // Setup
    const Layout &layout = numeric_layout();

    // Action + Verification
    EXPECT_EQ(layout.size(), 11);
    EXPECT_THAT(layout.symbols(), testing::UnorderedElementsAre('0', '1', '2', '3', '4', '5', '6',
                                                                '7', '8', '9', ACTIVATE));
    EXPECT_EQ(layout.position_of('7'), Position(0, 0));
    EXPECT_EQ(layout.position_of('5'), Position(1, 1));
    EXPECT_EQ(layout.position_of('0'), Position(1, 3));
    EXPECT_EQ(layout.position_of(ACTIVATE), Position(2, 3));
    EXPECT_EQ(layout.gap(), Position(0, 3));
    EXPECT_TRUE(layout.is_gap(Position(0, 3)));
}

TEST(KeypadTest, indices_are_dense_and_row_major) {
    // Setup
    const Layout &layout = directional_layout();

    // Action + Verification
    for (int i = 0; i < layout.size(); i++) {
        EXPECT_EQ(layout.index_of(layout.symbols().at(i)), i);
    }
    EXPECT_EQ(layout.index_of(UP), 0);
    EXPECT_EQ(layout.index_of(RIGHT), 4);
}

TEST(KeypadTest, unknown_symbol_throws) {
    // Setup
    const Layout &directional = directional_layout();
    const Layout &numeric = numeric_layout();

    // Action + Verification
    EXPECT_THROW(directional.position_of('7'), UnknownSymbolError);
    EXPECT_THROW(numeric.position_of(UP), UnknownSymbolError);
    EXPECT_THROW(numeric.index_of(GAP_MARKER), UnknownSymbolError);
    EXPECT_FALSE(numeric.contains('B'));
    try {
        numeric.position_of('B');
        FAIL() << "Expected UnknownSymbolError";
    } catch (const UnknownSymbolError &e) {
        EXPECT_EQ(e.symbol(), 'B');
        EXPECT_THAT(e.what(), testing::HasSubstr("numeric"));
    }
}

TEST(KeypadTest, symbol_at_skips_gap_and_off_pad_cells) {
    // Setup
    const Layout &layout = numeric_layout();

    // Action + Verification
    EXPECT_EQ(layout.symbol_at(Position(2, 2)), std::make_optional('3'));
    EXPECT_EQ(layout.symbol_at(Position(0, 3)), std::nullopt);
    EXPECT_EQ(layout.symbol_at(Position(3, 0)), std::nullopt);
    EXPECT_EQ(layout.symbol_at(Position(-1, 0)), std::nullopt);
}

TEST(KeypadTest, malformed_rows_are_rejected) {
    // Action + Verification
    EXPECT_THROW(Layout::from_rows("no_gap", {"12", "34"}), std::invalid_argument);
    EXPECT_THROW(Layout::from_rows("two_gaps", {" 1", "2 "}), std::invalid_argument);
    EXPECT_THROW(Layout::from_rows("repeat", {" 1", "11"}), std::invalid_argument);
}

TEST(KeypadTest, custom_layout_round_trips_positions) {
    // Setup
    const Layout layout = Layout::from_rows("tiny", {"A^", "> "});

    // Action + Verification
    EXPECT_EQ(layout.name(), "tiny");
    EXPECT_EQ(layout.gap(), Position(1, 1));
    EXPECT_EQ(layout.position_of(RIGHT), Position(0, 1));
    EXPECT_EQ(layout.symbol_at(Position(1, 0)), std::make_optional(UP));
}

}  // namespace keyrelay::domain
