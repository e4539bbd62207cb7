#include <algorithm>
#include <unordered_set>

#include <gtest/gtest.h>

#include "state.hpp"

using namespace sokogen;

TEST(StateTest, CompressAndDecompress) {
    Grid level = {
        "######",
        "#+ $ #",
        "# *$.#",
        "#  . #",
        "######",
    };
    Layout layout;
    GameState state;
    ASSERT_TRUE(compressLevel(level, layout, state));
    EXPECT_EQ(layout.rows, 5);
    EXPECT_EQ(layout.cols, 6);
    EXPECT_EQ(state.player, layout.encodePos(1, 1));
    EXPECT_EQ(state.boxes, std::vector<int>({layout.encodePos(1, 3), layout.encodePos(2, 2), layout.encodePos(2, 3)}));
    EXPECT_EQ(layout.goals.size(), 4u);
    EXPECT_EQ(countBoxesOnGoals(layout, state), 1);
    EXPECT_EQ(decompressState(layout, state), level);
}

TEST(StateTest, CompressFailsWithoutPlayer) {
    Layout layout;
    GameState state;
    EXPECT_FALSE(compressLevel({"#####", "#$ .#", "#####"}, layout, state));
}

TEST(StateTest, OutOfBoundsIsWall) {
    Layout layout = extractLayout({"@ $."});
    EXPECT_TRUE(layout.isWall(-1, 0));
    EXPECT_TRUE(layout.isWall(0, 4));
    EXPECT_FALSE(layout.isWall(0, 1));
}

TEST(StateTest, EqualStatesHashEqual) {
    GameState a{7, {8, 12}};
    GameState b{7, {8, 12}};
    GameState c{8, {8, 12}};
    GameStateHash hash;
    EXPECT_EQ(a, b);
    EXPECT_EQ(hash(a), hash(b));
    EXPECT_NE(a, c);

    std::unordered_set<GameState, GameStateHash> seen = {a, b, c};
    EXPECT_EQ(seen.size(), 2u);
}

TEST(StateTest, PushKeepsBoxesSorted) {
    Grid level = {
        "######",
        "#  . #",
        "#@$$.#",
        "#    #",
        "######",
    };
    Layout layout;
    GameState state;
    ASSERT_TRUE(compressLevel(level, layout, state));

    GameState next;
    bool pushed = true;
    // two boxes in a row cannot be pushed
    EXPECT_FALSE(tryMove(layout, state, dirIndexFromChar('R'), next));
    ASSERT_TRUE(tryMove(layout, state, dirIndexFromChar('D'), next, &pushed));
    EXPECT_FALSE(pushed);

    GameState moved;
    ASSERT_TRUE(tryMove(layout, next, dirIndexFromChar('R'), moved));
    ASSERT_TRUE(tryMove(layout, moved, dirIndexFromChar('U'), next, &pushed));
    EXPECT_TRUE(pushed);
    EXPECT_EQ(next.boxes, std::vector<int>({layout.encodePos(1, 2), layout.encodePos(2, 3)}));
    EXPECT_TRUE(std::is_sorted(next.boxes.begin(), next.boxes.end()));
}

TEST(StateTest, SolvedCompact) {
    Layout layout;
    GameState state;
    ASSERT_TRUE(compressLevel({"#####", "#@**#", "#####"}, layout, state));
    EXPECT_TRUE(isSolvedCompact(layout, state));

    ASSERT_TRUE(compressLevel({"#####", "#@*.#", "#####"}, layout, state));
    EXPECT_FALSE(isSolvedCompact(layout, state));
}
