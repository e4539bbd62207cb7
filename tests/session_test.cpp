#include <stdexcept>

#include <gtest/gtest.h>

#include "session.hpp"

using namespace sokogen;

namespace {

const Grid kCornerLevel = {
    "#####",
    "#@  #",
    "# $.#",
    "#   #",
    "#####",
};

} // namespace

TEST(SessionTest, FollowingTheSolution) {
    PlaySession session(kCornerLevel, "DR");
    char next = 0;
    ASSERT_TRUE(session.hint(next));
    EXPECT_EQ(next, 'D');

    ASSERT_TRUE(session.move('D'));
    EXPECT_EQ(session.cursor(), 1u);
    ASSERT_TRUE(session.hint(next));
    EXPECT_EQ(next, 'R');

    ASSERT_TRUE(session.move('R'));
    EXPECT_TRUE(session.isSolved());
    EXPECT_FALSE(session.hint(next));
    EXPECT_EQ(session.moveCount(), 2);
}

TEST(SessionTest, LeavingTheSolutionRegeneratesIt) {
    PlaySession session(kCornerLevel, "DR");
    ASSERT_TRUE(session.move('R'));
    EXPECT_TRUE(session.solution().empty());

    char next = 0;
    ASSERT_TRUE(session.hint(next));
    // from (1,2): down onto the box is a push that only takes it away
    EXPECT_EQ(session.solution(), "LDR");
    EXPECT_EQ(next, 'L');
}

TEST(SessionTest, BlockedMovesChangeNothing) {
    PlaySession session(kCornerLevel, "DR");
    EXPECT_FALSE(session.move('U'));
    EXPECT_EQ(session.board(), kCornerLevel);
    EXPECT_EQ(session.historySize(), 0u);
    EXPECT_EQ(session.solution(), "DR");
    EXPECT_THROW(session.move('x'), std::invalid_argument);
}

TEST(SessionTest, UndoAndReset) {
    PlaySession session(kCornerLevel, "DR");
    EXPECT_FALSE(session.undo());
    ASSERT_TRUE(session.move('D'));
    ASSERT_TRUE(session.move('R'));
    ASSERT_TRUE(session.undo());
    EXPECT_FALSE(session.isSolved());
    EXPECT_EQ(session.moveCount(), 1);

    char next = 0;
    ASSERT_TRUE(session.hint(next));
    EXPECT_EQ(next, 'R');

    session.reset();
    EXPECT_EQ(session.board(), kCornerLevel);
    EXPECT_EQ(session.solution(), "DR");
    EXPECT_EQ(session.cursor(), 0u);
    EXPECT_EQ(session.historySize(), 0u);
}

TEST(SessionTest, HistoryIsCapped) {
    PlaySession session(kCornerLevel, "DR");
    for (int i = 0; i < 75; ++i) {
        ASSERT_TRUE(session.move('R'));
        ASSERT_TRUE(session.move('L'));
    }
    EXPECT_EQ(session.moveCount(), 150);
    EXPECT_EQ(session.historySize(), MAX_UNDO_HISTORY);
    while (session.undo()) {
    }
    EXPECT_EQ(session.moveCount(), 50);
}
