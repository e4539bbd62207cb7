#include <gtest/gtest.h>

#include "fallback_bank.hpp"
#include "validity.hpp"

using namespace sokogen;

TEST(ValidityTest, AcceptsPlayableLevel) {
    Grid level = {
        "#####",
        "#@  #",
        "# $.#",
        "#   #",
        "#####",
    };
    EXPECT_EQ(validateLevel(level), LevelIssue::None);
    EXPECT_TRUE(isValidLevel(level));
}

TEST(ValidityTest, RejectsAllBoxesOnGoals) {
    EXPECT_EQ(validateLevel({"######", "#@** #", "######"}), LevelIssue::AlreadySolved);
}

TEST(ValidityTest, RejectsCountMismatch) {
    EXPECT_EQ(validateLevel({
                  "######",
                  "#    #",
                  "#@$$.#",
                  "#    #",
                  "######",
              }),
              LevelIssue::CountMismatch);
}

TEST(ValidityTest, RejectsTooManyPrePlacedBoxes) {
    EXPECT_EQ(validateLevel({
                  "#######",
                  "#     #",
                  "# *   #",
                  "#  *$ #",
                  "#   . #",
                  "#   @ #",
                  "#######",
              }),
              LevelIssue::TooManyOnGoals);

    // a single box already home is fine
    EXPECT_EQ(validateLevel({
                  "#######",
                  "#     #",
                  "# *   #",
                  "#  $$ #",
                  "#   . #",
                  "#  .@ #",
                  "#######",
              }),
              LevelIssue::None);
}

TEST(ValidityTest, RejectsMissingPieces) {
    EXPECT_EQ(validateLevel({}), LevelIssue::Malformed);
    EXPECT_EQ(validateLevel({"#####", "#@$.", "#####"}), LevelIssue::Malformed);
    EXPECT_EQ(validateLevel({"#####", "# $.#", "#####"}), LevelIssue::MissingPlayer);
    EXPECT_EQ(validateLevel({"#####", "#@@.#", "#####"}), LevelIssue::MissingPlayer);
    EXPECT_EQ(validateLevel({"#####", "#@ .#", "#####"}), LevelIssue::MissingBoxesOrGoals);
}

TEST(ValidityTest, RejectsDeadlock) {
    EXPECT_EQ(validateLevel({
                  "#####",
                  "#$ .#",
                  "# @ #",
                  "#####",
              }),
              LevelIssue::Deadlocked);
}

TEST(ValidityTest, BankLevelsAreValid) {
    for (const BankEntry &entry : fallbackLevels()) {
        EXPECT_TRUE(isValidLevel(entry.grid)) << entry.name << ": " << levelIssueName(validateLevel(entry.grid));
    }
    EXPECT_TRUE(isValidLevel(emergencyLevel().grid));
}
