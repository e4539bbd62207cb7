#include "validity.hpp"
#include "deadlock.hpp"
#include "state.hpp"

using namespace std;

namespace sokogen {

const char *levelIssueName(LevelIssue issue) {
    switch (issue) {
    case LevelIssue::None:
        return "ok";
    case LevelIssue::Malformed:
        return "malformed grid";
    case LevelIssue::MissingPlayer:
        return "missing or duplicate player";
    case LevelIssue::MissingBoxesOrGoals:
        return "missing boxes or goals";
    case LevelIssue::CountMismatch:
        return "box count does not match goal count";
    case LevelIssue::AlreadySolved:
        return "already solved";
    case LevelIssue::TooManyOnGoals:
        return "more than one box starts on a goal";
    case LevelIssue::Deadlocked:
        return "deadlocked";
    }
    return "unknown";
}

LevelIssue validateLevel(const Grid &grid) {
    if (!isRectangular(grid)) return LevelIssue::Malformed;

    Layout layout;
    GameState state;
    if (!compressLevel(grid, layout, state)) return LevelIssue::MissingPlayer;
    if (state.boxes.empty() || layout.goals.empty()) return LevelIssue::MissingBoxesOrGoals;
    if (state.boxes.size() != layout.goals.size()) return LevelIssue::CountMismatch;

    int onGoals = countBoxesOnGoals(layout, state);
    if (onGoals == static_cast<int>(state.boxes.size())) return LevelIssue::AlreadySolved;
    // one box already home is fine, two or more are not
    if (onGoals > 1) return LevelIssue::TooManyOnGoals;

    DeadlockClassifier classifier(layout);
    if (classifier.hasDeadlock(state)) return LevelIssue::Deadlocked;
    return LevelIssue::None;
}

} // namespace sokogen
