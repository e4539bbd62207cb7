#ifndef SOKOGEN_VALIDITY_HPP
#define SOKOGEN_VALIDITY_HPP

#include "board.hpp"

namespace sokogen {

enum class LevelIssue {
    None,
    Malformed,          // empty or ragged grid
    MissingPlayer,      // zero or several players
    MissingBoxesOrGoals,
    CountMismatch,      // box count != goal count
    AlreadySolved,      // every box already on a goal
    TooManyOnGoals,     // more than one box starts on a goal
    Deadlocked
};

const char *levelIssueName(LevelIssue issue);

LevelIssue validateLevel(const Grid &grid);
inline bool isValidLevel(const Grid &grid) { return validateLevel(grid) == LevelIssue::None; }

} // namespace sokogen

#endif // SOKOGEN_VALIDITY_HPP
