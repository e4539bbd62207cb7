#ifndef SOKOGEN_DEADLOCK_HPP
#define SOKOGEN_DEADLOCK_HPP

#include <set>
#include <vector>

#include "board.hpp"
#include "state.hpp"

namespace sokogen {

enum class DeadlockKind {
    None,
    Simple, // box on a square from which no goal can be reached
    Freeze, // box immobile on both axes
    Corral  // box the player cannot get next to
};

const char *deadlockKindName(DeadlockKind kind);

// Reverse BFS from every goal over the pull relation. true = dead square.
std::vector<bool> computeSimpleDeadlocks(const Layout &layout);

// Freeze detection. `visited` guards against two boxes blocking each other.
bool isBlockedAlongAxis(const Layout &layout, const GameState &state, int y, int x,
                        bool checkHorizontal, std::set<int> &visited);
bool isFrozenBox(const Layout &layout, const GameState &state, int box);
bool hasFreezeDeadlock(const Layout &layout, const GameState &state);

// Cells the player can walk to without pushing anything.
std::vector<bool> computeReachable(const Layout &layout, const GameState &state);
bool hasCorralDeadlock(const Layout &layout, const GameState &state);

// Holds the per-layout dead square table so that it is computed once and
// shared by every state of a search or generation episode.
class DeadlockClassifier {
public:
    explicit DeadlockClassifier(const Layout &layout);

    DeadlockKind classify(const GameState &state) const;
    bool hasDeadlock(const GameState &state) const { return classify(state) != DeadlockKind::None; }

    bool isDeadSquare(int pos) const { return deadSquares[pos]; }
    const Layout &getLayout() const { return layout; }
    const std::vector<bool> &getDeadSquares() const { return deadSquares; }

private:
    Layout layout;
    std::vector<bool> deadSquares;
};

// Whole-grid verdict. A grid without player, boxes or goals counts as deadlocked.
bool hasDeadlock(const Grid &grid);

} // namespace sokogen

#endif // SOKOGEN_DEADLOCK_HPP
