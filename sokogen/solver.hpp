#ifndef SOKOGEN_SOLVER_HPP
#define SOKOGEN_SOLVER_HPP

#include "board.hpp"
#include "deadlock.hpp"
#include "state.hpp"

namespace sokogen {

const int DEFAULT_ITERATION_BUDGET = 100000;

struct SolveResult {
    bool found = false;
    Solution moves;      // valid only when found; empty = start already solved
    int iterations = 0;  // dequeues performed
    int statesSeen = 0;  // size of the visited set at exit
};

// Breadth-first search over (player, box set). The first solution found is
// a shortest one in moves. Successors that are deadlocked are pruned.
SolveResult solve(const DeadlockClassifier &classifier, const GameState &initial,
                  int budget = DEFAULT_ITERATION_BUDGET);
SolveResult solve(const Layout &layout, const GameState &initial,
                  int budget = DEFAULT_ITERATION_BUDGET);
// Malformed grids (no single player, no boxes, box count != goal count)
// are never searched.
SolveResult solve(const Grid &grid, int budget = DEFAULT_ITERATION_BUDGET);

} // namespace sokogen

#endif // SOKOGEN_SOLVER_HPP
