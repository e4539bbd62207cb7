#include <algorithm>
#include <queue>
#include <unordered_set>
#include <vector>

#include "solver.hpp"

using namespace std;

namespace {

// Walk the parent links back to the root, collecting the move used at each
// step, then flip the result into start -> goal order.
sokogen::Solution buildSolutionPath(int idx, const vector<int> &parents, const vector<char> &moveDirs) {
    sokogen::Solution path;
    while (idx > 0) {
        path.push_back(moveDirs[idx]);
        idx = parents[idx];
    }
    reverse(path.begin(), path.end());
    return path;
}

} // namespace

namespace sokogen {

SolveResult solve(const DeadlockClassifier &classifier, const GameState &initial, int budget) {
    const Layout &layout = classifier.getLayout();
    SolveResult result;

    if (isSolvedCompact(layout, initial)) {
        result.found = true;
        result.statesSeen = 1;
        return result;
    }

    // node i: states[i], reached from parents[i] with moveDirs[i]
    vector<GameState> states;
    vector<int> parents;
    vector<char> moveDirs;
    unordered_set<GameState, GameStateHash> visited;

    states.push_back(initial);
    parents.push_back(-1);
    moveDirs.push_back('?');
    visited.insert(initial);

    queue<int> q;
    q.push(0);

    while (!q.empty() && result.iterations < budget) {
        int currentIdx = q.front();
        q.pop();
        ++result.iterations;

        for (int dir = 0; dir < NUM_DIRS; ++dir) {
            GameState next;
            if (!tryMove(layout, states[currentIdx], dir, next)) {
                continue;
            }
            if (visited.count(next)) {
                continue;
            }
            if (isSolvedCompact(layout, next)) {
                result.found = true;
                result.moves = buildSolutionPath(currentIdx, parents, moveDirs);
                result.moves.push_back(directions[dir]);
                result.statesSeen = static_cast<int>(visited.size());
                return result;
            }
            // deadlocked successors are dropped before they reach the queue
            if (classifier.hasDeadlock(next)) {
                continue;
            }
            visited.insert(next);
            states.push_back(std::move(next));
            parents.push_back(currentIdx);
            moveDirs.push_back(directions[dir]);
            q.push(static_cast<int>(states.size()) - 1);
        }
    }

    result.statesSeen = static_cast<int>(visited.size());
    return result;
}

SolveResult solve(const Layout &layout, const GameState &initial, int budget) {
    DeadlockClassifier classifier(layout);
    return solve(classifier, initial, budget);
}

SolveResult solve(const Grid &grid, int budget) {
    Layout layout;
    GameState state;
    if (!compressLevel(grid, layout, state)) {
        return SolveResult{};
    }
    if (state.boxes.empty() || state.boxes.size() != layout.goals.size()) {
        return SolveResult{};
    }
    return solve(layout, state, budget);
}

} // namespace sokogen
