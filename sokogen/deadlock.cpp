#include <queue>

#include "deadlock.hpp"

using namespace std;

namespace sokogen {

const char *deadlockKindName(DeadlockKind kind) {
    switch (kind) {
    case DeadlockKind::None:
        return "none";
    case DeadlockKind::Simple:
        return "simple";
    case DeadlockKind::Freeze:
        return "freeze";
    case DeadlockKind::Corral:
        return "corral";
    }
    return "unknown";
}

// Simple deadlocks only depend on walls and goals.
// goalReachable[c] == true: a box standing on c could (ignoring every other
// box) be pushed onto some goal. Everything else that is not a wall is dead.
vector<bool> computeSimpleDeadlocks(const Layout &layout) {
    int total = layout.rows * layout.cols;
    vector<bool> goalReachable(total, false);
    queue<int> q;
    for (int g : layout.goals) {
        goalReachable[g] = true;
        q.push(g);
    }

    while (!q.empty()) {
        int pos = q.front();
        q.pop();
        auto [y, x] = layout.decodePos(pos);
        for (int dir = 0; dir < NUM_DIRS; ++dir) {
            // box one step away, player standing behind it to push it back here
            int boxY = y + dy[dir];
            int boxX = x + dx[dir];
            int playerY = boxY + dy[dir];
            int playerX = boxX + dx[dir];
            if (!layout.isWithin(boxY, boxX) || !layout.isWithin(playerY, playerX)) {
                continue;
            }
            if (layout.isWall(boxY, boxX) || layout.isWall(playerY, playerX)) {
                continue;
            }
            int boxPos = layout.encodePos(boxY, boxX);
            if (!goalReachable[boxPos]) {
                goalReachable[boxPos] = true;
                q.push(boxPos);
            }
        }
    }

    vector<bool> dead(total, false);
    for (int pos = 0; pos < total; ++pos) {
        if (!layout.wall[pos] && !layout.goal[pos] && !goalReachable[pos]) {
            dead[pos] = true;
        }
    }
    return dead;
}

// A box is blocked along an axis when both neighbours on that axis are walls
// or boxes that are themselves blocked along the other axis.
bool isBlockedAlongAxis(const Layout &layout, const GameState &state, int y, int x,
                        bool checkHorizontal, set<int> &visited) {
    int pos = layout.encodePos(y, x);
    // already on the current chain: treat as wall
    if (visited.count(pos)) {
        return true;
    }
    visited.insert(pos);

    // a box on a goal never blocks anything
    if (layout.isGoal(pos)) {
        return false;
    }

    if (checkHorizontal) {
        bool leftBlocked = false;
        bool rightBlocked = false;

        if (layout.isWall(y, x - 1)) {
            leftBlocked = true;
        } else if (hasBox(state, layout.encodePos(y, x - 1))) {
            leftBlocked = isBlockedAlongAxis(layout, state, y, x - 1, false, visited);
        }
        if (!leftBlocked) return false;

        if (layout.isWall(y, x + 1)) {
            rightBlocked = true;
        } else if (hasBox(state, layout.encodePos(y, x + 1))) {
            rightBlocked = isBlockedAlongAxis(layout, state, y, x + 1, false, visited);
        }
        return rightBlocked;
    } else {
        bool upBlocked = false;
        bool downBlocked = false;

        if (layout.isWall(y - 1, x)) {
            upBlocked = true;
        } else if (hasBox(state, layout.encodePos(y - 1, x))) {
            upBlocked = isBlockedAlongAxis(layout, state, y - 1, x, true, visited);
        }
        if (!upBlocked) return false;

        if (layout.isWall(y + 1, x)) {
            downBlocked = true;
        } else if (hasBox(state, layout.encodePos(y + 1, x))) {
            downBlocked = isBlockedAlongAxis(layout, state, y + 1, x, true, visited);
        }
        return downBlocked;
    }
}

bool isFrozenBox(const Layout &layout, const GameState &state, int box) {
    if (layout.isGoal(box)) return false;
    auto [y, x] = layout.decodePos(box);

    set<int> visited;
    bool frozenH = isBlockedAlongAxis(layout, state, y, x, true, visited);
    if (!frozenH) return false;

    visited.clear();
    bool frozenV = isBlockedAlongAxis(layout, state, y, x, false, visited);
    return frozenV;
}

bool hasFreezeDeadlock(const Layout &layout, const GameState &state) {
    for (int box : state.boxes) {
        if (isFrozenBox(layout, state, box)) {
            return true;
        }
    }
    return false;
}

vector<bool> computeReachable(const Layout &layout, const GameState &state) {
    vector<bool> reachable(layout.rows * layout.cols, false);
    if (state.player < 0) return reachable;

    queue<int> q;
    reachable[state.player] = true;
    q.push(state.player);
    while (!q.empty()) {
        int pos = q.front();
        q.pop();
        auto [y, x] = layout.decodePos(pos);
        for (int dir = 0; dir < NUM_DIRS; ++dir) {
            int ny = y + dy[dir];
            int nx = x + dx[dir];
            if (layout.isWall(ny, nx)) continue;
            int npos = layout.encodePos(ny, nx);
            if (reachable[npos] || hasBox(state, npos)) continue;
            reachable[npos] = true;
            q.push(npos);
        }
    }
    return reachable;
}

bool hasCorralDeadlock(const Layout &layout, const GameState &state) {
    vector<bool> reachable = computeReachable(layout, state);
    for (int box : state.boxes) {
        if (layout.isGoal(box)) continue;
        auto [y, x] = layout.decodePos(box);
        bool accessible = false;
        for (int dir = 0; dir < NUM_DIRS && !accessible; ++dir) {
            int ny = y + dy[dir];
            int nx = x + dx[dir];
            if (layout.isWithin(ny, nx) && reachable[layout.encodePos(ny, nx)]) {
                accessible = true;
            }
        }
        if (!accessible) return true;
    }
    return false;
}

DeadlockClassifier::DeadlockClassifier(const Layout &layout)
    : layout(layout), deadSquares(computeSimpleDeadlocks(layout)) {}

DeadlockKind DeadlockClassifier::classify(const GameState &state) const {
    for (int box : state.boxes) {
        if (deadSquares[box]) return DeadlockKind::Simple;
    }
    if (hasFreezeDeadlock(layout, state)) return DeadlockKind::Freeze;
    if (hasCorralDeadlock(layout, state)) return DeadlockKind::Corral;
    return DeadlockKind::None;
}

bool hasDeadlock(const Grid &grid) {
    Layout layout;
    GameState state;
    if (!compressLevel(grid, layout, state)) return true;
    if (state.boxes.empty() || layout.goals.empty()) return true;
    DeadlockClassifier classifier(layout);
    return classifier.hasDeadlock(state);
}

} // namespace sokogen
