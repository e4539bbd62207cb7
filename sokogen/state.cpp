#include <algorithm>

#include <boost/functional/hash.hpp>

#include "state.hpp"

using namespace std;

namespace sokogen {

size_t GameStateHash::operator()(const GameState &state) const {
    size_t seed = 0;
    boost::hash_combine(seed, state.player);
    for (int box : state.boxes) {
        boost::hash_combine(seed, box);
    }
    return seed;
}

Layout extractLayout(const Grid &grid) {
    Layout layout;
    layout.rows = static_cast<int>(grid.size());
    for (const auto &row : grid) {
        layout.cols = max(layout.cols, static_cast<int>(row.size()));
    }
    int total = layout.rows * layout.cols;
    // cells missing from a ragged row behave like walls
    layout.wall.assign(total, 1);
    layout.goal.assign(total, 0);
    for (int y = 0; y < layout.rows; ++y) {
        for (int x = 0; x < static_cast<int>(grid[y].size()); ++x) {
            int pos = layout.encodePos(y, x);
            char c = grid[y][x];
            layout.wall[pos] = (c == WALL);
            if (isGoalTile(c)) {
                layout.goal[pos] = 1;
                layout.goals.push_back(pos);
            }
        }
    }
    return layout;
}

bool compressLevel(const Grid &grid, Layout &layout, GameState &state) {
    Pos player;
    vector<Pos> boxes;
    if (!locate(grid, player, boxes)) return false;
    layout = extractLayout(grid);
    state.player = layout.encodePos(player.first, player.second);
    state.boxes.clear();
    for (const auto &b : boxes) {
        state.boxes.push_back(layout.encodePos(b.first, b.second));
    }
    // sorted so that equal box sets compare and hash equal
    sort(state.boxes.begin(), state.boxes.end());
    return true;
}

Grid decompressState(const Layout &layout, const GameState &state) {
    Grid grid(layout.rows, string(layout.cols, FLOOR));
    for (int y = 0; y < layout.rows; ++y) {
        for (int x = 0; x < layout.cols; ++x) {
            int pos = layout.encodePos(y, x);
            if (layout.wall[pos]) {
                grid[y][x] = WALL;
            } else if (layout.goal[pos]) {
                grid[y][x] = GOAL;
            }
        }
    }
    for (int box : state.boxes) {
        auto [y, x] = layout.decodePos(box);
        grid[y][x] = layout.goal[box] ? BOX_ON_GOAL : BOX;
    }
    if (state.player >= 0) {
        auto [py, px] = layout.decodePos(state.player);
        grid[py][px] = layout.goal[state.player] ? PLAYER_ON_GOAL : PLAYER;
    }
    return grid;
}

bool hasBox(const GameState &state, int pos) {
    return binary_search(state.boxes.begin(), state.boxes.end(), pos);
}

int countBoxesOnGoals(const Layout &layout, const GameState &state) {
    int count = 0;
    for (int box : state.boxes) {
        if (layout.goal[box]) ++count;
    }
    return count;
}

bool isSolvedCompact(const Layout &layout, const GameState &state) {
    if (state.boxes.empty() || layout.goals.empty()) return false;
    // both vectors are sorted
    return state.boxes == layout.goals;
}

bool tryMove(const Layout &layout, const GameState &current, int dir, GameState &out, bool *pushed) {
    if (dir < 0 || dir >= NUM_DIRS) return false;
    auto [py, px] = layout.decodePos(current.player);
    int ny = py + dy[dir];
    int nx = px + dx[dir];
    if (layout.isWall(ny, nx)) return false;

    int npos = layout.encodePos(ny, nx);
    if (!hasBox(current, npos)) {
        out.player = npos;
        out.boxes = current.boxes;
        if (pushed) *pushed = false;
        return true;
    }

    int nny = ny + dy[dir];
    int nnx = nx + dx[dir];
    if (layout.isWall(nny, nnx)) return false;
    int nnpos = layout.encodePos(nny, nnx);
    if (hasBox(current, nnpos)) return false;

    out.player = npos;
    out.boxes = current.boxes;
    auto it = lower_bound(out.boxes.begin(), out.boxes.end(), npos);
    out.boxes.erase(it);
    out.boxes.insert(lower_bound(out.boxes.begin(), out.boxes.end(), nnpos), nnpos);
    if (pushed) *pushed = true;
    return true;
}

} // namespace sokogen
