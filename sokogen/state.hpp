#ifndef SOKOGEN_STATE_HPP
#define SOKOGEN_STATE_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "board.hpp"

namespace sokogen {

// Static part of a level: walls and goals never move during a solve or a
// generation episode. Cells are addressed by y * cols + x.
struct Layout {
    int rows = 0;
    int cols = 0;
    std::vector<char> wall;
    std::vector<char> goal;
    std::vector<int> goals; // sorted

    int encodePos(int y, int x) const { return y * cols + x; }
    std::pair<int, int> decodePos(int pos) const { return {pos / cols, pos % cols}; }
    bool isWithin(int y, int x) const { return y >= 0 && y < rows && x >= 0 && x < cols; }
    // out of bounds counts as wall
    bool isWall(int y, int x) const { return !isWithin(y, x) || wall[encodePos(y, x)]; }
    bool isGoal(int pos) const { return goal[pos] != 0; }

    bool operator==(const Layout &other) const {
        return rows == other.rows && cols == other.cols && wall == other.wall && goal == other.goal;
    }
};

// Dynamic part of a level: what the search actually explores.
struct GameState {
    int player = -1;
    std::vector<int> boxes; // sorted, no duplicates

    bool operator==(const GameState &other) const {
        return player == other.player && boxes == other.boxes;
    }
    bool operator!=(const GameState &other) const { return !(*this == other); }
};

struct GameStateHash {
    size_t operator()(const GameState &state) const;
};

Layout extractLayout(const Grid &grid);
// Split a grid into layout and state. Fails when the player cannot be located.
bool compressLevel(const Grid &grid, Layout &layout, GameState &state);
Grid decompressState(const Layout &layout, const GameState &state);

bool hasBox(const GameState &state, int pos);
int countBoxesOnGoals(const Layout &layout, const GameState &state);
bool isSolvedCompact(const Layout &layout, const GameState &state);

// Compact counterpart of the grid tryMove. `pushed` reports whether a box moved.
bool tryMove(const Layout &layout, const GameState &current, int dir, GameState &out,
             bool *pushed = nullptr);

} // namespace sokogen

#endif // SOKOGEN_STATE_HPP
