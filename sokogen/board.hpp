#ifndef SOKOGEN_BOARD_HPP
#define SOKOGEN_BOARD_HPP

#include <string>
#include <utility>
#include <vector>

namespace sokogen {

// Level alphabet (same characters as the .txt level files)
const char WALL = '#';
const char FLOOR = ' ';
const char GOAL = '.';
const char BOX = '$';
const char BOX_ON_GOAL = '*';
const char PLAYER = '@';
const char PLAYER_ON_GOAL = '+';

// One string per row, every row the same length.
using Grid = std::vector<std::string>;
// (row, col)
using Pos = std::pair<int, int>;
// Sequence of 'U' / 'D' / 'L' / 'R'. Empty means already solved.
using Solution = std::string;

// Direction order is fixed: the solver's determinism depends on it.
const int NUM_DIRS = 4;
const int dy[NUM_DIRS] = {-1, 1, 0, 0};
const int dx[NUM_DIRS] = {0, 0, -1, 1};
const char directions[NUM_DIRS] = {'U', 'D', 'L', 'R'};

int dirIndexFromChar(char c);
int oppositeDir(int dir);

inline bool isBoxTile(char c) { return c == BOX || c == BOX_ON_GOAL; }
inline bool isPlayerTile(char c) { return c == PLAYER || c == PLAYER_ON_GOAL; }
inline bool isGoalTile(char c) { return c == GOAL || c == BOX_ON_GOAL || c == PLAYER_ON_GOAL; }
// Somewhere a player may step or a box may be pushed into.
inline bool isFreeTile(char c) { return c == FLOOR || c == GOAL; }
bool isLevelChar(char c);

bool isWithin(const Grid &grid, int y, int x);
bool isRectangular(const Grid &grid);

// Scan for the player and all boxes. Fails on zero or several players.
bool locate(const Grid &grid, Pos &player, std::vector<Pos> &boxes);
std::vector<Pos> goalPositions(const Grid &grid);

// Every box on a goal and no goal left uncovered. Empty sets are not solved.
bool isSolved(const std::vector<Pos> &boxes, const std::vector<Pos> &goals);
bool isSolved(const Grid &grid);

// One player step or push. The caller's grid is left untouched; on
// rejection `out` is not modified.
bool tryMove(const Grid &current, int dir, Grid &out);
bool applyMoves(const Grid &start, const Solution &moves, Grid &out);

// Plain-text level format.
Grid parseLevel(const std::string &text);
std::string formatLevel(const Grid &grid);
Grid loadLevel(const std::string &path);
void saveLevel(const std::string &path, const Grid &grid, const Solution &solution);

} // namespace sokogen

#endif // SOKOGEN_BOARD_HPP
