#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "board.hpp"

using namespace std;

namespace sokogen {

int dirIndexFromChar(char c) {
    switch (c) {
    case 'U':
        return 0;
    case 'D':
        return 1;
    case 'L':
        return 2;
    case 'R':
        return 3;
    default:
        return -1;
    }
}

int oppositeDir(int dir) {
    // U<->D, L<->R
    return dir ^ 1;
}

bool isLevelChar(char c) {
    return c == WALL || c == FLOOR || c == GOAL || c == BOX || c == BOX_ON_GOAL || c == PLAYER ||
           c == PLAYER_ON_GOAL;
}

bool isWithin(const Grid &grid, int y, int x) {
    return y >= 0 && y < static_cast<int>(grid.size()) && x >= 0 &&
           x < static_cast<int>(grid[y].size());
}

bool isRectangular(const Grid &grid) {
    if (grid.empty()) return false;
    for (const auto &row : grid) {
        if (row.size() != grid[0].size()) return false;
    }
    return !grid[0].empty();
}

bool locate(const Grid &grid, Pos &player, vector<Pos> &boxes) {
    int players = 0;
    boxes.clear();
    for (int y = 0; y < static_cast<int>(grid.size()); ++y) {
        for (int x = 0; x < static_cast<int>(grid[y].size()); ++x) {
            char c = grid[y][x];
            if (isPlayerTile(c)) {
                player = {y, x};
                ++players;
            } else if (isBoxTile(c)) {
                boxes.emplace_back(y, x);
            }
        }
    }
    return players == 1;
}

vector<Pos> goalPositions(const Grid &grid) {
    vector<Pos> goals;
    for (int y = 0; y < static_cast<int>(grid.size()); ++y) {
        for (int x = 0; x < static_cast<int>(grid[y].size()); ++x) {
            if (isGoalTile(grid[y][x])) {
                goals.emplace_back(y, x);
            }
        }
    }
    return goals;
}

bool isSolved(const vector<Pos> &boxes, const vector<Pos> &goals) {
    if (boxes.empty() || goals.empty()) return false;
    if (boxes.size() != goals.size()) return false;
    vector<Pos> a = boxes;
    vector<Pos> b = goals;
    sort(a.begin(), a.end());
    sort(b.begin(), b.end());
    return a == b;
}

bool isSolved(const Grid &grid) {
    Pos player;
    vector<Pos> boxes;
    locate(grid, player, boxes);
    return isSolved(boxes, goalPositions(grid));
}

bool tryMove(const Grid &current, int dir, Grid &out) {
    if (dir < 0 || dir >= NUM_DIRS) return false;
    Pos player;
    vector<Pos> boxes;
    if (!locate(current, player, boxes)) return false;

    int py = player.first;
    int px = player.second;
    // ny,nx: where the player steps; nny,nnx: where a pushed box lands
    int ny = py + dy[dir];
    int nx = px + dx[dir];
    int nny = ny + dy[dir];
    int nnx = nx + dx[dir];

    if (!isWithin(current, ny, nx)) return false;

    Grid next = current;
    char target = current[ny][nx];
    if (isFreeTile(target)) {
        next[ny][nx] = (target == GOAL) ? PLAYER_ON_GOAL : PLAYER;
    } else if (isBoxTile(target)) {
        if (!isWithin(current, nny, nnx)) return false;
        char beyond = current[nny][nnx];
        if (!isFreeTile(beyond)) return false;
        next[nny][nnx] = (beyond == GOAL) ? BOX_ON_GOAL : BOX;
        next[ny][nx] = (target == BOX_ON_GOAL) ? PLAYER_ON_GOAL : PLAYER;
    } else {
        return false;
    }
    // the cell the player leaves goes back to what lies underneath
    next[py][px] = (current[py][px] == PLAYER_ON_GOAL) ? GOAL : FLOOR;
    out = std::move(next);
    return true;
}

bool applyMoves(const Grid &start, const Solution &moves, Grid &out) {
    Grid current = start;
    for (char mv : moves) {
        int dir = dirIndexFromChar(mv);
        if (dir < 0) return false;
        Grid next;
        if (!tryMove(current, dir, next)) return false;
        current = std::move(next);
    }
    out = std::move(current);
    return true;
}

Grid parseLevel(const string &text) {
    Grid grid;
    istringstream in(text);
    string line;
    int lineNo = 0;
    while (getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // "; solution: ..." and other comment lines
        if (!line.empty() && line[0] == ';') continue;
        for (char c : line) {
            if (!isLevelChar(c)) {
                throw runtime_error("Unknown level character '" + string(1, c) + "' on line " +
                                    to_string(lineNo));
            }
        }
        grid.push_back(line);
    }
    // trailing blank lines are ignored
    while (!grid.empty() && grid.back().find_first_not_of(FLOOR) == string::npos) {
        grid.pop_back();
    }
    size_t width = 0;
    for (const auto &row : grid) width = max(width, row.size());
    for (auto &row : grid) row.resize(width, FLOOR);
    return grid;
}

string formatLevel(const Grid &grid) {
    string text;
    for (const auto &row : grid) {
        text += row;
        text.push_back('\n');
    }
    return text;
}

Grid loadLevel(const string &path) {
    ifstream file(path);
    if (!file.is_open()) throw runtime_error("Failed to open level file: " + path);
    stringstream buffer;
    buffer << file.rdbuf();
    return parseLevel(buffer.str());
}

void saveLevel(const string &path, const Grid &grid, const Solution &solution) {
    ofstream out(path, ios::out | ios::trunc);
    if (!out.is_open()) throw runtime_error("Failed to open output file: " + path);
    out << formatLevel(grid);
    out << "; solution: " << solution << "\n";
}

} // namespace sokogen
