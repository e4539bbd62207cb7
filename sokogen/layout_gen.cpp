#include <algorithm>
#include <queue>

#include "layout_gen.hpp"

using namespace std;

namespace sokogen {

int randomInt(Rng &rng, int lo, int hi) {
    uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

double randomReal(Rng &rng, double lo, double hi) {
    if (hi <= lo) return lo;
    uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

Grid createEmptyLevel(int rows, int cols) {
    return Grid(rows, string(cols, FLOOR));
}

void addOuterWalls(Grid &grid) {
    int rows = static_cast<int>(grid.size());
    if (rows == 0) return;
    int cols = static_cast<int>(grid[0].size());
    for (int x = 0; x < cols; ++x) {
        grid[0][x] = WALL;
        grid[rows - 1][x] = WALL;
    }
    for (int y = 0; y < rows; ++y) {
        grid[y][0] = WALL;
        grid[y][cols - 1] = WALL;
    }
}

void generateInternalWalls(Grid &grid, double complexity, Rng &rng) {
    int rows = static_cast<int>(grid.size());
    if (rows == 0) return;
    int cols = static_cast<int>(grid[0].size());
    if (rows <= 4 || cols <= 4) return;

    int numWalks = static_cast<int>((rows + cols) * complexity);
    int maxWalkLen = static_cast<int>((rows + cols) * complexity);

    for (int walk = 0; walk < numWalks; ++walk) {
        int y = randomInt(rng, 1, rows - 2);
        int x = randomInt(rng, 1, cols - 2);
        for (int step = 0; step < maxWalkLen; ++step) {
            if (grid[y][x] == FLOOR) {
                grid[y][x] = WALL;
            }
            int dir = randomInt(rng, 0, NUM_DIRS - 1);
            int ny = y + dy[dir];
            int nx = x + dx[dir];
            if (ny >= 1 && ny < rows - 1 && nx >= 1 && nx < cols - 1) {
                y = ny;
                x = nx;
            } else {
                // walked into the border: jump somewhere else inside
                y = randomInt(rng, 1, rows - 2);
                x = randomInt(rng, 1, cols - 2);
            }
        }
    }
}

bool checkConnectivity(const Grid &grid) {
    int rows = static_cast<int>(grid.size());
    int start = -1;
    int cols = 0;
    for (const auto &row : grid) cols = max(cols, static_cast<int>(row.size()));
    int nonWall = 0;
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < static_cast<int>(grid[y].size()); ++x) {
            if (grid[y][x] != WALL) {
                if (start == -1) start = y * cols + x;
                ++nonWall;
            }
        }
    }
    if (start == -1) return false;

    vector<bool> visited(rows * cols, false);
    queue<int> q;
    visited[start] = true;
    q.push(start);
    int seen = 1;
    while (!q.empty()) {
        int pos = q.front();
        q.pop();
        int y = pos / cols;
        int x = pos % cols;
        for (int dir = 0; dir < NUM_DIRS; ++dir) {
            int ny = y + dy[dir];
            int nx = x + dx[dir];
            if (!isWithin(grid, ny, nx) || grid[ny][nx] == WALL) continue;
            int npos = ny * cols + nx;
            if (visited[npos]) continue;
            visited[npos] = true;
            ++seen;
            q.push(npos);
        }
    }
    return seen == nonWall;
}

vector<Pos> placeGoals(Grid &grid, int numGoals, Rng &rng) {
    int rows = static_cast<int>(grid.size());
    int cols = rows > 0 ? static_cast<int>(grid[0].size()) : 0;
    vector<Pos> placed;

    // floor cells touching at least one wall make for tighter puzzles
    vector<Pos> wallAdjacent;
    for (int y = 1; y < rows - 1; ++y) {
        for (int x = 1; x < cols - 1; ++x) {
            if (grid[y][x] != FLOOR) continue;
            int wallCount = 0;
            for (int dir = 0; dir < NUM_DIRS; ++dir) {
                if (grid[y + dy[dir]][x + dx[dir]] == WALL) ++wallCount;
            }
            if (wallCount >= 1) wallAdjacent.emplace_back(y, x);
        }
    }
    shuffle(wallAdjacent.begin(), wallAdjacent.end(), rng);
    for (const auto &cell : wallAdjacent) {
        if (static_cast<int>(placed.size()) >= numGoals) break;
        grid[cell.first][cell.second] = GOAL;
        placed.push_back(cell);
    }

    if (static_cast<int>(placed.size()) < numGoals) {
        vector<Pos> remaining;
        for (int y = 1; y < rows - 1; ++y) {
            for (int x = 1; x < cols - 1; ++x) {
                if (grid[y][x] == FLOOR) remaining.emplace_back(y, x);
            }
        }
        shuffle(remaining.begin(), remaining.end(), rng);
        for (const auto &cell : remaining) {
            if (static_cast<int>(placed.size()) >= numGoals) break;
            grid[cell.first][cell.second] = GOAL;
            placed.push_back(cell);
        }
    }
    return placed;
}

} // namespace sokogen
