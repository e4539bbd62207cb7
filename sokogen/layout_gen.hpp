#ifndef SOKOGEN_LAYOUT_GEN_HPP
#define SOKOGEN_LAYOUT_GEN_HPP

#include <cstdint>
#include <random>
#include <vector>

#include "board.hpp"

namespace sokogen {

using Rng = std::mt19937_64;

int randomInt(Rng &rng, int lo, int hi);          // inclusive
double randomReal(Rng &rng, double lo, double hi); // [lo, hi)

Grid createEmptyLevel(int rows, int cols);
void addOuterWalls(Grid &grid);
// Random-walk wall carving. Number and length of the walks scale with
// (rows + cols) * complexity. The outer ring is never touched.
void generateInternalWalls(Grid &grid, double complexity, Rng &rng);
// true when every non-wall cell is reachable from every other one
bool checkConnectivity(const Grid &grid);
// Goals go next to walls first, then anywhere on the floor. Returns the cells
// actually used, which can be fewer than requested on a cramped layout.
std::vector<Pos> placeGoals(Grid &grid, int numGoals, Rng &rng);

} // namespace sokogen

#endif // SOKOGEN_LAYOUT_GEN_HPP
