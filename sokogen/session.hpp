#ifndef SOKOGEN_SESSION_HPP
#define SOKOGEN_SESSION_HPP

#include <cstddef>
#include <deque>

#include "board.hpp"
#include "solver.hpp"

namespace sokogen {

const size_t MAX_UNDO_HISTORY = 100;

// One level being played: the board, undo history, and the solution the
// hints are read from. A move that leaves the solution drops it; the next
// hint re-solves from wherever the player is.
class PlaySession {
public:
    PlaySession(Grid level, Solution solution);

    bool move(int dir);
    // throws std::invalid_argument for anything but U, D, L, R
    bool move(char moveChar);
    bool undo();
    void reset();

    bool isSolved() const;
    bool hint(char &next, int budget = DEFAULT_ITERATION_BUDGET);

    const Grid &board() const { return board_; }
    const Solution &solution() const { return solution_; }
    size_t cursor() const { return cursor_; }
    size_t historySize() const { return history_.size(); }
    int moveCount() const { return moves_; }

private:
    Grid initial_;
    Solution initialSolution_;
    Grid board_;
    Solution solution_;
    size_t cursor_ = 0;
    std::deque<Grid> history_;
    int moves_ = 0;
};

} // namespace sokogen

#endif // SOKOGEN_SESSION_HPP
