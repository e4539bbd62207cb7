#include <stdexcept>
#include <utility>

#include "session.hpp"

using namespace std;

namespace sokogen {

PlaySession::PlaySession(Grid level, Solution solution)
    : initial_(std::move(level)), initialSolution_(std::move(solution)) {
    reset();
}

bool PlaySession::move(int dir) {
    Grid next;
    if (!tryMove(board_, dir, next)) return false;

    history_.push_back(std::move(board_));
    if (history_.size() > MAX_UNDO_HISTORY) history_.pop_front();
    board_ = std::move(next);
    ++moves_;

    if (cursor_ < solution_.size() && solution_[cursor_] == directions[dir]) {
        ++cursor_;
    } else {
        solution_.clear();
        cursor_ = 0;
    }
    return true;
}

bool PlaySession::move(char moveChar) {
    int dir = dirIndexFromChar(moveChar);
    if (dir < 0) throw invalid_argument(string("Invalid move character: ") + moveChar);
    return move(dir);
}

bool PlaySession::undo() {
    if (history_.empty()) return false;
    board_ = std::move(history_.back());
    history_.pop_back();
    --moves_;
    // the remaining plan no longer starts from this board
    solution_.clear();
    cursor_ = 0;
    return true;
}

void PlaySession::reset() {
    board_ = initial_;
    solution_ = initialSolution_;
    cursor_ = 0;
    history_.clear();
    moves_ = 0;
}

bool PlaySession::isSolved() const { return sokogen::isSolved(board_); }

bool PlaySession::hint(char &next, int budget) {
    if (isSolved()) return false;
    if (cursor_ >= solution_.size()) {
        SolveResult result = solve(board_, budget);
        if (!result.found || result.moves.empty()) return false;
        solution_ = std::move(result.moves);
        cursor_ = 0;
    }
    next = solution_[cursor_];
    return true;
}

} // namespace sokogen
