#ifndef SOKOGEN_FALLBACK_BANK_HPP
#define SOKOGEN_FALLBACK_BANK_HPP

#include <string>
#include <vector>

#include "board.hpp"
#include "layout_gen.hpp"
#include "solver.hpp"

namespace sokogen {

struct BankEntry {
    std::string name;
    Grid grid;
    Solution solution; // stored reference solution
};

const std::vector<BankEntry> &fallbackLevels();
const BankEntry &emergencyLevel();

// Remembers what was handed out last so that two consecutive fallbacks differ.
class FallbackSelector {
public:
    int last() const { return last_; }
    void remember(int index) { last_ = index; }
    void clear() { last_ = -1; }

private:
    int last_ = -1;
};

// Solve every entry. Entries are independent and are checked in parallel.
std::vector<SolveResult> verifyBank(const std::vector<BankEntry> &entries,
                                    int budget = DEFAULT_ITERATION_BUDGET);

struct FallbackChoice {
    Grid level;
    Solution solution;
    int index = -1; // -1: emergency level
    std::vector<std::string> warnings;
};

FallbackChoice dispenseFallback(FallbackSelector &selector, Rng &rng,
                                int budget = DEFAULT_ITERATION_BUDGET);

} // namespace sokogen

#endif // SOKOGEN_FALLBACK_BANK_HPP
