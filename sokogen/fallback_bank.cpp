#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

#include "fallback_bank.hpp"

namespace tbb = oneapi::tbb;
using namespace std;

namespace sokogen {

const vector<BankEntry> &fallbackLevels() {
    static const vector<BankEntry> levels = {
        {"corner step",
         {"#####",
          "#@  #",
          "# $.#",
          "#   #",
          "#####"},
         "DR"},
        {"two lanes",
         {"######",
          "#    #",
          "#@$ .#",
          "# $ .#",
          "#    #",
          "######"},
         "RRLLDRR"},
        {"cross",
         {"#######",
          "#     #",
          "# $ $ #",
          "# .@. #",
          "#  $  #",
          "#  .  #",
          "#######"},
         "DUUULDURRD"},
        {"corridors",
         {"#######",
          "#     #",
          "# ### #",
          "#@$  .#",
          "# ### #",
          "#   $.#",
          "#######"},
         "RRRLLLDDRRR"},
        {"pillars",
         {"########",
          "#  #   #",
          "#  $   #",
          "#  # $ #",
          "## #   #",
          "#. @  .#",
          "#      #",
          "########"},
         "LUUURRRURDDDULULDDRDLLL"},
    };
    return levels;
}

const BankEntry &emergencyLevel() {
    static const BankEntry level = {"emergency",
                                    {"#####",
                                     "#@$.#",
                                     "#   #",
                                     "#####"},
                                    "R"};
    return level;
}

vector<SolveResult> verifyBank(const vector<BankEntry> &entries, int budget) {
    vector<SolveResult> results(entries.size());
    tbb::parallel_for(tbb::blocked_range<size_t>(0, entries.size()),
                      [&](const tbb::blocked_range<size_t> &range) {
                          for (size_t i = range.begin(); i != range.end(); ++i) {
                              results[i] = solve(entries[i].grid, budget);
                          }
                      });
    return results;
}

FallbackChoice dispenseFallback(FallbackSelector &selector, Rng &rng, int budget) {
    const vector<BankEntry> &bank = fallbackLevels();
    vector<SolveResult> results = verifyBank(bank, budget);

    FallbackChoice choice;
    vector<int> verified;
    for (size_t i = 0; i < bank.size(); ++i) {
        if (results[i].found) {
            verified.push_back(static_cast<int>(i));
        } else {
            choice.warnings.push_back("fallback level '" + bank[i].name + "' failed verification, skipped");
        }
    }

    if (verified.empty()) {
        choice.warnings.push_back("no fallback level verified, using the emergency level");
        choice.level = emergencyLevel().grid;
        choice.solution = emergencyLevel().solution;
        choice.index = -1;
        selector.clear();
        return choice;
    }

    int picked = verified[0];
    if (verified.size() > 1) {
        vector<int> candidates;
        for (int idx : verified) {
            if (idx != selector.last()) candidates.push_back(idx);
        }
        picked = candidates[randomInt(rng, 0, static_cast<int>(candidates.size()) - 1)];
    }

    selector.remember(picked);
    choice.level = bank[picked].grid;
    choice.solution = results[picked].moves;
    choice.index = picked;
    return choice;
}

} // namespace sokogen
