#ifndef SOKOGEN_GENERATOR_HPP
#define SOKOGEN_GENERATOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "board.hpp"
#include "fallback_bank.hpp"
#include "layout_gen.hpp"
#include "solver.hpp"

namespace sokogen {

struct GeneratorConfig {
    int minRows = 7;
    int maxRows = 10;
    int minCols = 7;
    int maxCols = 10;
    int minBoxes = 1;
    int maxBoxes = 3;
    double minComplexity = 0.1;
    double maxComplexity = 0.3;
    int minSteps = 15;         // reverse-play target, drawn per level
    int maxSteps = 30;
    int minAcceptedSteps = 10; // fewer steps than this is too easy
    int attemptsPerStep = 10;
    int maxAttempts = 100;     // layouts tried before the fallback bank
    int solverBudget = DEFAULT_ITERATION_BUDGET;
    std::uint64_t seed = 1234;
    bool verbose = false;      // progress lines on stderr
};

// Swap inverted ranges and clamp everything into something generateLevel can use.
GeneratorConfig normalizeConfig(GeneratorConfig config);

enum class ReverseFailure {
    None,
    GoalCountMismatch,
    NoPlayerCell,
    TooFewSteps,
    Unsolvable,
    ReplayMismatch,
    InvalidLevel
};

const char *reverseFailureName(ReverseFailure failure);

struct ReversePlayResult {
    bool ok = false;
    Grid level;
    Solution solution;
    int steps = 0;
    int attempts = 0;
    ReverseFailure failure = ReverseFailure::None;
};

// Start from every box on a goal and pull boxes away, recording the pushes
// that undo each pull. `layoutWithGoals` supplies walls and goals; anything
// else on it is ignored.
ReversePlayResult reversePlay(const Grid &layoutWithGoals, int targetBoxes, Rng &rng,
                              const GeneratorConfig &config);

struct GeneratedLevel {
    Grid level;
    Solution solution;
    bool fromFallback = false;
    int fallbackIndex = -1; // -1 with fromFallback: emergency level
    int attempts = 0;
    std::uint64_t seed = 0;
    std::vector<std::string> diagnostics;
};

// Always returns a solvable level; the fallback bank covers generation failure.
GeneratedLevel generateLevel(const GeneratorConfig &config, FallbackSelector &selector);

// Level i is generated from seed ^ (0x9E3779B97F4A7C15 * (i + 1)), so the
// output does not depend on the number of threads.
std::vector<GeneratedLevel> generateBatch(const GeneratorConfig &config, int count);

} // namespace sokogen

#endif // SOKOGEN_GENERATOR_HPP
