#include <omp.h>

#include <gtest/gtest.h>

#include "generator.hpp"
#include "validity.hpp"

using namespace sokogen;

namespace {

GeneratorConfig smallConfig(std::uint64_t seed) {
    GeneratorConfig config;
    config.minRows = 7;
    config.maxRows = 8;
    config.minCols = 7;
    config.maxCols = 8;
    config.minBoxes = 1;
    config.maxBoxes = 2;
    config.seed = seed;
    return config;
}

void expectSolvable(const Grid &level, const Solution &solution) {
    ASSERT_FALSE(level.empty());
    EXPECT_TRUE(isValidLevel(level)) << levelIssueName(validateLevel(level));
    Grid out;
    ASSERT_TRUE(applyMoves(level, solution, out)) << formatLevel(level) << solution;
    EXPECT_TRUE(isSolved(out)) << formatLevel(level) << solution;
    EXPECT_TRUE(solve(level).found);
}

} // namespace

TEST(GeneratorTest, NormalizeConfig) {
    GeneratorConfig config;
    config.minRows = 12;
    config.maxRows = 6;
    config.minCols = 1;
    config.maxCols = 2;
    config.minBoxes = 0;
    config.maxBoxes = 0;
    config.minComplexity = 0.9;
    config.maxComplexity = -0.5;
    config.attemptsPerStep = 0;
    config.solverBudget = -3;

    GeneratorConfig n = normalizeConfig(config);
    EXPECT_EQ(n.minRows, 6);
    EXPECT_EQ(n.maxRows, 12);
    EXPECT_EQ(n.minCols, 3);
    EXPECT_EQ(n.maxCols, 3);
    EXPECT_EQ(n.minBoxes, 1);
    EXPECT_EQ(n.maxBoxes, 1);
    EXPECT_DOUBLE_EQ(n.minComplexity, 0.0);
    EXPECT_DOUBLE_EQ(n.maxComplexity, 0.9);
    EXPECT_EQ(n.attemptsPerStep, 1);
    EXPECT_EQ(n.solverBudget, 1);
}

TEST(GeneratorTest, ReversePlayNeedsMatchingGoals) {
    Rng rng(1);
    GeneratorConfig config;
    Grid layout = {
        "######",
        "#  . #",
        "#    #",
        "######",
    };
    ReversePlayResult result = reversePlay(layout, 2, rng, config);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ReverseFailure::GoalCountMismatch);
}

TEST(GeneratorTest, ReversePlayNeedsRoomForThePlayer) {
    Rng rng(1);
    GeneratorConfig config;
    ReversePlayResult result = reversePlay({"###", "#.#", "###"}, 1, rng, config);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, ReverseFailure::NoPlayerCell);
}

TEST(GeneratorTest, ReversePlayProducesSolvableLevels) {
    GeneratorConfig config;
    Grid room = {
        "########",
        "#      #",
        "#      #",
        "# .    #",
        "#    . #",
        "#      #",
        "#      #",
        "########",
    };
    int successes = 0;
    for (std::uint64_t seed = 1; seed <= 10; ++seed) {
        Rng rng(seed);
        ReversePlayResult result = reversePlay(room, 2, rng, config);
        EXPECT_LE(result.attempts, config.maxSteps * config.attemptsPerStep);
        if (!result.ok) continue;
        ++successes;
        EXPECT_GE(result.steps, config.minAcceptedSteps);
        EXPECT_LE(static_cast<int>(result.solution.size()), config.maxSteps);
        expectSolvable(result.level, result.solution);
    }
    EXPECT_GT(successes, 0);
}

TEST(GeneratorTest, GeneratedLevelsAreSolvable) {
    for (std::uint64_t seed : {1ULL, 42ULL, 2025ULL, 777ULL}) {
        FallbackSelector selector;
        GeneratedLevel generated = generateLevel(smallConfig(seed), selector);
        EXPECT_EQ(generated.seed, seed);
        EXPECT_GE(generated.attempts, 1);
        expectSolvable(generated.level, generated.solution);
    }
}

TEST(GeneratorTest, SameSeedSameLevel) {
    FallbackSelector a;
    FallbackSelector b;
    GeneratedLevel first = generateLevel(smallConfig(99), a);
    GeneratedLevel second = generateLevel(smallConfig(99), b);
    EXPECT_EQ(first.level, second.level);
    EXPECT_EQ(first.solution, second.solution);
    EXPECT_EQ(first.attempts, second.attempts);
}

TEST(GeneratorTest, FallsBackWhenNothingFits) {
    GeneratorConfig config;
    // a single interior cell leaves no room for the player
    config.minRows = config.maxRows = 3;
    config.minCols = config.maxCols = 3;
    config.maxAttempts = 5;
    config.seed = 3;

    FallbackSelector selector;
    GeneratedLevel generated = generateLevel(config, selector);
    EXPECT_TRUE(generated.fromFallback);
    EXPECT_EQ(generated.attempts, 5);
    EXPECT_GE(generated.fallbackIndex, 0);
    EXPECT_EQ(selector.last(), generated.fallbackIndex);
    EXPECT_FALSE(generated.diagnostics.empty());
    expectSolvable(generated.level, generated.solution);
}

TEST(GeneratorTest, BatchIndependentOfThreadCount) {
    GeneratorConfig config = smallConfig(12345);
    int saved = omp_get_max_threads();

    omp_set_num_threads(1);
    std::vector<GeneratedLevel> serial = generateBatch(config, 4);
    omp_set_num_threads(4);
    std::vector<GeneratedLevel> parallel = generateBatch(config, 4);
    omp_set_num_threads(saved);

    ASSERT_EQ(serial.size(), 4u);
    ASSERT_EQ(parallel.size(), 4u);
    for (size_t i = 0; i < serial.size(); ++i) {
        EXPECT_EQ(serial[i].level, parallel[i].level);
        EXPECT_EQ(serial[i].solution, parallel[i].solution);
        EXPECT_EQ(serial[i].seed, config.seed ^ (0x9E3779B97F4A7C15ULL * (i + 1)));
        expectSolvable(serial[i].level, serial[i].solution);
    }
    EXPECT_TRUE(generateBatch(config, 0).empty());
}
