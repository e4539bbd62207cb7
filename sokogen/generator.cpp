#include <algorithm>
#include <iostream>
#include <utility>

#include "deadlock.hpp"
#include "generator.hpp"
#include "state.hpp"
#include "validity.hpp"

using namespace std;

namespace {

using sokogen::GameState;
using sokogen::Layout;

struct Candidate {
    GameState next;
    char forwardMove;
};

void orderRange(int &lo, int &hi) {
    if (lo > hi) swap(lo, hi);
}

bool isOpenCell(const Layout &layout, const GameState &state, int y, int x) {
    return !layout.isWall(y, x) && !sokogen::hasBox(state, layout.encodePos(y, x));
}

// Pulls available from the current player cell P: a box at P - d comes along
// when the player backs off to P + d.
vector<Candidate> collectPulls(const sokogen::DeadlockClassifier &classifier, const GameState &state) {
    const Layout &layout = classifier.getLayout();
    vector<Candidate> pulls;
    auto [py, px] = layout.decodePos(state.player);
    for (int dir = 0; dir < sokogen::NUM_DIRS; ++dir) {
        int by = py - sokogen::dy[dir];
        int bx = px - sokogen::dx[dir];
        int ny = py + sokogen::dy[dir];
        int nx = px + sokogen::dx[dir];
        if (!layout.isWithin(by, bx) || !sokogen::hasBox(state, layout.encodePos(by, bx))) continue;
        if (!isOpenCell(layout, state, ny, nx)) continue;

        GameState next;
        next.player = layout.encodePos(ny, nx);
        next.boxes = state.boxes;
        auto it = lower_bound(next.boxes.begin(), next.boxes.end(), layout.encodePos(by, bx));
        next.boxes.erase(it);
        next.boxes.insert(lower_bound(next.boxes.begin(), next.boxes.end(), state.player), state.player);

        if (classifier.hasDeadlock(next)) continue;
        pulls.push_back({std::move(next), sokogen::directions[sokogen::oppositeDir(dir)]});
    }
    return pulls;
}

// Plain player steps, used to walk towards another box when nothing can be pulled.
vector<Candidate> collectSteps(const Layout &layout, const GameState &state) {
    vector<Candidate> steps;
    auto [py, px] = layout.decodePos(state.player);
    for (int dir = 0; dir < sokogen::NUM_DIRS; ++dir) {
        int ny = py + sokogen::dy[dir];
        int nx = px + sokogen::dx[dir];
        if (!isOpenCell(layout, state, ny, nx)) continue;
        GameState next = state;
        next.player = layout.encodePos(ny, nx);
        steps.push_back({std::move(next), sokogen::directions[sokogen::oppositeDir(dir)]});
    }
    return steps;
}

int placePlayer(const Layout &layout) {
    // next to a box first; every goal holds a box at this point
    for (int goal : layout.goals) {
        auto [gy, gx] = layout.decodePos(goal);
        for (int dir = 0; dir < sokogen::NUM_DIRS; ++dir) {
            int ny = gy + sokogen::dy[dir];
            int nx = gx + sokogen::dx[dir];
            if (!layout.isWall(ny, nx) && !layout.isGoal(layout.encodePos(ny, nx))) {
                return layout.encodePos(ny, nx);
            }
        }
    }
    for (int pos = 0; pos < layout.rows * layout.cols; ++pos) {
        if (!layout.wall[pos] && !layout.isGoal(pos)) return pos;
    }
    return -1;
}

} // namespace

namespace sokogen {

GeneratorConfig normalizeConfig(GeneratorConfig config) {
    orderRange(config.minRows, config.maxRows);
    orderRange(config.minCols, config.maxCols);
    orderRange(config.minBoxes, config.maxBoxes);
    orderRange(config.minSteps, config.maxSteps);
    if (config.minComplexity > config.maxComplexity) swap(config.minComplexity, config.maxComplexity);

    // a 3x3 level is the smallest with an interior cell
    config.minRows = max(config.minRows, 3);
    config.maxRows = max(config.maxRows, config.minRows);
    config.minCols = max(config.minCols, 3);
    config.maxCols = max(config.maxCols, config.minCols);
    config.minBoxes = max(config.minBoxes, 1);
    config.maxBoxes = max(config.maxBoxes, config.minBoxes);
    config.minComplexity = min(max(config.minComplexity, 0.0), 1.0);
    config.maxComplexity = min(max(config.maxComplexity, 0.0), 1.0);
    config.minSteps = max(config.minSteps, 1);
    config.maxSteps = max(config.maxSteps, config.minSteps);
    config.minAcceptedSteps = max(config.minAcceptedSteps, 0);
    config.attemptsPerStep = max(config.attemptsPerStep, 1);
    config.maxAttempts = max(config.maxAttempts, 1);
    config.solverBudget = max(config.solverBudget, 1);
    return config;
}

const char *reverseFailureName(ReverseFailure failure) {
    switch (failure) {
    case ReverseFailure::None:
        return "none";
    case ReverseFailure::GoalCountMismatch:
        return "goal count does not match box count";
    case ReverseFailure::NoPlayerCell:
        return "no free cell for the player";
    case ReverseFailure::TooFewSteps:
        return "too few reverse steps";
    case ReverseFailure::Unsolvable:
        return "solver found no solution";
    case ReverseFailure::ReplayMismatch:
        return "recorded solution does not solve the level";
    case ReverseFailure::InvalidLevel:
        return "level failed validity check";
    }
    return "unknown";
}

ReversePlayResult reversePlay(const Grid &layoutWithGoals, int targetBoxes, Rng &rng,
                              const GeneratorConfig &config) {
    ReversePlayResult result;
    Layout layout = extractLayout(layoutWithGoals);
    if (layout.goals.empty() || static_cast<int>(layout.goals.size()) != targetBoxes) {
        result.failure = ReverseFailure::GoalCountMismatch;
        return result;
    }

    // solved configuration: one box per goal
    GameState state;
    state.boxes = layout.goals;
    state.player = placePlayer(layout);
    if (state.player < 0) {
        result.failure = ReverseFailure::NoPlayerCell;
        return result;
    }

    DeadlockClassifier classifier(layout);
    int targetSteps = randomInt(rng, config.minSteps, config.maxSteps);
    int maxAttempts = targetSteps * config.attemptsPerStep;

    // forward moves, collected last-to-first
    Solution reversed;
    while (result.steps < targetSteps && result.attempts < maxAttempts) {
        ++result.attempts;
        vector<Candidate> options = collectPulls(classifier, state);
        if (options.empty()) options = collectSteps(layout, state);
        if (options.empty()) continue;

        Candidate &chosen = options[randomInt(rng, 0, static_cast<int>(options.size()) - 1)];
        state = std::move(chosen.next);
        reversed.push_back(chosen.forwardMove);
        ++result.steps;
    }

    if (result.steps < config.minAcceptedSteps) {
        result.failure = ReverseFailure::TooFewSteps;
        return result;
    }

    Grid level = decompressState(layout, state);
    Solution solution(reversed.rbegin(), reversed.rend());

    if (!solve(classifier, state, config.solverBudget).found) {
        result.failure = ReverseFailure::Unsolvable;
        return result;
    }
    Grid replayed;
    if (!applyMoves(level, solution, replayed) || !isSolved(replayed)) {
        result.failure = ReverseFailure::ReplayMismatch;
        return result;
    }
    if (!isValidLevel(level)) {
        result.failure = ReverseFailure::InvalidLevel;
        return result;
    }

    result.ok = true;
    result.level = std::move(level);
    result.solution = std::move(solution);
    return result;
}

GeneratedLevel generateLevel(const GeneratorConfig &rawConfig, FallbackSelector &selector) {
    GeneratorConfig config = normalizeConfig(rawConfig);
    GeneratedLevel generated;
    generated.seed = config.seed;
    Rng rng(config.seed);

    int rows = randomInt(rng, config.minRows, config.maxRows);
    int cols = randomInt(rng, config.minCols, config.maxCols);
    int numBoxes = randomInt(rng, config.minBoxes, config.maxBoxes);

    for (int attempt = 0; attempt < config.maxAttempts; ++attempt) {
        generated.attempts = attempt + 1;
        if (config.verbose && attempt % 10 == 0) {
            cerr << "[sokogen] seed " << config.seed << ": attempt " << attempt + 1 << "/"
                 << config.maxAttempts << " (" << rows << "x" << cols << ", " << numBoxes << " boxes)" << endl;
        }

        Grid grid = createEmptyLevel(rows, cols);
        addOuterWalls(grid);
        generateInternalWalls(grid, randomReal(rng, config.minComplexity, config.maxComplexity), rng);
        if (!checkConnectivity(grid)) {
            generated.diagnostics.push_back("attempt " + to_string(attempt + 1) + ": disconnected layout");
            continue;
        }
        placeGoals(grid, numBoxes, rng);

        ReversePlayResult reverse = reversePlay(grid, numBoxes, rng, config);
        if (!reverse.ok) {
            generated.diagnostics.push_back("attempt " + to_string(attempt + 1) + ": " +
                                            reverseFailureName(reverse.failure));
            continue;
        }

        if (checkConnectivity(reverse.level) && isValidLevel(reverse.level) &&
            solve(reverse.level, config.solverBudget).found) {
            generated.level = std::move(reverse.level);
            generated.solution = std::move(reverse.solution);
            if (config.verbose) {
                cerr << "[sokogen] seed " << config.seed << ": generated after " << generated.attempts
                     << " attempts, " << generated.solution.size() << " moves" << endl;
            }
            return generated;
        }
        generated.diagnostics.push_back("attempt " + to_string(attempt + 1) + ": final check failed");
    }

    generated.diagnostics.push_back("no level after " + to_string(config.maxAttempts) +
                                    " attempts, using the fallback bank");
    FallbackChoice fallback = dispenseFallback(selector, rng, config.solverBudget);
    generated.diagnostics.insert(generated.diagnostics.end(), fallback.warnings.begin(), fallback.warnings.end());
    generated.level = std::move(fallback.level);
    generated.solution = std::move(fallback.solution);
    generated.fromFallback = true;
    generated.fallbackIndex = fallback.index;
    if (config.verbose) {
        for (const auto &warning : fallback.warnings) cerr << "[sokogen] warning: " << warning << endl;
        cerr << "[sokogen] seed " << config.seed << ": using fallback level " << fallback.index << endl;
    }
    return generated;
}

vector<GeneratedLevel> generateBatch(const GeneratorConfig &config, int count) {
    if (count <= 0) return {};
    vector<GeneratedLevel> levels(static_cast<size_t>(count));

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < count; ++i) {
        GeneratorConfig itemConfig = config;
        // decorrelate RNG per level
        itemConfig.seed = config.seed ^ (0x9E3779B97F4A7C15ULL * static_cast<uint64_t>(i + 1));
        FallbackSelector selector;
        levels[static_cast<size_t>(i)] = generateLevel(itemConfig, selector);
    }
    return levels;
}

} // namespace sokogen
