// sokogen: generate, solve and check Sokoban levels from the command line.
//
// Examples:
//   ./sokogen --seed 42 --min-boxes 2 --max-boxes 3 --out level.txt
//   ./sokogen --count 16 --omp-threads 8
//   ./sokogen --solve level.txt --budget 500000
//   ./sokogen --check-bank

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <omp.h>

#include "board.hpp"
#include "fallback_bank.hpp"
#include "generator.hpp"
#include "solver.hpp"
#include "validity.hpp"

using namespace sokogen;

struct Params {
  GeneratorConfig gen;
  bool seed_set = false;
  int count = 1;
  int omp_threads = 0; // 0 => OMP default
  std::string solve_path;
  std::string out_path;
  bool check_bank = false;
};

static void usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0
      << " [--min-rows N] [--max-rows N] [--min-cols N] [--max-cols N]\n"
      << "           [--min-boxes N] [--max-boxes N] [--min-steps N] [--max-steps N]\n"
      << "           [--attempts N] [--budget N] [--seed N] [--count N] [--omp-threads N]\n"
      << "           [--out PATH] [--verbose]\n"
      << "       " << argv0 << " --solve PATH [--budget N]\n"
      << "       " << argv0 << " --check-bank [--budget N]\n";
}

static bool env_u64(const char* name, std::uint64_t& out) {
  const char* v = std::getenv(name);
  if (!v || !*v) return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(v));
    return true;
  } catch (const std::exception&) {
    std::cerr << "Ignoring invalid " << name << "=" << v << "\n";
    return false;
  }
}

static bool parse_args(int argc, char** argv, Params& p) {
  for (int i = 1; i < argc; ++i) {
    auto next = [&](const char* name) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (std::strcmp(argv[i], "--min-rows") == 0) {
      const char* v = next("--min-rows"); if (!v) return false;
      p.gen.minRows = std::stoi(v);
    } else if (std::strcmp(argv[i], "--max-rows") == 0) {
      const char* v = next("--max-rows"); if (!v) return false;
      p.gen.maxRows = std::stoi(v);
    } else if (std::strcmp(argv[i], "--min-cols") == 0) {
      const char* v = next("--min-cols"); if (!v) return false;
      p.gen.minCols = std::stoi(v);
    } else if (std::strcmp(argv[i], "--max-cols") == 0) {
      const char* v = next("--max-cols"); if (!v) return false;
      p.gen.maxCols = std::stoi(v);
    } else if (std::strcmp(argv[i], "--min-boxes") == 0) {
      const char* v = next("--min-boxes"); if (!v) return false;
      p.gen.minBoxes = std::stoi(v);
    } else if (std::strcmp(argv[i], "--max-boxes") == 0) {
      const char* v = next("--max-boxes"); if (!v) return false;
      p.gen.maxBoxes = std::stoi(v);
    } else if (std::strcmp(argv[i], "--min-steps") == 0) {
      const char* v = next("--min-steps"); if (!v) return false;
      p.gen.minSteps = std::stoi(v);
    } else if (std::strcmp(argv[i], "--max-steps") == 0) {
      const char* v = next("--max-steps"); if (!v) return false;
      p.gen.maxSteps = std::stoi(v);
    } else if (std::strcmp(argv[i], "--attempts") == 0) {
      const char* v = next("--attempts"); if (!v) return false;
      p.gen.maxAttempts = std::stoi(v);
    } else if (std::strcmp(argv[i], "--budget") == 0) {
      const char* v = next("--budget"); if (!v) return false;
      p.gen.solverBudget = std::stoi(v);
    } else if (std::strcmp(argv[i], "--seed") == 0) {
      const char* v = next("--seed"); if (!v) return false;
      p.gen.seed = static_cast<std::uint64_t>(std::stoull(v));
      p.seed_set = true;
    } else if (std::strcmp(argv[i], "--count") == 0) {
      const char* v = next("--count"); if (!v) return false;
      p.count = std::stoi(v);
    } else if (std::strcmp(argv[i], "--omp-threads") == 0) {
      const char* v = next("--omp-threads"); if (!v) return false;
      p.omp_threads = std::stoi(v);
    } else if (std::strcmp(argv[i], "--solve") == 0) {
      const char* v = next("--solve"); if (!v) return false;
      p.solve_path = v;
    } else if (std::strcmp(argv[i], "--out") == 0) {
      const char* v = next("--out"); if (!v) return false;
      p.out_path = v;
    } else if (std::strcmp(argv[i], "--check-bank") == 0) {
      p.check_bank = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      p.gen.verbose = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      return false;
    } else {
      std::cerr << "Unknown arg: " << argv[i] << "\n";
      return false;
    }
  }

  if (p.count <= 0 || p.gen.solverBudget <= 0 || p.gen.maxAttempts <= 0) {
    std::cerr << "Invalid parameters.\n";
    return false;
  }
  if (!p.solve_path.empty() && p.check_bank) {
    std::cerr << "--solve and --check-bank are exclusive.\n";
    return false;
  }
  return true;
}

static void print_level(const GeneratedLevel& g) {
  std::cout << formatLevel(g.level);
  std::cout << "solution (" << g.solution.size() << " moves): " << g.solution << "\n";
  std::cout << "seed=" << g.seed << " attempts=" << g.attempts;
  if (g.fromFallback) std::cout << " fallback=" << g.fallbackIndex;
  std::cout << "\n";
}

static int run_solve(const Params& p) {
  Grid grid = loadLevel(p.solve_path);
  LevelIssue issue = validateLevel(grid);
  if (issue != LevelIssue::None) std::cerr << "Warning: " << levelIssueName(issue) << "\n";

  auto t0 = std::chrono::high_resolution_clock::now();
  SolveResult result = solve(grid, p.gen.solverBudget);
  auto t1 = std::chrono::high_resolution_clock::now();
  const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

  std::cout << std::fixed << std::setprecision(3);
  if (result.found) {
    std::cout << "solution (" << result.moves.size() << " moves): " << result.moves << "\n";
  } else {
    std::cout << "no solution within " << p.gen.solverBudget << " iterations\n";
  }
  std::cout << "iterations=" << result.iterations << " states=" << result.statesSeen << " time_ms=" << ms << "\n";
  return result.found ? 0 : 1;
}

static int run_check_bank(const Params& p) {
  const std::vector<BankEntry>& bank = fallbackLevels();
  std::vector<SolveResult> results = verifyBank(bank, p.gen.solverBudget);
  int failures = 0;
  for (std::size_t i = 0; i < bank.size(); ++i) {
    std::cout << i << " " << bank[i].name << ": ";
    if (results[i].found) {
      std::cout << "ok (" << results[i].moves.size() << " moves, stored " << bank[i].solution.size() << ")\n";
    } else {
      std::cout << "FAILED\n";
      ++failures;
    }
  }
  return failures == 0 ? 0 : 1;
}

static int run_generate(const Params& p) {
  if (p.omp_threads > 0) omp_set_num_threads(p.omp_threads);

  auto t0 = std::chrono::high_resolution_clock::now();
  std::vector<GeneratedLevel> levels;
  if (p.count == 1) {
    FallbackSelector selector;
    levels.push_back(generateLevel(p.gen, selector));
  } else {
    levels = generateBatch(p.gen, p.count);
  }
  auto t1 = std::chrono::high_resolution_clock::now();
  const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

  for (std::size_t i = 0; i < levels.size(); ++i) {
    if (levels.size() > 1) std::cout << "; level " << i << "\n";
    print_level(levels[i]);
    if (!p.out_path.empty()) {
      const std::string path = levels.size() > 1 ? p.out_path + "." + std::to_string(i) : p.out_path;
      saveLevel(path, levels[i].level, levels[i].solution);
      std::cout << "Wrote level: " << path << "\n";
    }
  }

  std::cout << std::fixed << std::setprecision(3);
  std::cout << "levels=" << levels.size() << " threads=" << omp_get_max_threads() << " time_ms=" << ms << "\n";
  return 0;
}

int main(int argc, char** argv) {
  Params p{};
  try {
    if (!parse_args(argc, argv, p)) {
      usage(argv[0]);
      return 2;
    }
  } catch (const std::exception& e) {
    // std::stoi and friends on a malformed number
    std::cerr << "Bad argument: " << e.what() << "\n";
    usage(argv[0]);
    return 2;
  }

  if (!p.seed_set && !env_u64("SOKOGEN_SEED", p.gen.seed)) {
    p.gen.seed = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
  }

  try {
    if (!p.solve_path.empty()) return run_solve(p);
    if (p.check_bank) return run_check_bank(p);
    return run_generate(p);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
