#ifndef SIMULATOR_H
#define SIMULATOR_H

#include "Bracket.h"
#include "globals.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct SimulationConfig {
    int championRuns = 20000;
    int desiredChampionRuns = 10000;
    long maxAttempts = 0;        // 0 -> desiredChampionRuns * 1000
    double reportThreshold = 1.0; // min championship percent reported
    unsigned numThreads = 0;      // 0 -> hardware concurrency
    std::optional<unsigned> seed; // unset -> seeded from std::random_device
    bool suppress = false;        // hide progress output
};

struct ChampionOdds {
    std::string name;
    int wins;
    double percent;
};

// Tallies over runs that produced the desired champion
struct DesiredChampionCounts {
    // region -> round -> team -> # runs team was alive in round
    std::map<std::string, std::map<Round, std::map<std::string, int>>>
        regionCounts;
    std::map<std::string, int> finalistCounts; // team -> # runs as finalist
    int runs = 0;      // accepted runs
    long attempts = 0; // simulations spent, accepted or not

    void add(const BracketResult &result);
    void merge(const DesiredChampionCounts &other);
};

struct DesiredChampionRun {
    std::optional<BracketResult> result; // unset if attempts ran out
    long attempts = 0;
};

// Simulate a fresh copy of original
BracketResult simulateBracket(const Bracket &original,
                              std::mt19937 &randomEngine);

// Simulate fresh copies of original until desiredChampion wins, taking one
// unit from attemptsLeft per simulation; gives up once attemptsLeft runs out
DesiredChampionRun simulateDesiredChampion(const Bracket &original,
                                           const std::string &desiredChampion,
                                           std::mt19937 &randomEngine,
                                           std::atomic<long> &attemptsLeft);

class Simulator {
  public:
    Simulator(std::string inputPath,
              SimulationConfig c = SimulationConfig(),
              Bracket::Pairings pairings = DEFAULT_SEMIFINAL_PAIRINGS);
    Simulator(Bracket b, SimulationConfig c = SimulationConfig());

    // one simulated copy of the bracket
    Bracket simulateOnce() const;
    // championship odds over config.championRuns simulations, sorted by wins
    std::vector<ChampionOdds> runChampionOdds() const;
    // tallies over config.desiredChampionRuns runs won by desiredChampion;
    // throws ConvergenceExhaustion if config.maxAttempts runs out first
    DesiredChampionCounts
    runDesiredChampion(const std::string &desiredChampion) const;

    void writeBracket(const Bracket &simulated,
                      const std::filesystem::path &outputPath) const;
    void writeChampionOdds(const std::vector<ChampionOdds> &odds,
                           const std::filesystem::path &outputPath) const;
    void writeDesiredChampion(const DesiredChampionCounts &counts,
                              const std::string &desiredChampion,
                              const std::filesystem::path &outputPath) const;

    const Bracket &getBracket() const { return bracket; }
    const SimulationConfig &getConfig() const { return config; }

  private:
    // Run work(threadIndex, runNumber) for runNumber in [0, iterations) on a
    // thread pool, showing progress; rethrows the first exception from work
    void runParallel(const std::string &task, int iterations,
                     const std::function<void(int, int)> &work) const;
    std::mt19937 createRandomEngine(int runNumber) const;
    unsigned getNumThreads() const;
    long getMaxAttempts() const;
    void writeFrontmatter(std::ostream &out, const std::string &mode,
                          long simulations) const;

    Bracket bracket;
    SimulationConfig config;
};

#endif // SIMULATOR_H
