#include "Simulator.h"
#include "Bracket.h"
#include "errors.h"
#include "globals.h"
#include "utils.h"
#include <BS_thread_pool/BS_thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <indicators/indicators.hpp>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

void DesiredChampionCounts::add(const BracketResult &result) {
    for (const RegionResult &r : result.regions) {
        for (const std::pair<const Round, std::vector<std::string>> &kv :
             r.teamsByRound) {
            for (const std::string &name : kv.second) {
                regionCounts[r.name][kv.first][name] += 1;
            }
        }
    }
    for (const std::string &name : result.finalists) {
        finalistCounts[name] += 1;
    }
    runs += 1;
}

void DesiredChampionCounts::merge(const DesiredChampionCounts &other) {
    for (const auto &region : other.regionCounts) {
        for (const auto &round : region.second) {
            for (const std::pair<const std::string, int> &kv : round.second) {
                regionCounts[region.first][round.first][kv.first] += kv.second;
            }
        }
    }
    for (const std::pair<const std::string, int> &kv : other.finalistCounts) {
        finalistCounts[kv.first] += kv.second;
    }
    runs += other.runs;
    attempts += other.attempts;
}

BracketResult simulateBracket(const Bracket &original,
                              std::mt19937 &randomEngine) {
    Bracket b = original;
    b.simulate(randomEngine);
    return b.results();
}

DesiredChampionRun simulateDesiredChampion(const Bracket &original,
                                           const std::string &desiredChampion,
                                           std::mt19937 &randomEngine,
                                           std::atomic<long> &attemptsLeft) {
    DesiredChampionRun run;
    while (attemptsLeft.fetch_sub(1, std::memory_order_relaxed) > 0) {
        run.attempts++;
        Bracket b = original;
        b.simulate(randomEngine);
        if (b.getChampion() == desiredChampion) {
            run.result = b.results();
            return run;
        }
    }
    return run;
}

Simulator::Simulator(std::string inputPath, SimulationConfig c,
                     Bracket::Pairings pairings)
    : bracket(Bracket::fromFile(inputPath, pairings)), config(c) {}

Simulator::Simulator(Bracket b, SimulationConfig c) : bracket(b), config(c) {}

unsigned Simulator::getNumThreads() const {
    unsigned n = config.numThreads;
    if (n == 0) {
        n = std::thread::hardware_concurrency();
    }
    return std::max(1u, n);
}

long Simulator::getMaxAttempts() const {
    if (config.maxAttempts > 0) {
        return config.maxAttempts;
    }
    return static_cast<long>(config.desiredChampionRuns) * 1000;
}

std::mt19937 Simulator::createRandomEngine(int runNumber) const {
    if (config.seed) {
        // runs are reproducible regardless of which thread picks them up
        std::seed_seq seq{*config.seed, static_cast<unsigned>(runNumber)};
        return std::mt19937(seq);
    }
    return std::mt19937(std::random_device{}());
}

Bracket Simulator::simulateOnce() const {
    Bracket b = bracket;
    std::mt19937 randomEngine = createRandomEngine(0);
    b.simulate(randomEngine);
    return b;
}

void Simulator::runParallel(const std::string &task, int iterations,
                            const std::function<void(int, int)> &work) const {
    const unsigned numThreads = getNumThreads();
    std::chrono::steady_clock::time_point tStart =
        std::chrono::steady_clock::now();
    if (!config.suppress) {
        std::cout << "Starting " << task << " (" << iterations << " runs, "
                  << numThreads << " threads)" << std::endl;
    }

    BS::thread_pool pool(numThreads);

    // each thread keeps its own counts, indexed by position in the pool
    std::vector<std::thread::id> threadIds = pool.get_thread_ids();
    std::unordered_map<std::thread::id, int> indexByThreadId;
    for (int i = 0; static_cast<size_t>(i) < threadIds.size(); i++) {
        indexByThreadId[threadIds[i]] = i;
    }

    // track progress
    std::atomic<int> completed{0};
    std::atomic<long> duration{0}; // us
    std::atomic<bool> failed{false};
    std::mutex errorMutex;
    std::exception_ptr error;

    for (int i = 0; i < iterations; i++) {
        pool.detach_task([i, &work, &indexByThreadId, &completed, &duration,
                          &failed, &errorMutex, &error] {
            auto t0 = std::chrono::steady_clock::now();
            if (!failed.load(std::memory_order_relaxed)) {
                try {
                    work(indexByThreadId.at(std::this_thread::get_id()), i);
                } catch (...) {
                    // rethrown on the calling thread once the pool is idle
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!error) {
                        error = std::current_exception();
                    }
                    failed.store(true, std::memory_order_relaxed);
                }
            }
            auto t1 = std::chrono::steady_clock::now();
            auto diff =
                std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0);
            duration.fetch_add(static_cast<long>(diff.count()),
                               std::memory_order_relaxed);
            completed.fetch_add(1, std::memory_order_relaxed);
        });
    }

    if (!config.suppress) {
        // set up progress bar
        indicators::show_console_cursor(false);
        indicators::BlockProgressBar bar{
            indicators::option::BarWidth{64},
            indicators::option::ForegroundColor{indicators::Color::white},
            indicators::option::FontStyles{
                std::vector<indicators::FontStyle>{
                    indicators::FontStyle::bold}},
            indicators::option::MaxProgress{iterations},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{true},
        };

        // update progress bar in completion order
        while (completed.load() < iterations) {
            int i = std::max(1, completed.load());
            bar.set_option(indicators::option::PostfixText{
                std::to_string(completed.load()) + "/" +
                std::to_string(iterations) + " (" +
                std::to_string(duration.load() / static_cast<float>(1000 * i)) +
                "ms / run)"});
            bar.set_progress(completed.load());
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        pool.wait();

        bar.set_option(indicators::option::PostfixText{
            std::to_string(iterations) + "/" + std::to_string(iterations)});
        bar.set_progress(iterations);
        bar.mark_as_completed();
        indicators::show_console_cursor(true);
    } else {
        pool.wait();
    }

    if (error) {
        std::rethrow_exception(error);
    }

    if (!config.suppress) {
        auto tEnd = std::chrono::steady_clock::now();
        std::cout << "Done " << task << ", took " << std::fixed
                  << std::setprecision(3)
                  << std::chrono::duration_cast<std::chrono::milliseconds>(
                         tEnd - tStart)
                             .count() /
                         1000.0
                  << " seconds" << std::defaultfloat << std::endl;
    }
}

std::vector<ChampionOdds> Simulator::runChampionOdds() const {
    const int iterations = config.championRuns;
    if (iterations <= 0) {
        throw std::invalid_argument("Number of simulations must be > 0");
    }

    std::vector<std::unordered_map<std::string, int>> threadCounts(
        getNumThreads());
    runParallel("championship odds simulations", iterations,
                [this, &threadCounts](int threadInd, int runNumber) {
                    std::mt19937 randomEngine = createRandomEngine(runNumber);
                    BracketResult result =
                        simulateBracket(bracket, randomEngine);
                    threadCounts[threadInd][result.champion] += 1;
                });

    // combine thread counts
    std::unordered_map<std::string, int> counts;
    for (std::unordered_map<std::string, int> &local : threadCounts) {
        for (std::pair<const std::string, int> &kv : local) {
            counts[kv.first] += kv.second;
        }
    }

    std::vector<ChampionOdds> odds;
    for (const std::pair<const std::string, int> &kv : counts) {
        double percent = kv.second * 100.0 / iterations;
        if (percent >= config.reportThreshold) {
            odds.push_back(ChampionOdds{kv.first, kv.second, percent});
        }
    }
    std::sort(odds.begin(), odds.end(),
              [](const ChampionOdds &o1, const ChampionOdds &o2) {
                  if (o1.wins != o2.wins) {
                      return o1.wins > o2.wins;
                  }
                  return o1.name < o2.name;
              });
    return odds;
}

DesiredChampionCounts
Simulator::runDesiredChampion(const std::string &desiredChampion) const {
    const int iterations = config.desiredChampionRuns;
    if (iterations <= 0) {
        throw std::invalid_argument("Number of simulations must be > 0");
    }
    if (config.maxAttempts < 0) {
        throw std::invalid_argument("Max attempts must be >= 0");
    }
    if (!bracket.hasTeam(desiredChampion)) {
        throw std::invalid_argument("Desired champion " + desiredChampion +
                                    " is not in the bracket");
    }

    std::atomic<long> attemptsLeft{getMaxAttempts()};
    std::vector<DesiredChampionCounts> threadCounts(getNumThreads());
    runParallel("desired champion simulations", iterations,
                [this, &threadCounts, &attemptsLeft,
                 &desiredChampion](int threadInd, int runNumber) {
                    std::mt19937 randomEngine = createRandomEngine(runNumber);
                    DesiredChampionRun run = simulateDesiredChampion(
                        bracket, desiredChampion, randomEngine, attemptsLeft);
                    threadCounts[threadInd].attempts += run.attempts;
                    if (run.result) {
                        threadCounts[threadInd].add(*run.result);
                    }
                });

    DesiredChampionCounts counts;
    for (const DesiredChampionCounts &local : threadCounts) {
        counts.merge(local);
    }
    if (counts.runs < iterations) {
        throw ConvergenceExhaustion(desiredChampion, counts.runs, iterations,
                                    counts.attempts);
    }
    return counts;
}

void Simulator::writeFrontmatter(std::ostream &out, const std::string &mode,
                                 long simulations) const {
    out << "---\n";
    out << "timestamp: "
        << formatSystemTimePoint(std::chrono::system_clock::now(),
                                 "%Y-%m-%d %H:%M:%S")
        << "\n";
    out << "mode: " << mode << "\n";
    out << "simulations: " << simulations << "\n";
    if (config.seed) {
        out << "seed: " << *config.seed << "\n";
    }
    out << "---\n";
}

static std::ofstream openOutput(const std::filesystem::path &outputPath) {
    if (outputPath.has_parent_path()) {
        std::filesystem::create_directories(outputPath.parent_path());
    }
    std::ofstream out(outputPath);
    if (!out) {
        throw std::runtime_error("Unable to write " + outputPath.string());
    }
    return out;
}

void Simulator::writeBracket(const Bracket &simulated,
                             const std::filesystem::path &outputPath) const {
    std::ofstream out = openOutput(outputPath);
    out << simulated.simulationString();
}

void Simulator::writeChampionOdds(
    const std::vector<ChampionOdds> &odds,
    const std::filesystem::path &outputPath) const {
    std::ofstream out = openOutput(outputPath);
    writeFrontmatter(out, "champion", config.championRuns);
    out << "team,wins,percent\n";
    for (const ChampionOdds &o : odds) {
        out << o.name << "," << o.wins << "," << std::fixed
            << std::setprecision(1) << o.percent << std::defaultfloat << "\n";
    }
}

void Simulator::writeDesiredChampion(
    const DesiredChampionCounts &counts, const std::string &desiredChampion,
    const std::filesystem::path &outputPath) const {
    std::ofstream out = openOutput(outputPath);
    writeFrontmatter(out, "desired champion " + desiredChampion,
                     counts.attempts);
    out << "region,round,team,count\n";
    for (const auto &region : counts.regionCounts) {
        for (const auto &round : region.second) {
            for (const std::pair<const std::string, int> &kv : round.second) {
                out << region.first << "," << roundLabel(round.first) << ","
                    << kv.first << "," << kv.second << "\n";
            }
        }
    }
    for (const std::pair<const std::string, int> &kv : counts.finalistCounts) {
        out << "FINALISTS,," << kv.first << "," << kv.second << "\n";
    }
}
