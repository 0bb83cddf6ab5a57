// Simulate brackets

#include "Bracket.h"
#include "Simulator.h"
#include "errors.h"
#include "globals.h"
#include "utils.h"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// usage:
// $ ./build/march [-i <input csv>] [-o <output path>] [-c | -f <team>]
//   [-p <region>,<region>]... [-s <seed>] [-t <threads>] [-m <max attempts>]

static void usage(const std::string &error) {
    std::cerr << RED << error << RESET << std::endl;
    std::cerr
        << "Usage: march [-i input] [-o output] [-c | -f champion]\n"
           "             [-p region,region]... [-s seed] [-t threads]\n"
           "             [-m max_attempts]\n"
           "  -i, --input          bracket csv (default data.csv)\n"
           "  -o, --output         output file (default output.txt)\n"
           "  -c, --champion_mode  print odds of each team being champion\n"
           "  -f, --find_champion  tally brackets won by the given team\n"
           "  -p, --pairing        regions whose winners meet in a semifinal\n"
           "  -s, --seed           seed for reproducible runs\n"
           "  -t, --threads        worker threads (default: all cores)\n"
           "  -m, --max_attempts   simulation budget for --find_champion"
        << std::endl;
    exit(1);
}

int main(int argc, char **argv) {
    std::string input = "data.csv";
    std::string output = "output.txt";
    bool championMode = false;
    std::string desiredChampion = "";
    Bracket::Pairings pairings;
    SimulationConfig config;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--champion_mode") {
            championMode = true;
            continue;
        }
        if (i + 1 >= argc) {
            usage("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        try {
            if (arg == "-i" || arg == "--input") {
                input = value;
            } else if (arg == "-o" || arg == "--output") {
                output = value;
            } else if (arg == "-f" || arg == "--find_champion") {
                desiredChampion = value;
            } else if (arg == "-p" || arg == "--pairing") {
                std::vector<std::string> regions = split(value, ',');
                if (regions.size() != 2) {
                    usage("Invalid pairing: " + value);
                }
                pairings.emplace_back(trim(regions[0]), trim(regions[1]));
            } else if (arg == "-s" || arg == "--seed") {
                config.seed = static_cast<unsigned>(parseCount(
                    value, 0, std::numeric_limits<unsigned>::max()));
            } else if (arg == "-t" || arg == "--threads") {
                config.numThreads = static_cast<unsigned>(
                    parseCount(value, 1, std::numeric_limits<int>::max()));
            } else if (arg == "-m" || arg == "--max_attempts") {
                config.maxAttempts =
                    parseCount(value, 1, std::numeric_limits<long>::max());
            } else {
                usage("Unknown argument: " + arg);
            }
        } catch (const std::logic_error &e) {
            usage("Invalid value for " + arg + ": " + e.what());
        }
    }

    if (championMode && !desiredChampion.empty()) {
        usage("--champion_mode and --find_champion can't be used together");
    }
    if (pairings.empty()) {
        pairings = DEFAULT_SEMIFINAL_PAIRINGS;
    }

    try {
        Simulator s(input, config, pairings);

        if (championMode) {
            std::vector<ChampionOdds> odds = s.runChampionOdds();
            std::cout << "Percent chance of winning tournament:" << std::endl;
            for (const ChampionOdds &o : odds) {
                std::cout << "  " << o.name << ": " << std::fixed
                          << std::setprecision(1) << o.percent << "%"
                          << std::defaultfloat << std::endl;
            }
            s.writeChampionOdds(odds, output);
        } else if (!desiredChampion.empty()) {
            std::cout << "Desired champion: " << desiredChampion << std::endl;
            std::cout << "Simulation will stop after "
                      << config.desiredChampionRuns
                      << " runs generate desired champion" << std::endl;
            DesiredChampionCounts counts =
                s.runDesiredChampion(desiredChampion);
            std::cout << "Finalists (" << counts.attempts
                      << " simulations):" << std::endl;
            for (const std::pair<const std::string, int> &kv :
                 counts.finalistCounts) {
                std::cout << "  " << kv.first << ": " << kv.second
                          << std::endl;
            }
            s.writeDesiredChampion(counts, desiredChampion, output);
        } else {
            Bracket b = s.simulateOnce();
            std::cout << b.simulationString() << std::endl;
            s.writeBracket(b, output);
        }
    } catch (const std::exception &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        return 2;
    }

    std::cout << "Wrote results to " << output << "." << std::endl;
    return 0;
}
