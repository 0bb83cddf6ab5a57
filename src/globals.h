#ifndef GLOBALS_H
#define GLOBALS_H

#include <string>
#include <utility>
#include <vector>

// Terminal colors
#define RESET "\033[0m"
#define GRAY "\033[90m"
#define RED "\033[91m"
#define GREEN "\033[92m"
#define CYAN "\033[96m"

// Rounds are numbered from 1, matching the probability columns of the input
enum class Round {
    FirstFour = 1,
    RoundOf32,
    RoundOf16,
    EliteEight,
    FinalFour, // last round played inside a region
    Finals,    // semifinal matchups between region winners
    Champions  // championship matchup
};

constexpr int NUM_ROUNDS = 7;
constexpr Round LAST_REGION_ROUND = Round::FinalFour;

// value used for odds reported as "<0.1"
constexpr double BELOW_THRESHOLD_ODDS = 0.0001;
const std::string BELOW_THRESHOLD_MARKER = "<0.1";

extern const std::string ROUND_LABELS[]; // indexed by round - 1
extern const std::string HEADER_STRING;

// each pair of region winners plays one semifinal
const std::vector<std::pair<std::string, std::string>>
    DEFAULT_SEMIFINAL_PAIRINGS = {{"Midwest", "West"}, {"South", "East"}};

#endif // GLOBALS_H
