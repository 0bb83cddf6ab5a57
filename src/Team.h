#ifndef TEAM_H
#define TEAM_H

#include "globals.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Per-round odds for one team; immutable once built and shared by every copy
// of the team
struct ProbabilityTable {
    std::vector<std::optional<double>> roundOdds; // odds of reaching round
    std::vector<std::optional<double>>
        conditionalRoundOdds; // odds of reaching round given previous round

    static ProbabilityTable fromRoundOdds(std::vector<std::optional<double>> o);
    std::optional<double> operator[](Round r) const; // conditional odds
};

struct Team {
    std::string region;
    int seed; // 1-based, lower is stronger
    std::string name;
    std::shared_ptr<const ProbabilityTable> odds;
    // If a team beats a higher seed, this stores the higher team's seed; only
    // used to pair teams in later rounds of the same simulation
    int seedSlot;

    Team(std::string r, int s, std::string n,
         std::shared_ptr<const ProbabilityTable> o)
        : region(r), seed(s), name(n), odds(o), seedSlot(s) {}

    // Build from one input row (REGION,SEED,TEAM,<round odds>...)
    static Team fromLine(const std::string &line);

    // conditional odds for round; throws StructuralError if absent
    double conditionalOdds(Round r) const;
    void resetSeedSlot() { seedSlot = seed; }
};

#endif // TEAM_H
