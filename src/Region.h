#ifndef REGION_H
#define REGION_H

#include "Team.h"
#include "globals.h"
#include <map>
#include <random>
#include <string>
#include <vector>

// team names still alive after each round of one simulated region
struct RegionResult {
    std::string name;
    std::map<Round, std::vector<std::string>> teamsByRound;
};

// Stores a region of the bracket and all team data for that region
class Region {
  public:
    explicit Region(std::string n) : name(n) {}

    void append(const Team &t);
    void sort(); // stable sort teams by seed
    // Play the region down to one winner; throws StructuralError if the
    // region's field can't be paired down to a single team
    void simulate(std::mt19937 &randomEngine, bool suppress = true);

    const std::string &getName() const { return name; }
    const std::vector<Team> &getTeams() const { return teams; }
    const std::vector<int> &getTeamIndsByRound(Round r) const;
    Team &winner();
    const Team &winner() const;
    RegionResult results() const;
    std::string simulationString() const;

  private:
    void resetSeedSlots();
    // throws StructuralError before a full simulation
    int winnerTeamInd() const;
    int playGame(int teamInd1, int teamInd2, Round r,
                 std::mt19937 &randomEngine, bool suppress);

    std::string name;
    std::vector<Team> teams;
    // After simulation, stores the team inds (into teams) alive in each round
    std::map<Round, std::vector<int>> teamIndsByRound;
};

#endif // REGION_H
