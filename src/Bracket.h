#ifndef BRACKET_H
#define BRACKET_H

#include "Region.h"
#include "Team.h"
#include "globals.h"
#include <istream>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

// snapshot of one finished simulation
struct BracketResult {
    std::vector<RegionResult> regions;
    std::vector<std::string> finalists;
    std::string champion;
};

// Represents bracket and stores all region and team data. Copying a bracket
// copies every team, so each simulation can run on its own copy.
class Bracket {
  public:
    using Pairings = std::vector<std::pair<std::string, std::string>>;

    // throws StructuralError if pairings don't match the regions
    Bracket(std::vector<Region> r,
            Pairings pairings = DEFAULT_SEMIFINAL_PAIRINGS);

    // Read bracket from csv; throws HeaderMismatchError, MalformedInputError
    // or StructuralError
    static Bracket fromFile(const std::string &path,
                            Pairings pairings = DEFAULT_SEMIFINAL_PAIRINGS);
    static Bracket fromStream(std::istream &in,
                              Pairings pairings = DEFAULT_SEMIFINAL_PAIRINGS);

    void simulate(std::mt19937 &randomEngine, bool suppress = true);

    const std::vector<Region> &getRegions() const { return regions; }
    const Pairings &getSemifinalPairings() const { return semifinalPairings; }
    bool hasTeam(const std::string &name) const;
    bool isSimulated() const { return champion.has_value(); }
    const std::string &getChampion() const; // throws std::logic_error
    BracketResult results() const;          // throws std::logic_error
    std::string simulationString() const;   // throws std::logic_error

  private:
    void validatePairings() const;
    Region &findRegion(const std::string &name);

    std::vector<Region> regions; // in order of first appearance in input
    Pairings semifinalPairings;
    std::vector<Team> finalists;
    std::optional<Team> champion;
};

#endif // BRACKET_H
