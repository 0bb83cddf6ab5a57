#include "Team.h"
#include "errors.h"
#include "globals.h"
#include "utils.h"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

ProbabilityTable
ProbabilityTable::fromRoundOdds(std::vector<std::optional<double>> o) {
    ProbabilityTable table;
    table.roundOdds = o;
    table.roundOdds.resize(NUM_ROUNDS); // missing trailing rounds are absent

    // make the odds conditional on reaching the previous round
    for (size_t i = 0; i < table.roundOdds.size(); i++) {
        const std::optional<double> &odd = table.roundOdds[i];
        if (i == 0 || !odd || !table.roundOdds[i - 1]) {
            // no previous round to condition on
            table.conditionalRoundOdds.push_back(odd);
        } else if (*table.roundOdds[i - 1] == 0) {
            table.conditionalRoundOdds.push_back(0.0);
        } else {
            table.conditionalRoundOdds.push_back(
                std::min(1.0, *odd / *table.roundOdds[i - 1]));
        }
    }
    return table;
}

std::optional<double> ProbabilityTable::operator[](Round r) const {
    // rounds are indexed from 1; vectors from 0
    return conditionalRoundOdds[roundIndex(r) - 1];
}

Team Team::fromLine(const std::string &line) {
    std::vector<std::string> row = split(trim(line), ',');
    if (row.size() < 3 || row.size() > 3 + static_cast<size_t>(NUM_ROUNDS)) {
        throw MalformedInputError("Expected 3 to " +
                                  std::to_string(3 + NUM_ROUNDS) +
                                  " fields, found " +
                                  std::to_string(row.size()));
    }
    std::string region = trim(row[0]);
    std::string name = trim(row[2]);
    if (region.empty() || name.empty()) {
        throw MalformedInputError("Missing region or team name");
    }
    int seed = parseSeed(row[1]);

    std::vector<std::optional<double>> roundOdds;
    for (size_t i = 3; i < row.size(); i++) {
        roundOdds.push_back(parseOdds(row[i]));
    }
    return Team(region, seed, name,
                std::make_shared<const ProbabilityTable>(
                    ProbabilityTable::fromRoundOdds(roundOdds)));
}

double Team::conditionalOdds(Round r) const {
    std::optional<double> odd = (*odds)[r];
    if (!odd) {
        throw StructuralError(name + " has no odds for round " +
                              roundLabel(r));
    }
    return *odd;
}
