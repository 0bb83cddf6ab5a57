#include "Region.h"
#include "Matchup.h"
#include "Team.h"
#include "errors.h"
#include "globals.h"
#include "utils.h"
#include <algorithm>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

void Region::append(const Team &t) {
    teams.push_back(t);
}

void Region::sort() {
    std::stable_sort(teams.begin(), teams.end(),
                     [](const Team &t1, const Team &t2) {
                         return t1.seed < t2.seed;
                     });
}

void Region::resetSeedSlots() {
    for (Team &t : teams) {
        t.resetSeedSlot();
    }
}

const std::vector<int> &Region::getTeamIndsByRound(Round r) const {
    return teamIndsByRound.at(r);
}

void Region::simulate(std::mt19937 &randomEngine, bool suppress) {
    teamIndsByRound.clear();
    resetSeedSlots();

    if (!suppress) {
        std::cout << CYAN << "Region: " << name << RESET << std::endl;
    }

    // first four: duplicate seeds play in, single seeds advance
    std::map<int, std::vector<int>> teamIndsBySeed;
    for (size_t i = 0; i < teams.size(); i++) {
        teamIndsBySeed[teams[i].seed].push_back(static_cast<int>(i));
    }
    std::vector<int> firstRoundTeamInds;
    for (const std::pair<const int, std::vector<int>> &kv : teamIndsBySeed) {
        const std::vector<int> &seedTeamInds = kv.second;
        if (seedTeamInds.size() == 2) {
            firstRoundTeamInds.push_back(playGame(seedTeamInds[0],
                                                  seedTeamInds[1],
                                                  Round::FirstFour,
                                                  randomEngine, suppress));
        } else if (seedTeamInds.size() == 1) {
            firstRoundTeamInds.push_back(seedTeamInds[0]);
        } else {
            throw StructuralError(
                "Incorrect number of teams (" +
                std::to_string(seedTeamInds.size()) + ") for seed " +
                std::to_string(kv.first) + " in region " + name);
        }
    }
    teamIndsByRound[Round::FirstFour] = firstRoundTeamInds;
    // only a region left with one team after the first four skips its games
    const bool loneEntrant = firstRoundTeamInds.size() == 1;

    for (int roundNumber = 2; roundNumber <= roundIndex(LAST_REGION_ROUND);
         roundNumber++) {
        const Round r = roundFromIndex(roundNumber);
        std::vector<int> prevRoundTeamInds =
            teamIndsByRound.at(roundFromIndex(roundNumber - 1));

        if (loneEntrant) {
            teamIndsByRound[r] = prevRoundTeamInds;
            continue;
        }
        if (prevRoundTeamInds.size() % 2 != 0) {
            throw StructuralError(
                "Odd number of teams (" +
                std::to_string(prevRoundTeamInds.size()) + ") entering " +
                roundLabel(r) + " in region " + name);
        }

        // best remaining seed slot plays worst remaining seed slot
        std::stable_sort(prevRoundTeamInds.begin(), prevRoundTeamInds.end(),
                         [this](int i1, int i2) {
                             return teams[i1].seedSlot < teams[i2].seedSlot;
                         });
        const size_t halfNumTeams = prevRoundTeamInds.size() / 2;
        std::vector<int> highSeeds(prevRoundTeamInds.begin(),
                                   prevRoundTeamInds.begin() + halfNumTeams);
        std::vector<int> lowSeeds(prevRoundTeamInds.begin() + halfNumTeams,
                                  prevRoundTeamInds.end());
        std::stable_sort(lowSeeds.begin(), lowSeeds.end(),
                         [this](int i1, int i2) {
                             return teams[i1].seedSlot > teams[i2].seedSlot;
                         });

        std::vector<int> thisRoundTeamInds;
        for (size_t i = 0; i < halfNumTeams; i++) {
            thisRoundTeamInds.push_back(
                playGame(highSeeds[i], lowSeeds[i], r, randomEngine, suppress));
        }

        // recorded by original seed for display
        std::stable_sort(thisRoundTeamInds.begin(), thisRoundTeamInds.end(),
                         [this](int i1, int i2) {
                             return teams[i1].seed < teams[i2].seed;
                         });
        teamIndsByRound[r] = thisRoundTeamInds;
    }

    if (teamIndsByRound.at(LAST_REGION_ROUND).size() != 1) {
        throw StructuralError(
            "Region " + name + " ended with " +
            std::to_string(teamIndsByRound.at(LAST_REGION_ROUND).size()) +
            " teams instead of one winner");
    }
}

int Region::playGame(int teamInd1, int teamInd2, Round r,
                     std::mt19937 &randomEngine, bool suppress) {
    Team &w = pickWinner(teams[teamInd1], teams[teamInd2], r, randomEngine);
    const int winnerInd = (&w == &teams[teamInd1]) ? teamInd1 : teamInd2;
    const int loserInd = (winnerInd == teamInd1) ? teamInd2 : teamInd1;
    if (!suppress) {
        std::cout << GRAY << roundLabel(r) << RESET << "  " << GREEN
                  << teams[winnerInd].name << RESET << " ("
                  << teams[winnerInd].seed << ", slot "
                  << teams[winnerInd].seedSlot << ") def. "
                  << teams[loserInd].name << " (" << teams[loserInd].seed
                  << ")" << std::endl;
    }
    return winnerInd;
}

int Region::winnerTeamInd() const {
    auto it = teamIndsByRound.find(LAST_REGION_ROUND);
    if (it == teamIndsByRound.end() || it->second.size() != 1) {
        throw StructuralError("Region " + name + " has no winner");
    }
    return it->second[0];
}

Team &Region::winner() {
    return teams[winnerTeamInd()];
}

const Team &Region::winner() const {
    return teams[winnerTeamInd()];
}

RegionResult Region::results() const {
    RegionResult result;
    result.name = name;
    for (const std::pair<const Round, std::vector<int>> &kv : teamIndsByRound) {
        std::vector<std::string> &names = result.teamsByRound[kv.first];
        for (int teamInd : kv.second) {
            names.push_back(teams[teamInd].name);
        }
    }
    return result;
}

std::string Region::simulationString() const {
    std::string s = "\n==========" + name + "==========\n";
    for (const std::pair<const Round, std::vector<int>> &kv : teamIndsByRound) {
        s += "\n" + roundLabel(kv.first) + ":\n";
        for (int teamInd : kv.second) {
            s += teams[teamInd].name + "\n";
        }
    }
    return s;
}
