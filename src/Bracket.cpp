#include "Bracket.h"
#include "Matchup.h"
#include "Region.h"
#include "Team.h"
#include "errors.h"
#include "globals.h"
#include "utils.h"
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

Bracket::Bracket(std::vector<Region> r, Pairings pairings)
    : regions(r), semifinalPairings(pairings) {
    validatePairings();
}

Bracket Bracket::fromFile(const std::string &path, Pairings pairings) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Unable to open bracket file " + path);
    }
    return fromStream(file, pairings);
}

Bracket Bracket::fromStream(std::istream &in, Pairings pairings) {
    // check for correct header line
    std::string line;
    std::getline(in, line);
    if (trim(line) != HEADER_STRING) {
        throw HeaderMismatchError(trim(line), HEADER_STRING);
    }

    std::vector<Region> regions;
    std::unordered_map<std::string, size_t> regionIndByName;
    int lineNumber = 1;
    while (std::getline(in, line)) {
        lineNumber++;
        if (trim(line).empty()) {
            continue;
        }
        try {
            Team t = Team::fromLine(line);
            if (regionIndByName.count(t.region) == 0) {
                regionIndByName[t.region] = regions.size();
                regions.push_back(Region(t.region));
            }
            regions[regionIndByName.at(t.region)].append(t);
        } catch (const MalformedInputError &e) {
            throw MalformedInputError("Line " + std::to_string(lineNumber) +
                                      ": " + e.what());
        }
    }

    for (Region &r : regions) {
        r.sort();
    }
    return Bracket(regions, pairings);
}

void Bracket::validatePairings() const {
    if (semifinalPairings.size() != 2) {
        throw StructuralError("Expected 2 semifinal pairings, found " +
                              std::to_string(semifinalPairings.size()));
    }
    std::unordered_set<std::string> regionNames;
    for (const Region &r : regions) {
        regionNames.insert(r.getName());
    }
    std::unordered_set<std::string> pairedNames;
    for (const std::pair<std::string, std::string> &p : semifinalPairings) {
        for (const std::string &n : {p.first, p.second}) {
            if (regionNames.count(n) == 0) {
                throw StructuralError("Region \"" + n + "\" not recognized");
            }
            if (!pairedNames.insert(n).second) {
                throw StructuralError("Region \"" + n +
                                      "\" appears in more than one pairing");
            }
        }
    }
    for (const std::string &n : regionNames) {
        if (pairedNames.count(n) == 0) {
            throw StructuralError("Region \"" + n +
                                  "\" not recognized by semifinal pairings");
        }
    }
}

Region &Bracket::findRegion(const std::string &name) {
    for (Region &r : regions) {
        if (r.getName() == name) {
            return r;
        }
    }
    throw StructuralError("Region \"" + name + "\" not recognized");
}

bool Bracket::hasTeam(const std::string &name) const {
    for (const Region &r : regions) {
        for (const Team &t : r.getTeams()) {
            if (t.name == name) {
                return true;
            }
        }
    }
    return false;
}

void Bracket::simulate(std::mt19937 &randomEngine, bool suppress) {
    finalists.clear();
    champion.reset();

    // find each region winner
    for (Region &r : regions) {
        r.simulate(randomEngine, suppress);
    }

    // then match up region winners
    for (const std::pair<std::string, std::string> &p : semifinalPairings) {
        Team &w1 = findRegion(p.first).winner();
        Team &w2 = findRegion(p.second).winner();
        finalists.push_back(pickWinner(w1, w2, Round::Finals, randomEngine));
        if (!suppress) {
            std::cout << GRAY << roundLabel(Round::Finals) << RESET << "  "
                      << GREEN << finalists.back().name << RESET << " ("
                      << p.first << " v " << p.second << ")" << std::endl;
        }
    }

    // now pick a champion
    champion = pickWinner(finalists[0], finalists[1], Round::Champions,
                          randomEngine);
    if (!suppress) {
        std::cout << GRAY << roundLabel(Round::Champions) << RESET << "  "
                  << GREEN << champion->name << RESET << std::endl;
    }
}

const std::string &Bracket::getChampion() const {
    if (!champion) {
        throw std::logic_error("Bracket has not been simulated");
    }
    return champion->name;
}

BracketResult Bracket::results() const {
    BracketResult result;
    result.champion = getChampion();
    for (const Region &r : regions) {
        result.regions.push_back(r.results());
    }
    for (const Team &t : finalists) {
        result.finalists.push_back(t.name);
    }
    return result;
}

std::string Bracket::simulationString() const {
    const std::string &championName = getChampion();
    std::string s;
    // first, build each region
    for (const Region &r : regions) {
        s += r.simulationString();
    }

    // build up finals
    s += "\n==========Championship==========\n";
    for (const Team &t : finalists) {
        s += t.name + "\n";
    }
    s += "\nChampion: " + championName + "\n";
    return s;
}
