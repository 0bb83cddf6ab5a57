#include "Region.h"
#include "Team.h"
#include "errors.h"
#include "globals.h"
#include "testUtils.h"
#include "utils.h"
#include <catch2/catch.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

std::vector<std::string> namesInRound(const Region &region, Round r) {
    std::vector<std::string> names;
    for (int teamInd : region.getTeamIndsByRound(r)) {
        names.push_back(region.getTeams()[teamInd].name);
    }
    return names;
}

// 16 seeds plus a play-in at seed 16
Region fullRegion() {
    Region region("Midwest");
    for (int seed = 1; seed <= 16; seed++) {
        const double q = 0.95 - 0.05 * (seed - 1);
        if (seed == 16) {
            region.append(makeTeam("Midwest", 16, "16a",
                                   {0.5, 0.5 * q, 0.5 * q * q,
                                    0.5 * q * q * q, 0.5 * q * q * q * q}));
            region.append(makeTeam("Midwest", 16, "16b",
                                   {0.5, 0.5 * q, 0.5 * q * q,
                                    0.5 * q * q * q, 0.5 * q * q * q * q}));
        } else {
            region.append(makeTeam("Midwest", seed, std::to_string(seed),
                                   {1.0, q, q * q, q * q * q, q * q * q * q}));
        }
    }
    region.sort();
    return region;
}

} // namespace

TEST_CASE("Region plays down to one winner", "[region]") {
    std::mt19937 randomEngine(2024);
    Region region = fullRegion();

    for (int run = 0; run < 200; run++) {
        region.simulate(randomEngine);
        size_t expected = 16;
        for (int r = 1; r <= roundIndex(LAST_REGION_ROUND); r++) {
            CHECK(region.getTeamIndsByRound(roundFromIndex(r)).size() ==
                  expected);
            expected /= 2;
        }
        const std::vector<int> &last =
            region.getTeamIndsByRound(LAST_REGION_ROUND);
        REQUIRE(last.size() == 1);
        CHECK(&region.winner() == &region.getTeams()[last[0]]);
    }
}

TEST_CASE("Play-in leaves one team per seed", "[region]") {
    std::mt19937 randomEngine(5);
    Region region = fullRegion();
    region.simulate(randomEngine);

    std::vector<std::string> firstRound =
        namesInRound(region, Round::FirstFour);
    REQUIRE(firstRound.size() == 16);
    for (int seed = 1; seed <= 15; seed++) {
        CHECK(firstRound[seed - 1] == std::to_string(seed));
    }
    CHECK((firstRound[15] == "16a" || firstRound[15] == "16b"));
}

TEST_CASE("Sure winner of a two team region always wins", "[region]") {
    std::mt19937 randomEngine(11);
    Region region("East");
    region.append(makeTeam("East", 1, "Sure Thing", {1.0}));
    region.append(makeTeam("East", 1, "No Chance", {0.0}));
    region.sort();

    for (int run = 0; run < 1000; run++) {
        region.simulate(randomEngine);
        REQUIRE(region.winner().name == "Sure Thing");
    }
    CHECK(namesInRound(region, Round::FirstFour) ==
          std::vector<std::string>{"Sure Thing"});
}

TEST_CASE("Upset winners are reseeded by their seed slot", "[region]") {
    std::mt19937 randomEngine(99);
    // round of 32: favorites win except 16 over 1
    // round of 16: 16, 2, 3 and 4 win
    // elite 8: 2 and 16 can only win if paired against 3 and 4
    Region region("South");
    for (int seed = 1; seed <= 16; seed++) {
        std::vector<std::optional<double>> odds;
        if (seed == 2 || seed == 16) {
            odds = {1.0, 1.0, 1.0, 1.0, 0.5};
        } else if (seed == 3 || seed == 4) {
            odds = {1.0, 1.0, 1.0, 0.0, 0.0};
        } else if (seed >= 5 && seed <= 8) {
            odds = {1.0, 1.0, 0.0, 0.0, 0.0};
        } else {
            odds = {1.0, 0.0, 0.0, 0.0, 0.0};
        }
        region.append(makeTeam("South", seed, "S" + std::to_string(seed),
                               odds));
    }
    region.sort();

    region.simulate(randomEngine);

    // recorded by original seed, not seed slot
    CHECK(namesInRound(region, Round::RoundOf32) ==
          std::vector<std::string>{"S2", "S3", "S4", "S5", "S6", "S7", "S8",
                                   "S16"});
    CHECK(namesInRound(region, Round::RoundOf16) ==
          std::vector<std::string>{"S2", "S3", "S4", "S16"});
    // 16 holds the 1 slot, so plays 4 while 2 plays 3
    CHECK(namesInRound(region, Round::EliteEight) ==
          std::vector<std::string>{"S2", "S16"});
    const Team &s16 = region.getTeams()[15];
    REQUIRE(s16.name == "S16");
    CHECK(s16.seed == 16);
    CHECK(s16.seedSlot == 1);
}

TEST_CASE("Lone first four survivor advances without games", "[region]") {
    std::mt19937 randomEngine(3);
    Region region("West");
    region.append(makeTeam("West", 1, "Only", {1.0}));

    region.simulate(randomEngine);
    CHECK(region.winner().name == "Only");
    for (int r = 1; r <= roundIndex(LAST_REGION_ROUND); r++) {
        CHECK(namesInRound(region, roundFromIndex(r)) ==
              std::vector<std::string>{"Only"});
    }
}

TEST_CASE("Region field must pair down evenly", "[region]") {
    std::mt19937 randomEngine(1);

    SECTION("three teams share a seed") {
        Region region("East");
        for (const std::string name : {"A", "B", "C"}) {
            region.append(makeTeam("East", 4, name, {0.3, 0.1}));
        }
        CHECK_THROWS_AS(region.simulate(randomEngine), StructuralError);
    }

    SECTION("odd number of teams after play-in") {
        Region region("East");
        for (int seed = 1; seed <= 3; seed++) {
            region.append(
                makeTeam("East", seed, std::to_string(seed), {1.0, 0.5, 0.5}));
        }
        CHECK_THROWS_AS(region.simulate(randomEngine), StructuralError);
    }

    SECTION("truncated region runs out of teams early") {
        Region region("East");
        for (int seed = 1; seed <= 4; seed++) {
            region.append(makeTeam("East", seed, std::to_string(seed),
                                   {1.0, 0.5, 0.5, 0.5, 0.5}));
        }
        CHECK_THROWS_AS(region.simulate(randomEngine), StructuralError);
    }

    SECTION("too many teams for the region rounds") {
        Region region("East");
        for (int seed = 1; seed <= 32; seed++) {
            region.append(makeTeam("East", seed, std::to_string(seed),
                                   {1.0, 0.5, 0.5, 0.5, 0.5}));
        }
        CHECK_THROWS_AS(region.simulate(randomEngine), StructuralError);
    }

    SECTION("empty region") {
        Region region("East");
        CHECK_THROWS_AS(region.simulate(randomEngine), StructuralError);
        CHECK_THROWS_AS(region.winner(), StructuralError);
    }
}

TEST_CASE("Region results list surviving team names", "[region]") {
    std::mt19937 randomEngine(17);
    Region region = fullRegion();
    region.simulate(randomEngine);

    RegionResult result = region.results();
    CHECK(result.name == "Midwest");
    REQUIRE(result.teamsByRound.size() ==
            static_cast<size_t>(roundIndex(LAST_REGION_ROUND)));
    CHECK(result.teamsByRound.at(LAST_REGION_ROUND) ==
          std::vector<std::string>{region.winner().name});

    std::string s = region.simulationString();
    CHECK(s.find("==========Midwest==========") != std::string::npos);
    CHECK(s.find("ELITE 8:") != std::string::npos);
}
