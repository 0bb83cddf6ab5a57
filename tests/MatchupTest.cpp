#include "Matchup.h"
#include "Team.h"
#include "globals.h"
#include "testUtils.h"
#include <catch2/catch.hpp>
#include <random>

TEST_CASE("Winner is picked in proportion to conditional odds", "[matchup]") {
    std::mt19937 randomEngine(42);
    Team t1 = makeTeam("East", 1, "Favorite", {1.0, 0.8});
    Team t2 = makeTeam("East", 16, "Underdog", {1.0, 0.2});

    const int trials = 100000;
    int t1Wins = 0;
    for (int i = 0; i < trials; i++) {
        Team a = t1;
        Team b = t2;
        if (&pickWinner(a, b, Round::RoundOf32, randomEngine) == &a) {
            t1Wins++;
        }
    }
    CHECK(t1Wins / static_cast<double>(trials) == Approx(0.8).margin(0.02));
}

TEST_CASE("Relative odds decide the game", "[matchup]") {
    std::mt19937 randomEngine(7);
    // 0.2 vs 0.2 is a coin flip even though both are unlikely to advance
    Team t1 = makeTeam("East", 3, "A", {1.0, 0.2});
    Team t2 = makeTeam("East", 14, "B", {1.0, 0.2});

    const int trials = 20000;
    int t1Wins = 0;
    for (int i = 0; i < trials; i++) {
        Team a = t1;
        Team b = t2;
        if (&pickWinner(a, b, Round::RoundOf32, randomEngine) == &a) {
            t1Wins++;
        }
    }
    CHECK(t1Wins / static_cast<double>(trials) == Approx(0.5).margin(0.02));
}

TEST_CASE("Upset winner takes the loser's seed slot", "[matchup]") {
    std::mt19937 randomEngine(1);
    Team five = makeTeam("West", 5, "Five", {1.0, 1.0});
    Team two = makeTeam("West", 2, "Two", {1.0, 0.0});

    Team &w = pickWinner(five, two, Round::RoundOf32, randomEngine);
    REQUIRE(&w == &five);
    CHECK(five.seedSlot == 2);
    CHECK(five.seed == 5);
    CHECK(two.seedSlot == 2);
}

TEST_CASE("Favorite winning keeps its seed slot", "[matchup]") {
    std::mt19937 randomEngine(1);
    Team two = makeTeam("West", 2, "Two", {1.0, 1.0});
    Team five = makeTeam("West", 5, "Five", {1.0, 0.0});

    Team &w = pickWinner(two, five, Round::RoundOf32, randomEngine);
    REQUIRE(&w == &two);
    CHECK(two.seedSlot == 2);
    CHECK(five.seedSlot == 5);
}

TEST_CASE("Seed slot only moves to a lower seed", "[matchup]") {
    std::mt19937 randomEngine(1);
    Team twelve = makeTeam("West", 12, "Twelve", {1.0, 1.0, 1.0});
    twelve.seedSlot = 1; // beat the 1 seed earlier
    Team four = makeTeam("West", 4, "Four", {1.0, 0.5, 0.0});

    pickWinner(twelve, four, Round::RoundOf16, randomEngine);
    CHECK(twelve.seedSlot == 1);
}

TEST_CASE("First team wins when neither team can advance", "[matchup]") {
    std::mt19937 randomEngine(3);
    Team t1 = makeTeam("South", 8, "A", {1.0, 0.0});
    Team t2 = makeTeam("South", 9, "B", {1.0, 0.0});
    for (int i = 0; i < 100; i++) {
        CHECK(&pickWinner(t1, t2, Round::RoundOf32, randomEngine) == &t1);
    }
}
