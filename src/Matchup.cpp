#include "Matchup.h"
#include "Team.h"
#include "globals.h"
#include <random>

Team &pickWinner(Team &t1, Team &t2, Round r, std::mt19937 &randomEngine) {
    const double t1Odds = t1.conditionalOdds(r);
    const double t2Odds = t2.conditionalOdds(r);
    const double oddsRange = t1Odds + t2Odds;

    double num = 0;
    if (oddsRange > 0) {
        std::uniform_real_distribution<double> dist(0, oddsRange);
        num = dist(randomEngine);
    }

    if (num <= t1Odds) {
        if (t2.seed < t1.seedSlot) {
            t1.seedSlot = t2.seed;
        }
        return t1;
    }
    if (t1.seed < t2.seedSlot) {
        t2.seedSlot = t1.seed;
    }
    return t2;
}
