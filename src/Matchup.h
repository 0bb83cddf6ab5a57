#ifndef MATCHUP_H
#define MATCHUP_H

#include "Team.h"
#include "globals.h"
#include <random>

// Pick the winner of one game in round r, with odds proportional to each
// team's conditional odds for that round. The winner inherits the loser's
// seed slot if the loser's seed is lower than the winner's current slot.
Team &pickWinner(Team &t1, Team &t2, Round r, std::mt19937 &randomEngine);

#endif // MATCHUP_H
