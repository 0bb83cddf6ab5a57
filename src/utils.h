#ifndef UTILS_H
#define UTILS_H

#include "globals.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string &s);
std::vector<std::string> split(const std::string &s, char delim);
std::string formatSystemTimePoint(const std::chrono::system_clock::time_point &tp,
                                  std::string format);

int roundIndex(Round r);
Round roundFromIndex(int i); // throws std::out_of_range outside 1..NUM_ROUNDS
const std::string &roundLabel(Round r);

// Parse one probability field: empty -> absent, "<0.1" -> small constant,
// otherwise a decimal in [0, 1]; throws MalformedInputError
std::optional<double> parseOdds(const std::string &field);

// Parse a positive integer seed; throws MalformedInputError
int parseSeed(const std::string &field);

// Parse a whole-number command line value in [min, max]; throws
// std::invalid_argument
long parseCount(const std::string &field, long min, long max);

#endif // UTILS_H
