#include "utils.h"
#include "errors.h"
#include "globals.h"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

const std::string ROUND_LABELS[] = {"FIRST FOUR", "ROUND OF 32", "ROUND OF 16",
                                    "ELITE 8",    "FINAL 4",     "FINALS",
                                    "CHAMPIONS"};

const std::string HEADER_STRING =
    "REGION,SEED,TEAM,FIRST FOUR,ROUND OF 32,ROUND OF 16,ELITE 8,FINAL 4,"
    "FINALS,CHAMPIONS";

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");

    if (start == std::string::npos) {
        // string is all whitespace
        return "";
    }
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &s, char delim) {
    // keeps empty fields, including a trailing one ("a,b," -> 3 fields)
    std::vector<std::string> fields;
    size_t last = 0;
    size_t next = 0;
    while ((next = s.find(delim, last)) != std::string::npos) {
        fields.push_back(s.substr(last, next - last));
        last = next + 1;
    }
    fields.push_back(s.substr(last));
    return fields;
}

std::string
formatSystemTimePoint(const std::chrono::system_clock::time_point &tp,
                      std::string format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm *tm = std::localtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(tm, format.c_str());
    return oss.str();
}

int roundIndex(Round r) {
    return static_cast<int>(r);
}

Round roundFromIndex(int i) {
    if (i < 1 || i > NUM_ROUNDS) {
        throw std::out_of_range("Round index " + std::to_string(i) +
                                " out of range");
    }
    return static_cast<Round>(i);
}

const std::string &roundLabel(Round r) {
    return ROUND_LABELS[roundIndex(r) - 1];
}

std::optional<double> parseOdds(const std::string &field) {
    std::string f = trim(field);
    if (f.empty()) {
        return std::nullopt;
    }
    if (f == BELOW_THRESHOLD_MARKER) {
        return BELOW_THRESHOLD_ODDS;
    }
    double value = 0;
    size_t pos = 0;
    try {
        value = std::stod(f, &pos);
    } catch (const std::logic_error &e) {
        // std::invalid_argument or std::out_of_range
        throw MalformedInputError("Invalid probability '" + f + "'");
    }
    if (pos != f.size() || !std::isfinite(value) || value < 0 || value > 1) {
        throw MalformedInputError("Invalid probability '" + f + "'");
    }
    return value;
}

int parseSeed(const std::string &field) {
    std::string f = trim(field);
    int seed = 0;
    size_t pos = 0;
    try {
        seed = std::stoi(f, &pos);
    } catch (const std::logic_error &e) {
        throw MalformedInputError("Invalid seed '" + f + "'");
    }
    if (pos != f.size() || seed <= 0) {
        throw MalformedInputError("Invalid seed '" + f + "'");
    }
    return seed;
}

long parseCount(const std::string &field, long min, long max) {
    std::string f = trim(field);
    long value = 0;
    size_t pos = 0;
    try {
        value = std::stol(f, &pos);
    } catch (const std::logic_error &e) {
        throw std::invalid_argument("Invalid number '" + f + "'");
    }
    if (pos != f.size() || value < min || value > max) {
        throw std::invalid_argument("'" + f + "' must be between " +
                                    std::to_string(min) + " and " +
                                    std::to_string(max));
    }
    return value;
}
