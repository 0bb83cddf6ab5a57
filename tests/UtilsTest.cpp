#include "utils.h"
#include <catch2/catch.hpp>
#include <limits>
#include <stdexcept>

TEST_CASE("Counts are parsed within their bounds", "[utils]") {
    CHECK(parseCount("8", 1, 64) == 8);
    CHECK(parseCount(" 0 ", 0, 10) == 0);
    CHECK(parseCount("4294967295", 0, std::numeric_limits<unsigned>::max()) ==
          4294967295L);
}

TEST_CASE("Negative and malformed counts are rejected", "[utils]") {
    // would wrap around if read as unsigned
    CHECK_THROWS_AS(parseCount("-1", 1, std::numeric_limits<int>::max()),
                    std::invalid_argument);
    CHECK_THROWS_AS(parseCount("-5", 1, std::numeric_limits<long>::max()),
                    std::invalid_argument);
    CHECK_THROWS_AS(parseCount("0", 1, 64), std::invalid_argument);
    CHECK_THROWS_AS(parseCount("65", 1, 64), std::invalid_argument);
    CHECK_THROWS_AS(parseCount("4x", 1, 64), std::invalid_argument);
    CHECK_THROWS_AS(parseCount("", 1, 64), std::invalid_argument);
    CHECK_THROWS_AS(parseCount("99999999999999999999", 1, 64),
                    std::invalid_argument);
}
