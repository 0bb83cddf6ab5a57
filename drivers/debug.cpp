// Run single simulation with every game displayed

#include "Bracket.h"
#include "globals.h"
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

// usage:
// $ ./build/debug <input csv> [<seed>]

int main(int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: ./build/debug <input csv> [<seed>]" << std::endl;
        exit(1);
    }

    const std::string input = argv[1];
    std::mt19937 randomEngine(std::random_device{}());
    if (argc == 3) {
        try {
            randomEngine.seed(static_cast<unsigned>(std::stoul(argv[2])));
        } catch (const std::logic_error &e) {
            std::cerr << "Invalid seed: " << argv[2] << std::endl;
            exit(1);
        }
    }

    try {
        Bracket b = Bracket::fromFile(input);
        b.simulate(randomEngine, false);
        std::cout << b.simulationString() << std::endl;
    } catch (const std::exception &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        return 2;
    }
    return 0;
}
