#include "commitment.hpp"
#include "errors.hpp"
#include "rng.hpp"

#include <cstdlib>
#include <iostream>

// Prints "<seed> <commitHash>" per line.
int main(int argc, char* argv[]) {
    int count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0 && parsed <= 100000) {
            count = static_cast<int>(parsed);
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }

    try {
        for (int i = 0; i < count; ++i) {
            std::string seed = hb::generateServerSeed();
            std::cout << seed << ' ' << hb::hashSeed(seed) << '\n';
        }
    } catch (const hb::EntropyFailure& ex) {
        std::cerr << "fatal: " << ex.what() << '\n';
        return 2;
    }
    return 0;
}
