#include "vrf.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc > 1 && std::string(argv[1]) == "--seed") {
        if (argc < 3) {
            std::cerr << "Usage: generate_oracle_key [count] | --seed <seedHex>\n";
            return 1;
        }
        try {
            auto keys = lk::deriveVrfKeypairFromSeed(argv[2]);
            std::cout << keys.publicKeyHex << ' ' << keys.secretKeyHex << '\n';
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << '\n';
            return 1;
        }
        return 0;
    }

    int count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = static_cast<int>(parsed);
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }

    try {
        for (int i = 0; i < count; ++i) {
            auto keys = lk::generateVrfKeypair();
            std::cout << keys.publicKeyHex << ' ' << keys.secretKeyHex << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    return 0;
}
