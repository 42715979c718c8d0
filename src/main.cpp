/**
 * @file main.cpp
 * @brief keytree-derive executable.
 * @author Keytree Project
 * @date 2026
 *
 * Usage: keytree-derive [--config FILE] [--public] <seed-hex> [path]
 *
 * Exit codes: 0 success, 1 usage error, 2 derivation error.
 */

#include "../include/cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return Keytree::runDerive(args, std::cout, std::cerr);
}
