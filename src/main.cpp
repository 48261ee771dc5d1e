#include "log.hpp"
#include "options.hpp"

#include <iostream>
#include <string>
#include <vector>

/**
 * lisel: select lines of TARGET by the lines of INDEX.
 *
 * Exits 0 when INDEX (or TARGET) is processed to its end, 1 on any usage,
 * configuration, range or I/O error.
 */
int main(int argc, char* argv[]) {
    // Enable immediate output flushing
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    lisel::log::init_from_env();

    std::vector<std::string> args(argv + 1, argv + argc);
    return lisel::run_lisel(args, std::cin, std::cout, std::cerr);
}
