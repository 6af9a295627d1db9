#include "cli/cli.hpp"
#include "core/utils.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace uisanitizer;

int main(int argc, char* argv[]) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);
        return cli::run(args, std::cin, std::cout, std::cerr);
    } catch (const std::exception& e) {
        utils::log::error(std::string("Fatal error: ") + e.what());
        return cli::kExitFailure;
    }
}
