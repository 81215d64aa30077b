#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "commands.hpp"

int main(int argc, char *argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    const std::vector<std::string> commandLine(argv + 1, argv + argc);

    try {
        const svcs::Result result = svcs::run(commandLine, ".");

        if (!result.ok()) {
            std::cerr << result.message << '\n';
            return EXIT_FAILURE;
        }
        std::cout << result.message << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
