#include <iostream>
#include <vector>
#include <string>
#include "cli/crew_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        CrewCLI cli;

        if (argc == 1) {
            cli.print_usage();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run_command(argv[1], args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
