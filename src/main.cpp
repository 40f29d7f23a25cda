#include <iostream>
#include <vector>
#include <string>
#include "cli/haul_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    haul"
              << theme::color::RESET << theme::color::DIM
              << "                       Interactive shell" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    haul submit "
              << theme::color::RESET << theme::color::BROWN << "<kind> <dest> <src...>"
              << theme::color::RESET << theme::color::DIM
              << "  Queue a job (add --start to run it)" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    haul history "
              << theme::color::RESET << theme::color::BROWN << "[backup|import]"
              << theme::color::RESET << theme::color::DIM
              << "  Past runs" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    haul config "
              << theme::color::RESET << theme::color::BROWN << "[init]"
              << theme::color::RESET << theme::color::DIM
              << "         Show or create ~/.haul/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    haul --version             Show version\n"
              << "    haul --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        HaulCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "haul"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        }
        if (cmd == "--help") {
            print_usage();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
