#include <iostream>
#include <vector>
#include <string>
#include <core/constants.hpp>
#include "cli/lab_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    mrilabs run"
              << theme::color::RESET << theme::color::BROWN << " [--hardware-mock]"
              << theme::color::RESET << theme::color::DIM
              << "   Start the scheduler and enter the shell" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    mrilabs check "
              << theme::color::RESET << theme::color::BROWN << "<file.yaml>"
              << theme::color::RESET << theme::color::DIM
              << "       Validate an experiment file" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    mrilabs setup"
              << theme::color::RESET << theme::color::DIM
              << "                     Write the default config" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    mrilabs --version                 Show version\n"
              << "    mrilabs --help                    Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        LabCLI cli;

        if (argc == 1) {
            print_usage();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "mrilabs"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << MRILABS_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            for (const auto& flag : rest) {
                if (flag == "--hardware-mock" || flag == "-hm") {
                    cli.config.set_hardware_mock(true);
                } else {
                    std::cout << theme::fail("Unknown option: " + flag);
                    print_usage();
                    return 1;
                }
            }
            cli.run_repl();
        } else if (cmd == "check") {
            if (rest.empty()) {
                std::cout << theme::fail("Missing experiment file.");
                std::cout << theme::step("Usage: mrilabs check <file.yaml>");
                return 1;
            }
            return cli.run_check(rest[0]);
        } else if (cmd == "setup") {
            cli.run_setup();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
