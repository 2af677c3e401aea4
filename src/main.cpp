#include <iostream>
#include <vector>
#include <string>
#include "cli/push_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    shellpush push "
              << theme::color::RESET << theme::color::BROWN << "<local> <remote> --host <host>"
              << theme::color::RESET << "\n";
    std::cout << theme::color::DIM
              << "        [--port N] [--user U] [--key PATH]\n"
              << "        [--password-env VAR | --ask-password]\n"
              << "        [--backend NAME] [--config PATH]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    shellpush backends "
              << theme::color::RESET << theme::color::BROWN << "[--password]"
              << theme::color::RESET << theme::color::DIM
              << "    Show detected tools and backend order" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    shellpush init"
              << theme::color::RESET << theme::color::DIM
              << "                   Write a default config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Backends: client-library, password-helper, native-openssh, raw-pipe\n\n"
              << "    shellpush --version        Show version\n"
              << "    shellpush --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);
        PushCLI cli;

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "shellpush"
                      << theme::color::RESET << theme::color::DIM
                      << " version " SHELLPUSH_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        } else if (cmd == "push") {
            return cli.run_push(args);
        } else if (cmd == "backends") {
            return cli.run_backends(args);
        } else if (cmd == "init") {
            return cli.run_init(args);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
