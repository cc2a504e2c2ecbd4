#include <iostream>
#include <vector>
#include <string>
#include <signal.h>
#include <core/abort_token.hpp>
#include <core/constants.hpp>
#include "cli/expctl_cli.hpp"
#include "cli/theme.hpp"

static AbortToken g_abort;

// First Ctrl-C asks the running stage to wind down; a second one kills.
static void on_sigint(int) {
    g_abort.request_from_signal();
}

static void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_sigint;
    sa.sa_flags = SA_RESETHAND;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int main(int argc, char** argv) {
    try {
        ExpctlCLI cli(g_abort, std::cin, std::cout);

        if (argc == 1) {
            cli.print_help();
            return EXIT_VALIDATION_FAILURE;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "expctl"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::VERSION << theme::color::RESET << "\n";
            return EXIT_OK;
        } else if (cmd == "--help" || cmd == "help") {
            cli.print_help();
            return EXIT_OK;
        }

        if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            cli.print_help();
            return EXIT_VALIDATION_FAILURE;
        }

        install_signal_handlers();
        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_VALIDATION_FAILURE;
    }
}
