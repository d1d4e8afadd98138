/**
 * @file gitpet.cpp
 * @brief CLI entry point: scan the repository, update the pet, print a report.
 */

#include <ctime>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 on success or when printing help/version, 1 on option errors or
 *         unexpected failures.
 */
#ifndef GITPET_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(std::cout, argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << GITPET_VERSION << "\n";
            return 0;
        }
        cli::setup_logging(opts.logging);
        if (logger_initialized() && !opts.config_file.empty())
            log_info("Loaded config", {{"path", opts.config_file.string()}});
        int rc = cli::run_command(opts, std::cout, std::time(nullptr));
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // GITPET_NO_MAIN
