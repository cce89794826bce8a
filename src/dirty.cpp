/**
 * @file dirty.cpp
 * @brief CLI entry point listing Git repositories and their local state.
 *
 * Discovers working copies below a root folder, classifies each with libgit2
 * and prints a filtered report.
 */

#include <csignal>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Start the file logger when `--log-file` was given.
 *
 * @return `false` if the log file could not be opened.
 */
static bool setup_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return true;
    if (!init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                     logging.max_log_files))
        return false;
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    log_debug("Logger started", {{"version", DIRTY_VERSION}});
    return true;
}

/**
 * @brief Application entry point.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 * @return int Zero when at least one repository was listed or when printing
 *             help/version; 1 on scan failures and invalid arguments.
 */
#ifndef DIRTY_NO_MAIN
int main(int argc, char* argv[]) {
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_DFL); // Exit quietly when piped into `head`.
#endif
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << DIRTY_VERSION << "\n";
            return 0;
        }
        if (!setup_logging(opts.logging))
            return 1;
        int rc = cli::run_scan(opts, std::cout, std::cerr);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        shutdown_logger();
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // DIRTY_NO_MAIN
