/**
 * @file git_global.cpp
 * @brief CLI entry point for git-global.
 *
 * Finds every git repository below a base directory, caches the list and
 * runs status-style queries across all of them at once.
 */

#include <iostream>

#include "cli.hpp"
#include "git_utils.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 on success, 1 when the subcommand or its arguments failed.
 */
#ifndef GITGLOBAL_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        return cli::run_from_command_line(argc, argv, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // GITGLOBAL_NO_MAIN
