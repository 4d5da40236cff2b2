#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <ostream>
#include <vector>

/** Description of one command line option. */
struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg; ///< Placeholder for the value, empty for boolean flags
    const char* desc;
    const char* category;
};

/** Every option git-global accepts. */
const std::vector<OptionInfo>& option_table();

/**
 * @brief Print usage, subcommands and options grouped by category.
 */
void print_help(std::ostream& os, const char* prog);

#endif // HELP_TEXT_HPP
