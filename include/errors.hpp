#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>

/**
 * @brief A mistake in how git-global was invoked.
 *
 * Unknown subcommands or flags, a missing argument, or a repository that is
 * already ignored. The command line layer prints the message and exits with
 * status 1.
 */
class CommandError : public std::runtime_error {
  public:
    explicit CommandError(const std::string& message) : std::runtime_error(message) {}

    /** `Unknown subcommand, <name>.` */
    static CommandError unknown_subcommand(const std::string& name) {
        return CommandError("Unknown subcommand, " + name + ".");
    }
};

#endif // ERRORS_HPP
