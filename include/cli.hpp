#ifndef CLI_HPP
#define CLI_HPP
#include <ostream>

namespace cli {

/**
 * @brief Parse arguments, run the chosen subcommand and print its report.
 *
 * Results go to @p out as text, or as JSON with `--json`. Errors go to
 * @p err as a plain line, or as `{"error": true, "message": ...}` with
 * `--json`. Expects libgit2 to be initialized by the caller.
 *
 * @return 0 on success, 1 on any reported error.
 */
int run_from_command_line(int argc, char* argv[], std::ostream& out, std::ostream& err);

} // namespace cli

#endif // CLI_HPP
