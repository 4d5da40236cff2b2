#include "errors.hpp"
#include "logger.hpp"
#include "subcommands.hpp"

namespace subcommands {

const std::vector<SubcommandInfo>& all() {
    static const std::vector<SubcommandInfo> cmds = {
        {"ahead", "Shows repos with changes that are not pushed to a remote"},
        {"ignore", "Ignores a repo, removing it from the list"},
        {"ignored", "Lists all ignored repos"},
        {"info", "Shows meta-information about git-global"},
        {"list", "Lists all known repos"},
        {"scan", "Updates cache of known repos"},
        {"staged", "Shows git index status for repos with staged changes"},
        {"stashed", "Shows repos with stashed changes"},
        {"status", "Shows status (`git status -s`) for repos with any changes"},
        {"unstaged", "Shows working dir status for repos with unstaged changes"},
    };
    return cmds;
}

Report run(const std::optional<std::string>& name, const Config& config,
           const std::optional<std::string>& arg, size_t workers) {
    const std::string cmd = name ? *name : config.default_cmd;
    log_debug("Running subcommand", {{"command", cmd}});
    if (cmd == "status")
        return status(config, workers);
    if (cmd == "staged")
        return staged(config, workers);
    if (cmd == "unstaged")
        return unstaged(config, workers);
    if (cmd == "stashed")
        return stashed(config, workers);
    if (cmd == "ahead")
        return ahead(config, workers);
    if (cmd == "list")
        return list(config);
    if (cmd == "scan")
        return scan(config);
    if (cmd == "info")
        return info(config);
    if (cmd == "ignore") {
        if (!arg)
            throw CommandError("ignore requires a path argument");
        return ignore(config, *arg);
    }
    if (cmd == "ignored")
        return ignored(config);
    throw CommandError::unknown_subcommand(cmd);
}

} // namespace subcommands
