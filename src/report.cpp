#include "report.hpp"

namespace fs = std::filesystem;

Report::Report(const std::vector<Repo>& repos) : repos_(repos) {
    for (const auto& repo : repos_)
        repo_messages_[repo.path()];
}

void Report::add_message(const std::string& message) { messages_.push_back(message); }

void Report::add_repo_message(const fs::path& repo, const std::string& line) {
    auto it = repo_messages_.find(repo);
    if (it != repo_messages_.end())
        it->second.push_back(line);
}

const std::vector<std::string>& Report::repo_messages(const fs::path& repo) const {
    static const std::vector<std::string> empty;
    auto it = repo_messages_.find(repo);
    return it == repo_messages_.end() ? empty : it->second;
}

void Report::print(std::ostream& os) const {
    for (const auto& msg : messages_)
        os << msg << '\n';
    for (const auto& repo : repos_) {
        const auto& lines = repo_messages(repo.path());
        if (lines.empty())
            continue;
        os << repo.path_string() << '\n';
        for (const auto& line : lines) {
            if (!line.empty())
                os << line << '\n';
        }
        if (pad_)
            os << '\n';
    }
    os.flush();
}

nlohmann::json Report::to_json() const {
    nlohmann::json out = {{"error", false},
                          {"messages", nlohmann::json::array()},
                          {"repo_messages", nlohmann::json::object()}};
    for (const auto& msg : messages_)
        out["messages"].push_back(msg);
    for (const auto& repo : repos_) {
        const auto& lines = repo_messages(repo.path());
        if (lines.empty())
            continue;
        auto& arr = out["repo_messages"][repo.path_string()];
        arr = nlohmann::json::array();
        for (const auto& line : lines) {
            if (!line.empty())
                arr.push_back(line);
        }
    }
    return out;
}

void Report::print_json(std::ostream& os) const { os << to_json().dump(2) << std::endl; }
