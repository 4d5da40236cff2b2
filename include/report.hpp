#ifndef REPORT_HPP
#define REPORT_HPP
#include <filesystem>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "repo.hpp"

/**
 * @brief Output of one subcommand: overall lines plus lines per repository.
 *
 * Repositories keep the order they were given in, regardless of the order
 * their messages arrive.
 */
class Report {
  public:
    Report() = default;
    explicit Report(const std::vector<Repo>& repos);

    /** Print a blank line after each repository block. */
    void pad_repo_output() { pad_ = true; }

    void add_message(const std::string& message);

    /**
     * @brief Attach a line to a repository.
     *
     * Lines for repositories not passed to the constructor are dropped. An
     * empty line still marks the repository as having output; it is just not
     * printed.
     */
    void add_repo_message(const std::filesystem::path& repo, const std::string& line);

    const std::vector<std::string>& messages() const { return messages_; }
    const std::vector<std::string>& repo_messages(const std::filesystem::path& repo) const;

    /** Text form: overall lines, then `path` and its lines per repository. */
    void print(std::ostream& os) const;

    /** `{"error": false, "messages": [...], "repo_messages": {path: [...]}}` */
    nlohmann::json to_json() const;

    void print_json(std::ostream& os) const;

  private:
    std::vector<Repo> repos_;
    std::map<std::filesystem::path, std::vector<std::string>> repo_messages_;
    std::vector<std::string> messages_;
    bool pad_ = false;
};

#endif // REPORT_HPP
