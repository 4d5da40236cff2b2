#ifndef REPO_HPP
#define REPO_HPP
#include <filesystem>
#include <ostream>
#include <string>
#include <utility>

/**
 * @brief A git repository, identified by the path of its working tree.
 *
 * The path is that of the directory containing `.git`, never the `.git`
 * directory itself. Repos are plain values: equality and ordering go
 * through the path.
 */
class Repo {
  public:
    explicit Repo(std::filesystem::path path) : path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }
    std::string path_string() const { return path_.string(); }

    bool operator==(const Repo& other) const { return path_ == other.path_; }
    bool operator!=(const Repo& other) const { return !(*this == other); }
    bool operator<(const Repo& other) const { return path_ < other.path_; }

  private:
    std::filesystem::path path_;
};

inline std::ostream& operator<<(std::ostream& os, const Repo& repo) {
    return os << repo.path_string();
}

#endif // REPO_HPP
