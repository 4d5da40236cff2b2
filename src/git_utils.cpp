#include "git_utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>

using namespace std;

namespace git {

namespace {

struct OidLess {
    bool operator()(const git_oid& a, const git_oid& b) const { return git_oid_cmp(&a, &b) < 0; }
};

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

git_repository* open_repo(const fs::path& repo, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, repo.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

/**
 * @brief Collect the target of every branch of the given type.
 *
 * Symbolic references such as `refs/remotes/origin/HEAD` have no direct
 * target and are skipped.
 */
bool branch_tips(git_repository* repo, git_branch_t type, vector<git_oid>& out,
                 std::string* error) {
    git_branch_iterator* raw_iter = nullptr;
    if (git_branch_iterator_new(&raw_iter, repo, type) != 0) {
        set_error(error);
        return false;
    }
    branch_iter_ptr iter(raw_iter);
    git_reference* raw_ref = nullptr;
    git_branch_t found_type;
    int rc = 0;
    while ((rc = git_branch_next(&raw_ref, &found_type, iter.get())) == 0) {
        reference_ptr ref(raw_ref);
        const git_oid* oid = git_reference_target(ref.get());
        if (oid)
            out.push_back(*oid);
    }
    if (rc != GIT_ITEROVER) {
        set_error(error);
        return false;
    }
    return true;
}

} // namespace

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    return git_repository_open_ext(nullptr, p.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                   nullptr) == 0;
}

string short_status(const string& path, unsigned int status) {
    char istatus = ' ';
    if (status & GIT_STATUS_INDEX_NEW)
        istatus = 'A';
    else if (status & GIT_STATUS_INDEX_MODIFIED)
        istatus = 'M';
    else if (status & GIT_STATUS_INDEX_DELETED)
        istatus = 'D';
    else if (status & GIT_STATUS_INDEX_RENAMED)
        istatus = 'R';
    else if (status & GIT_STATUS_INDEX_TYPECHANGE)
        istatus = 'T';

    char wstatus = ' ';
    if (status & GIT_STATUS_WT_NEW) {
        if (istatus == ' ')
            istatus = '?';
        wstatus = '?';
    } else if (status & GIT_STATUS_WT_MODIFIED) {
        wstatus = 'M';
    } else if (status & GIT_STATUS_WT_DELETED) {
        wstatus = 'D';
    } else if (status & GIT_STATUS_WT_RENAMED) {
        wstatus = 'R';
    } else if (status & GIT_STATUS_WT_TYPECHANGE) {
        wstatus = 'T';
    }

    if (status & GIT_STATUS_IGNORED) {
        istatus = '!';
        wstatus = '!';
    }
    if (status & GIT_STATUS_CONFLICTED) {
        istatus = 'C';
        wstatus = 'C';
    }
    string line;
    line.reserve(path.size() + 3);
    line.push_back(istatus);
    line.push_back(wstatus);
    line.push_back(' ');
    line += path;
    return line;
}

optional<vector<string>> get_status_lines(const fs::path& repo, StatusScope scope,
                                          bool include_untracked, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    switch (scope) {
    case StatusScope::Index:
        opts.show = GIT_STATUS_SHOW_INDEX_ONLY;
        break;
    case StatusScope::Workdir:
        opts.show = GIT_STATUS_SHOW_WORKDIR_ONLY;
        break;
    case StatusScope::IndexAndWorkdir:
        opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
        break;
    }
    opts.flags = include_untracked ? GIT_STATUS_OPT_INCLUDE_UNTRACKED : 0;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0) {
        set_error(error);
        return nullopt;
    }
    status_list_ptr list(raw_list);
    vector<string> lines;
    size_t count = git_status_list_entrycount(list.get());
    lines.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const git_status_entry* entry = git_status_byindex(list.get(), i);
        if (!entry)
            continue;
        const git_diff_delta* delta = entry->head_to_index ? entry->head_to_index
                                                           : entry->index_to_workdir;
        const char* path = nullptr;
        if (delta)
            path = delta->old_file.path ? delta->old_file.path : delta->new_file.path;
        lines.push_back(short_status(path ? path : "", entry->status));
    }
    return lines;
}

optional<vector<string>> get_stash_list(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    vector<string> lines;
    auto cb = [](size_t index, const char* message, const git_oid*, void* payload) -> int {
        auto* out = static_cast<vector<string>*>(payload);
        out->push_back("stash@{" + to_string(index) + "}: " + (message ? message : ""));
        return 0;
    };
    int rc = git_stash_foreach(r.get(), cb, &lines);
    // A repository that has never stashed has no refs/stash; that is not an error.
    if (rc != 0 && rc != GIT_ENOTFOUND) {
        set_error(error);
        return nullopt;
    }
    return lines;
}

optional<bool> is_ahead(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    vector<git_oid> local;
    vector<git_oid> remote;
    if (!branch_tips(r.get(), GIT_BRANCH_LOCAL, local, error) ||
        !branch_tips(r.get(), GIT_BRANCH_REMOTE, remote, error))
        return nullopt;
    if (local.empty())
        return false;

    set<git_oid, OidLess> reachable;
    if (!remote.empty()) {
        git_revwalk* raw_walk = nullptr;
        if (git_revwalk_new(&raw_walk, r.get()) != 0) {
            set_error(error);
            return nullopt;
        }
        revwalk_ptr walk(raw_walk);
        for (const auto& oid : remote) {
            if (git_revwalk_push(walk.get(), &oid) != 0) {
                set_error(error);
                return nullopt;
            }
        }
        git_oid next;
        while (git_revwalk_next(&next, walk.get()) == 0)
            reachable.insert(next);
    }
    return any_of(local.begin(), local.end(),
                  [&](const git_oid& oid) { return reachable.count(oid) == 0; });
}

map<string, string> read_config_section(const string& section) {
    map<string, string> out;
    git_config* raw_cfg = nullptr;
    if (git_config_open_default(&raw_cfg) != 0)
        return out;
    config_ptr cfg(raw_cfg);
    git_config_iterator* raw_iter = nullptr;
    string prefix = section + ".";
    string regex = "^" + section + "\\.";
    if (git_config_iterator_glob_new(&raw_iter, cfg.get(), regex.c_str()) != 0)
        return out;
    config_iter_ptr iter(raw_iter);
    git_config_entry* entry = nullptr;
    while (git_config_next(&entry, iter.get()) == 0) {
        if (!entry->name || !entry->value)
            continue;
        string name = entry->name;
        transform(name.begin(), name.end(), name.begin(),
                  [](unsigned char ch) { return static_cast<char>(tolower(ch)); });
        if (name.rfind(prefix, 0) != 0)
            continue;
        out[name.substr(prefix.size())] = entry->value;
    }
    return out;
}

} // namespace git
