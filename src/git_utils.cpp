#include "git_utils.hpp"

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

std::string short_hash(const git_oid& oid) {
    char buf[8];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf);
}

std::optional<RepoLocation> discover_repo(const fs::path& start, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, start.string().c_str(), 0, nullptr) != 0) {
        set_error(error);
        return std::nullopt;
    }
    repo_ptr r(raw);
    if (git_repository_is_bare(r.get())) {
        if (error)
            *error = "Repository is bare";
        return std::nullopt;
    }
    const char* wd = git_repository_workdir(r.get());
    if (!wd) {
        set_error(error);
        return std::nullopt;
    }
    RepoLocation loc;
    loc.workdir = fs::path(wd);
    if (!loc.workdir.has_filename())
        loc.workdir = loc.workdir.parent_path(); // drop the trailing separator
    loc.unborn = git_repository_head_unborn(r.get()) == 1;

    git_reference* head = nullptr;
    if (!loc.unborn && git_repository_head(&head, r.get()) == 0) {
        reference_ptr ref(head);
        if (!git_repository_head_detached(r.get())) {
            const char* name = git_reference_shorthand(ref.get());
            loc.branch = name ? name : "";
        }
        const git_oid* oid = git_reference_target(ref.get());
        if (oid)
            loc.head = short_hash(*oid);
    } else if (loc.unborn) {
        // HEAD points at a branch that does not exist yet
        git_reference* sym = nullptr;
        if (git_reference_lookup(&sym, r.get(), "HEAD") == 0) {
            reference_ptr ref(sym);
            const char* target = git_reference_symbolic_target(ref.get());
            std::string t = target ? target : "";
            const std::string prefix = "refs/heads/";
            if (t.rfind(prefix, 0) == 0)
                loc.branch = t.substr(prefix.size());
        }
    }
    return loc;
}

} // namespace git
