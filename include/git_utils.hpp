#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so guards may nest. Instantiate one
 * in `main` for the lifetime of the application.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;

/**
 * @brief What the scanner needs to know about the enclosing repository.
 */
struct RepoLocation {
    fs::path workdir;    ///< Root of the working tree
    std::string branch;  ///< Checked-out branch, empty when HEAD is detached
    std::string head;    ///< Short HEAD hash, empty when HEAD is unborn
    bool unborn = false; ///< `true` when the repository has no commits yet
};

/**
 * @brief Locate the non-bare repository that contains @p start.
 *
 * Searches @p start and its parents, like `git rev-parse` does. Runs
 * in-process through libgit2; no external command is spawned.
 * libgit2 must already be initialized.
 *
 * @param start Directory to start from.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Repository description or `std::nullopt` when @p start is not
 *         inside a work tree.
 */
std::optional<RepoLocation> discover_repo(const fs::path& start, std::string* error = nullptr);

/**
 * @brief Abbreviated (7 character) hexadecimal form of an object id.
 */
std::string short_hash(const git_oid& oid);

} // namespace git

#endif // GIT_UTILS_HPP
