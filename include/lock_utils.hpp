#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <filesystem>
#include "system_utils.hpp"

namespace procutil {

/**
 * @brief Exclusive advisory lock held on a lock file for the guard's lifetime.
 *
 * The lock file is created when missing and left in place on release, so
 * concurrent holders always contend on the same inode. Blocks until the lock
 * is available.
 */
class FileLockGuard {
  public:
    explicit FileLockGuard(const std::filesystem::path& path);
    ~FileLockGuard();
    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    /** @return `true` when the lock was acquired. */
    bool locked() const { return locked_; }

  private:
    UniqueFd fd_;
    bool locked_ = false;
};

} // namespace procutil

#endif // LOCK_UTILS_HPP
