#include "lock_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <sys/file.h>

namespace procutil {

FileLockGuard::FileLockGuard(const std::filesystem::path& path)
    : fd_(open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
    if (!fd_)
        return;
    int rc;
    do {
        rc = flock(fd_.get(), LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    locked_ = rc == 0;
}

FileLockGuard::~FileLockGuard() {
    if (locked_)
        flock(fd_.get(), LOCK_UN);
}

} // namespace procutil
