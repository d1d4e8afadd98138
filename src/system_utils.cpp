#include "system_utils.hpp"
#include <cstdlib>
#include <pwd.h>
#include <sys/types.h>

namespace procutil {

std::optional<std::filesystem::path> home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home)
        return std::filesystem::path(home);
    const passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir && *pw->pw_dir)
        return std::filesystem::path(pw->pw_dir);
    return std::nullopt;
}

} // namespace procutil
