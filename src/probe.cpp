#include "probe.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <thread>

#include "system_utils.hpp"

namespace procutil {

namespace {

using Clock = std::chrono::steady_clock;

void reap(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            status = -1;
            return;
        }
    }
}

// Wait for @p pid until @p deadline. Returns false if the child is still
// running when the deadline passes.
bool reap_until(pid_t pid, int& status, Clock::time_point deadline) {
    while (true) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid)
            return true;
        if (rc < 0 && errno != EINTR) {
            status = -1;
            return true;
        }
        if (Clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(char* const* argv, const char* cwd, int out_fd) {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO)
            close(devnull);
    }
    dup2(out_fd, STDOUT_FILENO);
    close(out_fd);
    if (cwd && *cwd && chdir(cwd) != 0)
        _exit(127);
    execvp(argv[0], argv);
    _exit(127);
}

} // namespace

const char* to_string(ProbeStatus status) {
    switch (status) {
    case ProbeStatus::Ok:
        return "ok";
    case ProbeStatus::NonZeroExit:
        return "exit";
    case ProbeStatus::Timeout:
        return "timeout";
    case ProbeStatus::OutputLimit:
        return "output-limit";
    case ProbeStatus::SpawnFailed:
        return "spawn-failed";
    }
    return "unknown";
}

ProbeResult run_probe(const ProbeSpec& spec, const std::filesystem::path& cwd) {
    ProbeResult result;
    const auto start = Clock::now();
    const std::string dir = cwd.string();
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& a : spec.args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // Both ends are close-on-exec; dup2 clears the flag on the child's STDOUT.
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return result;
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);

    pid_t pid = fork();
    if (pid < 0)
        return result;
    if (pid == 0) {
        read_end.reset();
        exec_child(argv.data(), dir.c_str(), write_end.release());
    }
    write_end.reset();

    const auto deadline = start + spec.timeout;
    bool killed = false;
    char buf[4096];
    while (true) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.status = ProbeStatus::Timeout;
            killed = true;
            break;
        }
        pollfd pfd{read_end.get(), POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            result.status = ProbeStatus::SpawnFailed;
            killed = true;
            break;
        }
        if (rc == 0)
            continue; // deadline re-checked at the top
        ssize_t n = read(read_end.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            result.status = ProbeStatus::SpawnFailed;
            killed = true;
            break;
        }
        if (n == 0)
            break; // EOF: child closed stdout
        if (result.output.size() + static_cast<std::size_t>(n) > spec.max_output) {
            result.status = ProbeStatus::OutputLimit;
            killed = true;
            break;
        }
        result.output.append(buf, static_cast<std::size_t>(n));
    }

    int status = 0;
    if (killed) {
        kill(pid, SIGKILL);
        reap(pid, status);
        result.output.clear();
    } else if (!reap_until(pid, status, deadline)) {
        // stdout closed but the process keeps running past its budget
        kill(pid, SIGKILL);
        reap(pid, status);
        result.status = ProbeStatus::Timeout;
        result.output.clear();
    } else {
        if (status >= 0 && WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            // execvp failure surfaces as 127 from the child
            if (result.exit_code == 0)
                result.status = ProbeStatus::Ok;
            else if (result.exit_code == 127)
                result.status = ProbeStatus::SpawnFailed;
            else
                result.status = ProbeStatus::NonZeroExit;
        } else {
            result.status = ProbeStatus::NonZeroExit;
        }
        if (!result.ok())
            result.output.clear();
    }
    result.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return result;
}

} // namespace procutil
