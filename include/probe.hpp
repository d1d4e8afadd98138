#ifndef PROBE_HPP
#define PROBE_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Outcome category of a single probe invocation.
 */
enum class ProbeStatus {
    Ok,          ///< Child exited with status 0; output is usable
    NonZeroExit, ///< Child exited with a non-zero status or was signalled
    Timeout,     ///< Child exceeded its time budget and was killed
    OutputLimit, ///< Child wrote more than the allowed output and was killed
    SpawnFailed  ///< The child could not be started at all
};

/**
 * @brief Definition of one bounded external query.
 */
struct ProbeSpec {
    std::string program = "git";                  ///< Executable looked up on PATH
    std::vector<std::string> args;                ///< Arguments after argv[0]
    std::chrono::milliseconds timeout{5000};      ///< Wall-clock budget
    std::size_t max_output = 1024 * 1024;         ///< Maximum bytes read from stdout
};

/**
 * @brief Tagged result of a probe.
 *
 * Only results with status ProbeStatus::Ok carry meaningful output. Callers
 * must check ok() and fall back to their own default otherwise.
 */
struct ProbeResult {
    ProbeStatus status = ProbeStatus::SpawnFailed;
    std::string output;
    int exit_code = -1;
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return status == ProbeStatus::Ok; }
};

/**
 * @brief Signature of a probe executor.
 *
 * The scanner and collectors receive an executor instead of calling
 * run_probe() directly so tests can substitute a recording fake.
 */
using ProbeFn = std::function<ProbeResult(const ProbeSpec&, const std::filesystem::path&)>;

/**
 * @brief Run an external command inside @p cwd with a time and output bound.
 *
 * Standard input and standard error are redirected to `/dev/null`; standard
 * output is captured. A child that outlives its timeout or exceeds the output
 * limit receives SIGKILL and is reaped before returning. Never throws.
 *
 * @param spec Command, timeout and output limit.
 * @param cwd  Working directory for the child.
 * @return Result tagged with a ProbeStatus.
 */
ProbeResult run_probe(const ProbeSpec& spec, const std::filesystem::path& cwd);

/**
 * @brief Short label for a ProbeStatus (`ok`, `timeout`, ...).
 */
const char* to_string(ProbeStatus status);

} // namespace procutil

#endif // PROBE_HPP
