#pragma once

#include <ctime>
#include <ostream>

#include "options.hpp"
#include "scanner.hpp"

namespace cli {

/**
 * @brief Start the file logger when `--log-file` was given.
 *
 * @return `true` when a log file is active afterwards.
 */
bool setup_logging(const LoggingOptions& logging);

/**
 * @brief Translate probe options into scanner settings.
 *
 * `--probe-timeout` replaces every per-family budget; otherwise the defaults
 * stay in place.
 */
gitpet::ScanOptions make_scan_options(const Options& opts, std::time_t now);

/**
 * @brief Run the command selected in @p opts and print its report.
 *
 * Applies the visit (decay and first-visit bonus) before any command except
 * `--reset`. Output goes to @p out as text or JSON.
 *
 * @return Process exit code.
 */
int run_command(const Options& opts, std::ostream& out, std::time_t now);

int handle_scan(const Options& opts, std::ostream& out, std::time_t now);
int handle_status(const Options& opts, std::ostream& out, std::time_t now);
int handle_feed(const Options& opts, std::ostream& out, std::time_t now);
int handle_stats(const Options& opts, std::ostream& out, std::time_t now);
int handle_reset(const Options& opts, std::ostream& out);

} // namespace cli
