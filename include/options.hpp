#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
};

struct ProbeOptions {
    std::optional<std::chrono::milliseconds> timeout; ///< Overrides every probe budget
    size_t max_output = 1024 * 1024;
    bool serial = false;
};

enum class Command { Scan, Status, Feed, Stats, Reset };

struct Options {
    std::filesystem::path root;
    std::filesystem::path state_file;
    std::string name;
    Command command = Command::Scan;
    bool json = false;
    long long idle_seconds = 0;
    bool no_colors = false;
    bool auto_config = false;
    bool show_help = false;
    bool print_version = false;
    LoggingOptions logging;
    ProbeOptions probe;
    std::filesystem::path config_file;
};

/**
 * @brief Option table shared by the parser and the config validator.
 */
const ArgParser::Spec& option_spec();

/**
 * Parse command-line arguments and configuration files into Options.
 *
 * Values are merged as defaults < config file < command line. Unknown flags,
 * unknown config keys, malformed values and conflicting commands throw
 * `std::runtime_error`.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 */
Options parse_options(int argc, char* argv[]);

/// Same as above for an argument list without the program name.
Options parse_options(const std::vector<std::string>& args);

/**
 * Load `--config-yaml`/`--config-json` and, when `--auto-config` is set,
 * the first `.gitpet.yaml`/`.gitpet.json` found in the root, the current
 * directory or the state directory.
 *
 * @param parser      Parsed command line.
 * @param cfg_opts    Receives the config values.
 * @param config_file Receives the path of the file that was loaded.
 */
void load_config_and_auto(const ArgParser& parser, ConfigMap& cfg_opts,
                          std::filesystem::path& config_file);

#endif // OPTIONS_HPP
