#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>

/// Option values keyed by their long flag, e.g. `--probe-timeout`.
using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief Load options from a YAML file.
 *
 * Top-level scalars become `--<key>` entries. A nested map is treated as a
 * category and its scalar children are flattened to `--<child>`, so
 * `logging: {log-level: debug}` yields `--log-level`. Sequences are ignored.
 *
 * @param path  YAML file to read.
 * @param opts  Receives the values; existing keys are overwritten.
 * @param error Human-readable reason on failure.
 * @return `true` on success.
 */
bool load_yaml_config(const std::string& path, ConfigMap& opts, std::string& error);

/**
 * @brief Load options from a JSON file using the same key rules as
 * load_yaml_config().
 */
bool load_json_config(const std::string& path, ConfigMap& opts, std::string& error);

/**
 * @brief Pick the loader from the file extension (`.json` or YAML otherwise).
 */
bool load_config_file(const std::string& path, ConfigMap& opts, std::string& error);

/**
 * @brief Look for `.gitpet.yaml`, `.gitpet.yml` then `.gitpet.json` in @p dir.
 */
std::optional<std::filesystem::path> find_auto_config(const std::filesystem::path& dir);

#endif // CONFIG_UTILS_HPP
