#include <filesystem>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "state_store.hpp"

namespace fs = std::filesystem;

const ArgParser::Spec& option_spec() {
    static const ArgParser::Spec spec{
        {"--json", "--status", "--feed", "--stats", "--reset", "--serial", "--no-colors",
         "--verbose", "--json-log", "--compress-logs", "--auto-config", "--help", "--version"},
        {"--root", "--state-file", "--name", "--idle", "--probe-timeout", "--max-output",
         "--log-file", "--log-level", "--max-log-size", "--log-files", "--config-yaml",
         "--config-json"},
        {{'o', "--root"},
         {'g', "--verbose"},
         {'h', "--help"},
         {'V', "--version"},
         {'y', "--config-yaml"},
         {'j', "--config-json"}}};
    return spec;
}

static void load_or_throw(const fs::path& path, ConfigMap& cfg_opts, bool json) {
    std::string err;
    bool ok = json ? load_json_config(path.string(), cfg_opts, err)
                   : load_yaml_config(path.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(const ArgParser& parser, ConfigMap& cfg_opts, fs::path& config_file) {
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        load_or_throw(cfg, cfg_opts, false);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        load_or_throw(cfg, cfg_opts, true);
        config_file = cfg;
    }

    bool want_auto = parser.has_flag("--auto-config");
    if (!want_auto && cfg_opts.count("--auto-config")) {
        bool ok = false;
        want_auto = parse_bool(cfg_opts["--auto-config"], ok) && ok;
    }
    if (!want_auto || !config_file.empty())
        return;

    fs::path root_hint;
    if (parser.has_flag("--root"))
        root_hint = parser.get_option("--root");
    else if (!parser.positional().empty())
        root_hint = parser.positional().front();
    std::vector<fs::path> dirs;
    if (!root_hint.empty())
        dirs.push_back(root_hint);
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec)
        dirs.push_back(cwd);
    fs::path state_file = parser.has_flag("--state-file")
                              ? fs::path(parser.get_option("--state-file"))
                              : gitpet::StateStore::default_path();
    dirs.push_back(state_file.parent_path());
    for (const auto& dir : dirs) {
        if (dir.empty())
            continue;
        if (auto found = find_auto_config(dir)) {
            std::string err;
            if (!load_config_file(found->string(), cfg_opts, err))
                throw std::runtime_error("Failed to load config " + found->string() + ": " + err);
            config_file = *found;
            return;
        }
    }
}

static Options parse_with(const ArgParser& parser) {
    const ArgParser::Spec& spec = option_spec();
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);

    Options opts;
    ConfigMap cfg_opts;
    load_config_and_auto(parser, cfg_opts, opts.config_file);
    for (const auto& kv : cfg_opts) {
        if (!spec.flags.count(kv.first) && !spec.value_flags.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto flag = [&](const std::string& k) {
        if (parser.has_flag(k))
            return true;
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        if (it->second.empty())
            return true;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid boolean for " + k + ": " + it->second);
        return v;
    };
    // Command line value, else config value, else nullopt.
    auto value = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::nullopt;
    };

    bool ok = false;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.json = flag("--json");
    opts.no_colors = flag("--no-colors");
    opts.auto_config = flag("--auto-config");
    opts.probe.serial = flag("--serial");

    std::vector<std::pair<const char*, Command>> commands = {{"--status", Command::Status},
                                                             {"--feed", Command::Feed},
                                                             {"--stats", Command::Stats},
                                                             {"--reset", Command::Reset}};
    int selected = 0;
    for (const auto& [name, cmd] : commands) {
        if (parser.has_flag(name)) {
            opts.command = cmd;
            ++selected;
        }
    }
    if (selected > 1)
        throw std::runtime_error("--status, --feed, --stats and --reset are exclusive");

    if (cfg_opts.count("--root"))
        opts.root = cfg_opts["--root"];
    if (!parser.positional().empty())
        opts.root = parser.positional().front();
    if (parser.has_flag("--root"))
        opts.root = parser.get_option("--root");
    if (opts.root.empty())
        opts.root = fs::current_path();

    if (auto v = value("--state-file"); v && !v->empty())
        opts.state_file = *v;
    else
        opts.state_file = gitpet::StateStore::default_path();
    if (auto v = value("--name"))
        opts.name = *v;

    if (auto v = value("--idle")) {
        opts.idle_seconds = parse_duration(*v, ok).count();
        if (!ok)
            throw std::runtime_error("Invalid value for --idle");
    }
    if (auto v = value("--probe-timeout")) {
        auto t = parse_time_ms(*v, ok);
        if (!ok || t.count() < 1)
            throw std::runtime_error("Invalid value for --probe-timeout");
        opts.probe.timeout = t;
    }
    if (auto v = value("--max-output")) {
        opts.probe.max_output = parse_bytes(*v, 1024, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-output");
    }

    if (auto v = value("--log-file"))
        opts.logging.log_file = *v;
    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (auto v = value("--log-level")) {
        opts.logging.log_level = parse_log_level(*v, ok);
        if (!ok)
            throw std::runtime_error("Invalid log level: " + *v);
    }
    if (auto v = value("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(*v, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (auto v = value("--log-files")) {
        opts.logging.log_files = parse_size_t(*v, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-files");
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    return opts;
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, option_spec());
    return parse_with(parser);
}

Options parse_options(const std::vector<std::string>& args) {
    ArgParser parser(args, option_spec());
    return parse_with(parser);
}
