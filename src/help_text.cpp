#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(std::ostream& os, const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--root", "-o", "<path>", "Repository to inspect (default: current directory)",
         "Basics"},
        {"--status", "", "", "Show the pet without scanning", "Commands"},
        {"--feed", "", "", "Feed the pet TODO/FIXME markers and debug logs", "Commands"},
        {"--stats", "", "", "Show repository fun facts", "Commands"},
        {"--reset", "", "", "Delete the saved pet", "Commands"},
        {"--name", "", "<name>", "Name the pet", "Basics"},
        {"--state-file", "", "<file>", "State file (default ~/.gitpet/state.json)", "Basics"},
        {"--idle", "", "<N[s|m|h]>", "Idle time used for the mood", "Basics"},
        {"--json", "", "", "Print JSON instead of text", "Display"},
        {"--no-colors", "", "", "Disable ANSI colors", "Display"},
        {"--probe-timeout", "", "<ms|s|m>", "Time budget for every git query", "Probes"},
        {"--max-output", "", "<bytes>", "Output limit for every git query", "Probes"},
        {"--serial", "", "", "Run metric collectors one after another", "Probes"},
        {"--auto-config", "", "", "Auto detect .gitpet.yaml or .gitpet.json", "Config"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "", "<path>", "File for general logs", "Logging"},
        {"--log-level", "", "<level>", "Set log verbosity", "Logging"},
        {"--verbose", "-g", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "gitpet - a terminal companion that lives on your repository's health\n\n";
    os << "Usage: " << prog << " [repository] [options]\n\n";
    const std::vector<std::string> order{"Basics", "Commands", "Display",
                                         "Probes", "Config",   "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        }
        os << "\n";
    }
}
