#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line parser for `--flag` and `--opt value` style arguments.
 *
 * Options that take a value are declared up front, so a bare flag never
 * swallows the argument that follows it. Values may be given as
 * `--opt value` or `--opt=value`; short aliases accept `-o value` and
 * `-ovalue`. Flags outside the known set are collected rather than rejected so
 * the caller can report them together.
 */
class ArgParser {
  public:
    struct Spec {
        std::set<std::string> flags;        ///< Boolean switches, e.g. `--json`
        std::set<std::string> value_flags;  ///< Options requiring a value
        std::map<char, std::string> short_map; ///< `-o` to `--root` style aliases
    };

    ArgParser(int argc, char* argv[], const Spec& spec) : spec_(spec) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);
        parse(args);
    }

    ArgParser(const std::vector<std::string>& args, const Spec& spec) : spec_(spec) {
        parse(args);
    }

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Value of an option or an empty string when absent.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        return it != options_.end() ? it->second : std::string();
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options given without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }

  private:
    Spec spec_;
    std::set<std::string> flags_;
    std::map<std::string, std::string> options_;
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_flags_;
    std::vector<std::string> missing_values_;

    bool takes_value(const std::string& key) const { return spec_.value_flags.count(key) > 0; }
    bool known(const std::string& key) const {
        return spec_.flags.count(key) > 0 || takes_value(key);
    }

    void store(const std::string& key, const std::string& val) {
        flags_.insert(key);
        options_[key] = val;
    }

    // Consume the next argument as the value of @p key when one is available.
    void take_value(const std::string& key, const std::vector<std::string>& args, size_t& i) {
        if (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
            store(key, args[++i]);
        } else {
            flags_.insert(key);
            missing_values_.push_back(key);
        }
    }

    void parse(const std::vector<std::string>& args) {
        bool only_positional = false;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                std::string key = arg.substr(0, eq);
                if (!known(key)) {
                    unknown_flags_.push_back(key);
                } else if (eq != std::string::npos) {
                    store(key, arg.substr(eq + 1));
                } else if (takes_value(key)) {
                    take_value(key, args, i);
                } else {
                    flags_.insert(key);
                }
            } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] != '-') {
                auto it = spec_.short_map.find(arg[1]);
                if (it == spec_.short_map.end()) {
                    unknown_flags_.push_back(arg.substr(0, 2));
                    continue;
                }
                const std::string& key = it->second;
                std::string rest = arg.substr(2);
                if (!rest.empty() && rest[0] == '=')
                    rest.erase(0, 1);
                if (takes_value(key)) {
                    if (!rest.empty())
                        store(key, rest);
                    else
                        take_value(key, args, i);
                } else if (rest.empty()) {
                    flags_.insert(key);
                } else {
                    unknown_flags_.push_back(arg);
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }
};

#endif // ARG_PARSER_HPP
