#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
    } else if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
    } else if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
    } else if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
    } else if (v.is_number_float()) {
        out = v.dump();
    } else if (v.is_null()) {
        out.clear();
    } else {
        return false;
    }
    return true;
}

bool load_yaml_config(const std::string& path, ConfigMap& opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const YAML::Node& node = it->second;
            std::string s;
            if (node.IsMap()) {
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (sub->first.IsScalar() && to_string_value(sub->second, s))
                        opts["--" + sub->first.Scalar()] = s;
                }
            } else if (to_string_value(node, s)) {
                opts["--" + it->first.Scalar()] = s;
            }
        }
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool load_json_config(const std::string& path, ConfigMap& opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    nlohmann::json root = nlohmann::json::parse(ifs, nullptr, false);
    if (root.is_discarded()) {
        error = "Invalid JSON";
        return false;
    }
    if (!root.is_object()) {
        error = "Root JSON value is not an object";
        return false;
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
        const auto& val = it.value();
        std::string s;
        if (val.is_object()) {
            for (auto sub = val.begin(); sub != val.end(); ++sub) {
                if (to_string_value(sub.value(), s))
                    opts["--" + sub.key()] = s;
            }
        } else if (to_string_value(val, s)) {
            opts["--" + it.key()] = s;
        }
    }
    return true;
}

bool load_config_file(const std::string& path, ConfigMap& opts, std::string& error) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json")
        return load_json_config(path, opts, error);
    return load_yaml_config(path, opts, error);
}

std::optional<fs::path> find_auto_config(const fs::path& dir) {
    for (const char* name : {".gitpet.yaml", ".gitpet.yml", ".gitpet.json"}) {
        std::error_code ec;
        fs::path candidate = dir / name;
        if (fs::is_regular_file(candidate, ec))
            return candidate;
    }
    return std::nullopt;
}
