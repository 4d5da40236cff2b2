#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <string>
#include <sstream>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            std::string s;
            if (!to_string_value(item, s))
                return false;
            if (!joined.empty())
                joined += ",";
            joined += s;
        }
        out = joined;
        return true;
    }
    // Scalars keep their textual form so `yes`, `on` and `1` reach the
    // boolean parser unchanged.
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    if (v.is_array()) {
        std::string joined;
        for (const auto& item : v) {
            std::string s;
            if (!to_string_value(item, s))
                return false;
            if (!joined.empty())
                joined += ",";
            joined += s;
        }
        out = joined;
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                if (key_name != "global")
                    continue;
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    std::string s;
                    if (to_string_value(it2->second, s))
                        opts[it2->first.as<std::string>()] = s;
                }
            } else {
                std::string s;
                if (to_string_value(node, s))
                    opts[key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            const std::string key_name = it.key();
            if (val.is_object()) {
                if (key_name != "global")
                    continue;
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string s;
                    if (to_string_value(sub.value(), s))
                        opts[sub.key()] = s;
                }
            } else {
                std::string s;
                if (to_string_value(val, s))
                    opts[key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
