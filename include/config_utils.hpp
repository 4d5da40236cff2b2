#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load settings from a YAML file.
 *
 * The root must be a mapping. Scalar values are stored as strings under
 * their key; a sequence (such as a list of `ignore` patterns) is joined with
 * commas. A nested `global:` mapping is flattened into the same map so files
 * can mirror the git config section.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving setting values keyed by setting name.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load settings from a JSON file.
 *
 * Same layout rules as @ref load_yaml_config: the root must be an object,
 * arrays are joined with commas and a nested `global` object is flattened.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving setting values keyed by setting name.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
