// =================================================================
// include/Testgate/ConfigParser.hpp
// =================================================================
// Reads .testgate/config.yml and exposes its scalars by dotted key.

#pragma once

#include <map>
#include <string>

namespace YAML {
class Node;
}

namespace Testgate {

class ConfigParser {
public:
    ConfigParser() = default;

    /**
     * @brief Constructs the parser and loads the configuration file.
     * A missing file is not an error; a malformed one is logged and ignored.
     * @param config_path The path to the config.yml file.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Replace the loaded values with the contents of a YAML document
     * @return False if the text is not valid YAML
     */
    bool loadFromString(const std::string& yaml_text);

    /**
     * @brief Retrieves a scalar value for a dotted key.
     * @param key The configuration key (e.g., "git.binary").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    bool hasKey(const std::string& key) const;

    const std::string& getLoadError() const { return m_load_error; }

private:
    std::map<std::string, std::string> m_config_values;
    std::string m_load_error;

    void flatten(const YAML::Node& node, const std::string& prefix);
};

} // namespace Testgate
