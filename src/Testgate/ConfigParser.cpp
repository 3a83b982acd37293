// =================================================================
// src/Testgate/ConfigParser.cpp
// =================================================================
// yaml-cpp backed configuration parser.

#include "Testgate/ConfigParser.hpp"
#include "Testgate/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Testgate {

ConfigParser::ConfigParser(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        // Expected before `testgate init` has been run
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        flatten(root, "");
    } catch (const YAML::Exception& e) {
        m_load_error = e.what();
        Logger::getInstance().warning("ConfigParser", "Failed to parse configuration, using defaults",
                                      config_path + ": " + e.what());
    }
}

bool ConfigParser::loadFromString(const std::string& yaml_text) {
    m_config_values.clear();
    m_load_error.clear();

    try {
        YAML::Node root = YAML::Load(yaml_text);
        flatten(root, "");
        return true;
    } catch (const YAML::Exception& e) {
        m_load_error = e.what();
        return false;
    }
}

void ConfigParser::flatten(const YAML::Node& node, const std::string& prefix) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flatten(it->second, prefix.empty() ? key : prefix + "." + key);
        }
    } else if (node.IsScalar() && !prefix.empty()) {
        m_config_values[prefix] = node.Scalar();
    }
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return "";
}

bool ConfigParser::hasKey(const std::string& key) const {
    return m_config_values.find(key) != m_config_values.end();
}

} // namespace Testgate
