// =================================================================
// src/Testgate/TestgateConfig.cpp
// =================================================================
// Implementation for testgate configuration management.

#include "Testgate/TestgateConfig.hpp"
#include "Testgate/CliParser.hpp"
#include "Testgate/ConfigParser.hpp"
#include "Testgate/Logger.hpp"
#include "Testgate/StringUtils.hpp"
#include <filesystem>
#include <regex>

namespace Testgate {

namespace {

bool parseBool(const std::string& value, bool fallback) {
    std::string lower = toLower(trim(value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return fallback;
}

bool isLevelName(const std::string& value) {
    std::string lower = toLower(trim(value));
    return lower == "debug" || lower == "info" || lower == "warn" || lower == "warning" ||
           lower == "error" || lower == "critical";
}

} // namespace

void TestgateConfig::loadFromConfig(const ConfigParser& config) {
    std::string storage_dir_str = config.getStringValue("storage_dir");
    if (!storage_dir_str.empty()) {
        storage_dir = storage_dir_str;
    }

    std::string binary_str = config.getStringValue("git.binary");
    if (!binary_str.empty()) {
        git_binary = binary_str;
    }

    std::string max_buffer_str = config.getStringValue("git.max_buffer_bytes");
    if (!max_buffer_str.empty()) {
        try {
            git_max_buffer_bytes = std::stoull(max_buffer_str);
        } catch (const std::exception&) {
            TESTGATE_LOG_WARNING("Config", "Invalid git.max_buffer_bytes value, using default");
        }
    }

    std::string base_dir_str = config.getStringValue("worktree.base_dir");
    if (!base_dir_str.empty()) {
        worktree_base_dir = base_dir_str;
    }

    std::string ref_str = config.getStringValue("worktree.default_ref");
    if (!trim(ref_str).empty()) {
        worktree_default_ref = trim(ref_str);
    }

    std::string leniency_str = config.getStringValue("apply.leniency.enabled");
    if (!leniency_str.empty()) {
        leniency.enabled = parseBool(leniency_str, leniency.enabled);
    }

    std::string pattern_str = config.getStringValue("apply.leniency.identifier_pattern");
    if (!pattern_str.empty()) {
        leniency.identifier_pattern = pattern_str;
    }

    std::string log_dir_str = config.getStringValue("logging.dir");
    if (!log_dir_str.empty()) {
        log_dir = log_dir_str;
    }

    std::string level_str = config.getStringValue("logging.console_level");
    if (!level_str.empty()) {
        console_level = level_str;
    }

    std::string file_level_str = config.getStringValue("logging.file_level");
    if (!file_level_str.empty()) {
        file_level = file_level_str;
    }

    std::string console_str = config.getStringValue("logging.console");
    if (!console_str.empty()) {
        console_logging = parseBool(console_str, console_logging);
    }
}

void TestgateConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.storage_dir.empty()) {
        storage_dir = commands.storage_dir;
    }
    if (commands.verbose) {
        console_level = "debug";
    } else if (commands.quiet) {
        console_level = "error";
    }
}

bool TestgateConfig::validate() const {
    bool valid = true;

    if (trim(storage_dir).empty()) {
        TESTGATE_LOG_ERROR("Config", "storage_dir cannot be empty");
        valid = false;
    }

    if (trim(git_binary).empty()) {
        TESTGATE_LOG_ERROR("Config", "git.binary cannot be empty");
        valid = false;
    }

    if (git_max_buffer_bytes == 0) {
        TESTGATE_LOG_ERROR("Config", "git.max_buffer_bytes must be greater than 0");
        valid = false;
    }

    if (leniency.enabled) {
        try {
            std::regex check(leniency.identifier_pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            TESTGATE_LOG_ERROR("Config", "apply.leniency.identifier_pattern is not a valid regex: " +
                               std::string(e.what()));
            valid = false;
        }
    }

    if (!isLevelName(console_level)) {
        TESTGATE_LOG_ERROR("Config", "logging.console_level must be one of debug, info, warn, error, critical");
        valid = false;
    }

    if (!isLevelName(file_level)) {
        TESTGATE_LOG_ERROR("Config", "logging.file_level must be one of debug, info, warn, error, critical");
        valid = false;
    }

    return valid;
}

std::string TestgateConfig::getWorktreeBaseDir() const {
    return worktree_base_dir.empty() ? storage_dir : worktree_base_dir;
}

std::string TestgateConfig::getLogDir() const {
    if (!log_dir.empty()) {
        return log_dir;
    }
    return (std::filesystem::path(storage_dir) / "logs").string();
}

std::string TestgateConfig::defaultConfigYaml() {
    return R"(# Testgate configuration
# Root directory for patches, recovery documents, events and logs
storage_dir: .testgate

git:
  binary: git
  max_buffer_bytes: 20971520   # 20 MiB cap on captured output per call

worktree:
  # base_dir: /tmp/testgate    # defaults to storage_dir
  default_ref: HEAD

apply:
  leniency:
    # Treat a patch as applied when every identifier on its added lines
    # already exists in the target test files
    enabled: true
    identifier_pattern: '\bTC-[A-Z0-9]+(?:-[A-Z0-9]+)*\b'

logging:
  # dir: .testgate/logs
  console: true
  console_level: info
  file_level: debug
)";
}

} // namespace Testgate
