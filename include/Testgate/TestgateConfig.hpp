// =================================================================
// include/Testgate/TestgateConfig.hpp
// =================================================================
// Configuration settings shared by all testgate commands.

#pragma once

#include "Testgate/PatchApplier.hpp"
#include <string>

namespace Testgate {

class ConfigParser;
struct Commands;

/**
 * @brief Effective configuration: defaults, then config.yml, then CLI flags
 */
struct TestgateConfig {
    // Storage
    std::string storage_dir = ".testgate";

    // Version control
    std::string git_binary = "git";
    size_t git_max_buffer_bytes = 20 * 1024 * 1024;

    // Worktrees; empty base dir means the storage directory
    std::string worktree_base_dir;
    std::string worktree_default_ref = "HEAD";

    // Apply pipeline
    LeniencySettings leniency;

    // Logging; empty dir means <storage_dir>/logs
    std::string log_dir;
    std::string console_level = "info";
    std::string file_level = "debug";
    bool console_logging = true;

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings, logging every problem found
     * @return True if configuration is valid
     */
    bool validate() const;

    std::string getWorktreeBaseDir() const;
    std::string getLogDir() const;

    /**
     * @brief Contents written by `testgate init`
     */
    static std::string defaultConfigYaml();
};

} // namespace Testgate
