// =================================================================
// include/Testgate/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Testgate {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command;  // Name of the subcommand triggered
    std::string subcommand;      // Nested action for 'worktree' and 'artifacts'

    // Global options
    std::string config_path = ".testgate/config.yml";
    std::string storage_dir;
    bool verbose = false;
    bool quiet = false;

    // Options for 'apply', 'analyze' and 'normalize' ("-" reads stdin)
    std::string input_path;
    std::string output_path;
    std::string task_id;
    std::string repo_root = ".";
    bool from_log = false;

    // Options for 'classify'
    std::vector<std::string> paths;

    // Options for 'worktree'
    std::string ref;
    std::string worktree_dir;
    bool apply_captured = false;

    // Options for 'artifacts clean'
    size_t max_age_days = 7;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupApplyCommand(CLI::App& app);
    void setupAnalyzeCommand(CLI::App& app);
    void setupNormalizeCommand(CLI::App& app);
    void setupClassifyCommand(CLI::App& app);
    void setupWorktreeCommand(CLI::App& app);
    void setupArtifactsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Testgate
