// =================================================================
// include/Testgate/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Testgate/CliParser.hpp"
#include "Testgate/TestgateConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Testgate {
    class ArtifactStore;
    class GitProcessRunner;
}

namespace Testgate {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleApply();
    int handleAnalyze();
    int handleNormalize();
    int handleClassify();
    int handleWorktree();
    int handleArtifacts();

    /**
     * @brief Run the apply pipeline on patch text and print the outcome
     * @param source Where the patch came from, recorded in the started event
     * @return 0 when applied, 1 otherwise
     */
    int applyPatchText(const std::string& task_id, const std::string& patch_text, const std::string& source);

    /**
     * @brief Write to --output, or stdout when none was given
     */
    bool writeOutput(const std::string& text) const;

    /**
     * @brief Read a file, or stdin when path is "-"
     * @throws std::runtime_error if the file cannot be read
     */
    std::string readInput(const std::string& path) const;

    std::string resolveTaskId() const;

    const Commands& m_commands;
    TestgateConfig m_config;
    std::unique_ptr<GitProcessRunner> m_runner;
    std::unique_ptr<ArtifactStore> m_store;
};

} // namespace Testgate
