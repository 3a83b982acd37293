// =================================================================
// src/Testgate/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Testgate/CliParser.hpp"

namespace Testgate {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Testgate: apply AI-generated test patches only when they touch test files.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the configuration file");
    m_app->add_option("--storage-dir", m_commands.storage_dir, "Override the artifact storage directory");
    auto* verbose = m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug logging on the console");
    m_app->add_flag("-q,--quiet", m_commands.quiet, "Only show errors on the console")->excludes(verbose);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupInitCommand(*m_app);
    setupApplyCommand(*m_app);
    setupAnalyzeCommand(*m_app);
    setupNormalizeCommand(*m_app);
    setupClassifyCommand(*m_app);
    setupWorktreeCommand(*m_app);
    setupArtifactsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    app.add_subcommand("init", "Writes a default .testgate/config.yml.");
}

void CliParser::setupApplyCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("apply", "Applies a patch if every path it touches is a test file.");
    sub->add_option("patch", m_commands.input_path, "Patch file, or '-' for stdin")->required();
    sub->add_option("--task-id", m_commands.task_id, "Task identifier used to name artifacts (default: timestamp)");
    sub->add_option("--repo", m_commands.repo_root, "Repository root to apply against (default: .)")
        ->check(CLI::ExistingDirectory);
    sub->add_flag("--from-log", m_commands.from_log, "Extract the patch from marker-delimited agent logs first");
}

void CliParser::setupAnalyzeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("analyze", "Prints the files changed by a unified diff.");
    sub->add_option("diff", m_commands.input_path, "Diff file, or '-' for stdin")->required();
}

void CliParser::setupNormalizeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("normalize", "Recomputes hunk header line counts.");
    sub->add_option("patch", m_commands.input_path, "Patch file, or '-' for stdin")->required();
    sub->add_option("-o,--output", m_commands.output_path, "Write the normalized patch here instead of stdout");
}

void CliParser::setupClassifyCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("classify", "Prints the test-like subset of the given paths.");
    sub->add_option("paths", m_commands.paths, "Repository-relative paths")->required();
}

void CliParser::setupWorktreeCommand(CLI::App& app) {
    auto* worktree_cmd = app.add_subcommand("worktree", "Manage temporary detached worktrees");
    worktree_cmd->require_subcommand(1);
    worktree_cmd->add_option("--repo", m_commands.repo_root, "Repository root (default: .)")
        ->check(CLI::ExistingDirectory);

    auto* create_cmd = worktree_cmd->add_subcommand("create", "Create a detached worktree for a task");
    create_cmd->add_option("--task-id", m_commands.task_id, "Task identifier")->required();
    create_cmd->add_option("--ref", m_commands.ref, "Commit-ish to check out (default: configured ref)");
    create_cmd->callback([this]() { m_commands.subcommand = "create"; });

    auto* capture_cmd = worktree_cmd->add_subcommand("capture", "Collect the test-file changes of a worktree as a patch");
    capture_cmd->add_option("dir", m_commands.worktree_dir, "Worktree directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    capture_cmd->add_option("-o,--output", m_commands.output_path, "Write the patch here instead of stdout");
    capture_cmd->add_flag("--apply", m_commands.apply_captured, "Apply the captured patch to --repo instead of printing it");
    capture_cmd->add_option("--task-id", m_commands.task_id, "Task identifier used to name artifacts (default: timestamp)");
    capture_cmd->callback([this]() { m_commands.subcommand = "capture"; });

    auto* remove_cmd = worktree_cmd->add_subcommand("remove", "Remove a worktree and its directory");
    remove_cmd->add_option("dir", m_commands.worktree_dir, "Worktree directory")->required();
    remove_cmd->callback([this]() { m_commands.subcommand = "remove"; });
}

void CliParser::setupArtifactsCommand(CLI::App& app) {
    auto* artifacts_cmd = app.add_subcommand("artifacts", "Inspect persisted patches");
    artifacts_cmd->require_subcommand(1);

    auto* list_cmd = artifacts_cmd->add_subcommand("list", "List persisted patches");
    list_cmd->callback([this]() { m_commands.subcommand = "list"; });

    auto* clean_cmd = artifacts_cmd->add_subcommand("clean", "Delete old artifacts");
    clean_cmd->add_option("--max-age-days", m_commands.max_age_days, "Maximum age in days (default: 7)");
    clean_cmd->callback([this]() { m_commands.subcommand = "clean"; });
}

} // namespace Testgate
