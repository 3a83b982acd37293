// =================================================================
// src/Testgate/Core.cpp
// =================================================================
// Implementation of the core application logic.

#include "Testgate/Core.hpp"
#include "Testgate/ArtifactStore.hpp"
#include "Testgate/ConfigParser.hpp"
#include "Testgate/EventLog.hpp"
#include "Testgate/HunkCountNormalizer.hpp"
#include "Testgate/Logger.hpp"
#include "Testgate/Notifier.hpp"
#include "Testgate/PatchApplier.hpp"
#include "Testgate/PatchExtractor.hpp"
#include "Testgate/ProcessRunner.hpp"
#include "Testgate/StringUtils.hpp"
#include "Testgate/TestPathClassifier.hpp"
#include "Testgate/UnifiedDiffParser.hpp"
#include "Testgate/WorktreeManager.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Testgate {

Core::Core(const Commands& commands)
    : m_commands(commands)
{
    ConfigParser parser(m_commands.config_path);
    m_config.loadFromConfig(parser);
    m_config.applyCommandOverrides(m_commands);

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(Logger::parseLevel(m_config.console_level));
    logger.setFileLogLevel(Logger::parseLevel(m_config.file_level, LogLevel::DEBUG));
    logger.setConsoleLogging(m_config.console_logging);
    logger.initialize(m_config.getLogDir());

    m_runner = std::make_unique<GitProcessRunner>(m_config.git_binary, m_config.git_max_buffer_bytes);
    m_store = std::make_unique<ArtifactStore>(m_config.storage_dir);
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command != "init" && !m_config.validate()) {
        std::cerr << "Invalid configuration in " << m_commands.config_path << "." << std::endl;
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.input_path);

    int exit_code = 1;
    if (m_commands.active_command == "init") {
        exit_code = handleInit();
    } else if (m_commands.active_command == "apply") {
        exit_code = handleApply();
    } else if (m_commands.active_command == "analyze") {
        exit_code = handleAnalyze();
    } else if (m_commands.active_command == "normalize") {
        exit_code = handleNormalize();
    } else if (m_commands.active_command == "classify") {
        exit_code = handleClassify();
    } else if (m_commands.active_command == "worktree") {
        exit_code = handleWorktree();
    } else if (m_commands.active_command == "artifacts") {
        exit_code = handleArtifacts();
    } else if (m_commands.active_command.empty()) {
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(elapsed.count()));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleInit() {
    const fs::path config_file(m_commands.config_path);

    if (fs::exists(config_file)) {
        std::cout << "Configuration file '" << config_file.string() << "' already exists. Skipping." << std::endl;
        return 0;
    }

    std::error_code ec;
    if (config_file.has_parent_path()) {
        fs::create_directories(config_file.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: Failed to create configuration directory '"
                      << config_file.parent_path().string() << "': " << ec.message() << std::endl;
            return 1;
        }
    }

    std::ofstream out(config_file, std::ios::binary);
    out << TestgateConfig::defaultConfigYaml();
    out.close();
    if (!out) {
        std::cerr << "Error: Failed to write configuration file '" << config_file.string() << "'." << std::endl;
        return 1;
    }

    std::cout << "Created default configuration file: " << config_file.string() << std::endl;
    return 0;
}

int Core::handleApply() {
    std::string input = readInput(m_commands.input_path);
    const std::string task_id = resolveTaskId();

    std::string patch_text = input;
    if (m_commands.from_log) {
        ExtractedPatch extracted = PatchExtractor::extractFromLogs(input);
        if (!extracted.found) {
            JsonlEventSink events(m_config.storage_dir);
            events.append(TaskEvent::started(task_id, "apply", m_commands.input_path));
            events.log(task_id, EventLevel::ERROR, "No patch markers found in the agent log.");
            events.append(TaskEvent::completed(task_id, 1));
            std::cerr << "Error: no patch between " << PatchExtractor::BEGIN_MARKER << " and "
                      << PatchExtractor::END_MARKER << " in " << m_commands.input_path << std::endl;
            return 1;
        }
        patch_text = extracted.patch_text;
    }

    return applyPatchText(task_id, patch_text, m_commands.input_path);
}

int Core::applyPatchText(const std::string& task_id, const std::string& patch_text, const std::string& source) {
    // A blank patch leaves no trace in the storage directory
    JsonlEventSink persistent_events(m_config.storage_dir);
    MemoryEventSink discarded_events;
    EventSink& events = trim(patch_text).empty() ? static_cast<EventSink&>(discarded_events)
                                                 : static_cast<EventSink&>(persistent_events);
    ConsoleNotifier notifier;
    events.append(TaskEvent::started(task_id, "apply", source));

    PatchApplier applier(*m_runner, *m_store, events, notifier,
                         TestPathClassifier::defaultPolicy(), m_config.leniency);
    ApplyOutcome outcome = applier.apply(task_id, patch_text, m_commands.repo_root);

    std::cout << "task: " << task_id << std::endl;
    std::cout << "result: " << applyReasonName(outcome.reason) << std::endl;
    for (const auto& path : outcome.test_paths) {
        std::cout << "test: " << path << std::endl;
    }
    if (!outcome.persisted_patch_path.empty()) {
        std::cout << "patch: " << outcome.persisted_patch_path << std::endl;
    }
    if (!outcome.persisted_instruction_path.empty()) {
        std::cout << "instructions: " << outcome.persisted_instruction_path << std::endl;
    }

    int exit_code = outcome.applied ? 0 : 1;
    events.append(TaskEvent::completed(task_id, exit_code));
    return exit_code;
}

int Core::handleAnalyze() {
    std::string diff_text = readInput(m_commands.input_path);

    UnifiedDiffParser parser;
    DiffAnalysis analysis = parser.analyze(diff_text);

    for (const auto& file : analysis.files) {
        std::cout << UnifiedDiffParser::changeTypeName(file.change_type) << "\t" << file.path;
        if (file.change_type == ChangeType::RENAMED && !file.old_path.empty()) {
            std::cout << "\t(from " << file.old_path << ")";
        }
        std::cout << std::endl;
    }

    if (analysis.skipped_headers > 0) {
        TESTGATE_LOG_WARNING("Analyze", "Skipped " + std::to_string(analysis.skipped_headers) +
                             " diff header(s) with unparseable paths");
    }
    TESTGATE_LOG_INFO("Analyze", std::to_string(analysis.files.size()) + " changed file(s)");
    return 0;
}

int Core::handleNormalize() {
    std::string patch_text = readInput(m_commands.input_path);

    HunkCountNormalizer normalizer;
    NormalizeResult result = normalizer.normalize(patch_text);

    if (!writeOutput(result.normalized)) {
        return 1;
    }

    std::cerr << (result.changed ? "Hunk counts were corrected." : "Hunk counts already correct.") << std::endl;
    return 0;
}

int Core::handleClassify() {
    for (const auto& path : TestPathClassifier::filterTestLikePaths(m_commands.paths)) {
        std::cout << path << std::endl;
    }
    return 0;
}

int Core::handleWorktree() {
    WorktreeManager manager(*m_runner, m_config.getWorktreeBaseDir());

    if (m_commands.subcommand == "create") {
        std::string ref = m_commands.ref.empty() ? m_config.worktree_default_ref : m_commands.ref;
        WorktreeCreateResult result = manager.create(m_commands.repo_root, m_commands.task_id, ref);
        if (!result.success) {
            std::cerr << "Error: Failed to create worktree:\n" << result.error_message << std::endl;
            return 1;
        }
        std::cout << result.worktree.worktree_dir << std::endl;
        return 0;
    }

    if (m_commands.subcommand == "capture") {
        TestPatchCapture capture = manager.captureTestPatch(m_commands.worktree_dir,
                                                            TestPathClassifier::defaultPolicy());
        if (!capture.success) {
            std::cerr << "Error: Failed to capture test changes:\n" << capture.error_message << std::endl;
            return 1;
        }
        if (capture.patch_text.empty()) {
            std::cerr << "No test file changes in " << m_commands.worktree_dir << "." << std::endl;
            return 0;
        }
        if (!m_commands.apply_captured) {
            return writeOutput(capture.patch_text) ? 0 : 1;
        }

        const std::string task_id = resolveTaskId();
        int exit_code = applyPatchText(task_id, capture.patch_text, m_commands.worktree_dir);
        if (exit_code != 0) {
            // Full copies help when the patch has to be merged by hand
            try {
                std::string snapshot = m_store->snapshotTestFiles(task_id, m_commands.worktree_dir,
                                                                  capture.test_paths);
                std::cout << "snapshot: " << snapshot << std::endl;
            } catch (const std::exception& e) {
                TESTGATE_LOG_ERROR("Core", std::string("Failed to snapshot test files: ") + e.what());
            }
        }
        return exit_code;
    }

    if (m_commands.subcommand == "remove") {
        WorktreeRemoveReport report = manager.remove(m_commands.repo_root, m_commands.worktree_dir);
        std::cout << "worktree remove: " << (report.git_remove_ok ? "ok" : "failed") << std::endl;
        std::cout << "worktree prune: " << (report.prune_ok ? "ok" : "failed") << std::endl;
        std::cout << "directory: " << (report.directory_removed ? "removed" : "still present") << std::endl;
        return report.directory_removed ? 0 : 1;
    }

    std::cerr << "Error: Unknown worktree action '" << m_commands.subcommand << "'." << std::endl;
    return 1;
}

int Core::handleArtifacts() {
    if (m_commands.subcommand == "list") {
        std::vector<ArtifactInfo> patches = m_store->listPersistedPatches();
        if (patches.empty()) {
            std::cout << "No persisted patches in " << m_store->getStorageDir() << std::endl;
            return 0;
        }
        for (const auto& info : patches) {
            std::time_t modified = std::chrono::system_clock::to_time_t(info.modified_at);
            std::cout << std::put_time(std::localtime(&modified), "%Y-%m-%d %H:%M:%S") << "  "
                      << std::setw(8) << info.file_size << "  " << info.path << std::endl;
        }
        return 0;
    }

    if (m_commands.subcommand == "clean") {
        size_t removed = m_store->cleanOldArtifacts(m_commands.max_age_days);
        std::cout << "Removed " << removed << " artifact(s) older than "
                  << m_commands.max_age_days << " day(s)." << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown artifacts action '" << m_commands.subcommand << "'." << std::endl;
    return 1;
}

bool Core::writeOutput(const std::string& text) const {
    if (m_commands.output_path.empty()) {
        std::cout << text;
        return true;
    }

    std::ofstream out(m_commands.output_path, std::ios::binary | std::ios::trunc);
    out << text;
    out.close();
    if (!out) {
        std::cerr << "Error: Failed to write '" << m_commands.output_path << "'." << std::endl;
        return false;
    }
    return true;
}

std::string Core::readInput(const std::string& path) const {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read input file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string Core::resolveTaskId() const {
    if (!m_commands.task_id.empty()) {
        return m_commands.task_id;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << "task-" << std::put_time(std::localtime(&now_t), "%Y%m%d-%H%M%S")
        << "-" << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace Testgate
