// =================================================================
// src/Testgate/WorktreeManager.cpp
// =================================================================

#include "Testgate/WorktreeManager.hpp"
#include "Testgate/Logger.hpp"
#include "Testgate/ProcessRunner.hpp"
#include "Testgate/StringUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace fs = std::filesystem;

namespace Testgate {

namespace {

// NUL-separated output of a `-z` listing; names are never quoted there.
std::vector<std::string> parsePathList(const std::string& output) {
    std::vector<std::string> paths;
    size_t begin = 0;
    while (begin < output.size()) {
        size_t end = output.find('\0', begin);
        if (end == std::string::npos) {
            end = output.size();
        }
        std::string path = normalizeRelativePath(output.substr(begin, end - begin));
        if (!path.empty()) {
            paths.push_back(path);
        }
        begin = end + 1;
    }
    return paths;
}

} // namespace

WorktreeManager::WorktreeManager(const ProcessRunner& runner, const std::string& base_dir)
    : m_runner(runner), m_base_dir(base_dir.empty() ? ".testgate" : base_dir) {
}

std::string WorktreeManager::worktreesRoot() const {
    return (fs::path(m_base_dir) / "worktrees").string();
}

WorktreeCreateResult WorktreeManager::create(const std::string& repo_root,
                                             const std::string& task_id,
                                             const std::string& ref) const {
    WorktreeCreateResult result;

    try {
        fs::path root = fs::absolute(worktreesRoot());
        fs::path dir = root / sanitizeTaskId(task_id);

        fs::create_directories(root);
        // Leftover from an interrupted run
        fs::remove_all(dir);

        std::string effective_ref = trim(ref);
        if (effective_ref.empty()) {
            effective_ref = "HEAD";
        }

        ProcessResult added = m_runner.run(repo_root, {"worktree", "add", "--detach", dir.string(), effective_ref});
        if (!added.ok) {
            result.error_message = added.output;
            TESTGATE_LOG_ERROR("WorktreeManager", "worktree add failed: " + added.output);
            return result;
        }

        result.success = true;
        result.worktree.worktree_dir = dir.string();
        TESTGATE_LOG_INFO("WorktreeManager", "Created worktree " + dir.string() + " at " + effective_ref);
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
        TESTGATE_LOG_ERROR("WorktreeManager", std::string("Failed to prepare worktree: ") + e.what());
    }

    return result;
}

WorktreeRemoveReport WorktreeManager::remove(const std::string& repo_root, const std::string& worktree_dir) const {
    WorktreeRemoveReport report;

    ProcessResult removed = m_runner.run(repo_root, {"worktree", "remove", "--force", worktree_dir});
    report.git_remove_ok = removed.ok;
    if (!removed.ok) {
        TESTGATE_LOG_DEBUG("WorktreeManager", "worktree remove failed: " + removed.output);
    }

    ProcessResult pruned = m_runner.run(repo_root, {"worktree", "prune"});
    report.prune_ok = pruned.ok;
    if (!pruned.ok) {
        TESTGATE_LOG_DEBUG("WorktreeManager", "worktree prune failed: " + pruned.output);
    }

    std::error_code ec;
    fs::remove_all(worktree_dir, ec);
    if (ec) {
        TESTGATE_LOG_WARNING("WorktreeManager", "Failed to delete " + worktree_dir + ": " + ec.message());
    }
    report.directory_removed = !fs::exists(worktree_dir, ec);

    return report;
}

TestPatchCapture WorktreeManager::captureTestPatch(const std::string& worktree_dir,
                                                   const TestPathClassifierFn& classifier) const {
    TestPatchCapture capture;

    try {
        ProcessResult tracked = m_runner.run(worktree_dir, {"diff", "--name-only", "-z"});
        if (!tracked.ok) {
            capture.error_message = tracked.output;
            TESTGATE_LOG_ERROR("WorktreeManager", "Listing changed files failed: " + tracked.output);
            return capture;
        }
        ProcessResult untracked = m_runner.run(worktree_dir, {"ls-files", "-z", "--others", "--exclude-standard"});
        if (!untracked.ok) {
            capture.error_message = untracked.output;
            TESTGATE_LOG_ERROR("WorktreeManager", "Listing untracked files failed: " + untracked.output);
            return capture;
        }

        std::vector<std::string> changed = parsePathList(tracked.stdout_text);
        std::vector<std::string> new_files = parsePathList(untracked.stdout_text);
        for (const auto& path : new_files) {
            if (std::find(changed.begin(), changed.end(), path) == changed.end()) {
                changed.push_back(path);
            }
        }

        TestPathClassifierFn policy = classifier ? classifier : TestPathClassifier::defaultPolicy();
        std::unordered_set<std::string> test_set;
        for (const auto& path : policy(changed)) {
            test_set.insert(normalizeRelativePath(path));
        }
        // Keep the listing order; the policy may reorder
        for (const auto& path : changed) {
            if (test_set.count(path) > 0) {
                capture.test_paths.push_back(path);
            }
        }

        if (capture.test_paths.empty()) {
            TESTGATE_LOG_INFO("WorktreeManager", "No test file changes in " + worktree_dir);
            capture.success = true;
            return capture;
        }

        std::unordered_set<std::string> untracked_set(new_files.begin(), new_files.end());
        for (const auto& path : capture.test_paths) {
            if (untracked_set.count(path) > 0) {
                capture.untracked_test_paths.push_back(path);
            }
        }

        if (!capture.untracked_test_paths.empty()) {
            std::vector<std::string> add_args = {"add", "-N", "--"};
            add_args.insert(add_args.end(), capture.untracked_test_paths.begin(), capture.untracked_test_paths.end());
            ProcessResult added = m_runner.run(worktree_dir, add_args);
            if (!added.ok) {
                // New files are then missing from the diff; the tracked part is still usable
                TESTGATE_LOG_WARNING("WorktreeManager", "Marking new test files intent-to-add failed: " + added.output);
            }
        }

        std::vector<std::string> diff_args = {"diff", "--no-color", "--binary", "--"};
        diff_args.insert(diff_args.end(), capture.test_paths.begin(), capture.test_paths.end());
        ProcessResult diff = m_runner.run(worktree_dir, diff_args);
        if (!diff.ok) {
            capture.error_message = diff.output;
            TESTGATE_LOG_ERROR("WorktreeManager", "Capturing the test diff failed: " + diff.output);
            return capture;
        }

        if (!trim(diff.stdout_text).empty()) {
            capture.patch_text = diff.stdout_text;
            if (capture.patch_text.back() != '\n') {
                capture.patch_text += "\n";
            }
        }
        capture.success = true;
        TESTGATE_LOG_INFO("WorktreeManager", "Captured changes to " + std::to_string(capture.test_paths.size()) +
                          " test file(s) from " + worktree_dir);
    } catch (const std::exception& e) {
        capture.success = false;
        capture.error_message = e.what();
        TESTGATE_LOG_ERROR("WorktreeManager", std::string("Failed to capture test changes: ") + e.what());
    }

    return capture;
}

ScopedWorktree::ScopedWorktree(const WorktreeManager& manager, const std::string& repo_root,
                               const TemporaryWorktree& worktree)
    : m_manager(manager), m_repo_root(repo_root), m_worktree(worktree), m_owned(true) {
}

ScopedWorktree::~ScopedWorktree() {
    if (m_owned && !m_worktree.worktree_dir.empty()) {
        m_manager.remove(m_repo_root, m_worktree.worktree_dir);
    }
}

TemporaryWorktree ScopedWorktree::release() {
    m_owned = false;
    return m_worktree;
}

} // namespace Testgate
