// =================================================================
// include/Testgate/WorktreeManager.hpp
// =================================================================
// Creates and tears down detached temporary worktrees so that agent
// work never touches the user's live working tree.

#pragma once

#include "Testgate/TestPathClassifier.hpp"
#include <string>
#include <vector>

namespace Testgate {

class ProcessRunner;

struct TemporaryWorktree {
    std::string worktree_dir;
};

struct WorktreeCreateResult {
    bool success;
    TemporaryWorktree worktree;
    std::string error_message;

    WorktreeCreateResult() : success(false) {}
};

/**
 * @brief Which teardown steps succeeded
 */
struct WorktreeRemoveReport {
    bool git_remove_ok;
    bool prune_ok;
    bool directory_removed;

    WorktreeRemoveReport() : git_remove_ok(false), prune_ok(false), directory_removed(false) {}
};

/**
 * @brief Test changes collected from a worktree as a single patch
 */
struct TestPatchCapture {
    bool success;
    std::string patch_text;                        ///< Empty when no test file changed
    std::vector<std::string> test_paths;           ///< Changed test-like paths, tracked then untracked
    std::vector<std::string> untracked_test_paths; ///< Subset that was new in the worktree
    std::string error_message;

    TestPatchCapture() : success(false) {}
};

class WorktreeManager {
public:
    /**
     * @param runner Version-control runner used for worktree commands
     * @param base_dir Directory under which `worktrees/<taskId>` is created
     */
    WorktreeManager(const ProcessRunner& runner, const std::string& base_dir);

    /**
     * @brief Create `<base_dir>/worktrees/<sanitized id>` detached at ref
     *
     * A stale directory with the same name is deleted first. A blank ref
     * means HEAD. Never throws; failures are reported in the result.
     */
    WorktreeCreateResult create(const std::string& repo_root,
                                const std::string& task_id,
                                const std::string& ref = "HEAD") const;

    /**
     * @brief Best-effort teardown
     *
     * Runs `worktree remove --force`, `worktree prune` and a recursive
     * delete of the directory. Every step is attempted regardless of
     * earlier failures. Never throws.
     */
    WorktreeRemoveReport remove(const std::string& repo_root, const std::string& worktree_dir) const;

    /**
     * @brief Collect the test-file changes made in a worktree as a patch
     *
     * Lists tracked changes and untracked files, keeps the test-like ones,
     * marks new test files intent-to-add so they show up in the diff, and
     * returns `git diff --no-color --binary` restricted to those paths.
     * Only test files are ever included. Never throws.
     *
     * @param worktree_dir Worktree the agent worked in
     * @param classifier Policy selecting test-like paths
     */
    TestPatchCapture captureTestPatch(const std::string& worktree_dir,
                                      const TestPathClassifierFn& classifier) const;

    std::string worktreesRoot() const;

private:
    const ProcessRunner& m_runner;
    std::string m_base_dir;
};

/**
 * @brief Owns a temporary worktree and removes it when destroyed
 */
class ScopedWorktree {
public:
    ScopedWorktree(const WorktreeManager& manager, const std::string& repo_root,
                   const TemporaryWorktree& worktree);
    ~ScopedWorktree();

    ScopedWorktree(const ScopedWorktree&) = delete;
    ScopedWorktree& operator=(const ScopedWorktree&) = delete;

    const std::string& getDirectory() const { return m_worktree.worktree_dir; }

    /**
     * @brief Stop owning the worktree; the destructor will leave it in place
     */
    TemporaryWorktree release();

private:
    const WorktreeManager& m_manager;
    std::string m_repo_root;
    TemporaryWorktree m_worktree;
    bool m_owned;
};

} // namespace Testgate
