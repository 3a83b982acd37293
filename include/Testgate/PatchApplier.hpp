// =================================================================
// include/Testgate/PatchApplier.hpp
// =================================================================
// The patch application pipeline: safety classification, hunk repair,
// escalating apply attempts and the artifact fallback.

#pragma once

#include "Testgate/TestPathClassifier.hpp"
#include <regex>
#include <string>
#include <vector>

namespace Testgate {

class ArtifactStore;
class EventSink;
class Notifier;
class ProcessRunner;

/**
 * @brief Terminal reasons of a pipeline run
 */
enum class ApplyReason {
    EMPTY_PATCH,
    NO_DIFF_PATHS,
    NO_TEST_PATHS,
    CONTAINS_NON_TEST_PATHS,
    APPLY_FAILED,
    EXCEPTION,
    APPLIED
};

/**
 * @brief Kebab-case name of a reason ("empty-patch", "applied", ...)
 */
std::string applyReasonName(ApplyReason reason);

/**
 * @brief The only value a pipeline run returns
 */
struct ApplyOutcome {
    bool applied;
    std::vector<std::string> test_paths;
    std::string persisted_patch_path;        ///< Empty when nothing was persisted
    std::string persisted_instruction_path;  ///< Empty unless reason is APPLY_FAILED
    ApplyReason reason;

    ApplyOutcome() : applied(false), reason(ApplyReason::EXCEPTION) {}
};

/**
 * @brief Tuning of the "already applied" identifier heuristic
 */
struct LeniencySettings {
    bool enabled;
    std::string identifier_pattern;

    LeniencySettings()
        : enabled(true), identifier_pattern(R"(\bTC-[A-Z0-9]+(?:-[A-Z0-9]+)*\b)") {}
};

/**
 * @brief Result of the escalating apply attempts
 */
struct ApplyAttemptResult {
    bool ok;
    std::string output;   ///< "[OK] label" / "[NG] label\n<diagnostic>" sections

    ApplyAttemptResult() : ok(false) {}
};

/**
 * @brief Decides whether and how to apply an externally generated patch
 *
 * A patch is applied only when every path it touches is test-like. The
 * tree is mutated exclusively through the ProcessRunner. Every non-success
 * outcome leaves the patch in the ArtifactStore. apply() never throws.
 */
class PatchApplier {
public:
    PatchApplier(const ProcessRunner& runner,
                 ArtifactStore& store,
                 EventSink& events,
                 Notifier& notifier,
                 TestPathClassifierFn classifier,
                 const LeniencySettings& leniency = LeniencySettings());

    /**
     * @brief Run the pipeline to a terminal outcome
     * @param task_id Task the patch belongs to; names all artifacts
     * @param patch_text Raw unified diff
     * @param repo_root Working tree to apply against
     */
    ApplyOutcome apply(const std::string& task_id,
                       const std::string& patch_text,
                       const std::string& repo_root);

    /**
     * @brief Distinct identifiers found on added lines, sorted
     */
    std::vector<std::string> collectIdentifiers(const std::string& patch_text) const;

    /**
     * @brief True when every identifier of the patch already appears in the test files
     *
     * False when there are no identifiers, when the heuristic is disabled,
     * or when any test file cannot be read.
     */
    bool looksAlreadyApplied(const std::string& repo_root,
                             const std::vector<std::string>& test_paths,
                             const std::string& patch_text) const;

private:
    const ProcessRunner& m_runner;
    ArtifactStore& m_store;
    EventSink& m_events;
    Notifier& m_notifier;
    TestPathClassifierFn m_classifier;
    bool m_leniency_enabled;
    std::regex m_identifier_regex;

    ApplyOutcome runPipeline(const std::string& task_id,
                             const std::string& patch_text,
                             const std::string& repo_root,
                             std::string& ephemeral_path,
                             std::string& persisted_path);

    ApplyAttemptResult tryApplyWithFallback(const std::string& repo_root,
                                            const std::string& patch_path) const;

    bool reverseCheck(const std::string& repo_root, const std::string& patch_path) const;

    ApplyOutcome succeed(const std::string& task_id,
                         const std::vector<std::string>& test_paths,
                         const std::string& ephemeral_path);
};

} // namespace Testgate
