// =================================================================
// src/Testgate/PatchApplier.cpp
// =================================================================
// Implementation of the patch application pipeline.

#include "Testgate/PatchApplier.hpp"
#include "Testgate/ArtifactStore.hpp"
#include "Testgate/EventLog.hpp"
#include "Testgate/HunkCountNormalizer.hpp"
#include "Testgate/Logger.hpp"
#include "Testgate/Notifier.hpp"
#include "Testgate/ProcessRunner.hpp"
#include "Testgate/StringUtils.hpp"
#include "Testgate/UnifiedDiffParser.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace Testgate {

namespace {

struct ApplyStep {
    std::string label;
    std::vector<std::string> flags;
};

bool readWholeFile(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return false;
    }
    out = buffer.str();
    return true;
}

} // namespace

std::string applyReasonName(ApplyReason reason) {
    switch (reason) {
        case ApplyReason::EMPTY_PATCH: return "empty-patch";
        case ApplyReason::NO_DIFF_PATHS: return "no-diff-paths";
        case ApplyReason::NO_TEST_PATHS: return "no-test-paths";
        case ApplyReason::CONTAINS_NON_TEST_PATHS: return "contains-non-test-paths";
        case ApplyReason::APPLY_FAILED: return "apply-failed";
        case ApplyReason::EXCEPTION: return "exception";
        case ApplyReason::APPLIED: return "applied";
    }
    return "exception";
}

PatchApplier::PatchApplier(const ProcessRunner& runner,
                           ArtifactStore& store,
                           EventSink& events,
                           Notifier& notifier,
                           TestPathClassifierFn classifier,
                           const LeniencySettings& leniency)
    : m_runner(runner),
      m_store(store),
      m_events(events),
      m_notifier(notifier),
      m_classifier(classifier ? classifier : TestPathClassifier::defaultPolicy()),
      m_leniency_enabled(leniency.enabled) {
    if (!m_leniency_enabled) {
        return;
    }
    try {
        m_identifier_regex = std::regex(leniency.identifier_pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        TESTGATE_LOG_WARNING("PatchApplier", "Invalid identifier pattern, leniency disabled: " +
                             leniency.identifier_pattern + " (" + e.what() + ")");
        m_leniency_enabled = false;
    }
}

ApplyOutcome PatchApplier::apply(const std::string& task_id,
                                 const std::string& patch_text,
                                 const std::string& repo_root) {
    std::string ephemeral_path;
    std::string persisted_path;
    ApplyOutcome outcome;

    try {
        outcome = runPipeline(task_id, patch_text, repo_root, ephemeral_path, persisted_path);
    } catch (const std::exception& e) {
        outcome = ApplyOutcome();
        outcome.reason = ApplyReason::EXCEPTION;
        m_events.log(task_id, EventLevel::ERROR, std::string("Patch application raised an exception: ") + e.what());

        std::error_code ec;
        if (persisted_path.empty() && !ephemeral_path.empty() && fs::exists(ephemeral_path, ec)) {
            try {
                persisted_path = m_store.promoteEphemeralPatch(task_id, ephemeral_path, patch_text);
            } catch (const std::exception& persist_error) {
                TESTGATE_LOG_CRITICAL("PatchApplier", "Patch for task " + task_id +
                                      " could not be saved and is lost: " + persist_error.what());
            }
        }
        if (!persisted_path.empty()) {
            outcome.persisted_patch_path = persisted_path;
            m_notifier.warning("Patch application failed with an error. Patch saved: " + persisted_path);
        }
    }

    Logger::getInstance().logApplyOutcome(task_id, outcome);
    return outcome;
}

ApplyOutcome PatchApplier::runPipeline(const std::string& task_id,
                                       const std::string& patch_text,
                                       const std::string& repo_root,
                                       std::string& ephemeral_path,
                                       std::string& persisted_path) {
    ApplyOutcome outcome;

    if (trim(patch_text).empty()) {
        m_events.log(task_id, EventLevel::WARN, "Patch is empty; nothing to apply.");
        outcome.reason = ApplyReason::EMPTY_PATCH;
        return outcome;
    }

    const std::string canonical = HunkCountNormalizer::canonicalizePatchText(patch_text);

    UnifiedDiffParser parser;
    DiffAnalysis analysis = parser.analyze(canonical);
    std::vector<std::string> all_paths;
    for (const auto& path : UnifiedDiffParser::extractChangedPaths(analysis)) {
        std::string normalized = normalizeRelativePath(path);
        if (!normalized.empty() &&
            std::find(all_paths.begin(), all_paths.end(), normalized) == all_paths.end()) {
            all_paths.push_back(normalized);
        }
    }

    if (all_paths.empty()) {
        m_events.log(task_id, EventLevel::WARN, "Could not extract any changed file path from the patch.");
        outcome.reason = ApplyReason::NO_DIFF_PATHS;
        persisted_path = m_store.persistPatchText(task_id, canonical);
        outcome.persisted_patch_path = persisted_path;
        m_notifier.warning("Patch contains no recognizable file changes. Patch saved: " +
                           outcome.persisted_patch_path);
        return outcome;
    }

    std::vector<std::string> test_paths = m_classifier(all_paths);
    for (auto& path : test_paths) {
        path = normalizeRelativePath(path);
    }

    HunkCountNormalizer normalizer;
    NormalizeResult normalized = normalizer.normalize(canonical);

    if (test_paths.empty()) {
        m_events.log(task_id, EventLevel::WARN, "Patch touches no test files; skipped.");
        outcome.reason = ApplyReason::NO_TEST_PATHS;
        persisted_path = m_store.persistPatchText(task_id, normalized.normalized);
        outcome.persisted_patch_path = persisted_path;
        m_notifier.warning("Patch touches no test files and was not applied. Patch saved: " +
                           outcome.persisted_patch_path);
        return outcome;
    }

    std::unordered_set<std::string> test_set(test_paths.begin(), test_paths.end());
    std::vector<std::string> offending;
    for (const auto& path : all_paths) {
        if (test_set.find(path) == test_set.end()) {
            offending.push_back(path);
        }
    }
    // A header whose paths could not be decoded cannot be proven test-only
    if (analysis.skipped_headers > 0) {
        offending.push_back("(" + std::to_string(analysis.skipped_headers) + " unparseable diff header(s))");
    }

    if (!offending.empty()) {
        outcome.reason = ApplyReason::CONTAINS_NON_TEST_PATHS;
        persisted_path = m_store.persistPatchText(task_id, normalized.normalized);
        outcome.persisted_patch_path = persisted_path;
        m_events.log(task_id, EventLevel::WARN,
                     "Patch contains non-test changes and was not applied: " + join(offending, ", ") +
                     " (patch saved: " + outcome.persisted_patch_path + ")");
        m_notifier.warning("Patch contains non-test changes and was not applied: " + join(offending, ", ") +
                           ". Patch saved: " + outcome.persisted_patch_path);
        return outcome;
    }

    if (normalized.changed) {
        m_events.log(task_id, EventLevel::INFO, "Repaired hunk line counts in the patch.");
    }

    ephemeral_path = m_store.writeEphemeralPatch(task_id, normalized.normalized);
    const std::string patch_arg = fs::absolute(ephemeral_path).string();

    ApplyAttemptResult attempt = tryApplyWithFallback(repo_root, patch_arg);
    if (attempt.ok) {
        m_events.log(task_id, EventLevel::INFO,
                     "Applied patch to " + std::to_string(test_paths.size()) + " test file(s).");
        for (const auto& path : test_paths) {
            m_events.append(TaskEvent::fileWrite(task_id, path));
        }
        return succeed(task_id, test_paths, ephemeral_path);
    }

    if (reverseCheck(repo_root, patch_arg)) {
        m_events.log(task_id, EventLevel::INFO,
                     "Patch is already applied (reverse check succeeded); treating as applied.");
        return succeed(task_id, test_paths, ephemeral_path);
    }

    if (looksAlreadyApplied(repo_root, test_paths, normalized.normalized)) {
        m_events.log(task_id, EventLevel::INFO,
                     "Patch did not apply, but all of its identifiers are already present; treating as applied.");
        return succeed(task_id, test_paths, ephemeral_path);
    }

    outcome.reason = ApplyReason::APPLY_FAILED;
    outcome.test_paths = test_paths;
    persisted_path = m_store.promoteEphemeralPatch(task_id, ephemeral_path, normalized.normalized);
    ephemeral_path.clear();
    outcome.persisted_patch_path = persisted_path;
    outcome.persisted_instruction_path = m_store.writeRecoveryInstructions(
        task_id, attempt.output, outcome.persisted_patch_path, test_paths);

    m_events.log(task_id, EventLevel::WARN, "git apply failed:\n" + attempt.output);
    m_notifier.warning("Patch could not be applied automatically; manual merge required. Patch: " +
                       outcome.persisted_patch_path + ", instructions: " + outcome.persisted_instruction_path);
    return outcome;
}

ApplyAttemptResult PatchApplier::tryApplyWithFallback(const std::string& repo_root,
                                                      const std::string& patch_path) const {
    const std::vector<ApplyStep> strategies = {
        {"apply", {}},
        {"apply --ignore-whitespace", {"--ignore-whitespace"}}
    };

    ApplyAttemptResult result;
    std::vector<std::string> sections;

    for (const auto& strategy : strategies) {
        std::vector<std::string> check_args = {"apply", "--check"};
        check_args.insert(check_args.end(), strategy.flags.begin(), strategy.flags.end());
        check_args.push_back("--whitespace=nowarn");
        check_args.push_back(patch_path);

        std::string check_label = "apply --check";
        for (const auto& flag : strategy.flags) {
            check_label += " " + flag;
        }

        ProcessResult check = m_runner.run(repo_root, check_args);
        if (!check.ok) {
            sections.push_back("[NG] " + check_label + "\n" + check.output);
            continue;
        }
        sections.push_back("[OK] " + check_label);

        std::vector<std::string> apply_args = {"apply"};
        apply_args.insert(apply_args.end(), strategy.flags.begin(), strategy.flags.end());
        apply_args.push_back("--whitespace=nowarn");
        apply_args.push_back(patch_path);

        ProcessResult applied = m_runner.run(repo_root, apply_args);
        if (applied.ok) {
            sections.push_back("[OK] " + strategy.label);
            result.ok = true;
            result.output = join(sections, "\n\n");
            return result;
        }
        sections.push_back("[NG] " + strategy.label + "\n" + applied.output);
    }

    result.output = join(sections, "\n\n");
    return result;
}

bool PatchApplier::reverseCheck(const std::string& repo_root, const std::string& patch_path) const {
    ProcessResult result = m_runner.run(
        repo_root, {"apply", "--reverse", "--check", "--ignore-whitespace", "--whitespace=nowarn", patch_path});
    return result.ok;
}

std::vector<std::string> PatchApplier::collectIdentifiers(const std::string& patch_text) const {
    std::set<std::string> found;
    if (!m_leniency_enabled) {
        return std::vector<std::string>();
    }

    for (const auto& line : splitLines(patch_text)) {
        if (!startsWith(line, "+") || startsWith(line, "+++ ")) {
            continue;
        }
        auto begin = std::sregex_iterator(line.begin() + 1, line.end(), m_identifier_regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            if (!it->str().empty()) {
                found.insert(it->str());
            }
        }
    }

    return std::vector<std::string>(found.begin(), found.end());
}

bool PatchApplier::looksAlreadyApplied(const std::string& repo_root,
                                       const std::vector<std::string>& test_paths,
                                       const std::string& patch_text) const {
    std::vector<std::string> identifiers = collectIdentifiers(patch_text);
    if (identifiers.empty()) {
        return false;
    }

    std::string all_text;
    for (const auto& relative : test_paths) {
        std::string contents;
        if (!readWholeFile(fs::path(repo_root) / relative, contents)) {
            TESTGATE_LOG_DEBUG("PatchApplier", "Cannot read " + relative + "; identifier check inconclusive");
            return false;
        }
        all_text += "\n" + contents;
    }

    for (const auto& id : identifiers) {
        if (all_text.find(id) == std::string::npos) {
            return false;
        }
    }
    return true;
}

ApplyOutcome PatchApplier::succeed(const std::string& task_id,
                                   const std::vector<std::string>& test_paths,
                                   const std::string& ephemeral_path) {
    if (!m_store.discardEphemeralPatch(ephemeral_path)) {
        m_events.log(task_id, EventLevel::WARN, "Could not delete temporary patch " + ephemeral_path);
    }

    ApplyOutcome outcome;
    outcome.applied = true;
    outcome.test_paths = test_paths;
    outcome.reason = ApplyReason::APPLIED;
    return outcome;
}

} // namespace Testgate
