// =================================================================
// tests/PatchApplierTest.cpp
// =================================================================
// Unit tests for the patch application pipeline, driven by a scripted
// version-control runner.

#include "Testgate/ArtifactStore.hpp"
#include "Testgate/EventLog.hpp"
#include "Testgate/Notifier.hpp"
#include "Testgate/PatchApplier.hpp"
#include "Testgate/ProcessRunner.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

using Handler = std::function<Testgate::ProcessResult(const std::vector<std::string>&)>;

class ScriptedProcessRunner : public Testgate::ProcessRunner {
public:
    explicit ScriptedProcessRunner(Handler handler) : m_handler(handler) {}

    Testgate::ProcessResult run(const std::string& cwd, const std::vector<std::string>& args) const override {
        (void)cwd;
        m_calls.push_back(args);
        return m_handler(args);
    }

    const std::vector<std::vector<std::string>>& getCalls() const { return m_calls; }

private:
    Handler m_handler;
    mutable std::vector<std::vector<std::string>> m_calls;
};

class RecordingNotifier : public Testgate::Notifier {
public:
    void warning(const std::string& message) override { warnings.push_back(message); }
    void info(const std::string& message) override { infos.push_back(message); }

    std::vector<std::string> warnings;
    std::vector<std::string> infos;
};

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

Testgate::ProcessResult ok() {
    return Testgate::ProcessResult::success("", "");
}

Testgate::ProcessResult ng(const std::string& why) {
    return Testgate::ProcessResult::failure(why, 1);
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

const std::string kTestPatch =
    "diff --git a/tests/a.test.ts b/tests/a.test.ts\n"
    "index 1111111..2222222 100644\n"
    "--- a/tests/a.test.ts\n"
    "+++ b/tests/a.test.ts\n"
    "@@ -1,2 +1,3 @@\n"
    " describe('a', () => {\n"
    "+  it('TC-A-N-01 works', () => {});\n"
    " });\n";

// Plain ---/+++ section with no diff --git line of its own
const std::string kTraditionalSourceSection =
    "--- a/src/main.ts\t2024-01-01 00:00:00\n"
    "+++ b/src/main.ts\t2024-01-01 00:00:00\n"
    "@@ -1 +1 @@\n"
    "-a\n"
    "+b\n";

const std::string kRenameOutOfSource =
    "diff --git a/src/main.ts b/tests/moved.test.ts\n"
    "similarity index 100%\n"
    "rename from src/main.ts\n"
    "rename to tests/moved.test.ts\n";

} // namespace

class PatchApplierTest {
private:
    fs::path test_dir;
    fs::path storage_dir;
    fs::path repo_dir;

    void resetDirs(const std::string& name) {
        storage_dir = test_dir / name / "store";
        repo_dir = test_dir / name / "repo";
        fs::remove_all(test_dir / name);
        fs::create_directories(repo_dir);
    }

    void writeRepoFile(const std::string& relative, const std::string& content) {
        fs::path path = repo_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

public:
    PatchApplierTest() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = fs::temp_directory_path() / ("testgate_applier_test_" + std::to_string(stamp));
        fs::create_directories(test_dir);
    }

    ~PatchApplierTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testAppliesTestOnlyPatch() {
        std::cout << "Testing test-only patch is applied..." << std::endl;
        resetDirs("applied");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-a", kTestPatch, repo_dir.string());

        assert(outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::APPLIED);
        assert(outcome.test_paths.size() == 1);
        assert(outcome.test_paths[0] == "tests/a.test.ts");
        assert(outcome.persisted_patch_path.empty());
        assert(!fs::exists(store.ephemeralPatchPath("task-a")) && "Ephemeral patch must be removed");
        assert(notifier.warnings.empty());

        const auto& calls = runner.getCalls();
        assert(calls.size() == 2);
        assert(calls[0].size() == 4);
        assert(calls[0][0] == "apply" && calls[0][1] == "--check" && calls[0][2] == "--whitespace=nowarn");
        assert(fs::path(calls[0][3]).is_absolute());
        assert(calls[1][0] == "apply" && calls[1][1] == "--whitespace=nowarn");

        bool saw_file_write = false;
        for (const auto& event : events.getEvents()) {
            if (event.type == Testgate::EventType::FILE_WRITE && event.path == "tests/a.test.ts") {
                saw_file_write = true;
            }
        }
        assert(saw_file_write);

        std::cout << "✓ Applied patch test passed" << std::endl;
    }

    void testRepairsHunkCountsBeforeApplying() {
        std::cout << "Testing hunk counts are repaired before apply..." << std::endl;
        resetDirs("repair");

        std::string seen_patch;
        ScriptedProcessRunner runner([&seen_patch](const std::vector<std::string>& args) {
            if (seen_patch.empty()) {
                seen_patch = readFile(args.back());
            }
            return ok();
        });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        std::string broken = kTestPatch;
        broken.replace(broken.find("@@ -1,2 +1,3 @@"), 15, "@@ -1,999 +1,999 @@");
        auto outcome = applier.apply("task-repair", broken, repo_dir.string());

        assert(outcome.applied);
        assert(seen_patch.find("@@ -1,2 +1,3 @@") != std::string::npos);
        assert(seen_patch.back() == '\n');

        std::cout << "✓ Hunk repair test passed" << std::endl;
    }

    void testRejectsMixedPatch() {
        std::cout << "Testing mixed test/non-test patch is rejected..." << std::endl;
        resetDirs("mixed");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        const std::string patch =
            "diff --git a/.gitignore b/.gitignore\n"
            "--- a/.gitignore\n"
            "+++ b/.gitignore\n"
            "@@ -1 +1,2 @@\n"
            " node_modules\n"
            "+dist\n" + kTestPatch;

        auto outcome = applier.apply("task-mixed", patch, repo_dir.string());

        assert(!outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS);
        assert(runner.getCalls().empty() && "Nothing may be applied");
        assert(!outcome.persisted_patch_path.empty());
        assert(fs::exists(outcome.persisted_patch_path));
        assert(!notifier.warnings.empty());
        assert(notifier.warnings[0].find(".gitignore") != std::string::npos);

        std::string saved = readFile(outcome.persisted_patch_path);
        assert(saved.back() == '\n');
        assert(saved.substr(saved.size() - 2) != "\n\n");

        std::cout << "✓ Mixed patch test passed" << std::endl;
    }

    void testUnparseableHeaderRejectsPatch() {
        std::cout << "Testing unparseable header blocks application..." << std::endl;
        resetDirs("unparseable");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-bad", kTestPatch + "diff --git garbage\n+x\n", repo_dir.string());
        assert(outcome.reason == Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS);
        assert(runner.getCalls().empty());

        std::cout << "✓ Unparseable header test passed" << std::endl;
    }

    void testAlreadyAppliedViaReverseCheck() {
        std::cout << "Testing already-applied patch is detected..." << std::endl;
        resetDirs("reverse");

        ScriptedProcessRunner runner([](const std::vector<std::string>& args) {
            if (hasFlag(args, "--reverse")) {
                return ok();
            }
            return ng("error: patch failed: tests/a.test.ts:1");
        });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-rev", kTestPatch, repo_dir.string());

        assert(outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::APPLIED);
        assert(notifier.warnings.empty() && "Idempotent re-run must not warn");
        assert(!fs::exists(store.ephemeralPatchPath("task-rev")));
        assert(!fs::exists(store.persistedPatchPath("task-rev")));

        const auto& calls = runner.getCalls();
        // Two failed checks, then the reverse check; no apply without --check ran
        assert(calls.size() == 3);
        assert(hasFlag(calls[1], "--ignore-whitespace") && hasFlag(calls[1], "--check"));
        assert(hasFlag(calls[2], "--reverse"));

        std::cout << "✓ Reverse check test passed" << std::endl;
    }

    void testIgnoreWhitespaceFallback() {
        std::cout << "Testing whitespace-tolerant fallback..." << std::endl;
        resetDirs("whitespace");

        ScriptedProcessRunner runner([](const std::vector<std::string>& args) {
            if (hasFlag(args, "--ignore-whitespace")) {
                return ok();
            }
            return ng("whitespace mismatch");
        });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-ws", kTestPatch, repo_dir.string());
        assert(outcome.applied);

        const auto& calls = runner.getCalls();
        assert(calls.size() == 3);
        assert(!hasFlag(calls[2], "--check") && hasFlag(calls[2], "--ignore-whitespace"));

        std::cout << "✓ Whitespace fallback test passed" << std::endl;
    }

    void testApplyFailedPersistsArtifacts() {
        std::cout << "Testing apply failure leaves patch and instructions..." << std::endl;
        resetDirs("failed");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) {
            return ng("error: patch does not apply");
        });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-fail", kTestPatch, repo_dir.string());

        assert(!outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::APPLY_FAILED);
        assert(outcome.test_paths.size() == 1);
        assert(outcome.persisted_patch_path == store.persistedPatchPath("task-fail"));
        assert(outcome.persisted_instruction_path == store.instructionPath("task-fail"));
        assert(fs::exists(outcome.persisted_patch_path));
        assert(!fs::exists(store.ephemeralPatchPath("task-fail")) && "Patch must not remain in both places");

        std::string doc = readFile(outcome.persisted_instruction_path);
        assert(doc.find("[NG] apply --check\nerror: patch does not apply") != std::string::npos);
        assert(doc.find("[NG] apply --check --ignore-whitespace") != std::string::npos);
        assert(doc.find("tests/a.test.ts") != std::string::npos);

        assert(notifier.warnings.size() == 1);
        assert(notifier.warnings[0].find(outcome.persisted_patch_path) != std::string::npos);
        assert(notifier.warnings[0].find(outcome.persisted_instruction_path) != std::string::npos);

        std::cout << "✓ Apply failure test passed" << std::endl;
    }

    void testIdentifierLeniency() {
        std::cout << "Testing identifier leniency..." << std::endl;
        resetDirs("leniency");

        Handler always_fail = [](const std::vector<std::string>&) { return ng("does not apply"); };
        ScriptedProcessRunner runner(always_fail);
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto ids = applier.collectIdentifiers(kTestPatch + "+// TC-B-E-02 and TC-A-N-01\n-// TC-GONE-01\n");
        assert(ids.size() == 2);
        assert(ids[0] == "TC-A-N-01");
        assert(ids[1] == "TC-B-E-02");

        // Target file missing: inconclusive
        auto missing = applier.apply("task-missing", kTestPatch, repo_dir.string());
        assert(missing.reason == Testgate::ApplyReason::APPLY_FAILED);

        writeRepoFile("tests/a.test.ts", "describe('a', () => {\n  it('TC-A-N-01 works', () => { expect(1).toBe(1); });\n});\n");
        auto present = applier.apply("task-present", kTestPatch, repo_dir.string());
        assert(present.applied);
        assert(present.reason == Testgate::ApplyReason::APPLIED);
        assert(!fs::exists(store.ephemeralPatchPath("task-present")));

        Testgate::LeniencySettings disabled;
        disabled.enabled = false;
        Testgate::PatchApplier strict(runner, store, events, notifier,
                                      Testgate::TestPathClassifier::defaultPolicy(), disabled);
        auto strict_outcome = strict.apply("task-strict", kTestPatch, repo_dir.string());
        assert(strict_outcome.reason == Testgate::ApplyReason::APPLY_FAILED);

        std::cout << "✓ Leniency test passed" << std::endl;
    }

    void testEmptyPatchWritesNothing() {
        std::cout << "Testing whitespace-only patch..." << std::endl;
        resetDirs("empty");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-empty", "  \n\t\r\n ", repo_dir.string());

        assert(!outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::EMPTY_PATCH);
        assert(outcome.persisted_patch_path.empty());
        assert(!fs::exists(storage_dir) && "Empty patch must not touch the filesystem");
        assert(runner.getCalls().empty());

        std::cout << "✓ Empty patch test passed" << std::endl;
    }

    void testNoDiffAndNoTestPaths() {
        std::cout << "Testing patches without usable paths..." << std::endl;
        resetDirs("nopaths");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto no_diff = applier.apply("task-nodiff", "I could not produce a patch.\n\n", repo_dir.string());
        assert(no_diff.reason == Testgate::ApplyReason::NO_DIFF_PATHS);
        assert(readFile(no_diff.persisted_patch_path) == "I could not produce a patch.\n");

        const std::string source_only =
            "diff --git a/src/main.ts b/src/main.ts\n"
            "--- a/src/main.ts\n"
            "+++ b/src/main.ts\n"
            "@@ -1 +1 @@\n"
            "-a\n"
            "+b\n";
        auto no_tests = applier.apply("task-notests", source_only, repo_dir.string());
        assert(no_tests.reason == Testgate::ApplyReason::NO_TEST_PATHS);
        assert(no_tests.test_paths.empty());
        assert(fs::exists(no_tests.persisted_patch_path));
        assert(runner.getCalls().empty());

        std::cout << "✓ No usable paths test passed" << std::endl;
    }

    void testExceptionsAreContained() {
        std::cout << "Testing exceptions map to the exception outcome..." << std::endl;
        resetDirs("exception");

        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;

        ScriptedProcessRunner quiet_runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::PatchApplier bad_classifier(quiet_runner, store, events, notifier,
            [](const std::vector<std::string>&) -> std::vector<std::string> {
                throw std::runtime_error("classifier exploded");
            });
        auto early = bad_classifier.apply("task-early", kTestPatch, repo_dir.string());
        assert(!early.applied);
        assert(early.reason == Testgate::ApplyReason::EXCEPTION);
        assert(early.persisted_patch_path.empty());

        ScriptedProcessRunner throwing_runner([](const std::vector<std::string>&) -> Testgate::ProcessResult {
            throw std::runtime_error("runner exploded");
        });
        Testgate::PatchApplier late(throwing_runner, store, events, notifier,
                                    Testgate::TestPathClassifier::defaultPolicy());
        auto outcome = late.apply("task-late", kTestPatch, repo_dir.string());
        assert(outcome.reason == Testgate::ApplyReason::EXCEPTION);
        assert(outcome.persisted_patch_path == store.persistedPatchPath("task-late"));
        assert(fs::exists(outcome.persisted_patch_path));
        assert(!fs::exists(store.ephemeralPatchPath("task-late")));

        std::cout << "✓ Exception containment test passed" << std::endl;
    }

    void testTraditionalSectionIsGated() {
        std::cout << "Testing plain ---/+++ sections are classified..." << std::endl;
        resetDirs("traditional");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto trailing = applier.apply("task-trailing", kTestPatch + kTraditionalSourceSection, repo_dir.string());
        assert(!trailing.applied);
        assert(trailing.reason == Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS);
        assert(runner.getCalls().empty());
        assert(!notifier.warnings.empty());
        assert(notifier.warnings.back().find("src/main.ts") != std::string::npos);

        auto alone = applier.apply("task-alone", kTraditionalSourceSection, repo_dir.string());
        assert(alone.reason == Testgate::ApplyReason::NO_TEST_PATHS);
        assert(runner.getCalls().empty());

        std::cout << "✓ Plain section test passed" << std::endl;
    }

    void testRenameSourceIsGated() {
        std::cout << "Testing rename sources are classified..." << std::endl;
        resetDirs("rename");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) { return ok(); });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto outcome = applier.apply("task-rename", kRenameOutOfSource, repo_dir.string());
        assert(!outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS);
        assert(runner.getCalls().empty() && "A rename out of source code must not reach git");
        assert(notifier.warnings.size() == 1);
        assert(notifier.warnings[0].find("src/main.ts") != std::string::npos);

        // Renames between test files stay test-only
        const std::string test_rename =
            "diff --git a/tests/old.test.ts b/tests/new.test.ts\n"
            "similarity index 100%\n"
            "rename from tests/old.test.ts\n"
            "rename to tests/new.test.ts\n";
        auto inside = applier.apply("task-rename-tests", test_rename, repo_dir.string());
        assert(inside.applied);
        assert(inside.test_paths.size() == 2);

        std::cout << "✓ Rename source test passed" << std::endl;
    }

    void testFailureAfterPromotionKeepsPatch() {
        std::cout << "Testing a failing recovery document keeps the saved patch..." << std::endl;
        resetDirs("late-failure");

        ScriptedProcessRunner runner([](const std::vector<std::string>&) {
            return ng("error: patch does not apply");
        });
        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(runner, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        // A plain file where the instructions directory belongs makes the document write throw
        fs::create_directories(storage_dir);
        {
            std::ofstream blocker(storage_dir / "merge-instructions", std::ios::binary);
            blocker << "not a directory";
        }

        auto outcome = applier.apply("task-late-fail", kTestPatch, repo_dir.string());

        assert(!outcome.applied);
        assert(outcome.reason == Testgate::ApplyReason::EXCEPTION);
        assert(outcome.persisted_patch_path == store.persistedPatchPath("task-late-fail"));
        assert(fs::exists(outcome.persisted_patch_path));
        assert(!fs::exists(store.ephemeralPatchPath("task-late-fail")));
        assert(outcome.persisted_instruction_path.empty());

        assert(notifier.warnings.size() == 1);
        assert(notifier.warnings[0].find(outcome.persisted_patch_path) != std::string::npos);

        std::cout << "✓ Late failure test passed" << std::endl;
    }

    void testWithRealRepository() {
        std::cout << "Testing against a real git repository..." << std::endl;

        Testgate::GitProcessRunner git;
        if (!git.run(test_dir.string(), {"--version"}).ok) {
            std::cout << "  (git not available, skipped)" << std::endl;
            return;
        }

        resetDirs("real");
        assert(git.run(repo_dir.string(), {"init", "-q"}).ok);
        writeRepoFile("tests/a.test.ts", "describe('a', () => {\n});\n");
        writeRepoFile("src/main.ts", "a\n");

        Testgate::ArtifactStore store(storage_dir.string());
        Testgate::MemoryEventSink events;
        RecordingNotifier notifier;
        Testgate::PatchApplier applier(git, store, events, notifier,
                                       Testgate::TestPathClassifier::defaultPolicy());

        auto first = applier.apply("task-real-1", kTestPatch, repo_dir.string());
        assert(first.applied);
        const std::string after_first = readFile(repo_dir / "tests/a.test.ts");
        assert(after_first == "describe('a', () => {\n  it('TC-A-N-01 works', () => {});\n});\n");

        auto second = applier.apply("task-real-2", kTestPatch, repo_dir.string());
        assert(second.applied && "Re-applying must be recognized as already applied");
        assert(readFile(repo_dir / "tests/a.test.ts") == after_first);
        assert(!fs::exists(store.persistedPatchPath("task-real-2")));

        const std::string non_ascii =
            "diff --git \"a/tests/\\343\\201\\202.test.ts\" \"b/tests/\\343\\201\\202.test.ts\"\n"
            "new file mode 100644\n"
            "--- /dev/null\n"
            "+++ \"b/tests/\\343\\201\\202.test.ts\"\n"
            "@@ -0,0 +1 @@\n"
            "+it('TC-J-01', () => {});\n";
        auto created = applier.apply("task-real-3", non_ascii, repo_dir.string());
        assert(created.applied);
        assert(created.test_paths.size() == 1);
        assert(created.test_paths[0] == "tests/\xE3\x81\x82.test.ts");
        assert(readFile(repo_dir / "tests/\xE3\x81\x82.test.ts") == "it('TC-J-01', () => {});\n");

        auto smuggled = applier.apply("task-real-4", kTestPatch + kTraditionalSourceSection, repo_dir.string());
        assert(smuggled.reason == Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS);
        assert(readFile(repo_dir / "src/main.ts") == "a\n");

        auto renamed = applier.apply("task-real-5", kRenameOutOfSource, repo_dir.string());
        assert(renamed.reason == Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS);
        assert(fs::exists(repo_dir / "src/main.ts"));
        assert(!fs::exists(repo_dir / "tests/moved.test.ts"));

        std::cout << "✓ Real repository test passed" << std::endl;
    }

    void testReasonNames() {
        std::cout << "Testing reason names..." << std::endl;

        assert(Testgate::applyReasonName(Testgate::ApplyReason::EMPTY_PATCH) == "empty-patch");
        assert(Testgate::applyReasonName(Testgate::ApplyReason::NO_DIFF_PATHS) == "no-diff-paths");
        assert(Testgate::applyReasonName(Testgate::ApplyReason::NO_TEST_PATHS) == "no-test-paths");
        assert(Testgate::applyReasonName(Testgate::ApplyReason::CONTAINS_NON_TEST_PATHS) == "contains-non-test-paths");
        assert(Testgate::applyReasonName(Testgate::ApplyReason::APPLY_FAILED) == "apply-failed");
        assert(Testgate::applyReasonName(Testgate::ApplyReason::EXCEPTION) == "exception");
        assert(Testgate::applyReasonName(Testgate::ApplyReason::APPLIED) == "applied");

        std::cout << "✓ Reason name test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PatchApplier unit tests..." << std::endl;

        testAppliesTestOnlyPatch();
        testRepairsHunkCountsBeforeApplying();
        testRejectsMixedPatch();
        testUnparseableHeaderRejectsPatch();
        testAlreadyAppliedViaReverseCheck();
        testIgnoreWhitespaceFallback();
        testApplyFailedPersistsArtifacts();
        testIdentifierLeniency();
        testEmptyPatchWritesNothing();
        testNoDiffAndNoTestPaths();
        testExceptionsAreContained();
        testTraditionalSectionIsGated();
        testRenameSourceIsGated();
        testFailureAfterPromotionKeepsPatch();
        testWithRealRepository();
        testReasonNames();

        std::cout << "All PatchApplier tests passed!" << std::endl;
    }
};

int main() {
    try {
        PatchApplierTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
