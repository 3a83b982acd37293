// =================================================================
// src/Testgate/RecoveryDocument.cpp
// =================================================================

#include "Testgate/RecoveryDocument.hpp"
#include "Testgate/StringUtils.hpp"
#include <sstream>

namespace Testgate {

std::string RecoveryDocument::buildPromptText(const RecoveryContext& context) {
    std::string apply_log = trim(context.apply_output);
    if (apply_log.empty()) {
        apply_log = "(none)";
    }

    std::ostringstream oss;
    oss << "Merge the generated test changes into the current working tree by hand.\n";
    oss << "Automatic application (git apply) failed, so conflicts must be resolved manually.\n";
    oss << "\n";
    oss << "## Background\n";
    oss << "- Task: " << context.task_id << "\n";
    oss << "\n";
    oss << "## Failure log (git apply)\n";
    oss << apply_log << "\n";
    oss << "\n";
    oss << "## Inputs\n";
    oss << "- Patch file: " << context.patch_path << "\n";
    oss << "- Target files (test code only):\n";
    if (context.test_paths.empty()) {
        oss << "- (none)\n";
    } else {
        for (const auto& path : context.test_paths) {
            oss << "- " << path << "\n";
        }
    }
    oss << "\n";
    oss << "## Constraints\n";
    oss << "- Only test code may change (e.g. **/*.test.ts, **/tests/**, **/__tests__/**)\n";
    oss << "- Do not create or edit docs/** or *.md files\n";
    oss << "- Do not edit production code\n";
    oss << "- Do not edit configuration files (package.json, tsconfig, CMakeLists.txt, ...)\n";
    oss << "\n";
    oss << "## Expected steps\n";
    oss << "1. Read the patch to understand the intended change\n";
    oss << "2. Compare it with the current files and resolve conflicts in the tests\n";
    oss << "3. Run the type checker or linter and fix errors in test code only (at most 3 rounds)\n";
    oss << "4. Report a short summary of which tests were added or updated";
    return oss.str();
}

std::string RecoveryDocument::buildMarkdown(const RecoveryContext& context) {
    std::ostringstream oss;
    oss << "# Manual merge required\n";
    oss << "\n";
    oss << "The patch for task `" << context.task_id << "` could not be applied automatically.\n";
    oss << "Paste the prompt below into an assistant, or follow it yourself.\n";
    oss << "\n";
    oss << "```text\n";
    oss << buildPromptText(context) << "\n";
    oss << "```\n";
    return oss.str();
}

} // namespace Testgate
