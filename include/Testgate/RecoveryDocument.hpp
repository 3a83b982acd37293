// =================================================================
// include/Testgate/RecoveryDocument.hpp
// =================================================================
// Builds the manual-merge instructions written when a patch cannot be
// applied automatically.

#pragma once

#include <string>
#include <vector>

namespace Testgate {

/**
 * @brief Inputs for a recovery document
 */
struct RecoveryContext {
    std::string task_id;
    std::string apply_output;             ///< Raw diagnostics of the failed apply attempts
    std::string patch_path;               ///< Where the patch was persisted
    std::vector<std::string> test_paths;  ///< Files the patch was meant to change
};

class RecoveryDocument {
public:
    /**
     * @brief Plain-text prompt asking a human or an assistant to merge the patch by hand
     */
    static std::string buildPromptText(const RecoveryContext& context);

    /**
     * @brief Markdown document wrapping the prompt in a fenced text block
     */
    static std::string buildMarkdown(const RecoveryContext& context);
};

} // namespace Testgate
