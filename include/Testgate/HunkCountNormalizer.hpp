// =================================================================
// include/Testgate/HunkCountNormalizer.hpp
// =================================================================
// Repairs hunk headers whose declared line counts disagree with the
// hunk body, a common defect in generated patches.

#pragma once

#include <string>

namespace Testgate {

/**
 * @brief Normalized patch text and whether any header was rewritten
 */
struct NormalizeResult {
    std::string normalized;
    bool changed;

    NormalizeResult() : changed(false) {}
};

/**
 * @brief Recomputes hunk line counts from hunk bodies
 *
 * Context and removal lines make up the old count, context and addition
 * lines the new count. Only numbers that disagree with the body are
 * rewritten; start offsets and section text are kept byte for byte.
 */
class HunkCountNormalizer {
public:
    /**
     * @brief Normalize every hunk header in a patch
     * @param patch_text Patch text (LF or CRLF)
     * @return LF text ending with exactly one newline, plus the changed flag
     */
    NormalizeResult normalize(const std::string& patch_text) const;

    /**
     * @brief Canonical form of patch text
     *
     * Drops leading blank lines and collapses any run of trailing CR/LF
     * characters to a single "\n". An all-whitespace input yields "".
     */
    static std::string canonicalizePatchText(const std::string& text);
};

} // namespace Testgate
