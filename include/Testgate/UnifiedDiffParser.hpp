// =================================================================
// include/Testgate/UnifiedDiffParser.hpp
// =================================================================
// Extracts the list of changed files from `git diff` style unified
// diff text, including git's quoted/escaped path syntax.

#pragma once

#include <string>
#include <vector>

namespace Testgate {

/**
 * @brief Kind of change recorded for a file in a diff
 */
enum class ChangeType {
    ADDED,
    MODIFIED,
    DELETED,
    RENAMED
};

/**
 * @brief One changed file extracted from a diff
 */
struct ChangedFile {
    std::string path;          ///< Post-image path, or pre-image path for deletions
    ChangeType change_type;
    std::string old_path;      ///< Pre-image path when it differs from `path` (renames, mismatched headers)

    ChangedFile() : change_type(ChangeType::MODIFIED) {}
    ChangedFile(const std::string& p, ChangeType type, const std::string& old = "")
        : path(p), change_type(type), old_path(old) {}
};

/**
 * @brief Result of analyzing one diff text
 */
struct DiffAnalysis {
    std::vector<ChangedFile> files;   ///< First-seen order; a path repeats only with a different old_path
    size_t skipped_headers;           ///< File headers whose paths could not be parsed

    DiffAnalysis() : skipped_headers(0) {}
};

/**
 * @brief The two paths named on a `diff --git` header line
 */
struct HeaderPaths {
    std::string a_path;   ///< Pre-image path without the "a/" prefix
    std::string b_path;   ///< Post-image path without the "b/" prefix
};

/**
 * @brief Line-oriented parser for git unified diffs
 *
 * Each `diff --git` header opens a new file record; `new file mode`,
 * `deleted file mode` and `rename from`/`rename to` lines refine it.
 * Every `---`/`+++` line pair also yields a record, inside a git block or
 * not, since `git apply` accepts traditional file sections on their own.
 * Records are deduplicated by final path, preferring rename records.
 */
class UnifiedDiffParser {
public:
    /**
     * @brief Analyze a diff and return its changed files
     * @param diff_text Raw diff text (LF or CRLF line endings)
     */
    DiffAnalysis analyze(const std::string& diff_text) const;

    /**
     * @brief Every path the records touch, in order and without duplicates
     *
     * Includes the pre-image path of renames, so a rename out of a
     * directory is seen on both sides.
     */
    static std::vector<std::string> extractChangedPaths(const DiffAnalysis& analysis);

    /**
     * @brief Parse the text following "diff --git "
     * @param rest Header remainder, e.g. `a/x.ts b/x.ts` or `"a/\343\201\202" "b/\343\201\202"`
     * @param out Receives the paths on success
     * @return False when the header does not name an a/ and a b/ path
     */
    static bool parseHeaderPaths(const std::string& rest, HeaderPaths& out);

    /**
     * @brief Split a header remainder into tokens, decoding quoted ones
     */
    static std::vector<std::string> splitHeaderTokens(const std::string& rest);

    /**
     * @brief Decode a git C-style quoted string
     * @param input Text containing the quoted string
     * @param pos Index of the opening quote; advanced past the closing quote
     * @return Decoded path as UTF-8
     */
    static std::string decodeQuotedToken(const std::string& input, size_t& pos);

    /**
     * @brief Replace ill-formed UTF-8 sequences with U+FFFD
     */
    static std::string sanitizeUtf8(const std::string& bytes);

    static std::string changeTypeName(ChangeType type);
};

} // namespace Testgate
