// =================================================================
// include/Testgate/TestPathClassifier.hpp
// =================================================================
// Default policy deciding which repository paths hold test code.

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace Testgate {

/**
 * @brief Pluggable policy: returns the test-like subset of the given paths
 */
using TestPathClassifierFn = std::function<std::vector<std::string>(const std::vector<std::string>&)>;

/**
 * @brief Filename and directory-convention heuristics for test paths
 *
 * Matches `*.test.<ext>`, `*.spec.<ext>` and anything under a `test`,
 * `tests`, `spec` or `__tests__` directory. Dependency trees, docs and
 * Python bytecode caches are never test-like.
 */
class TestPathClassifier {
public:
    /**
     * @brief Whether a single relative path looks like test code
     */
    static bool isTestLikePath(const std::string& relative_path);

    /**
     * @brief Normalized, deduplicated and sorted test-like subset
     */
    static std::vector<std::string> filterTestLikePaths(const std::vector<std::string>& paths);

    /**
     * @brief The default policy as a TestPathClassifierFn
     */
    static TestPathClassifierFn defaultPolicy();
};

} // namespace Testgate
