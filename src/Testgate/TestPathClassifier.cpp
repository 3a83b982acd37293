// =================================================================
// src/Testgate/TestPathClassifier.cpp
// =================================================================
// Implementation of the default test path policy.

#include "Testgate/TestPathClassifier.hpp"
#include "Testgate/StringUtils.hpp"
#include <algorithm>
#include <regex>
#include <unordered_set>

namespace Testgate {

namespace {

bool underDirectory(const std::string& lower, const std::string& dir) {
    return startsWith(lower, dir + "/") || lower.find("/" + dir + "/") != std::string::npos;
}

} // namespace

bool TestPathClassifier::isTestLikePath(const std::string& relative_path) {
    static const std::regex pycache_pattern(R"((^|/)__pycache__(/|$))");
    static const std::regex test_file_pattern(R"(\.(test|spec)\.[a-z0-9]+$)");
    static const std::regex test_dir_pattern(R"((^|/)(__tests__|tests?|spec)(/|$))");

    const std::string lower = toLower(normalizeRelativePath(relative_path));

    if (underDirectory(lower, "node_modules") || underDirectory(lower, "docs")) {
        return false;
    }
    // Generated caches inside test directories must not be applied
    if (std::regex_search(lower, pycache_pattern)) {
        return false;
    }
    if (endsWith(lower, ".pyc") || endsWith(lower, ".pyo")) {
        return false;
    }

    size_t slash = lower.rfind('/');
    const std::string base = slash == std::string::npos ? lower : lower.substr(slash + 1);
    if (std::regex_search(base, test_file_pattern)) {
        return true;
    }

    return std::regex_search(lower, test_dir_pattern);
}

std::vector<std::string> TestPathClassifier::filterTestLikePaths(const std::vector<std::string>& paths) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;

    for (const auto& path : paths) {
        std::string normalized = normalizeRelativePath(path);
        if (!seen.insert(normalized).second) {
            continue;
        }
        if (isTestLikePath(normalized)) {
            out.push_back(normalized);
        }
    }

    std::sort(out.begin(), out.end());
    return out;
}

TestPathClassifierFn TestPathClassifier::defaultPolicy() {
    return [](const std::vector<std::string>& paths) {
        return filterTestLikePaths(paths);
    };
}

} // namespace Testgate
