// =================================================================
// src/Testgate/StringUtils.cpp
// =================================================================

#include "Testgate/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace Testgate {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    lines.push_back(current);
    return lines;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string normalizeRelativePath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    while (startsWith(normalized, "./")) {
        size_t i = 2;
        while (i < normalized.size() && normalized[i] == '/') {
            i++;
        }
        normalized = normalized.substr(i);
    }
    return trim(normalized);
}

std::string sanitizeTaskId(const std::string& task_id) {
    const size_t max_length = 120;
    std::string trimmed = trim(task_id);
    if (trimmed.empty()) {
        return "task";
    }

    std::string out;
    bool in_run = false;
    for (unsigned char c : trimmed) {
        bool allowed = std::isalnum(c) || c == '.' || c == '_' || c == '-';
        if (allowed) {
            out.push_back(static_cast<char>(c));
            in_run = false;
        } else if (!in_run) {
            out.push_back('_');
            in_run = true;
        }
    }

    if (out.size() > max_length) {
        out.resize(max_length);
    }
    // "." and ".." would escape the containing directory
    if (out == "." || out == "..") {
        out = "task";
    }
    return out;
}

} // namespace Testgate
