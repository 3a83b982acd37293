// =================================================================
// src/Testgate/HunkCountNormalizer.cpp
// =================================================================
// Implementation of hunk header count repair.

#include "Testgate/HunkCountNormalizer.hpp"
#include "Testgate/StringUtils.hpp"
#include <regex>
#include <vector>

namespace Testgate {

namespace {

const std::regex kHunkHeaderPattern(R"(^@@\s+-(\d+)(?:,(\d+))?\s+\+(\d+)(?:,(\d+))?\s+@@(.*)$)");

bool isFileHeaderAt(const std::vector<std::string>& lines, size_t index) {
    const std::string& line = lines[index];
    if (startsWith(line, "diff --git ")) {
        return true;
    }
    return startsWith(line, "--- ") && index + 1 < lines.size() && startsWith(lines[index + 1], "+++ ");
}

// Compares a declared count (possibly with leading zeros) to a tally
// without converting the declared digits, which may be arbitrarily long.
bool declaredEquals(const std::string& declared, size_t actual) {
    std::string digits = declared.empty() ? "1" : declared;
    size_t first = digits.find_first_not_of('0');
    digits = first == std::string::npos ? "0" : digits.substr(first);
    return digits == std::to_string(actual);
}

} // namespace

NormalizeResult HunkCountNormalizer::normalize(const std::string& patch_text) const {
    NormalizeResult result;
    std::vector<std::string> lines = splitLines(patch_text);

    for (size_t i = 0; i < lines.size(); i++) {
        std::smatch m;
        if (!std::regex_match(lines[i], m, kHunkHeaderPattern)) {
            continue;
        }

        size_t old_count = 0;
        size_t new_count = 0;
        for (size_t j = i + 1; j < lines.size(); j++) {
            const std::string& body = lines[j];
            if (startsWith(body, "@@ ") || isFileHeaderAt(lines, j)) {
                break;
            }
            if (body.empty() || body[0] == '\\') {
                // "\ No newline at end of file" does not count
                continue;
            }
            if (body[0] == ' ' || body[0] == '-') {
                old_count++;
            }
            if (body[0] == ' ' || body[0] == '+') {
                new_count++;
            }
        }

        std::string rewritten = lines[i];
        // Right to left so earlier match positions stay valid
        if (!declaredEquals(m[4].matched ? m[4].str() : "", new_count)) {
            if (m[4].matched) {
                rewritten.replace(m.position(4), m.length(4), std::to_string(new_count));
            } else {
                rewritten.insert(m.position(3) + m.length(3), "," + std::to_string(new_count));
            }
        }
        if (!declaredEquals(m[2].matched ? m[2].str() : "", old_count)) {
            if (m[2].matched) {
                rewritten.replace(m.position(2), m.length(2), std::to_string(old_count));
            } else {
                rewritten.insert(m.position(1) + m.length(1), "," + std::to_string(old_count));
            }
        }

        if (rewritten != lines[i]) {
            lines[i] = rewritten;
            result.changed = true;
        }
    }

    std::string joined = join(lines, "\n");
    while (!joined.empty() && (joined.back() == '\n' || joined.back() == '\r')) {
        joined.pop_back();
    }
    result.normalized = joined + "\n";
    return result;
}

std::string HunkCountNormalizer::canonicalizePatchText(const std::string& text) {
    if (trim(text).empty()) {
        return "";
    }

    std::string normalized;
    normalized.reserve(text.size() + 1);
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        normalized.push_back(text[i]);
    }

    // Leading blank lines
    size_t begin = 0;
    while (begin < normalized.size()) {
        size_t eol = normalized.find('\n', begin);
        if (eol == std::string::npos) {
            break;
        }
        if (!trim(normalized.substr(begin, eol - begin)).empty()) {
            break;
        }
        begin = eol + 1;
    }
    normalized.erase(0, begin);

    while (!normalized.empty() && (normalized.back() == '\n' || normalized.back() == '\r')) {
        normalized.pop_back();
    }
    return normalized + "\n";
}

} // namespace Testgate
