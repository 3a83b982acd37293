// =================================================================
// src/Testgate/UnifiedDiffParser.cpp
// =================================================================
// Implementation of the unified diff parser.

#include "Testgate/UnifiedDiffParser.hpp"
#include "Testgate/StringUtils.hpp"
#include <algorithm>
#include <unordered_map>

namespace Testgate {

namespace {

const std::string kDiffGitPrefix = "diff --git ";
const std::string kNewFilePrefix = "new file mode ";
const std::string kDeletedFilePrefix = "deleted file mode ";
const std::string kRenameFromPrefix = "rename from ";
const std::string kRenameToPrefix = "rename to ";
const std::string kOldMarkerPrefix = "--- ";
const std::string kNewMarkerPrefix = "+++ ";
const std::string kDevNull = "/dev/null";

const std::string kReplacementChar = "\xEF\xBF\xBD";

bool isOctalDigit(char c) {
    return c >= '0' && c <= '7';
}

// Paths in marker lines use the same quoting as the header.
std::string decodeMarkerPath(const std::string& raw) {
    std::string value = trim(raw);
    if (!value.empty() && value[0] == '"') {
        size_t pos = 0;
        return UnifiedDiffParser::decodeQuotedToken(value, pos);
    }
    return value;
}

// Name on a "--- "/"+++ " line with its leading component removed, the
// way `git apply` strips it by default. /dev/null yields is_null.
bool parseMarkerName(const std::string& raw, std::string& out, bool& is_null) {
    std::string value = raw;
    size_t tab = value.find('\t');
    if (tab != std::string::npos) {
        value.erase(tab);
    }
    value = decodeMarkerPath(value);
    if (value.empty()) {
        return false;
    }

    is_null = value == kDevNull;
    if (is_null) {
        out.clear();
        return true;
    }

    size_t slash = value.find('/');
    if (slash != std::string::npos && slash + 1 < value.size()) {
        value = value.substr(slash + 1);
    }
    out = value;
    return true;
}

struct FileRecord {
    std::string a_path;
    std::string b_path;
    ChangeType change_type = ChangeType::MODIFIED;
    std::string old_path;
};

} // namespace

std::string UnifiedDiffParser::decodeQuotedToken(const std::string& input, size_t& pos) {
    std::string bytes;
    if (pos >= input.size() || input[pos] != '"') {
        return bytes;
    }
    pos++;

    while (pos < input.size()) {
        char ch = input[pos];
        if (ch == '"') {
            pos++;
            break;
        }
        if (ch == '\\' && pos + 1 < input.size()) {
            char next = input[pos + 1];
            if (isOctalDigit(next)) {
                int value = 0;
                size_t digits = 0;
                size_t i = pos + 1;
                while (i < input.size() && digits < 3 && isOctalDigit(input[i])) {
                    value = value * 8 + (input[i] - '0');
                    i++;
                    digits++;
                }
                bytes.push_back(static_cast<char>(value & 0xFF));
                pos = i;
                continue;
            }
            switch (next) {
                case 'n': bytes.push_back('\n'); break;
                case 't': bytes.push_back('\t'); break;
                case 'r': bytes.push_back('\r'); break;
                case 'b': bytes.push_back('\b'); break;
                case 'f': bytes.push_back('\f'); break;
                case 'v': bytes.push_back('\v'); break;
                case '\\': bytes.push_back('\\'); break;
                case '"': bytes.push_back('"'); break;
                default: bytes.push_back(next); break;
            }
            pos += 2;
            continue;
        }
        bytes.push_back(ch);
        pos++;
    }

    return sanitizeUtf8(bytes);
}

std::string UnifiedDiffParser::sanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t needed = 0;
    size_t seen = 0;
    size_t start = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;

    for (size_t i = 0; i < bytes.size(); i++) {
        unsigned char b = static_cast<unsigned char>(bytes[i]);
        if (needed == 0) {
            if (b <= 0x7F) {
                out.push_back(static_cast<char>(b));
            } else if (b >= 0xC2 && b <= 0xDF) {
                needed = 1;
                start = i;
            } else if (b >= 0xE0 && b <= 0xEF) {
                if (b == 0xE0) lower = 0xA0;
                if (b == 0xED) upper = 0x9F;
                needed = 2;
                start = i;
            } else if (b >= 0xF0 && b <= 0xF4) {
                if (b == 0xF0) lower = 0x90;
                if (b == 0xF4) upper = 0x8F;
                needed = 3;
                start = i;
            } else {
                out += kReplacementChar;
            }
            continue;
        }

        if (b < lower || b > upper) {
            // The truncated sequence becomes one replacement; the byte is re-examined.
            needed = 0;
            seen = 0;
            lower = 0x80;
            upper = 0xBF;
            out += kReplacementChar;
            i--;
            continue;
        }

        lower = 0x80;
        upper = 0xBF;
        seen++;
        if (seen == needed) {
            out.append(bytes, start, i - start + 1);
            needed = 0;
            seen = 0;
        }
    }

    if (needed != 0) {
        out += kReplacementChar;
    }
    return out;
}

std::vector<std::string> UnifiedDiffParser::splitHeaderTokens(const std::string& rest) {
    std::vector<std::string> tokens;
    size_t i = 0;

    while (i < rest.size()) {
        while (i < rest.size() && rest[i] == ' ') {
            i++;
        }
        if (i >= rest.size()) {
            break;
        }

        if (rest[i] == '"') {
            tokens.push_back(decodeQuotedToken(rest, i));
            continue;
        }

        size_t begin = i;
        while (i < rest.size() && rest[i] != ' ') {
            i++;
        }
        tokens.push_back(rest.substr(begin, i - begin));
    }

    return tokens;
}

bool UnifiedDiffParser::parseHeaderPaths(const std::string& rest, HeaderPaths& out) {
    std::vector<std::string> tokens = splitHeaderTokens(rest);
    if (tokens.size() >= 2 && startsWith(tokens[0], "a/") && startsWith(tokens[1], "b/")) {
        out.a_path = tokens[0].substr(2);
        out.b_path = tokens[1].substr(2);
        return true;
    }

    // git leaves paths with spaces unquoted; like git itself, accept the
    // split where both halves name the same file.
    std::string unquoted = rest;
    while (!unquoted.empty() && unquoted.back() == ' ') {
        unquoted.pop_back();
    }
    if (unquoted.empty() || unquoted[0] == '"' || !startsWith(unquoted, "a/")) {
        return false;
    }
    for (size_t space = unquoted.find(' '); space != std::string::npos; space = unquoted.find(' ', space + 1)) {
        std::string left = unquoted.substr(0, space);
        std::string right = unquoted.substr(space + 1);
        if (startsWith(right, "b/") && left.substr(2) == right.substr(2) && left.size() > 2) {
            out.a_path = left.substr(2);
            out.b_path = right.substr(2);
            return true;
        }
    }
    return false;
}

DiffAnalysis UnifiedDiffParser::analyze(const std::string& diff_text) const {
    DiffAnalysis analysis;
    std::vector<ChangedFile> records;

    bool in_file = false;
    FileRecord current;

    auto flush = [&]() {
        if (!in_file) {
            return;
        }
        const std::string& path = current.change_type == ChangeType::DELETED ? current.a_path : current.b_path;
        std::string old_path = current.old_path;
        if (old_path.empty() && current.change_type != ChangeType::DELETED && current.a_path != current.b_path) {
            old_path = current.a_path;
        }
        records.emplace_back(path, current.change_type, old_path);
        in_file = false;
    };

    const std::vector<std::string> lines = splitLines(diff_text);
    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];

        // git applies a "--- "/"+++ " pair as a file section even without a
        // `diff --git` line, so every such pair names a file the patch touches.
        if (startsWith(line, kOldMarkerPrefix) && i + 1 < lines.size() &&
            startsWith(lines[i + 1], kNewMarkerPrefix)) {
            std::string old_name;
            std::string new_name;
            bool old_null = false;
            bool new_null = false;
            if (!parseMarkerName(line.substr(kOldMarkerPrefix.size()), old_name, old_null) ||
                !parseMarkerName(lines[i + 1].substr(kNewMarkerPrefix.size()), new_name, new_null) ||
                (old_null && new_null)) {
                analysis.skipped_headers++;
            } else if (old_null) {
                records.emplace_back(new_name, ChangeType::ADDED);
            } else if (new_null) {
                records.emplace_back(old_name, ChangeType::DELETED);
            } else {
                records.emplace_back(new_name, ChangeType::MODIFIED, old_name == new_name ? "" : old_name);
            }
            i++;
            continue;
        }

        if (startsWith(line, kDiffGitPrefix)) {
            flush();
            HeaderPaths paths;
            if (!parseHeaderPaths(line.substr(kDiffGitPrefix.size()), paths)) {
                analysis.skipped_headers++;
                continue;
            }
            current = FileRecord{paths.a_path, paths.b_path, ChangeType::MODIFIED, ""};
            in_file = true;
            continue;
        }

        if (!in_file) {
            continue;
        }

        if (startsWith(line, kNewFilePrefix)) {
            current.change_type = ChangeType::ADDED;
        } else if (startsWith(line, kDeletedFilePrefix)) {
            current.change_type = ChangeType::DELETED;
        } else if (startsWith(line, kRenameFromPrefix)) {
            current.change_type = ChangeType::RENAMED;
            current.old_path = decodeMarkerPath(line.substr(kRenameFromPrefix.size()));
        } else if (startsWith(line, kRenameToPrefix)) {
            // The post-image path always comes from the header
            current.change_type = ChangeType::RENAMED;
        }
    }
    flush();

    std::unordered_map<std::string, size_t> index_by_path;
    for (const auto& record : records) {
        auto it = index_by_path.find(record.path);
        if (it == index_by_path.end()) {
            index_by_path[record.path] = analysis.files.size();
            analysis.files.push_back(record);
            continue;
        }
        ChangedFile& existing = analysis.files[it->second];
        if (!record.old_path.empty() && !existing.old_path.empty() && record.old_path != existing.old_path) {
            // Two different pre-images for one path; both stay visible
            analysis.files.push_back(record);
            continue;
        }
        if (existing.change_type != ChangeType::RENAMED && record.change_type == ChangeType::RENAMED) {
            existing = record;
        } else if (existing.old_path.empty()) {
            existing.old_path = record.old_path;
        }
    }

    return analysis;
}

std::vector<std::string> UnifiedDiffParser::extractChangedPaths(const DiffAnalysis& analysis) {
    std::vector<std::string> paths;
    paths.reserve(analysis.files.size());
    auto add = [&paths](const std::string& path) {
        if (!path.empty() && std::find(paths.begin(), paths.end(), path) == paths.end()) {
            paths.push_back(path);
        }
    };
    for (const auto& file : analysis.files) {
        add(file.path);
        add(file.old_path);
    }
    return paths;
}

std::string UnifiedDiffParser::changeTypeName(ChangeType type) {
    switch (type) {
        case ChangeType::ADDED: return "added";
        case ChangeType::MODIFIED: return "modified";
        case ChangeType::DELETED: return "deleted";
        case ChangeType::RENAMED: return "renamed";
    }
    return "modified";
}

} // namespace Testgate
