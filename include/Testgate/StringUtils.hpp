// =================================================================
// include/Testgate/StringUtils.hpp
// =================================================================
// Small string helpers shared across components.

#pragma once

#include <string>
#include <vector>

namespace Testgate {

/**
 * @brief Trim spaces, tabs, CR and LF from both ends
 */
std::string trim(const std::string& s);

/**
 * @brief Join parts with a separator
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Split text on '\n' after converting CRLF to LF
 *
 * A trailing newline yields a final empty element, so joining the result
 * with "\n" restores the LF-normalized input.
 */
std::vector<std::string> splitLines(const std::string& text);

bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);

std::string toLower(const std::string& s);

/**
 * @brief Normalize a relative path: backslashes to '/', leading "./" removed, trimmed
 */
std::string normalizeRelativePath(const std::string& path);

/**
 * @brief Turn a task identifier into a safe single path component
 *
 * Trims the id (empty becomes "task"), replaces every run of characters
 * outside [A-Za-z0-9._-] with '_' and caps the result at 120 bytes.
 */
std::string sanitizeTaskId(const std::string& task_id);

} // namespace Testgate
