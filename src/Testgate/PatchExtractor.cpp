// =================================================================
// src/Testgate/PatchExtractor.cpp
// =================================================================

#include "Testgate/PatchExtractor.hpp"
#include "Testgate/StringUtils.hpp"
#include <cstring>

namespace Testgate {

const char* const PatchExtractor::BEGIN_MARKER = "<!-- BEGIN TESTGATE PATCH -->";
const char* const PatchExtractor::END_MARKER = "<!-- END TESTGATE PATCH -->";

ExtractedPatch PatchExtractor::extractFromLogs(const std::string& raw_logs) {
    ExtractedPatch result;

    size_t start = raw_logs.find(BEGIN_MARKER);
    if (start == std::string::npos) {
        return result;
    }
    size_t after_start = start + std::strlen(BEGIN_MARKER);
    size_t end = raw_logs.find(END_MARKER, after_start);
    if (end == std::string::npos) {
        return result;
    }

    result.found = true;
    result.patch_text = trim(raw_logs.substr(after_start, end - after_start));
    return result;
}

} // namespace Testgate
