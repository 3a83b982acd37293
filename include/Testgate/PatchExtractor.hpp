// =================================================================
// include/Testgate/PatchExtractor.hpp
// =================================================================
// Pulls a marker-delimited patch out of raw agent log output.

#pragma once

#include <string>

namespace Testgate {

/**
 * @brief Result of searching agent logs for a patch
 */
struct ExtractedPatch {
    bool found;
    std::string patch_text;   ///< Trimmed text between the markers

    ExtractedPatch() : found(false) {}
};

class PatchExtractor {
public:
    static const char* const BEGIN_MARKER;
    static const char* const END_MARKER;

    /**
     * @brief Find the first BEGIN/END marker pair and return what lies between
     * @param raw_logs Complete agent output
     * @return found=false when either marker is missing
     */
    static ExtractedPatch extractFromLogs(const std::string& raw_logs);
};

} // namespace Testgate
