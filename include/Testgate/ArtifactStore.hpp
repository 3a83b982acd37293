// =================================================================
// include/Testgate/ArtifactStore.hpp
// =================================================================
// Header for the on-disk store of patches and recovery documents.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace Testgate {

/**
 * @brief Information about a single persisted artifact
 */
struct ArtifactInfo {
    std::string task_id;    ///< File stem (sanitized task id)
    std::string path;       ///< Full path of the artifact
    size_t file_size;
    std::chrono::system_clock::time_point modified_at;

    ArtifactInfo() : file_size(0) {}
};

/**
 * @brief Owns the storage directory layout
 *
 * Layout under the storage directory:
 *   tmp/<taskId>.patch                 ephemeral patch used for apply attempts
 *   patches/<taskId>.patch             persisted patch
 *   merge-instructions/<taskId>.md     recovery document
 *   snapshots/<taskId>/<path>          full copies of generated test files
 *
 * Task ids are sanitized before they become file names. Write operations
 * throw std::runtime_error (or std::filesystem::filesystem_error) on I/O
 * failure; the pipeline catches them at its boundary.
 */
class ArtifactStore {
public:
    /**
     * @brief Construct a new ArtifactStore
     * @param storage_dir Root directory for artifacts (default: .testgate)
     */
    explicit ArtifactStore(const std::string& storage_dir = ".testgate");

    const std::string& getStorageDir() const { return m_storage_dir; }

    std::string ephemeralPatchPath(const std::string& task_id) const;
    std::string persistedPatchPath(const std::string& task_id) const;
    std::string instructionPath(const std::string& task_id) const;
    std::string snapshotDir(const std::string& task_id) const;

    /**
     * @brief Write the patch text to tmp/<taskId>.patch
     * @return Path of the written file
     */
    std::string writeEphemeralPatch(const std::string& task_id, const std::string& text);

    /**
     * @brief Delete an ephemeral patch; failures are logged, not raised
     * @return True if the file is gone afterwards
     */
    bool discardEphemeralPatch(const std::string& ephemeral_path);

    /**
     * @brief Write patch text straight to patches/<taskId>.patch
     *
     * The text is canonicalized so the file ends with exactly one newline.
     * @return Path of the persisted patch
     */
    std::string persistPatchText(const std::string& task_id, const std::string& text);

    /**
     * @brief Move an ephemeral patch to its permanent location
     *
     * Tries a rename first, then copy followed by deletion of the source,
     * and finally writes fallback_text. The patch never remains in both
     * places when one of the first two strategies succeeds.
     * @return Path of the persisted patch
     */
    std::string promoteEphemeralPatch(const std::string& task_id,
                                      const std::string& ephemeral_path,
                                      const std::string& fallback_text);

    /**
     * @brief Write merge-instructions/<taskId>.md
     * @return Path of the written document
     */
    std::string writeRecoveryInstructions(const std::string& task_id,
                                          const std::string& apply_output,
                                          const std::string& patch_path,
                                          const std::vector<std::string>& test_paths);

    /**
     * @brief Copy the current content of test files to snapshots/<taskId>/
     *
     * Missing files and non-regular files are skipped, as are paths that
     * would leave the source tree.
     * @param source_root Tree the relative paths are resolved against
     * @return Snapshot directory (created even when nothing was copied)
     */
    std::string snapshotTestFiles(const std::string& task_id,
                                  const std::string& source_root,
                                  const std::vector<std::string>& test_paths);

    /**
     * @brief All persisted patches, sorted by task id
     */
    std::vector<ArtifactInfo> listPersistedPatches() const;

    /**
     * @brief Delete artifacts older than the given age
     * @param max_age_days Maximum age in days (0 = keep everything)
     * @return Number of files and snapshot directories removed
     */
    size_t cleanOldArtifacts(size_t max_age_days = 7);

private:
    std::string m_storage_dir;

    std::string subdirectory(const std::string& name) const;

    /**
     * @brief Write text in binary mode, creating parent directories
     */
    void writeTextFile(const std::string& path, const std::string& text) const;
};

} // namespace Testgate
