// =================================================================
// src/Testgate/ArtifactStore.cpp
// =================================================================
// Implementation for persisting patches and recovery documents.

#include "Testgate/ArtifactStore.hpp"
#include "Testgate/HunkCountNormalizer.hpp"
#include "Testgate/Logger.hpp"
#include "Testgate/RecoveryDocument.hpp"
#include "Testgate/StringUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Testgate {

namespace {

const char* const TMP_DIR = "tmp";
const char* const PATCHES_DIR = "patches";
const char* const INSTRUCTIONS_DIR = "merge-instructions";
const char* const SNAPSHOTS_DIR = "snapshots";

std::chrono::system_clock::time_point toSystemTime(fs::file_time_type file_time) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

bool staysInside(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute()) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace

ArtifactStore::ArtifactStore(const std::string& storage_dir)
    : m_storage_dir(storage_dir.empty() ? ".testgate" : storage_dir) {
}

std::string ArtifactStore::subdirectory(const std::string& name) const {
    return (fs::path(m_storage_dir) / name).string();
}

std::string ArtifactStore::ephemeralPatchPath(const std::string& task_id) const {
    return (fs::path(subdirectory(TMP_DIR)) / (sanitizeTaskId(task_id) + ".patch")).string();
}

std::string ArtifactStore::persistedPatchPath(const std::string& task_id) const {
    return (fs::path(subdirectory(PATCHES_DIR)) / (sanitizeTaskId(task_id) + ".patch")).string();
}

std::string ArtifactStore::instructionPath(const std::string& task_id) const {
    return (fs::path(subdirectory(INSTRUCTIONS_DIR)) / (sanitizeTaskId(task_id) + ".md")).string();
}

std::string ArtifactStore::snapshotDir(const std::string& task_id) const {
    return (fs::path(subdirectory(SNAPSHOTS_DIR)) / sanitizeTaskId(task_id)).string();
}

void ArtifactStore::writeTextFile(const std::string& path, const std::string& text) const {
    fs::path file_path(path);
    if (file_path.has_parent_path()) {
        fs::create_directories(file_path.parent_path());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    out << text;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

std::string ArtifactStore::writeEphemeralPatch(const std::string& task_id, const std::string& text) {
    std::string path = ephemeralPatchPath(task_id);
    writeTextFile(path, text);
    TESTGATE_LOG_DEBUG("ArtifactStore", "Wrote ephemeral patch: " + path);
    return path;
}

bool ArtifactStore::discardEphemeralPatch(const std::string& ephemeral_path) {
    std::error_code ec;
    fs::remove(ephemeral_path, ec);
    if (ec) {
        TESTGATE_LOG_WARNING("ArtifactStore",
                             "Failed to delete ephemeral patch " + ephemeral_path + ": " + ec.message());
        return false;
    }
    return !fs::exists(ephemeral_path, ec);
}

std::string ArtifactStore::persistPatchText(const std::string& task_id, const std::string& text) {
    std::string path = persistedPatchPath(task_id);
    writeTextFile(path, HunkCountNormalizer::canonicalizePatchText(text));
    TESTGATE_LOG_INFO("ArtifactStore", "Persisted patch: " + path);
    return path;
}

std::string ArtifactStore::promoteEphemeralPatch(const std::string& task_id,
                                                 const std::string& ephemeral_path,
                                                 const std::string& fallback_text) {
    std::string destination = persistedPatchPath(task_id);
    fs::create_directories(fs::path(destination).parent_path());

    std::error_code ec;
    fs::rename(ephemeral_path, destination, ec);
    if (!ec) {
        TESTGATE_LOG_INFO("ArtifactStore", "Moved patch to " + destination);
        return destination;
    }
    TESTGATE_LOG_WARNING("ArtifactStore", "Rename failed, falling back to copy: " + ec.message());

    ec.clear();
    fs::copy_file(ephemeral_path, destination, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        discardEphemeralPatch(ephemeral_path);
        TESTGATE_LOG_INFO("ArtifactStore", "Copied patch to " + destination);
        return destination;
    }
    TESTGATE_LOG_WARNING("ArtifactStore", "Copy failed, writing patch text directly: " + ec.message());

    writeTextFile(destination, HunkCountNormalizer::canonicalizePatchText(fallback_text));
    discardEphemeralPatch(ephemeral_path);
    return destination;
}

std::string ArtifactStore::writeRecoveryInstructions(const std::string& task_id,
                                                     const std::string& apply_output,
                                                     const std::string& patch_path,
                                                     const std::vector<std::string>& test_paths) {
    RecoveryContext context;
    context.task_id = task_id;
    context.apply_output = apply_output;
    context.patch_path = patch_path;
    context.test_paths = test_paths;

    std::string path = instructionPath(task_id);
    writeTextFile(path, RecoveryDocument::buildMarkdown(context));
    TESTGATE_LOG_INFO("ArtifactStore", "Wrote merge instructions: " + path);
    return path;
}

std::string ArtifactStore::snapshotTestFiles(const std::string& task_id,
                                             const std::string& source_root,
                                             const std::vector<std::string>& test_paths) {
    std::string dir = snapshotDir(task_id);
    fs::create_directories(dir);

    size_t copied = 0;
    for (const auto& relative : test_paths) {
        fs::path rel(relative);
        if (!staysInside(rel)) {
            TESTGATE_LOG_WARNING("ArtifactStore", "Not snapshotting path outside the tree: " + relative);
            continue;
        }

        fs::path source = fs::path(source_root) / rel;
        std::error_code ec;
        if (!fs::is_regular_file(source, ec)) {
            continue;
        }

        fs::path destination = fs::path(dir) / rel;
        fs::create_directories(destination.parent_path(), ec);
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            TESTGATE_LOG_WARNING("ArtifactStore", "Failed to snapshot " + relative + ": " + ec.message());
            continue;
        }
        copied++;
    }

    TESTGATE_LOG_INFO("ArtifactStore", "Snapshot of " + std::to_string(copied) + " test file(s): " + dir);
    return dir;
}

std::vector<ArtifactInfo> ArtifactStore::listPersistedPatches() const {
    std::vector<ArtifactInfo> patches;
    std::string dir = subdirectory(PATCHES_DIR);

    try {
        if (!fs::exists(dir)) {
            return patches;
        }
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".patch") {
                continue;
            }
            ArtifactInfo info;
            info.task_id = entry.path().stem().string();
            info.path = entry.path().string();
            info.file_size = static_cast<size_t>(entry.file_size());
            info.modified_at = toSystemTime(entry.last_write_time());
            patches.push_back(info);
        }
    } catch (const std::exception& e) {
        TESTGATE_LOG_WARNING("ArtifactStore", std::string("Error listing patches: ") + e.what());
    }

    std::sort(patches.begin(), patches.end(),
              [](const ArtifactInfo& a, const ArtifactInfo& b) { return a.task_id < b.task_id; });
    return patches;
}

size_t ArtifactStore::cleanOldArtifacts(size_t max_age_days) {
    if (max_age_days == 0) {
        return 0;
    }

    auto now = std::chrono::system_clock::now();
    auto max_age = std::chrono::hours(24 * max_age_days);
    size_t removed = 0;

    for (const char* name : {TMP_DIR, PATCHES_DIR, INSTRUCTIONS_DIR}) {
        std::string dir = subdirectory(name);
        try {
            if (!fs::exists(dir)) {
                continue;
            }
            for (const auto& entry : fs::directory_iterator(dir)) {
                if (!entry.is_regular_file()) {
                    continue;
                }
                if ((now - toSystemTime(entry.last_write_time())) > max_age) {
                    fs::remove(entry.path());
                    removed++;
                }
            }
        } catch (const std::exception& e) {
            TESTGATE_LOG_WARNING("ArtifactStore", "Error cleaning " + dir + ": " + e.what());
        }
    }

    std::string snapshots = subdirectory(SNAPSHOTS_DIR);
    try {
        if (fs::exists(snapshots)) {
            for (const auto& entry : fs::directory_iterator(snapshots)) {
                if (entry.is_directory() && (now - toSystemTime(entry.last_write_time())) > max_age) {
                    fs::remove_all(entry.path());
                    removed++;
                }
            }
        }
    } catch (const std::exception& e) {
        TESTGATE_LOG_WARNING("ArtifactStore", "Error cleaning " + snapshots + ": " + e.what());
    }

    if (removed > 0) {
        TESTGATE_LOG_INFO("ArtifactStore", "Removed " + std::to_string(removed) + " old artifacts");
    }
    return removed;
}

} // namespace Testgate
