// SPECTRE - Filesystem Utilities
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Small helpers over std::filesystem for artifact caching and the
// scratch directories used while proving.

#ifndef SPECTRE_UTIL_FS_H
#define SPECTRE_UTIL_FS_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace spectre {
namespace util {
namespace fs {

using Path = std::filesystem::path;

// ============================================================================
// File Content Operations
// ============================================================================

/// Read entire file as string (nullopt if it cannot be opened)
std::optional<std::string> ReadFile(const Path& path);

/// Read entire file as bytes (nullopt if it cannot be opened)
std::optional<std::vector<uint8_t>> ReadFileBytes(const Path& path);

/// Write string to file
bool WriteFile(const Path& path, const std::string& content);

/// Write bytes to file
bool WriteFile(const Path& path, const uint8_t* data, size_t size);

/// Write bytes to file with restrictive permissions (0600).
/// Use this for anything holding key material.
bool SecureWriteFile(const Path& path, const std::string& content);

/// Write to "<path>.tmp" and rename over path, so readers never see a
/// partially written file
bool AtomicWriteFile(const Path& path, const uint8_t* data, size_t size);

/// Create directory and parents; true if it exists afterwards
bool EnsureDirectory(const Path& path);

/// Directory for scratch files ($TMPDIR or /tmp)
Path TempDirectoryPath();

// ============================================================================
// Temporary Directories
// ============================================================================

/// RAII private temporary directory (mode 0700, removed on destruction)
class TempDirectory {
public:
    TempDirectory();
    /// Create "<parent>/<prefix>XXXXXX"; an empty parent means TempDirectoryPath()
    TempDirectory(const Path& parent, const std::string& prefix);
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    const Path& GetPath() const { return path_; }

    /// Release ownership (won't be deleted)
    Path Release();

    bool IsValid() const { return !path_.empty(); }

private:
    Path path_;

    void Remove() noexcept;
};

} // namespace fs
} // namespace util
} // namespace spectre

#endif // SPECTRE_UTIL_FS_H
