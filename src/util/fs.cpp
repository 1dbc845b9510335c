// SPECTRE - Filesystem Utilities Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/util/fs.h"
#include "spectre/util/logging.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spectre {
namespace util {
namespace fs {

// ============================================================================
// File Content Operations
// ============================================================================

std::optional<std::string> ReadFile(const Path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::optional<std::vector<uint8_t>> ReadFileBytes(const Path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) return std::nullopt;

    auto size = file.tellg();
    if (size < 0) return std::nullopt;
    file.seekg(0);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        return std::nullopt;
    }
    return data;
}

bool WriteFile(const Path& path, const std::string& content) {
    return WriteFile(path, reinterpret_cast<const uint8_t*>(content.data()), content.size());
}

bool WriteFile(const Path& path, const uint8_t* data, size_t size) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;

    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return file.good();
}

bool SecureWriteFile(const Path& path, const std::string& content) {
    // Create with restrictive permissions from the start
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (fd < 0) return false;

    size_t written = 0;
    while (written < content.size()) {
        ssize_t result = write(fd, content.data() + written, content.size() - written);
        if (result < 0) {
            close(fd);
            return false;
        }
        written += static_cast<size_t>(result);
    }

    bool ok = fsync(fd) == 0;
    return close(fd) == 0 && ok;
}

bool AtomicWriteFile(const Path& path, const uint8_t* data, size_t size) {
    Path tmp = path;
    tmp += ".tmp";
    if (!WriteFile(tmp, data, size)) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool EnsureDirectory(const Path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return std::filesystem::is_directory(path, ec);
}

Path TempDirectoryPath() {
    std::error_code ec;
    Path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Path("/tmp");
    }
    return tmp;
}

// ============================================================================
// Temporary Directories
// ============================================================================

TempDirectory::TempDirectory() : TempDirectory(Path(), "spectre_") {}

TempDirectory::TempDirectory(const Path& parent, const std::string& prefix) {
    Path base = parent.empty() ? TempDirectoryPath() : parent;
    std::string pattern = (base / (prefix + "XXXXXX")).string();

    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (mkdtemp(buf.data()) != nullptr) {
        path_ = Path(buf.data());
    } else {
        LOG_WARN(LogCategory::DEFAULT) << "Could not create temporary directory under "
                                       << base.string();
    }
}

TempDirectory::~TempDirectory() {
    Remove();
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Path TempDirectory::Release() {
    Path result = path_;
    path_.clear();
    return result;
}

void TempDirectory::Remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

} // namespace fs
} // namespace util
} // namespace spectre
