// KEYSEAL - Filesystem Utilities Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/util/fs.h"

#include <cerrno>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace keyseal {
namespace util {
namespace fs {

// ============================================================================
// File Status
// ============================================================================

bool Exists(const std::string& path) {
#ifdef _WIN32
    return GetFileAttributesA(path.c_str()) != INVALID_FILE_ATTRIBUTES;
#else
    struct stat st;
    return stat(path.c_str(), &st) == 0;
#endif
}

bool IsFile(const std::string& path) {
#ifdef _WIN32
    DWORD attrs = GetFileAttributesA(path.c_str());
    return attrs != INVALID_FILE_ATTRIBUTES && !(attrs & FILE_ATTRIBUTE_DIRECTORY);
#else
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
#endif
}

std::optional<uint64_t> FileSize(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }
    auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

// ============================================================================
// File Operations
// ============================================================================

std::optional<std::string> ReadFile(const std::string& path, size_t maxSize) {
    if (!IsFile(path)) {
        return std::nullopt;
    }

    auto size = FileSize(path);
    if (!size || *size > maxSize) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

bool SecureWriteFile(const std::string& path, const std::string& content, bool overwrite) {
#ifdef _WIN32
    if (!overwrite && Exists(path)) {
        return false;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    return !file.fail();
#else
    // Create with restrictive permissions from the start
    int flags = O_WRONLY | O_CREAT | (overwrite ? O_TRUNC : O_EXCL);
    int fd = open(path.c_str(), flags, S_IRUSR | S_IWUSR);
    if (fd < 0) return false;

    size_t written = 0;
    while (written < content.size()) {
        ssize_t result = write(fd, content.data() + written, content.size() - written);
        if (result < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return false;
        }
        written += static_cast<size_t>(result);
    }

    bool ok = fsync(fd) == 0;
    ok = (close(fd) == 0) && ok;
    return ok;
#endif
}

} // namespace fs
} // namespace util
} // namespace keyseal
