// KEYSEAL - Filesystem Utilities
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// File reading and owner-only file writing for keystore records and
// password files.

#ifndef KEYSEAL_UTIL_FS_H
#define KEYSEAL_UTIL_FS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace keyseal {
namespace util {
namespace fs {

/// Largest file ReadFile will load by default (4 MB)
constexpr size_t DEFAULT_MAX_READ_SIZE = 4 * 1024 * 1024;

/// Check if a path exists
bool Exists(const std::string& path);

/// Check if a path is a regular file
bool IsFile(const std::string& path);

/// File size in bytes, or nullopt if it cannot be stat'ed
std::optional<uint64_t> FileSize(const std::string& path);

/**
 * Read an entire file.
 * @return Contents, or nullopt if the file cannot be opened, read, or is
 *         larger than maxSize
 */
std::optional<std::string> ReadFile(const std::string& path,
                                    size_t maxSize = DEFAULT_MAX_READ_SIZE);

/**
 * Write a file readable and writable by the owner only (0600 on Unix).
 * The data is flushed to disk before returning.
 *
 * @param overwrite If false, fail when the file already exists
 * @return true on success
 */
bool SecureWriteFile(const std::string& path, const std::string& content,
                     bool overwrite = false);

} // namespace fs
} // namespace util
} // namespace keyseal

#endif // KEYSEAL_UTIL_FS_H
