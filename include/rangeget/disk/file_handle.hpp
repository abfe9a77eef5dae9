// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace rangeget::disk {

enum class OpenMode : std::uint8_t {
    truncate,   // Start from an empty file
    keep,       // Keep existing bytes (resume)
};

// Owned POSIX file descriptor with positioned I/O. Concurrent write() calls
// on disjoint ranges are safe: there is no shared file cursor.
class FileHandle {
public:
    static std::expected<FileHandle, std::error_code>
    open(std::string_view path, OpenMode mode) noexcept;

    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&&) noexcept;
    FileHandle& operator=(FileHandle&&) noexcept;

    // Write all of `size` bytes at `offset` (retries short writes)
    [[nodiscard]] std::error_code write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::uint64_t offset, void* buffer, std::size_t size) noexcept;

    // Set the file length (pre-size or trim)
    [[nodiscard]] std::error_code resize(std::uint64_t size) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    // fdatasync
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    FileHandle() = default;

    int fd_{-1};
    std::string path_;
};

} // namespace rangeget::disk
