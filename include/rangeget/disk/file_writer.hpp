// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/disk/file_handle.hpp>
#include <rangeget/disk/error.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace rangeget::disk {

// Output file shared by all segment workers. Each worker writes only its own
// byte range, so writes need no lock; open/close are guarded against races
// with in-flight writes by the owner joining its workers first.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open for writing. A known `size` pre-sizes the file.
    [[nodiscard]] std::error_code open(std::string_view path,
                                       OpenMode mode,
                                       std::optional<std::uint64_t> size) noexcept;

    // Write data at offset (thread-safe for disjoint ranges)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Make every completed write durable
    [[nodiscard]] std::error_code flush() noexcept;

    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::unique_ptr<FileHandle> file_;
    std::string path_;
    std::atomic<bool> closed_{true};  // Guard against double-close
};

} // namespace rangeget::disk
