// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/disk/file_handle.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace rangeget::disk {

//=============================================================================
// FileHandle
//=============================================================================

std::expected<FileHandle, std::error_code>
FileHandle::open(std::string_view path, OpenMode mode) noexcept {
    FileHandle file;
    try {
        file.path_ = path;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (mode == OpenMode::truncate) {
        flags |= O_TRUNC;
    }

    file.fd_ = ::open(file.path_.c_str(), flags, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(from_errno(errno, DiskErrc::write_error));
    }
    return file;
}

FileHandle::~FileHandle() {
    close();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileHandle::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);

    const auto* cursor = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t written = ::pwrite(fd_, cursor, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        if (written == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        cursor += written;
        offset += static_cast<std::uint64_t>(written);
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

std::expected<std::size_t, std::error_code>
FileHandle::read(std::uint64_t offset, void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) return std::unexpected(make_error_code(DiskErrc::handle_invalid));

    ssize_t got;
    do {
        got = ::pread(fd_, buffer, size, static_cast<off_t>(offset));
    } while (got < 0 && errno == EINTR);

    if (got < 0) {
        return std::unexpected(from_errno(errno, DiskErrc::read_error));
    }
    return static_cast<std::size_t>(got);
}

std::error_code FileHandle::resize(std::uint64_t size) noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return from_errno(errno, DiskErrc::truncate_error);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code> FileHandle::size() const noexcept {
    if (fd_ < 0) return std::unexpected(make_error_code(DiskErrc::handle_invalid));

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(from_errno(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code FileHandle::sync() noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno, DiskErrc::sync_error);
    }
    return {};
}

void FileHandle::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace rangeget::disk
