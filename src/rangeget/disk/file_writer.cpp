// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/disk/file_writer.hpp>
#include <rangeget/log.hpp>

namespace rangeget::disk {

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(std::string_view path,
                                 OpenMode mode,
                                 std::optional<std::uint64_t> size) noexcept {
    if (!closed_.load(std::memory_order_acquire)) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    auto file = FileHandle::open(path, mode);
    if (!file) {
        return file.error();
    }

    // Pre-size so every segment's slice exists before the first write
    if (size) {
        if (auto ec = file->resize(*size)) {
            return ec;
        }
    }

    try {
        path_ = path;
        file_ = std::make_unique<FileHandle>(std::move(*file));
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
    closed_.store(false, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    // No mutex - pwrite carries its own offset
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return file_->write(offset, data, size);
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return file_->sync();
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return file_->resize(size);
}

std::expected<std::uint64_t, std::error_code> FileWriter::size() const noexcept {
    if (!file_) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    return file_->size();
}

void FileWriter::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already closed
    }

    if (file_) {
        if (auto ec = file_->sync()) {
            log::logger()->warn("flush of {} on close failed: {}", path_, ec.message());
        }
        file_->close();
        file_.reset();
    }
}

} // namespace rangeget::disk
