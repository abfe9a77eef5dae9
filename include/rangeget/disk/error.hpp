// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cerrno>
#include <string>
#include <system_error>

namespace rangeget::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    sync_error,
    truncate_error,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangeget::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::disk_full:       return "Disk full";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::sync_error:      return "Flush to disk failed";
            case DiskErrc::truncate_error:  return "Resize failed";
            case DiskErrc::handle_invalid:  return "Invalid handle";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// errno -> DiskErrc, `fallback` for anything not listed
[[nodiscard]] inline std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

} // namespace rangeget::disk

namespace std {

template<>
struct is_error_code_enum<rangeget::disk::DiskErrc> : true_type {};

} // namespace std
