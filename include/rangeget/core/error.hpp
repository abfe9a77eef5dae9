// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace rangeget::core {

enum class DownloadErrc {
    success = 0,
    // Job-level taxonomy
    probe_failed,
    segment_transfer_failed,
    resume_record_invalid,
    integrity_mismatch,
    state_store_failure,
    range_not_honored,
    // Transfer causes
    network_error,
    timeout,
    connection_lost,
    refused,
    dns_error,
    ssl_error,
    not_found,
    permission_denied,
    server_error,
    client_error,
    too_many_redirects,
    invalid_url,
    invalid_config,
    cancelled,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangeget::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                  return "Success";
            case DownloadErrc::probe_failed:             return "Resource probe failed";
            case DownloadErrc::segment_transfer_failed:  return "Segment transfer failed";
            case DownloadErrc::resume_record_invalid:    return "Resume record does not match the resource";
            case DownloadErrc::integrity_mismatch:       return "Assembled file size does not match the expected total";
            case DownloadErrc::state_store_failure:      return "Resume state could not be read or written";
            case DownloadErrc::range_not_honored:        return "Server ignored the byte range request";
            case DownloadErrc::network_error:            return "Network error";
            case DownloadErrc::timeout:                  return "Operation timed out";
            case DownloadErrc::connection_lost:          return "Connection lost";
            case DownloadErrc::refused:                  return "Connection refused";
            case DownloadErrc::dns_error:                return "DNS resolution failed";
            case DownloadErrc::ssl_error:                return "SSL/TLS error";
            case DownloadErrc::not_found:                return "Resource not found (404)";
            case DownloadErrc::permission_denied:        return "Access denied by server";
            case DownloadErrc::server_error:             return "Server error (5xx)";
            case DownloadErrc::client_error:             return "Request rejected (4xx)";
            case DownloadErrc::too_many_redirects:       return "Too many redirects";
            case DownloadErrc::invalid_url:              return "Invalid URL";
            case DownloadErrc::invalid_config:           return "Invalid configuration";
            case DownloadErrc::cancelled:                return "Download cancelled";
            default:                                     return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Transfer errors worth another attempt from the last durable offset
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != download_errc_category()) return false;
    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::connection_lost:
        case DownloadErrc::refused:
        case DownloadErrc::dns_error:
        case DownloadErrc::ssl_error:
        case DownloadErrc::server_error:
            return true;
        default:
            return false;
    }
}

} // namespace rangeget::core

namespace std {

template<>
struct is_error_code_enum<rangeget::core::DownloadErrc> : true_type {};

} // namespace std
