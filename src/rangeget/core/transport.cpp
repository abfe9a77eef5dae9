// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/transport.hpp>
#include <charconv>

namespace rangeget::core {

namespace {

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Parse "attachment; filename=file.zip"
std::string parse_content_disposition(std::string_view value) {
    auto pos = value.find("filename=");
    if (pos == std::string_view::npos) return {};

    auto filename = value.substr(pos + 9);
    auto semicolon = filename.find(';');
    if (semicolon != std::string_view::npos) filename = filename.substr(0, semicolon);
    if (!filename.empty() && (filename.front() == '"' || filename.front() == '\'')) {
        filename.remove_prefix(1);
        if (!filename.empty() && (filename.back() == '"' || filename.back() == '\'')) {
            filename.remove_suffix(1);
        }
    }
    return std::string(filename);
}

} // namespace

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    constexpr std::string_view unit = "bytes ";
    if (value.substr(0, unit.size()) != unit) return std::nullopt;
    value.remove_prefix(unit.size());

    auto slash = value.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    ContentRange range;
    auto span = value.substr(0, slash);
    auto complete = value.substr(slash + 1);

    if (complete != "*") {
        range.complete_length = parse_u64(complete);
        if (!range.complete_length) return std::nullopt;
    }

    if (span != "*") {
        auto dash = span.find('-');
        if (dash == std::string_view::npos) return std::nullopt;
        range.first = parse_u64(span.substr(0, dash));
        range.last = parse_u64(span.substr(dash + 1));
        if (!range.first || !range.last || *range.last < *range.first) return std::nullopt;
    }

    return range;
}

void decode_headers(HttpResponse& response) {
    const auto& headers = response.headers;

    if (auto it = headers.find("content-length"); it != headers.end()) {
        response.content_length = parse_u64(it->second);
    }
    if (auto it = headers.find("content-range"); it != headers.end()) {
        response.content_range = parse_content_range(it->second);
    }
    if (auto it = headers.find("accept-ranges"); it != headers.end()) {
        response.accepts_ranges = it->second.find("bytes") != std::string::npos;
    }
    if (auto it = headers.find("etag"); it != headers.end()) {
        response.etag = it->second;
    }
    if (auto it = headers.find("content-type"); it != headers.end()) {
        response.content_type = it->second;
    }
    if (auto it = headers.find("content-disposition"); it != headers.end()) {
        response.filename = parse_content_disposition(it->second);
    }
}

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status < 400) return {};
    switch (status) {
        case 401:
        case 403: return make_error_code(DownloadErrc::permission_denied);
        case 404:
        case 410: return make_error_code(DownloadErrc::not_found);
        case 408: return make_error_code(DownloadErrc::timeout);
        case 429: return make_error_code(DownloadErrc::server_error);
        default:  break;
    }
    return status >= 500
        ? make_error_code(DownloadErrc::server_error)
        : make_error_code(DownloadErrc::client_error);
}

} // namespace rangeget::core
