// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace rangeget::core {

// End marker for a range whose size is not known yet
constexpr std::uint64_t UNBOUNDED = std::numeric_limits<std::uint64_t>::max();

// Half-open byte range [start, end)
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{UNBOUNDED};

    [[nodiscard]] bool bounded() const noexcept { return end != UNBOUNDED; }
    [[nodiscard]] std::uint64_t size() const noexcept { return bounded() ? end - start : 0; }
    [[nodiscard]] bool empty() const noexcept { return bounded() && end <= start; }

    bool operator==(const ByteRange&) const = default;
};

// Parsed "Content-Range: bytes first-last/complete" (or "bytes */complete")
struct ContentRange {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    std::optional<std::uint64_t> complete_length;
};

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Response metadata (headers are lower-cased)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
    std::optional<ContentRange> content_range;
    bool accepts_ranges{false};
    std::string etag;
    std::string content_type;
    std::string filename;       // From Content-Disposition
};

// Fill the typed fields of `response` from its header map
void decode_headers(HttpResponse& response);

// Map an HTTP status >= 400 to an error, empty for success codes
[[nodiscard]] std::error_code status_to_error(std::int32_t status) noexcept;

// Streaming consumer for a GET. Returning an error from either callback
// aborts the transfer and that error is what fetch() reports.
struct FetchHandler {
    std::function<std::error_code(const HttpResponse&)> on_response;
    std::function<std::error_code(const char* data, std::size_t size)> on_data;
};

// Network client shared by the prober and every segment worker.
// Implementations must allow concurrent calls from several threads.
class Transport {
public:
    virtual ~Transport() = default;

    // Metadata-only request
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) = 0;

    // GET, optionally limited to `range`. Any HTTP status is a successful
    // transfer here; only transport failures, handler errors and a stop
    // request (DownloadErrc::cancelled) are reported as errors.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    fetch(const std::string& url,
          const std::optional<ByteRange>& range,
          FetchHandler& handler,
          std::stop_token stop) = 0;
};

} // namespace rangeget::core
