// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace rangeget::core {

// What the server told us about a resource before any segment work
struct ProbeResult {
    std::optional<std::uint64_t> total_size;    // Empty: length unknown
    bool range_supported{false};
    std::string etag;
    std::string filename;                       // From Content-Disposition
    std::string content_type;
};

// Finds size and range support with a HEAD followed by a one-byte ranged
// GET. Servers that advertise Accept-Ranges but answer 200 are caught by the
// second request.
class ResourceProber {
public:
    explicit ResourceProber(Transport& transport) noexcept
        : transport_(transport) {}

    // Fails with probe_failed; the cause is logged
    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const std::string& url, std::stop_token stop = {});

private:
    Transport& transport_;
};

} // namespace rangeget::core
