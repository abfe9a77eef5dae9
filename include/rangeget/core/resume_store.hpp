// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/segment.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace rangeget::core {

constexpr int RESUME_FORMAT_VERSION = 1;

// Persisted state of one segment. bytes_written is always a durable count.
struct SegmentRecord {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t bytes_written{0};
    SegmentStatus status{SegmentStatus::pending};
    std::uint32_t retries{0};

    bool operator==(const SegmentRecord&) const = default;
};

// On-disk state of an unfinished job
struct ResumeRecord {
    int version{RESUME_FORMAT_VERSION};
    std::string url;
    std::string destination;
    std::uint64_t total_size{0};
    bool range_supported{false};
    std::string etag;
    std::vector<SegmentRecord> segments;

    bool operator==(const ResumeRecord&) const = default;
};

// Reads and writes Resume Records, one file per job. Not safe for
// concurrent writers; the owner serializes save() calls.
class ResumeStore {
public:
    // Empty state_dir: records live beside the destination file
    explicit ResumeStore(std::filesystem::path state_dir = {});

    // Stable job identifier: hex SHA-256 of url and absolute destination
    [[nodiscard]] static std::string job_key(const std::string& url,
                                             const std::filesystem::path& destination);

    [[nodiscard]] std::filesystem::path record_path(const std::string& key,
                                                    const std::filesystem::path& destination) const;

    // Empty optional when no record exists. Unreadable file is
    // state_store_failure, malformed content is resume_record_invalid.
    [[nodiscard]] std::expected<std::optional<ResumeRecord>, std::error_code>
    load(const std::string& key, const std::filesystem::path& destination) const noexcept;

    // Write to a temp file, sync it, then rename over the record
    [[nodiscard]] std::error_code save(const std::string& key,
                                       const std::filesystem::path& destination,
                                       const ResumeRecord& record) const noexcept;

    std::error_code remove(const std::string& key,
                           const std::filesystem::path& destination) const noexcept;

private:
    std::filesystem::path state_dir_;
};

} // namespace rangeget::core
