// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

namespace rangeget::core {

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * KiB;
constexpr std::uint64_t GiB = 1024 * MiB;

// Dynamic split policy thresholds
constexpr std::uint64_t SMALL_FILE_LIMIT = 100 * MiB;
constexpr std::uint64_t MEDIUM_FILE_LIMIT = 1 * GiB;
constexpr std::uint32_t SMALL_FILE_SPLITS = 4;
constexpr std::uint32_t MEDIUM_FILE_SPLITS = 8;
constexpr std::uint32_t LARGE_FILE_SPLITS = 16;

constexpr std::uint64_t MAX_CHUNK_SIZE = 4 * MiB;
constexpr std::uint64_t MIN_CHUNK_SIZE = 16 * KiB;
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1 * MiB;               // Unknown total size
constexpr std::uint64_t MIN_SEGMENT_SIZE = 256 * KiB;
constexpr std::uint32_t MAX_SEGMENTS = 32;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_BACKOFF{500};
constexpr std::chrono::milliseconds MAX_RETRY_BACKOFF{30'000};

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{200};
constexpr std::chrono::milliseconds SAVE_INTERVAL{1000};

constexpr std::size_t MAX_CURL_BUFFER_SIZE = 512 * 1024;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Per-job settings, validated once when the job starts
struct DownloadConfig {
    std::optional<std::uint32_t> splits;            // Overrides the dynamic segment count
    std::optional<std::uint64_t> chunk_size_kb;     // Overrides the dynamic chunk size (KiB)
    std::uint64_t min_segment_size{MIN_SEGMENT_SIZE};
    std::uint32_t max_segments{MAX_SEGMENTS};
    std::uint32_t max_retries{RETRY_COUNT};
    std::chrono::milliseconds retry_backoff{RETRY_BACKOFF};
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds stall_timeout{STALL_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds save_interval{SAVE_INTERVAL};
    std::string state_dir;                          // Empty: record lives beside the output
    bool fail_fast{false};                          // Stop siblings when one segment fails
    std::string user_agent;                         // Empty: "rangeget/<version>"

    [[nodiscard]] std::error_code validate() const noexcept;
};

// Read a DownloadConfig from a JSON file. Missing keys keep their defaults.
[[nodiscard]] std::expected<DownloadConfig, std::error_code>
load_config(const std::string& path) noexcept;

} // namespace rangeget::core
