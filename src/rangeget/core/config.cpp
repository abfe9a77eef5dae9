// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/config.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/disk/error.hpp>
#include <rangeget/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace rangeget::core {

std::error_code DownloadConfig::validate() const noexcept {
    if (splits && *splits == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (chunk_size_kb && *chunk_size_kb == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (max_segments == 0 || min_segment_size == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (retry_backoff.count() < 0 || progress_interval.count() <= 0 || save_interval.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (connect_timeout.count() <= 0 || stall_timeout.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::expected<DownloadConfig, std::error_code>
load_config(const std::string& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        DownloadConfig cfg;
        if (j.contains("splits")) cfg.splits = j["splits"].get<std::uint32_t>();
        if (j.contains("chunk_size_kb")) cfg.chunk_size_kb = j["chunk_size_kb"].get<std::uint64_t>();
        cfg.min_segment_size = j.value("min_segment_size", cfg.min_segment_size);
        cfg.max_segments = j.value("max_segments", cfg.max_segments);
        cfg.max_retries = j.value("max_retries", cfg.max_retries);
        cfg.retry_backoff = std::chrono::milliseconds{
            j.value("retry_backoff_ms", static_cast<std::int64_t>(cfg.retry_backoff.count()))};
        cfg.connect_timeout = std::chrono::seconds{
            j.value("connect_timeout_sec", static_cast<std::int64_t>(cfg.connect_timeout.count()))};
        cfg.stall_timeout = std::chrono::seconds{
            j.value("stall_timeout_sec", static_cast<std::int64_t>(cfg.stall_timeout.count()))};
        cfg.progress_interval = std::chrono::milliseconds{
            j.value("progress_interval_ms", static_cast<std::int64_t>(cfg.progress_interval.count()))};
        cfg.save_interval = std::chrono::milliseconds{
            j.value("save_interval_ms", static_cast<std::int64_t>(cfg.save_interval.count()))};
        cfg.state_dir = j.value("state_dir", cfg.state_dir);
        cfg.fail_fast = j.value("fail_fast", cfg.fail_fast);
        cfg.user_agent = j.value("user_agent", cfg.user_agent);

        if (auto ec = cfg.validate()) {
            return std::unexpected(ec);
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        log::logger()->warn("config {}: {}", path, e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

} // namespace rangeget::core
