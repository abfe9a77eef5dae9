// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/resume_store.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/disk/file_handle.hpp>
#include <rangeget/log.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace rangeget::core {

//=============================================================================
// JSON mapping
//=============================================================================

// Unknown names load as pending
NLOHMANN_JSON_SERIALIZE_ENUM(SegmentStatus, {
    {SegmentStatus::pending, "pending"},
    {SegmentStatus::in_progress, "in-progress"},
    {SegmentStatus::done, "done"},
    {SegmentStatus::failed, "failed"},
})

void to_json(nlohmann::json& j, const SegmentRecord& s) {
    j = nlohmann::json{
        {"start", s.start},
        {"end", s.end},
        {"bytes_written", s.bytes_written},
        {"status", s.status},
        {"retries", s.retries},
    };
}

void from_json(const nlohmann::json& j, SegmentRecord& s) {
    j.at("start").get_to(s.start);
    j.at("end").get_to(s.end);
    j.at("bytes_written").get_to(s.bytes_written);
    j.at("status").get_to(s.status);
    s.retries = j.value("retries", 0u);
}

void to_json(nlohmann::json& j, const ResumeRecord& r) {
    j = nlohmann::json{
        {"version", r.version},
        {"url", r.url},
        {"destination", r.destination},
        {"total_size", r.total_size},
        {"range_supported", r.range_supported},
        {"etag", r.etag},
        {"segments", r.segments},
    };
}

void from_json(const nlohmann::json& j, ResumeRecord& r) {
    j.at("version").get_to(r.version);
    j.at("url").get_to(r.url);
    j.at("destination").get_to(r.destination);
    j.at("total_size").get_to(r.total_size);
    j.at("range_supported").get_to(r.range_supported);
    r.etag = j.value("etag", std::string{});
    j.at("segments").get_to(r.segments);
}

namespace {

// Structural checks the JSON schema cannot express
bool well_formed(const ResumeRecord& record) noexcept {
    if (record.version != RESUME_FORMAT_VERSION || record.segments.empty()) {
        return false;
    }
    for (const auto& s : record.segments) {
        if (s.end < s.start || s.bytes_written > s.end - s.start) {
            return false;
        }
    }
    return true;
}

std::error_code store_failure(std::string_view what, const std::filesystem::path& path, std::error_code cause) {
    log::logger()->warn("resume store: {} {}: {}", what, path.string(), cause.message());
    return make_error_code(DownloadErrc::state_store_failure);
}

} // namespace

//=============================================================================
// ResumeStore
//=============================================================================

ResumeStore::ResumeStore(std::filesystem::path state_dir)
    : state_dir_(std::move(state_dir)) {}

std::string ResumeStore::job_key(const std::string& url, const std::filesystem::path& destination) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(destination, ec);
    std::string input = url;
    input.push_back('\0');
    input += ec ? destination.string() : absolute.lexically_normal().string();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

std::filesystem::path ResumeStore::record_path(const std::string& key,
                                               const std::filesystem::path& destination) const {
    if (!state_dir_.empty()) {
        return state_dir_ / (key + ".rgresume");
    }
    auto name = fmt::format(".{}.{}.rgresume", destination.filename().string(), key.substr(0, 16));
    return destination.parent_path() / name;
}

std::expected<std::optional<ResumeRecord>, std::error_code>
ResumeStore::load(const std::string& key, const std::filesystem::path& destination) const noexcept {
    std::filesystem::path path;
    try {
        path = record_path(key, destination);

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                return std::unexpected(store_failure("stat", path, ec));
            }
            return std::optional<ResumeRecord>{};
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(store_failure("open", path, make_error_code(disk::DiskErrc::read_error)));
        }

        auto record = nlohmann::json::parse(file).get<ResumeRecord>();
        if (!well_formed(record)) {
            log::logger()->info("resume store: discarding malformed record {}", path.string());
            return std::unexpected(make_error_code(DownloadErrc::resume_record_invalid));
        }
        return std::optional<ResumeRecord>{std::move(record)};
    } catch (const nlohmann::json::exception& e) {
        log::logger()->info("resume store: discarding unreadable record {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::resume_record_invalid));
    } catch (const std::exception& e) {
        log::logger()->warn("resume store: load {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::state_store_failure));
    }
}

std::error_code ResumeStore::save(const std::string& key,
                                  const std::filesystem::path& destination,
                                  const ResumeRecord& record) const noexcept {
    std::filesystem::path path;
    try {
        path = record_path(key, destination);

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return store_failure("create directory for", path, ec);
            }
        }

        const std::string text = nlohmann::json(record).dump(2);
        auto tmp = path;
        tmp += ".tmp";

        // A failed save leaves no temp file behind
        auto discard = [&](std::string_view what, const std::filesystem::path& where, std::error_code cause) {
            std::error_code rm_ec;
            std::filesystem::remove(tmp, rm_ec);
            return store_failure(what, where, cause);
        };

        auto file = disk::FileHandle::open(tmp.string(), disk::OpenMode::truncate);
        if (!file) {
            return discard("open", tmp, file.error());
        }
        if (auto write_ec = file->write(0, text.data(), text.size())) {
            return discard("write", tmp, write_ec);
        }
        if (auto sync_ec = file->sync()) {
            return discard("sync", tmp, sync_ec);
        }
        file->close();

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            return discard("rename", path, ec);
        }
        return {};
    } catch (const std::exception& e) {
        log::logger()->warn("resume store: save {}: {}", path.string(), e.what());
        return make_error_code(DownloadErrc::state_store_failure);
    }
}

std::error_code ResumeStore::remove(const std::string& key,
                                    const std::filesystem::path& destination) const noexcept {
    try {
        auto path = record_path(key, destination);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            return store_failure("remove", path, ec);
        }
        return {};
    } catch (const std::exception& e) {
        log::logger()->warn("resume store: remove: {}", e.what());
        return make_error_code(DownloadErrc::state_store_failure);
    }
}

} // namespace rangeget::core
