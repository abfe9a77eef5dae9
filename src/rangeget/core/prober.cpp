// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/prober.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/log.hpp>

namespace rangeget::core {

namespace {

std::error_code probe_failure(const std::string& url, std::string_view step, std::error_code cause) {
    log::logger()->error("probe {}: {} failed: {}", url, step, cause.message());
    return make_error_code(DownloadErrc::probe_failed);
}

void merge_metadata(ProbeResult& result, const HttpResponse& response) {
    if (result.etag.empty()) result.etag = response.etag;
    if (result.filename.empty()) result.filename = response.filename;
    if (result.content_type.empty()) result.content_type = response.content_type;
}

} // namespace

std::expected<ProbeResult, std::error_code>
ResourceProber::probe(const std::string& url, std::stop_token stop) {
    auto log = log::logger();
    ProbeResult result;

    auto head = transport_.head(url);
    if (!head) {
        return std::unexpected(probe_failure(url, "HEAD", head.error()));
    }

    // Some servers reject HEAD; the ranged GET alone decides then
    const bool head_rejected = head->status_code == 405 || head->status_code == 501;
    if (!head_rejected) {
        if (auto ec = status_to_error(head->status_code)) {
            return std::unexpected(probe_failure(url, "HEAD", ec));
        }
        result.total_size = head->content_length;
        result.range_supported = head->accepts_ranges;
        merge_metadata(result, *head);
    }

    HttpResponse ranged;
    bool answered = false;
    FetchHandler handler;
    handler.on_response = [&](const HttpResponse& response) -> std::error_code {
        ranged = response;
        answered = true;
        return {};
    };
    // Only the headers matter
    handler.on_data = [](const char*, std::size_t) -> std::error_code {
        return make_error_code(DownloadErrc::cancelled);
    };

    auto get = transport_.fetch(url, ByteRange{0, 1}, handler, stop);
    if (!get && !(answered && get.error() == DownloadErrc::cancelled)) {
        return std::unexpected(probe_failure(url, "ranged GET", get.error()));
    }
    if (!answered) {
        ranged = *get;
    }

    const auto& cr = ranged.content_range;
    switch (ranged.status_code) {
        case 206:
            if (cr && cr->first == 0 && cr->complete_length) {
                result.range_supported = true;
                result.total_size = cr->complete_length;
            } else {
                log->warn("probe {}: 206 without a usable Content-Range", url);
                result.range_supported = false;
            }
            break;
        case 416:
            // "bytes */0": the resource is empty
            if (cr && cr->complete_length == 0) {
                result.range_supported = true;
                result.total_size = 0;
            } else {
                result.range_supported = false;
            }
            break;
        default:
            if (auto ec = status_to_error(ranged.status_code)) {
                return std::unexpected(probe_failure(url, "ranged GET", ec));
            }
            result.range_supported = false;
            if (!result.total_size) {
                result.total_size = ranged.content_length;
            }
            break;
    }
    merge_metadata(result, ranged);

    log->info("probe {}: size {}, ranges {}", url,
              result.total_size ? std::to_string(*result.total_size) : "unknown",
              result.range_supported ? "supported" : "not supported");
    return result;
}

} // namespace rangeget::core
