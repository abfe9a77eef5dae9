// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/segment.hpp>
#include <rangeget/core/config.hpp>
#include <rangeget/log.hpp>
#include <algorithm>
#include <condition_variable>

namespace rangeget::core {

std::string_view to_string(SegmentStatus status) noexcept {
    switch (status) {
        case SegmentStatus::pending:     return "pending";
        case SegmentStatus::in_progress: return "in-progress";
        case SegmentStatus::done:        return "done";
        case SegmentStatus::failed:      return "failed";
    }
    return "pending";
}

std::optional<SegmentStatus> segment_status_from_string(std::string_view name) noexcept {
    if (name == "pending") return SegmentStatus::pending;
    if (name == "in-progress") return SegmentStatus::in_progress;
    if (name == "done") return SegmentStatus::done;
    if (name == "failed") return SegmentStatus::failed;
    return std::nullopt;
}

//=============================================================================
// Segment
//=============================================================================

Segment::Segment(std::uint32_t index, ByteRange range) noexcept
    : index_(index)
    , range_(range) {}

bool Segment::complete() const noexcept {
    return range_.bounded() && bytes_durable() >= range_.size();
}

std::optional<double> Segment::percent() const noexcept {
    if (!range_.bounded()) return std::nullopt;
    if (range_.size() == 0) return 100.0;
    return static_cast<double>(bytes_written()) * 100.0 / static_cast<double>(range_.size());
}

void Segment::restore(std::uint64_t durable_bytes, SegmentStatus s) noexcept {
    if (range_.bounded()) {
        durable_bytes = std::min(durable_bytes, range_.size());
    }
    written_.store(durable_bytes, std::memory_order_release);
    durable_.store(durable_bytes, std::memory_order_release);
    retries_.store(0, std::memory_order_relaxed);
    status(s);
}

std::error_code Segment::error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

void Segment::error(std::error_code ec) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_ = ec;
}

//=============================================================================
// PauseGate
//=============================================================================

void PauseGate::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void PauseGate::resume() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

bool PauseGate::paused() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool PauseGate::wait(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait(lock, stop, [this] { return !paused_; });
}

//=============================================================================
// SegmentWorker
//=============================================================================

SegmentWorker::SegmentWorker(Segment& segment,
                             Transport& transport,
                             disk::FileWriter& writer,
                             std::string url,
                             WorkerOptions options,
                             std::function<void()> notify)
    : segment_(segment)
    , transport_(transport)
    , writer_(writer)
    , url_(std::move(url))
    , options_(options)
    , notify_(std::move(notify)) {}

void SegmentWorker::run(std::stop_token stop) noexcept {
    auto log = log::logger();
    try {
        segment_.status(SegmentStatus::in_progress);
        segment_.error({});

        while (!segment_.complete()) {
            if (options_.gate && !options_.gate->wait(stop)) {
                finish(SegmentStatus::pending);
                return;
            }
            auto ec = attempt(stop);
            if (!ec) {
                ec = checkpoint();
                if (!ec) break;
            }

            // Keep whatever landed before the failure
            if (auto flush_ec = checkpoint()) {
                log->warn("Segment {}: flush failed: {}", segment_.index() + 1, flush_ec.message());
            }

            if (stop.stop_requested() || ec == DownloadErrc::cancelled) {
                log->debug("Segment {}: stopped at {} bytes", segment_.index() + 1, segment_.bytes_durable());
                finish(SegmentStatus::pending);
                return;
            }

            if (!is_transient(ec) || segment_.retries() >= options_.max_retries) {
                log->error("Segment {}: giving up after {} retries: {}",
                           segment_.index() + 1, segment_.retries(), ec.message());
                segment_.error(ec);
                finish(SegmentStatus::failed);
                return;
            }

            auto attempt_no = segment_.add_retry();
            log->warn("Segment {}: retry {}/{} from byte {} after error: {}",
                      segment_.index() + 1, attempt_no, options_.max_retries,
                      segment_.range().start + segment_.bytes_durable(), ec.message());

            if (!backoff(stop, attempt_no)) {
                finish(SegmentStatus::pending);
                return;
            }
        }

        finish(SegmentStatus::done);
    } catch (const std::exception& e) {
        log->error("Segment {}: {}", segment_.index() + 1, e.what());
        segment_.error(make_error_code(DownloadErrc::network_error));
        finish(SegmentStatus::failed);
    }
}

std::error_code SegmentWorker::attempt(std::stop_token stop) {
    const ByteRange& range = segment_.range();

    // Bytes past the durable point were never confirmed; fetch them again
    segment_.rewind_to_durable();
    since_checkpoint_ = 0;
    const std::uint64_t resume_at = segment_.bytes_durable();

    std::optional<ByteRange> request;
    std::uint64_t skip = 0;
    if (options_.range_requests) {
        request = ByteRange{range.start + resume_at, range.end};
    } else {
        // No ranges: the body always starts at byte 0
        skip = resume_at;
    }

    const bool whole_resource = !request ||
        (request->start == 0 && (!options_.total_size || request->end == *options_.total_size));

    FetchHandler handler;
    handler.on_response = [&](const HttpResponse& response) -> std::error_code {
        if (auto ec = status_to_error(response.status_code)) {
            return ec;
        }
        if (!request) {
            return {};
        }
        if (response.status_code == 206) {
            const auto& cr = response.content_range;
            if (cr && cr->first && *cr->first != request->start) {
                return make_error_code(DownloadErrc::range_not_honored);
            }
            return {};
        }
        // A full 200 body is only usable when the full body was asked for
        return whole_resource ? std::error_code{} : make_error_code(DownloadErrc::range_not_honored);
    };

    handler.on_data = [&](const char* data, std::size_t size) -> std::error_code {
        if (options_.gate && !options_.gate->wait(stop)) {
            return make_error_code(DownloadErrc::cancelled);
        }
        if (skip > 0) {
            auto n = static_cast<std::size_t>(std::min<std::uint64_t>(skip, size));
            data += n;
            size -= n;
            skip -= n;
            if (size == 0) return {};
        }

        std::uint64_t written = segment_.bytes_written();
        bool overflow = false;
        if (range.bounded()) {
            std::uint64_t room = range.size() - written;
            if (size > room) {
                size = static_cast<std::size_t>(room);
                overflow = true;
            }
        }

        if (size > 0) {
            if (auto ec = writer_.write(range.start + written, data, size)) {
                return ec;
            }
            segment_.add_written(size);
            since_checkpoint_ += size;
        }

        // Server sent more than this slice holds: the resource changed size
        if (overflow) {
            return make_error_code(DownloadErrc::integrity_mismatch);
        }

        if (since_checkpoint_ >= options_.chunk_size) {
            return checkpoint();
        }
        return {};
    };

    auto result = transport_.fetch(url_, request, handler, stop);
    if (!result) {
        return result.error();
    }

    if (range.bounded() && segment_.bytes_written() < range.size()) {
        return make_error_code(DownloadErrc::connection_lost);
    }
    return {};
}

std::error_code SegmentWorker::checkpoint() {
    if (auto ec = writer_.flush()) {
        return ec;
    }
    segment_.mark_durable();
    since_checkpoint_ = 0;
    return {};
}

bool SegmentWorker::backoff(std::stop_token stop, std::uint32_t attempt_no) const {
    auto shift = std::min<std::uint32_t>(attempt_no - 1, 16);
    auto delay = std::min<std::chrono::milliseconds>(options_.retry_backoff * (1LL << shift), MAX_RETRY_BACKOFF);

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

void SegmentWorker::finish(SegmentStatus status) {
    segment_.status(status);
    if (notify_) notify_();
}

} // namespace rangeget::core
