// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/progress.hpp>
#include <rangeget/core/config.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace rangeget::core {

namespace {

// Weight of the newest interval in the smoothed speed
constexpr double SPEED_SMOOTHING = 0.3;

} // namespace

//=============================================================================
// ProgressAggregator
//=============================================================================

ProgressSnapshot ProgressAggregator::snapshot(const std::vector<std::unique_ptr<Segment>>& segments,
                                              std::optional<std::uint64_t> total) {
    ProgressSnapshot snap;
    snap.total_size = total;
    snap.segments.reserve(segments.size());

    for (const auto& seg : segments) {
        SegmentView view;
        view.index = seg->index();
        view.range = seg->range();
        view.status = seg->status();
        view.bytes_written = seg->bytes_written();
        view.bytes_durable = seg->bytes_durable();
        view.retries = seg->retries();
        view.percent = seg->percent();
        snap.bytes_written += view.bytes_written;
        snap.segments.push_back(view);
    }

    if (total) {
        snap.percent = *total == 0
            ? 100.0
            : std::min(100.0, static_cast<double>(snap.bytes_written) * 100.0 / static_cast<double>(*total));
    }
    return snap;
}

ProgressSnapshot ProgressAggregator::sample(const std::vector<std::unique_ptr<Segment>>& segments,
                                            std::optional<std::uint64_t> total,
                                            std::chrono::steady_clock::time_point now) {
    auto snap = snapshot(segments, total);

    if (last_time_) {
        auto elapsed = std::chrono::duration<double>(now - *last_time_).count();
        if (elapsed > 0.0) {
            // Retries rewind counters; never report negative speed
            auto delta = snap.bytes_written > last_bytes_ ? snap.bytes_written - last_bytes_ : 0;
            double instant = static_cast<double>(delta) / elapsed;
            speed_ = speed_ == 0.0 ? instant : SPEED_SMOOTHING * instant + (1.0 - SPEED_SMOOTHING) * speed_;
        }
    }
    last_time_ = now;
    last_bytes_ = snap.bytes_written;

    snap.speed_bps = speed_;
    if (total && speed_ > 0.0) {
        auto remaining = *total > snap.bytes_written ? *total - snap.bytes_written : 0;
        snap.eta = std::chrono::seconds{static_cast<std::int64_t>(static_cast<double>(remaining) / speed_)};
    }
    return snap;
}

void ProgressAggregator::reset() noexcept {
    last_time_.reset();
    last_bytes_ = 0;
    speed_ = 0.0;
}

//=============================================================================
// Formatting
//=============================================================================

std::string render_segment_line(const SegmentView& view, std::size_t segment_count) {
    if (!view.percent) {
        return fmt::format("Downloading part {}/{}: {}", view.index + 1, segment_count,
                           format_bytes(view.bytes_written));
    }
    return fmt::format("Downloading part {}/{}: {:.2f}%", view.index + 1, segment_count, *view.percent);
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t TiB = 1024 * GiB;

    if (bytes >= TiB) {
        return fmt::format("{:.2f} TB", static_cast<double>(bytes) / TiB);
    } else if (bytes >= GiB) {
        return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GiB);
    } else if (bytes >= MiB) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MiB);
    } else if (bytes >= KiB) {
        return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KiB);
    }
    return fmt::format("{} B", bytes);
}

std::string format_speed(double bps) {
    if (bps >= static_cast<double>(GiB)) {
        return fmt::format("{:.1f} GB/s", bps / GiB);
    } else if (bps >= static_cast<double>(MiB)) {
        return fmt::format("{:.1f} MB/s", bps / MiB);
    } else if (bps >= static_cast<double>(KiB)) {
        return fmt::format("{:.1f} KB/s", bps / KiB);
    }
    return fmt::format("{:.0f} B/s", bps);
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02}m {}s", hours, minutes, secs);
    } else if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}

//=============================================================================
// ProgressChannel
//=============================================================================

ProgressChannel::ProgressChannel(std::size_t capacity) noexcept
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void ProgressChannel::push(ProgressSnapshot snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
        }
        queue_.push_back(std::move(snapshot));
    }
    cv_.notify_one();
}

std::optional<ProgressSnapshot> ProgressChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    auto snap = std::move(queue_.front());
    queue_.pop_front();
    return snap;
}

std::optional<ProgressSnapshot> ProgressChannel::wait_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto snap = std::move(queue_.front());
    queue_.pop_front();
    return snap;
}

std::optional<ProgressSnapshot> ProgressChannel::wait_pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto snap = std::move(queue_.front());
    queue_.pop_front();
    return snap;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void ProgressChannel::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    closed_ = false;
}

} // namespace rangeget::core
