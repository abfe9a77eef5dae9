// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/segment.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rangeget::core {

// Copy of one segment's counters at sample time
struct SegmentView {
    std::uint32_t index{0};
    ByteRange range;
    SegmentStatus status{SegmentStatus::pending};
    std::uint64_t bytes_written{0};
    std::uint64_t bytes_durable{0};
    std::uint32_t retries{0};
    std::optional<double> percent;      // Empty for an open-ended segment
};

struct ProgressSnapshot {
    std::vector<SegmentView> segments;
    std::uint64_t bytes_written{0};
    std::optional<std::uint64_t> total_size;
    std::optional<double> percent;      // Empty when the total is unknown
    double speed_bps{0.0};
    std::optional<std::chrono::seconds> eta;
};

// Turns live segment counters into snapshots. Reading never blocks workers;
// speed is smoothed across successive sample() calls.
class ProgressAggregator {
public:
    [[nodiscard]] static ProgressSnapshot
    snapshot(const std::vector<std::unique_ptr<Segment>>& segments,
             std::optional<std::uint64_t> total);

    // snapshot() plus speed and ETA against the previous sample
    [[nodiscard]] ProgressSnapshot
    sample(const std::vector<std::unique_ptr<Segment>>& segments,
           std::optional<std::uint64_t> total,
           std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void reset() noexcept;

private:
    std::optional<std::chrono::steady_clock::time_point> last_time_;
    std::uint64_t last_bytes_{0};
    double speed_{0.0};
};

// "Downloading part 3/8: 41.27%"
[[nodiscard]] std::string render_segment_line(const SegmentView& view, std::size_t segment_count);

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(double bytes_per_second);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

// Bounded snapshot queue between the coordinator and a consumer. A full
// queue drops its oldest entry so the producer never waits.
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 64) noexcept;

    void push(ProgressSnapshot snapshot);

    [[nodiscard]] std::optional<ProgressSnapshot> try_pop();

    // Blocks until a snapshot arrives; empty once closed and drained
    [[nodiscard]] std::optional<ProgressSnapshot> wait_pop();

    // As wait_pop(), but gives up after `timeout`
    [[nodiscard]] std::optional<ProgressSnapshot> wait_pop_for(std::chrono::milliseconds timeout);

    void close();
    [[nodiscard]] bool closed() const;

    // Clear and reopen for a new run
    void reset();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressSnapshot> queue_;
    std::size_t capacity_;
    bool closed_{false};
};

} // namespace rangeget::core
