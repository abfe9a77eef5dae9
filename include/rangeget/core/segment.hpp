// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/error.hpp>
#include <rangeget/core/transport.hpp>
#include <rangeget/disk/file_writer.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace rangeget::core {

// Segment state machine
enum class SegmentStatus : std::uint8_t {
    pending,      // Not started, or stopped with a resumable prefix
    in_progress,  // Owned by a running worker
    done,         // Every byte written and flushed
    failed        // Retries exhausted
};

[[nodiscard]] std::string_view to_string(SegmentStatus status) noexcept;
[[nodiscard]] std::optional<SegmentStatus> segment_status_from_string(std::string_view name) noexcept;

// A contiguous byte range of the resource and its download progress.
// Counters are atomics written by the owning worker and read by anyone.
class Segment {
public:
    Segment(std::uint32_t index, ByteRange range) noexcept;

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return range_.size(); }

    [[nodiscard]] SegmentStatus status() const noexcept { return status_.load(std::memory_order_acquire); }
    void status(SegmentStatus s) noexcept { status_.store(s, std::memory_order_release); }

    // Bytes handed to the OS
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_.load(std::memory_order_acquire); }
    // Bytes confirmed on disk; never ahead of bytes_written()
    [[nodiscard]] std::uint64_t bytes_durable() const noexcept { return durable_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t retries() const noexcept { return retries_.load(std::memory_order_relaxed); }

    // All bytes of a bounded range are durable
    [[nodiscard]] bool complete() const noexcept;

    // Empty when the range is open-ended
    [[nodiscard]] std::optional<double> percent() const noexcept;

    // Restore persisted progress before a worker starts
    void restore(std::uint64_t durable_bytes, SegmentStatus s) noexcept;

    // Worker-side updates
    void add_written(std::uint64_t bytes) noexcept { written_.fetch_add(bytes, std::memory_order_acq_rel); }
    void mark_durable() noexcept { durable_.store(bytes_written(), std::memory_order_release); }
    void rewind_to_durable() noexcept { written_.store(bytes_durable(), std::memory_order_release); }
    std::uint32_t add_retry() noexcept { return retries_.fetch_add(1, std::memory_order_relaxed) + 1; }

    [[nodiscard]] std::error_code error() const;
    void error(std::error_code ec);

private:
    std::uint32_t index_;
    ByteRange range_;
    std::atomic<SegmentStatus> status_{SegmentStatus::pending};
    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> durable_{0};
    std::atomic<std::uint32_t> retries_{0};

    mutable std::mutex error_mutex_;
    std::error_code error_;
};

// Holds workers between chunks while paused. A stop request releases them.
class PauseGate {
public:
    void pause() noexcept;
    void resume() noexcept;
    [[nodiscard]] bool paused() const noexcept;

    // Blocks while paused; false if a stop arrived first
    [[nodiscard]] bool wait(std::stop_token stop);

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool paused_{false};
};

struct WorkerOptions {
    std::uint64_t chunk_size{0};            // Flush-and-publish granularity
    std::uint32_t max_retries{0};
    std::chrono::milliseconds retry_backoff{0};
    bool range_requests{true};              // False: stream from 0 and skip the durable prefix
    std::optional<std::uint64_t> total_size;
    PauseGate* gate{nullptr};               // Optional; not owned
};

// Downloads one Segment into its slice of the output file
class SegmentWorker {
public:
    SegmentWorker(Segment& segment,
                  Transport& transport,
                  disk::FileWriter& writer,
                  std::string url,
                  WorkerOptions options,
                  std::function<void()> notify = {});

    // Runs until the segment is done, failed, or a stop is requested. A
    // stopped segment goes back to pending with its durable prefix kept.
    void run(std::stop_token stop) noexcept;

private:
    // One request for the uncovered remainder
    [[nodiscard]] std::error_code attempt(std::stop_token stop);

    // Flush the file and publish bytes_written as durable
    [[nodiscard]] std::error_code checkpoint();

    // Wait before retry `attempt_no`; false if a stop arrived meanwhile
    [[nodiscard]] bool backoff(std::stop_token stop, std::uint32_t attempt_no) const;

    void finish(SegmentStatus status);

    Segment& segment_;
    Transport& transport_;
    disk::FileWriter& writer_;
    std::string url_;
    WorkerOptions options_;
    std::function<void()> notify_;
    std::uint64_t since_checkpoint_{0};
};

} // namespace rangeget::core
