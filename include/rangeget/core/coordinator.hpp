// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/config.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/core/progress.hpp>
#include <rangeget/core/resume_store.hpp>
#include <rangeget/core/segment.hpp>
#include <rangeget/core/transport.hpp>
#include <rangeget/disk/file_writer.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace rangeget::core {

// Job state machine
enum class JobState : std::uint8_t {
    idle,         // Not started
    probing,      // Asking the server for size and range support
    planning,     // Building (or restoring) the segment list
    downloading,  // Workers running
    finalizing,   // Verifying the assembled file
    completed,    // Output verified, resume record cleared
    failed        // See JobResult::error
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

// Facts about the running job, filled in as they become known
struct JobInfo {
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> total_size;
    bool range_supported{false};
    std::string etag;
    std::string filename;
    std::string content_type;
    std::uint32_t splits{0};
    std::uint64_t chunk_size{0};
    bool resumed{false};
};

struct JobResult {
    JobState state{JobState::idle};
    std::error_code error;
    std::vector<std::uint32_t> failed_segments;     // 1-based
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> total_size;
    bool resumed{false};
};

// Runs one download job at a time: probe, plan, spawn a worker per segment,
// persist resume state, finalize.
class DownloadCoordinator {
public:
    DownloadCoordinator(Transport& transport, DownloadConfig config);
    ~DownloadCoordinator();

    // Non-copyable, non-movable (threads capture this)
    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;
    DownloadCoordinator(DownloadCoordinator&&) = delete;
    DownloadCoordinator& operator=(DownloadCoordinator&&) = delete;

    // Blocking run to a terminal state
    [[nodiscard]] JobResult run(const std::string& url, const std::filesystem::path& destination);

    // run() on a background thread; wait() joins it
    [[nodiscard]] std::error_code start(std::string url, std::filesystem::path destination);
    JobResult wait();

    // Stop every worker at a resumable point. The job ends failed/cancelled
    // with its record saved. Applies to the job in flight only: run() and
    // start() arm a fresh stop source, so a cancel() made while no job is
    // running does not carry over to the next one.
    void cancel() noexcept;

    // Hold every worker between chunks until resume(). The job stays in
    // downloading; cancel() still works while paused. Cleared by the next
    // run() or start().
    void pause() noexcept;
    void resume() noexcept;
    [[nodiscard]] bool paused() const noexcept { return gate_.paused(); }

    [[nodiscard]] JobState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Latest snapshot
    [[nodiscard]] ProgressSnapshot progress() const;

    // Snapshots pushed every progress_interval; closed at the end of a run
    [[nodiscard]] ProgressChannel& events() noexcept { return events_; }

    [[nodiscard]] std::vector<SegmentView> segments() const;

    [[nodiscard]] JobInfo job() const;

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

private:
    // Clear the previous job and arm a fresh stop source
    void reset_job(const std::string& url, const std::filesystem::path& destination);

    [[nodiscard]] JobResult execute();

    // Probe through planning; opens the output file
    [[nodiscard]] std::error_code prepare(std::stop_token stop);

    // Worker threads plus the monitor loop; returns when all workers exit
    void download(std::stop_token stop);

    // Verify size and clear the record
    [[nodiscard]] std::error_code finalize();

    // Save current durable progress (no-op once resume is disabled)
    void persist();

    // Sample counters into latest_ and the event channel
    void publish();

    void tally(JobResult& result) const;

    [[nodiscard]] ResumeRecord make_record() const;

    void set_state(JobState s) noexcept;
    void wake();

    JobResult fail(JobResult& result, std::error_code ec);

    Transport& transport_;
    DownloadConfig config_;
    ResumeStore store_;

    std::atomic<JobState> state_{JobState::idle};
    JobInfo info_;
    std::string key_;
    std::optional<ResumeRecord> record_;
    std::vector<std::unique_ptr<Segment>> segments_;
    disk::FileWriter writer_;

    ProgressAggregator aggregator_;
    ProgressSnapshot latest_;
    ProgressChannel events_;

    std::stop_source stop_source_;
    std::atomic<bool> cancel_requested_{false};
    PauseGate gate_;

    // Monitor wakeups from workers
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool dirty_{false};
    std::uint32_t running_{0};

    // Resume Store writes are funneled through here
    std::mutex store_mutex_;
    bool resumable_{true};

    std::jthread runner_;
    JobResult runner_result_;

    mutable std::mutex mutex_;  // info_, segments_ structure, latest_, stop_source_
};

} // namespace rangeget::core
