// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/coordinator.hpp>
#include <rangeget/core/prober.hpp>
#include <rangeget/core/segment_planner.hpp>
#include <rangeget/log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <chrono>
#include <utility>

namespace rangeget::core {

namespace {

std::uint64_t durable_total(const std::vector<std::unique_ptr<Segment>>& segments) noexcept {
    std::uint64_t total = 0;
    for (const auto& seg : segments) {
        total += seg->bytes_durable();
    }
    return total;
}

// An interrupted job leaves the output preallocated to its full size
bool output_matches(const std::filesystem::path& destination, std::uint64_t total_size) {
    std::error_code ec;
    auto status = std::filesystem::status(destination, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return false;
    }
    auto size = std::filesystem::file_size(destination, ec);
    return !ec && size == total_size;
}

} // namespace

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::idle:        return "idle";
        case JobState::probing:     return "probing";
        case JobState::planning:    return "planning";
        case JobState::downloading: return "downloading";
        case JobState::finalizing:  return "finalizing";
        case JobState::completed:   return "completed";
        case JobState::failed:      return "failed";
    }
    return "idle";
}

//=============================================================================
// DownloadCoordinator
//=============================================================================

DownloadCoordinator::DownloadCoordinator(Transport& transport, DownloadConfig config)
    : transport_(transport)
    , config_(std::move(config))
    , store_(config_.state_dir) {}

DownloadCoordinator::~DownloadCoordinator() {
    // Workers are owned by the runner thread; stopping it joins them
    cancel();
    if (runner_.joinable()) {
        runner_.join();
    }
}

JobResult DownloadCoordinator::run(const std::string& url, const std::filesystem::path& destination) {
    reset_job(url, destination);
    return execute();
}

std::error_code DownloadCoordinator::start(std::string url, std::filesystem::path destination) {
    if (runner_.joinable()) {
        return std::make_error_code(std::errc::device_or_resource_busy);
    }
    reset_job(url, destination);
    runner_ = std::jthread([this] { runner_result_ = execute(); });
    return {};
}

JobResult DownloadCoordinator::wait() {
    if (runner_.joinable()) {
        runner_.join();
    }
    return runner_result_;
}

void DownloadCoordinator::cancel() noexcept {
    cancel_requested_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_source_.request_stop();
    }
    wake();
}

void DownloadCoordinator::pause() noexcept {
    gate_.pause();
    log::logger()->info("download paused");
}

void DownloadCoordinator::resume() noexcept {
    gate_.resume();
    log::logger()->info("download resumed");
}

ProgressSnapshot DownloadCoordinator::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::vector<SegmentView> DownloadCoordinator::segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ProgressAggregator::snapshot(segments_, info_.total_size).segments;
}

JobInfo DownloadCoordinator::job() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

void DownloadCoordinator::reset_job(const std::string& url, const std::filesystem::path& destination) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = JobInfo{};
        info_.url = url;
        info_.destination = destination;
        segments_.clear();
        latest_ = ProgressSnapshot{};
        stop_source_ = std::stop_source{};
    }
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        resumable_ = true;
    }
    cancel_requested_.store(false, std::memory_order_release);
    gate_.resume();
    record_.reset();
    key_.clear();
    aggregator_.reset();
    events_.reset();
    state_.store(JobState::idle, std::memory_order_release);
}

JobResult DownloadCoordinator::execute() {
    JobResult result;

    std::stop_token stop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop = stop_source_.get_token();
    }

    set_state(JobState::probing);
    if (auto ec = config_.validate()) {
        return fail(result, ec);
    }

    if (auto ec = prepare(stop)) {
        if (cancel_requested_.load(std::memory_order_acquire)) {
            ec = make_error_code(DownloadErrc::cancelled);
        }
        return fail(result, ec);
    }

    set_state(JobState::downloading);
    download(stop);

    bool integrity = false;
    bool unfinished = false;
    for (const auto& seg : segments_) {
        if (seg->status() == SegmentStatus::failed && seg->error() == DownloadErrc::integrity_mismatch) {
            integrity = true;
        }
        if (seg->status() != SegmentStatus::done) {
            unfinished = true;
        }
    }

    tally(result);
    if (!result.failed_segments.empty()) {
        persist();
        log::logger()->error("download {}: segment(s) {} failed", info_.url,
                             fmt::join(result.failed_segments, ", "));
        return fail(result, make_error_code(integrity ? DownloadErrc::integrity_mismatch
                                                      : DownloadErrc::segment_transfer_failed));
    }
    if (unfinished || cancel_requested_.load(std::memory_order_acquire)) {
        persist();
        return fail(result, make_error_code(DownloadErrc::cancelled));
    }

    if (auto ec = finalize()) {
        persist();
        return fail(result, ec);
    }

    tally(result);
    result.state = JobState::completed;
    set_state(JobState::completed);
    publish();
    events_.close();
    log::logger()->info("download {} complete: {} bytes", info_.url, result.bytes_downloaded);
    return result;
}

std::error_code DownloadCoordinator::prepare(std::stop_token stop) {
    auto log = log::logger();

    key_ = ResumeStore::job_key(info_.url, info_.destination);
    auto loaded = store_.load(key_, info_.destination);
    if (loaded) {
        record_ = std::move(*loaded);
    } else if (loaded.error() == DownloadErrc::state_store_failure) {
        log->warn("resume state unavailable, continuing without resume");
        std::lock_guard<std::mutex> lock(store_mutex_);
        resumable_ = false;
    }

    // Guard against a key collision
    if (record_ && record_->url != info_.url) {
        log->info("resume record belongs to {}, ignoring it", record_->url);
        record_.reset();
    }

    ResourceProber prober(transport_);
    auto probe = prober.probe(info_.url, stop);
    if (!probe) {
        return probe.error();
    }
    if (stop.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    set_state(JobState::planning);

    if (record_ && !record_->etag.empty() && !probe->etag.empty() && record_->etag != probe->etag) {
        log->info("resource changed (ETag {} -> {}), starting fresh", record_->etag, probe->etag);
        record_.reset();
    }

    // The record only counts bytes that are still in the output file
    if (record_ && !output_matches(info_.destination, record_->total_size)) {
        log->info("{} is missing or was resized, discarding resume record", info_.destination.string());
        record_.reset();
    }

    auto outcome = SegmentPlanner::plan(probe->total_size, probe->range_supported, config_,
                                        record_ ? &*record_ : nullptr);

    std::vector<std::unique_ptr<Segment>> segments;
    segments.reserve(outcome.plan.ranges.size());
    for (std::size_t i = 0; i < outcome.plan.ranges.size(); ++i) {
        auto seg = std::make_unique<Segment>(static_cast<std::uint32_t>(i), outcome.plan.ranges[i]);
        if (outcome.reused) {
            // Failed segments get a fresh retry budget
            seg->restore(record_->segments[i].bytes_written, SegmentStatus::pending);
        }
        if (seg->complete()) {
            seg->status(SegmentStatus::done);
        }
        segments.push_back(std::move(seg));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        info_.total_size = probe->total_size;
        info_.range_supported = probe->range_supported;
        info_.etag = probe->etag;
        info_.filename = probe->filename;
        info_.content_type = probe->content_type;
        info_.splits = static_cast<std::uint32_t>(outcome.plan.ranges.size());
        info_.chunk_size = outcome.plan.chunk_size;
        info_.resumed = outcome.reused;
        segments_ = std::move(segments);
    }

    if (outcome.reused) {
        log->info("resuming {} from {} of {} bytes", info_.url, durable_total(segments_), *info_.total_size);
    } else {
        log->debug("planned {} segment(s), chunk {} bytes", info_.splits, info_.chunk_size);
    }

    // Unknown size leaves nothing stable to resume against
    if (!info_.total_size) {
        std::lock_guard<std::mutex> lock(store_mutex_);
        resumable_ = false;
        if (record_) {
            if (auto ec = store_.remove(key_, info_.destination)) {
                log->debug("stale resume record kept: {}", ec.message());
            }
        }
    }

    auto mode = outcome.reused ? disk::OpenMode::keep : disk::OpenMode::truncate;
    if (auto ec = writer_.open(info_.destination.string(), mode, info_.total_size)) {
        log->error("cannot open {}: {}", info_.destination.string(), ec.message());
        return ec;
    }

    persist();
    return {};
}

void DownloadCoordinator::download(std::stop_token stop) {
    auto log = log::logger();

    WorkerOptions options;
    options.chunk_size = info_.chunk_size;
    options.max_retries = config_.max_retries;
    options.retry_backoff = config_.retry_backoff;
    options.range_requests = info_.range_supported;
    options.total_size = info_.total_size;
    options.gate = &gate_;

    std::vector<std::unique_ptr<SegmentWorker>> workers;
    for (auto& seg : segments_) {
        if (seg->status() == SegmentStatus::done) continue;
        workers.push_back(std::make_unique<SegmentWorker>(
            *seg, transport_, writer_, info_.url, options, [this] { wake(); }));
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        dirty_ = false;
        running_ = static_cast<std::uint32_t>(workers.size());
    }

    // Declared after workers so the threads join first
    std::vector<std::jthread> threads;
    threads.reserve(workers.size());
    for (std::size_t i = 0; i < workers.size(); ++i) {
        try {
            threads.emplace_back([this, worker = workers[i].get(), stop] {
                worker->run(stop);
                {
                    std::lock_guard<std::mutex> lock(wake_mutex_);
                    --running_;
                    dirty_ = true;
                }
                wake_cv_.notify_all();
            });
        } catch (const std::system_error& e) {
            log->error("cannot start worker thread: {}", e.what());
            {
                std::lock_guard<std::mutex> lock(wake_mutex_);
                running_ -= static_cast<std::uint32_t>(workers.size() - i);
            }
            cancel();
            break;
        }
    }

    auto last_save = std::chrono::steady_clock::now();
    std::uint64_t saved_durable = durable_total(segments_);
    bool siblings_stopped = false;

    while (true) {
        bool changed = false;
        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, config_.progress_interval, [this] { return dirty_ || running_ == 0; });
            changed = std::exchange(dirty_, false);
            finished = running_ == 0;
        }

        publish();

        if (config_.fail_fast && !siblings_stopped) {
            bool any_failed = std::any_of(segments_.begin(), segments_.end(), [](const auto& seg) {
                return seg->status() == SegmentStatus::failed;
            });
            if (any_failed) {
                log->warn("segment failed, stopping the remaining segments");
                std::lock_guard<std::mutex> lock(mutex_);
                stop_source_.request_stop();
                siblings_stopped = true;
            }
        }

        // Save on state changes, and periodically while durable bytes move
        auto now = std::chrono::steady_clock::now();
        auto durable = durable_total(segments_);
        if (changed || (now - last_save >= config_.save_interval && durable != saved_durable)) {
            persist();
            last_save = now;
            saved_durable = durable;
        }

        if (finished) break;
    }

    threads.clear();
}

std::error_code DownloadCoordinator::finalize() {
    auto log = log::logger();
    set_state(JobState::finalizing);

    const std::uint64_t received = durable_total(segments_);

    if (auto ec = writer_.flush()) {
        return ec;
    }

    // Streamed without a length: the file is exactly what arrived
    if (!info_.total_size) {
        if (auto ec = writer_.truncate(received)) {
            return ec;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        info_.total_size = received;
    }

    auto size = writer_.size();
    if (!size) {
        return size.error();
    }
    writer_.close();

    if (*size != *info_.total_size || received != *info_.total_size) {
        log->error("integrity check failed for {}: file {} bytes, segments {} bytes, expected {}",
                   info_.destination.string(), *size, received, *info_.total_size);
        return make_error_code(DownloadErrc::integrity_mismatch);
    }

    std::lock_guard<std::mutex> lock(store_mutex_);
    if (auto ec = store_.remove(key_, info_.destination)) {
        log->warn("resume record for {} not removed: {}", info_.destination.string(), ec.message());
    }
    resumable_ = false;
    return {};
}

void DownloadCoordinator::persist() {
    std::lock_guard<std::mutex> lock(store_mutex_);
    if (!resumable_ || segments_.empty()) {
        return;
    }
    if (auto ec = store_.save(key_, info_.destination, make_record())) {
        log::logger()->warn("resume disabled for {}: {}", info_.destination.string(), ec.message());
        resumable_ = false;
    }
}

ResumeRecord DownloadCoordinator::make_record() const {
    ResumeRecord record;
    record.url = info_.url;

    std::error_code ec;
    auto absolute = std::filesystem::absolute(info_.destination, ec);
    record.destination = ec ? info_.destination.string() : absolute.string();
    record.total_size = info_.total_size.value_or(0);
    record.range_supported = info_.range_supported;
    record.etag = info_.etag;

    record.segments.reserve(segments_.size());
    for (const auto& seg : segments_) {
        SegmentRecord saved;
        saved.start = seg->range().start;
        saved.end = seg->range().end;
        saved.bytes_written = seg->bytes_durable();
        saved.retries = seg->retries();
        saved.status = seg->status();
        // A running segment is only as far as its durable prefix
        if (saved.status == SegmentStatus::in_progress) {
            saved.status = SegmentStatus::pending;
        }
        record.segments.push_back(saved);
    }
    return record;
}

void DownloadCoordinator::publish() {
    auto snap = aggregator_.sample(segments_, info_.total_size);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = snap;
    }
    events_.push(std::move(snap));
}

void DownloadCoordinator::tally(JobResult& result) const {
    result.bytes_downloaded = durable_total(segments_);
    result.total_size = info_.total_size;
    result.resumed = info_.resumed;
    result.failed_segments.clear();
    for (const auto& seg : segments_) {
        if (seg->status() == SegmentStatus::failed) {
            result.failed_segments.push_back(seg->index() + 1);
        }
    }
}

JobResult DownloadCoordinator::fail(JobResult& result, std::error_code ec) {
    tally(result);
    result.state = JobState::failed;
    result.error = ec;

    writer_.close();
    set_state(JobState::failed);
    if (!segments_.empty()) {
        publish();
    }
    events_.close();

    if (ec == DownloadErrc::cancelled) {
        log::logger()->warn("download {} cancelled at {} bytes", info_.url, result.bytes_downloaded);
    } else {
        log::logger()->error("download {} failed: {}", info_.url, ec.message());
    }
    return result;
}

void DownloadCoordinator::set_state(JobState s) noexcept {
    state_.store(s, std::memory_order_release);
    log::logger()->debug("job state: {}", to_string(s));
}

void DownloadCoordinator::wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        dirty_ = true;
    }
    wake_cv_.notify_all();
}

} // namespace rangeget::core
