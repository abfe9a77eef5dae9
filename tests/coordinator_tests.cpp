// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangeget/core/coordinator.hpp>
#include <rangeget/core/segment_planner.hpp>
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace rangeget::core;
using namespace std::chrono_literals;
using rangeget::test::FakeTransport;
using rangeget::test::TempDir;

namespace {

constexpr std::uint64_t BODY_SIZE = 64 * KiB;
const std::string URL = "https://example.com/pub/data.bin";

DownloadConfig test_config() {
    DownloadConfig config;
    config.splits = 8;
    config.chunk_size_kb = 4;
    config.max_retries = 2;
    config.retry_backoff = 1ms;
    config.progress_interval = 5ms;
    config.save_interval = 5ms;
    return config;
}

std::optional<ResumeRecord> load_record(const std::filesystem::path& destination) {
    ResumeStore store;
    auto loaded = store.load(ResumeStore::job_key(URL, destination), destination);
    if (!loaded) return std::nullopt;
    return *loaded;
}

bool record_exists(const std::filesystem::path& destination) {
    ResumeStore store;
    return std::filesystem::exists(store.record_path(ResumeStore::job_key(URL, destination), destination));
}

// Third of eight segments
const ByteRange SEGMENT_3 = SegmentPlanner::partition(BODY_SIZE, 8)[2];

// Polls `ready` for up to five seconds
template <typename Pred>
bool eventually(Pred ready) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (ready()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return ready();
}

} // namespace

TEST_CASE("Coordinator downloads all segments", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);

    DownloadCoordinator coordinator(transport, test_config());
    auto result = coordinator.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK_FALSE(result.error);
    CHECK(result.failed_segments.empty());
    CHECK(result.bytes_downloaded == BODY_SIZE);
    CHECK(result.total_size == BODY_SIZE);
    CHECK_FALSE(result.resumed);
    CHECK(coordinator.state() == JobState::completed);

    auto info = coordinator.job();
    CHECK(info.splits == 8);
    CHECK(info.chunk_size == 4 * KiB);
    CHECK(info.range_supported);

    CHECK(transport.transfers().size() == 8);
    CHECK(rangeget::test::read_file(dest) == body);
    CHECK_FALSE(record_exists(dest));

    auto snap = coordinator.progress();
    REQUIRE(snap.percent.has_value());
    CHECK(*snap.percent == Catch::Approx(100.0));
    for (const auto& view : coordinator.segments()) {
        CHECK(view.status == SegmentStatus::done);
    }
}

TEST_CASE("Coordinator completes a zero-length resource", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "empty.bin";
    FakeTransport transport("");

    DownloadCoordinator coordinator(transport, test_config());
    auto result = coordinator.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK(result.total_size == 0u);
    CHECK(transport.transfers().empty());
    REQUIRE(std::filesystem::exists(dest));
    CHECK(std::filesystem::file_size(dest) == 0);
    CHECK_FALSE(record_exists(dest));
}

TEST_CASE("Coordinator resumes only the failed segment", "[coordinator][resume]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);
    transport.fail_in(SEGMENT_3, FakeTransport::ALWAYS, 1000);

    {
        DownloadCoordinator coordinator(transport, test_config());
        auto result = coordinator.run(URL, dest);

        CHECK(result.state == JobState::failed);
        CHECK(result.error == DownloadErrc::segment_transfer_failed);
        CHECK(result.failed_segments == std::vector<std::uint32_t>{3});

        for (const auto& view : coordinator.segments()) {
            CHECK(view.status == (view.index == 2 ? SegmentStatus::failed : SegmentStatus::done));
        }
    }

    // Every retry kept the 1000 bytes that arrived before the drop
    auto record = load_record(dest);
    REQUIRE(record.has_value());
    REQUIRE(record->segments.size() == 8);
    CHECK(record->segments[2].status == SegmentStatus::failed);
    CHECK(record->segments[2].bytes_written == 3000);
    CHECK(record->segments[0].status == SegmentStatus::done);
    CHECK(record->segments[0].bytes_written == record->segments[0].end - record->segments[0].start);

    transport.clear_failures();
    transport.clear_requests();

    DownloadCoordinator again(transport, test_config());
    auto result = again.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK(result.resumed);
    auto transfers = transport.transfers();
    REQUIRE(transfers.size() == 1);
    CHECK(transfers[0] == ByteRange{SEGMENT_3.start + 3000, SEGMENT_3.end});
    CHECK(rangeget::test::read_file(dest) == body);
    CHECK_FALSE(record_exists(dest));
}

TEST_CASE("Coordinator discards a record when the output file is gone", "[coordinator][resume]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);
    transport.fail_in(SEGMENT_3, FakeTransport::ALWAYS, 1000);

    {
        DownloadCoordinator coordinator(transport, test_config());
        REQUIRE(coordinator.run(URL, dest).state == JobState::failed);
    }
    REQUIRE(load_record(dest).has_value());

    transport.clear_failures();
    transport.clear_requests();

    SECTION("Deleted") {
        std::filesystem::remove(dest);
    }
    SECTION("Truncated") {
        std::filesystem::resize_file(dest, 100);
    }

    DownloadCoordinator again(transport, test_config());
    auto result = again.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK_FALSE(result.resumed);
    CHECK(transport.transfers().size() == 8);
    CHECK(rangeget::test::read_file(dest) == body);
    CHECK_FALSE(record_exists(dest));
}

TEST_CASE("Coordinator discards a record when the resource changes", "[coordinator][resume]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    FakeTransport transport(rangeget::test::make_body(BODY_SIZE));
    transport.etag = "\"v1\"";
    transport.fail_in(SEGMENT_3, FakeTransport::ALWAYS, 1000);

    {
        DownloadCoordinator coordinator(transport, test_config());
        auto result = coordinator.run(URL, dest);
        REQUIRE(result.state == JobState::failed);
    }
    REQUIRE(load_record(dest).has_value());

    transport.clear_failures();
    transport.clear_requests();

    SECTION("Size changed") {
        auto body = rangeget::test::make_body(BODY_SIZE + 123, 11);
        transport.body(body);

        DownloadCoordinator again(transport, test_config());
        auto result = again.run(URL, dest);

        CHECK(result.state == JobState::completed);
        CHECK_FALSE(result.resumed);
        CHECK(transport.transfers().size() == 8);
        CHECK(rangeget::test::read_file(dest) == body);
    }

    SECTION("ETag changed") {
        auto body = rangeget::test::make_body(BODY_SIZE, 13);
        transport.body(body);
        transport.etag = "\"v2\"";

        DownloadCoordinator again(transport, test_config());
        auto result = again.run(URL, dest);

        CHECK(result.state == JobState::completed);
        CHECK_FALSE(result.resumed);
        CHECK(transport.transfers().size() == 8);
        CHECK(rangeget::test::read_file(dest) == body);
    }
}

TEST_CASE("Coordinator falls back to one stream without range support", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);
    transport.honor_ranges = false;
    transport.advertise_ranges = false;

    DownloadCoordinator coordinator(transport, test_config());
    auto result = coordinator.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK(coordinator.job().splits == 1);
    CHECK_FALSE(coordinator.job().range_supported);

    auto transfers = transport.transfers();
    REQUIRE(transfers.size() == 1);
    CHECK_FALSE(transfers[0].has_value());
    CHECK(rangeget::test::read_file(dest) == body);
}

TEST_CASE("Coordinator streams a resource of unknown length", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "stream.bin";
    auto body = rangeget::test::make_body(10'000);
    FakeTransport transport(body);
    transport.send_length = false;

    DownloadCoordinator coordinator(transport, test_config());
    auto result = coordinator.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK(result.total_size == body.size());
    CHECK(coordinator.job().splits == 1);
    CHECK(rangeget::test::read_file(dest) == body);
    CHECK_FALSE(record_exists(dest));
}

TEST_CASE("Coordinator cancel keeps durable progress", "[coordinator][resume]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);
    transport.chunk = 1024;

    {
        DownloadCoordinator coordinator(transport, test_config());
        std::atomic<int> chunks{0};
        transport.on_chunk = [&](std::uint64_t) {
            if (++chunks == 12) coordinator.cancel();
        };

        auto result = coordinator.run(URL, dest);
        transport.on_chunk = nullptr;

        CHECK(result.state == JobState::failed);
        CHECK(result.error == DownloadErrc::cancelled);
        CHECK(result.failed_segments.empty());
        CHECK(result.bytes_downloaded > 0);
        CHECK(result.bytes_downloaded < BODY_SIZE);
    }

    auto record = load_record(dest);
    REQUIRE(record.has_value());
    std::uint64_t saved = 0;
    for (const auto& s : record->segments) {
        CHECK(s.status != SegmentStatus::in_progress);
        CHECK(s.status != SegmentStatus::failed);
        saved += s.bytes_written;
    }
    CHECK(saved > 0);

    transport.clear_requests();
    DownloadCoordinator again(transport, test_config());
    auto result = again.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK(result.resumed);
    for (const auto& r : transport.transfers()) {
        REQUIRE(r.has_value());
        auto it = std::find_if(record->segments.begin(), record->segments.end(),
                               [&](const SegmentRecord& s) { return r->start >= s.start && r->start < s.end; });
        REQUIRE(it != record->segments.end());
        CHECK(r->start == it->start + it->bytes_written);
    }
    CHECK(rangeget::test::read_file(dest) == body);
}

TEST_CASE("Coordinator reports probe failures", "[coordinator]") {
    TempDir dir;
    FakeTransport transport(rangeget::test::make_body(1000));
    transport.error_status = 404;

    DownloadCoordinator coordinator(transport, test_config());
    auto result = coordinator.run(URL, dir / "missing.bin");

    CHECK(result.state == JobState::failed);
    CHECK(result.error == DownloadErrc::probe_failed);
    CHECK(transport.transfers().empty());
    CHECK(coordinator.events().closed());
}

TEST_CASE("Coordinator rejects an invalid configuration", "[coordinator][config]") {
    TempDir dir;
    FakeTransport transport(rangeget::test::make_body(1000));
    auto config = test_config();
    config.splits = 0;

    DownloadCoordinator coordinator(transport, config);
    auto result = coordinator.run(URL, dir / "out.bin");

    CHECK(result.state == JobState::failed);
    CHECK(result.error == DownloadErrc::invalid_config);
    CHECK(transport.head_count.load() == 0);
}

TEST_CASE("Coordinator publishes progress while running in the background", "[coordinator][progress]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);

    DownloadCoordinator coordinator(transport, test_config());
    REQUIRE_FALSE(coordinator.start(URL, dest));
    CHECK(coordinator.start(URL, dest) == std::errc::device_or_resource_busy);

    std::optional<ProgressSnapshot> last;
    while (auto snap = coordinator.events().wait_pop()) {
        last = std::move(snap);
    }

    auto result = coordinator.wait();
    CHECK(result.state == JobState::completed);
    REQUIRE(last.has_value());
    CHECK(last->bytes_written == BODY_SIZE);
    REQUIRE(last->segments.size() == 8);
    CHECK(rangeget::test::read_file(dest) == body);
}

TEST_CASE("Coordinator output does not depend on completion order", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);
    const auto ranges = SegmentPlanner::partition(BODY_SIZE, 8);

    DownloadCoordinator coordinator(transport, test_config());

    // Each segment's first chunk waits for every later segment: they finish last to first
    std::atomic<bool> timed_out{false};
    transport.on_chunk = [&](std::uint64_t offset) {
        auto it = std::find_if(ranges.begin(), ranges.end(), [&](const ByteRange& r) { return r.start == offset; });
        if (it == ranges.end()) return;
        auto index = static_cast<std::size_t>(it - ranges.begin());
        bool ok = eventually([&] {
            auto views = coordinator.segments();
            if (views.size() != ranges.size()) return true;     // Still probing
            return std::all_of(views.begin() + static_cast<std::ptrdiff_t>(index) + 1, views.end(),
                               [](const SegmentView& v) { return v.status == SegmentStatus::done; });
        });
        if (!ok) timed_out = true;
    };

    auto result = coordinator.run(URL, dest);
    transport.on_chunk = nullptr;

    CHECK_FALSE(timed_out.load());
    CHECK(result.state == JobState::completed);
    CHECK(rangeget::test::read_file(dest) == body);
}

TEST_CASE("Coordinator fails finalization when the output size is wrong", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    FakeTransport transport(rangeget::test::make_body(BODY_SIZE));

    // The output grows behind the writer's back
    std::atomic<bool> grown{false};
    transport.on_chunk = [&](std::uint64_t offset) {
        if (offset != SEGMENT_3.start || grown.exchange(true)) return;
        std::filesystem::resize_file(dest, BODY_SIZE + 100);
    };

    DownloadCoordinator coordinator(transport, test_config());
    auto result = coordinator.run(URL, dest);
    transport.on_chunk = nullptr;

    REQUIRE(grown.load());
    CHECK(result.state == JobState::failed);
    CHECK(result.error == DownloadErrc::integrity_mismatch);
    CHECK(result.failed_segments.empty());
    CHECK(result.bytes_downloaded == BODY_SIZE);
    CHECK(coordinator.state() == JobState::failed);

    // Kept for diagnosis
    CHECK(record_exists(dest));
}

TEST_CASE("Coordinator completes without resume state when the store is unusable", "[coordinator][resume]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);

    // A regular file where the state directory's parent should be
    auto blocker = dir / "blocker";
    rangeget::test::write_file(blocker, "x");

    auto config = test_config();
    config.state_dir = (blocker / "state").string();

    DownloadCoordinator coordinator(transport, config);
    auto result = coordinator.run(URL, dest);

    CHECK(result.state == JobState::completed);
    CHECK(rangeget::test::read_file(dest) == body);
    CHECK(std::filesystem::is_regular_file(blocker));
    CHECK_FALSE(record_exists(dest));
}

TEST_CASE("Coordinator cancel applies to the running job only", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);

    DownloadCoordinator coordinator(transport, test_config());
    coordinator.cancel();

    auto result = coordinator.run(URL, dest);
    CHECK(result.state == JobState::completed);
    CHECK(rangeget::test::read_file(dest) == body);
}

TEST_CASE("Coordinator pause holds workers until resume", "[coordinator]") {
    TempDir dir;
    auto dest = dir / "data.bin";
    auto body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport(body);

    DownloadCoordinator coordinator(transport, test_config());
    std::atomic<bool> pause_sent{false};
    transport.on_chunk = [&](std::uint64_t offset) {
        if (offset == SEGMENT_3.start && !pause_sent.exchange(true)) coordinator.pause();
    };

    REQUIRE_FALSE(coordinator.start(URL, dest));
    REQUIRE(eventually([&] { return coordinator.paused(); }));

    // Segment 3 is held before its first byte
    std::this_thread::sleep_for(50ms);
    auto held = coordinator.segments();
    REQUIRE(held.size() == 8);
    CHECK(held[2].bytes_written == 0);
    CHECK(coordinator.state() == JobState::downloading);

    SECTION("Resume finishes the job") {
        coordinator.resume();
        CHECK_FALSE(coordinator.paused());

        auto result = coordinator.wait();
        CHECK(result.state == JobState::completed);
        CHECK(rangeget::test::read_file(dest) == body);
    }

    SECTION("Cancel while paused") {
        coordinator.cancel();
        auto result = coordinator.wait();

        CHECK(result.state == JobState::failed);
        CHECK(result.error == DownloadErrc::cancelled);
        CHECK(result.bytes_downloaded < BODY_SIZE);
        CHECK(record_exists(dest));
    }
}
