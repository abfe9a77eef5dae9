// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangeget/core/config.hpp>
#include <rangeget/core/segment.hpp>
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"
#include <chrono>
#include <thread>

using namespace rangeget::core;
using namespace std::chrono_literals;
using rangeget::test::FakeTransport;
using rangeget::test::TempDir;

namespace {

constexpr std::uint64_t BODY_SIZE = 10'000;

struct WorkerFixture {
    TempDir dir;
    std::string body = rangeget::test::make_body(BODY_SIZE);
    FakeTransport transport{body};
    rangeget::disk::FileWriter writer;
    std::string path = (dir / "out.bin").string();

    WorkerFixture() {
        if (auto ec = writer.open(path, rangeget::disk::OpenMode::truncate, BODY_SIZE)) {
            throw std::system_error(ec);
        }
    }

    WorkerOptions options() const {
        WorkerOptions opts;
        opts.chunk_size = 512;
        opts.max_retries = 3;
        opts.retry_backoff = 1ms;
        opts.total_size = BODY_SIZE;
        return opts;
    }

    std::string slice(const ByteRange& range) {
        writer.close();
        return rangeget::test::read_file(path).substr(range.start, range.size());
    }
};

} // namespace

TEST_CASE("Segment counters", "[segment]") {
    Segment segment(0, ByteRange{100, 200});
    CHECK(segment.status() == SegmentStatus::pending);
    CHECK_FALSE(segment.complete());

    segment.add_written(60);
    CHECK(segment.bytes_written() == 60);
    CHECK(segment.bytes_durable() == 0);
    CHECK(*segment.percent() == Catch::Approx(60.0));

    segment.mark_durable();
    segment.add_written(20);
    segment.rewind_to_durable();
    CHECK(segment.bytes_written() == 60);

    SECTION("restore clamps to the range") {
        segment.restore(500, SegmentStatus::pending);
        CHECK(segment.bytes_durable() == 100);
        CHECK(segment.complete());
    }

    SECTION("restore resets the retry budget") {
        segment.add_retry();
        segment.add_retry();
        segment.restore(10, SegmentStatus::pending);
        CHECK(segment.retries() == 0);
        CHECK(segment.bytes_written() == 10);
    }
}

TEST_CASE("SegmentStatus names", "[segment]") {
    CHECK(to_string(SegmentStatus::in_progress) == "in-progress");
    CHECK(segment_status_from_string("done") == SegmentStatus::done);
    CHECK_FALSE(segment_status_from_string("finished").has_value());
}

TEST_CASE("PauseGate", "[segment]") {
    PauseGate gate;
    std::stop_source stop;

    CHECK_FALSE(gate.paused());
    CHECK(gate.wait(stop.get_token()));

    gate.pause();
    CHECK(gate.paused());

    // A stop releases a paused wait
    stop.request_stop();
    CHECK_FALSE(gate.wait(stop.get_token()));

    gate.resume();
    CHECK_FALSE(gate.paused());
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker writes its own range", "[segment][worker]") {
    ByteRange range{2000, 5000};
    Segment segment(1, range);
    int notified = 0;
    SegmentWorker worker(segment, transport, writer, "https://example.com/f", options(), [&] { ++notified; });

    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::done);
    CHECK(segment.bytes_durable() == range.size());
    CHECK(notified == 1);

    auto transfers = transport.transfers();
    REQUIRE(transfers.size() == 1);
    CHECK(transfers[0] == ByteRange{2000, 5000});
    CHECK(slice(range) == body.substr(2000, 3000));
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker resumes from the durable offset after a drop", "[segment][worker]") {
    ByteRange range{2000, 5000};
    Segment segment(1, range);
    transport.fail_in(range, 1, 1500);

    SegmentWorker worker(segment, transport, writer, "https://example.com/f", options());
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::done);
    CHECK(segment.retries() == 1);

    auto transfers = transport.transfers();
    REQUIRE(transfers.size() == 2);
    CHECK(transfers[0] == ByteRange{2000, 5000});
    CHECK(transfers[1] == ByteRange{3500, 5000});
    CHECK(slice(range) == body.substr(2000, 3000));
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker skips the durable prefix without ranges", "[segment][worker]") {
    ByteRange range{0, BODY_SIZE};
    Segment segment(0, range);
    transport.honor_ranges = false;
    transport.fail_in(range, 1, 3000);

    auto opts = options();
    opts.range_requests = false;
    SegmentWorker worker(segment, transport, writer, "https://example.com/f", opts);
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::done);
    auto transfers = transport.transfers();
    REQUIRE(transfers.size() == 2);
    CHECK_FALSE(transfers[0].has_value());
    CHECK_FALSE(transfers[1].has_value());
    CHECK(slice(range) == body);
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker rejects a full body for a partial request", "[segment][worker]") {
    ByteRange range{5000, BODY_SIZE};
    Segment segment(1, range);
    transport.honor_ranges = false;

    SegmentWorker worker(segment, transport, writer, "https://example.com/f", options());
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::failed);
    CHECK(segment.error() == DownloadErrc::range_not_honored);
    CHECK(segment.bytes_durable() == 0);
    CHECK(transport.transfers().size() == 1);
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker treats extra bytes as a size change", "[segment][worker]") {
    ByteRange range{0, 4000};
    Segment segment(0, range);
    transport.honor_ranges = false;

    auto opts = options();
    opts.total_size.reset();
    SegmentWorker worker(segment, transport, writer, "https://example.com/f", opts);
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::failed);
    CHECK(segment.error() == DownloadErrc::integrity_mismatch);
    CHECK(segment.bytes_written() == 4000);
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker gives up after max_retries", "[segment][worker]") {
    ByteRange range{0, 5000};
    Segment segment(0, range);
    transport.fail_in(range, FakeTransport::ALWAYS, 1000);

    auto opts = options();
    opts.max_retries = 2;
    SegmentWorker worker(segment, transport, writer, "https://example.com/f", opts);
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::failed);
    CHECK(segment.error() == DownloadErrc::connection_lost);
    CHECK(segment.retries() == 2);
    CHECK(transport.transfers().size() == 3);

    // Progress made before each drop is kept
    CHECK(segment.bytes_durable() == 3000);
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker backoff is capped and stoppable", "[segment][worker]") {
    ByteRange range{0, 5000};
    Segment segment(0, range);
    transport.fail_in(range, 1, 1000);

    auto opts = options();
    opts.retry_backoff = std::chrono::hours(1);
    SegmentWorker worker(segment, transport, writer, "https://example.com/f", opts);

    std::stop_source stop;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });

    auto started = std::chrono::steady_clock::now();
    worker.run(stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed < MAX_RETRY_BACKOFF);
    CHECK(segment.status() == SegmentStatus::pending);
    CHECK(segment.retries() == 1);
    CHECK(segment.bytes_durable() == 1000);
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker does not retry permanent errors", "[segment][worker]") {
    ByteRange range{0, 5000};
    Segment segment(0, range);
    transport.fail_in(range, FakeTransport::ALWAYS, 0, make_error_code(DownloadErrc::not_found));

    SegmentWorker worker(segment, transport, writer, "https://example.com/f", options());
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::failed);
    CHECK(segment.error() == DownloadErrc::not_found);
    CHECK(segment.retries() == 0);
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker stops at a resumable point", "[segment][worker]") {
    ByteRange range{0, BODY_SIZE};
    Segment segment(0, range);
    transport.chunk = 1000;

    std::stop_source stop;
    transport.on_chunk = [&](std::uint64_t offset) {
        if (offset >= 4000) stop.request_stop();
    };

    SegmentWorker worker(segment, transport, writer, "https://example.com/f", options());
    worker.run(stop.get_token());

    CHECK(segment.status() == SegmentStatus::pending);
    CHECK(segment.retries() == 0);
    CHECK(segment.bytes_durable() >= 4000);
    CHECK(segment.bytes_durable() < BODY_SIZE);
    CHECK(slice(ByteRange{0, segment.bytes_durable()}) == body.substr(0, segment.bytes_durable()));
}

TEST_CASE_METHOD(WorkerFixture, "SegmentWorker finishes an empty range without a request", "[segment][worker]") {
    Segment segment(0, ByteRange{0, 0});
    SegmentWorker worker(segment, transport, writer, "https://example.com/f", options());
    worker.run(std::stop_token{});

    CHECK(segment.status() == SegmentStatus::done);
    CHECK(transport.transfers().empty());
}
