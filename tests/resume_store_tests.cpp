// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangeget/core/resume_store.hpp>
#include "support/temp_dir.hpp"

using namespace rangeget::core;
using rangeget::test::TempDir;

namespace {

ResumeRecord sample_record(const std::string& destination) {
    ResumeRecord record;
    record.url = "https://example.com/big.iso";
    record.destination = destination;
    record.total_size = 3000;
    record.range_supported = true;
    record.etag = "\"v1\"";
    record.segments = {
        {0, 1000, 1000, SegmentStatus::done, 0},
        {1000, 2000, 420, SegmentStatus::pending, 1},
        {2000, 3000, 0, SegmentStatus::failed, 3},
    };
    return record;
}

} // namespace

TEST_CASE("ResumeStore::job_key", "[resume]") {
    auto key = ResumeStore::job_key("https://example.com/a.bin", "/tmp/a.bin");

    CHECK(key.size() == 64);
    CHECK(key.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(key == ResumeStore::job_key("https://example.com/a.bin", "/tmp/a.bin"));
    CHECK(key == ResumeStore::job_key("https://example.com/a.bin", "/tmp/./a.bin"));
    CHECK(key != ResumeStore::job_key("https://example.com/a.bin", "/tmp/b.bin"));
    CHECK(key != ResumeStore::job_key("https://example.com/b.bin", "/tmp/a.bin"));
}

TEST_CASE("ResumeStore::record_path", "[resume]") {
    const std::string key(64, 'a');

    SECTION("Beside the destination by default") {
        ResumeStore store;
        auto path = store.record_path(key, "/data/out/movie.mkv");
        CHECK(path.parent_path() == std::filesystem::path("/data/out"));
        CHECK(path.filename().string() == ".movie.mkv.aaaaaaaaaaaaaaaa.rgresume");
    }

    SECTION("Inside the state directory when configured") {
        ResumeStore store("/var/lib/rangeget");
        auto path = store.record_path(key, "/data/out/movie.mkv");
        CHECK(path == std::filesystem::path("/var/lib/rangeget") / (key + ".rgresume"));
    }
}

TEST_CASE("ResumeStore save and load", "[resume]") {
    TempDir dir;
    auto destination = dir / "big.iso";
    auto key = ResumeStore::job_key("https://example.com/big.iso", destination);

    SECTION("Missing record is not an error") {
        ResumeStore store;
        auto loaded = store.load(key, destination);
        REQUIRE(loaded.has_value());
        CHECK_FALSE(loaded->has_value());
    }

    SECTION("Saved record loads back unchanged") {
        ResumeStore store;
        auto record = sample_record(destination.string());
        REQUIRE_FALSE(store.save(key, destination, record));

        auto loaded = store.load(key, destination);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        CHECK(**loaded == record);

        // Temp file is renamed away
        auto tmp = store.record_path(key, destination);
        tmp += ".tmp";
        CHECK_FALSE(std::filesystem::exists(tmp));
    }

    SECTION("Later save replaces the earlier one") {
        ResumeStore store;
        auto record = sample_record(destination.string());
        REQUIRE_FALSE(store.save(key, destination, record));
        record.segments[1].bytes_written = 1000;
        record.segments[1].status = SegmentStatus::done;
        REQUIRE_FALSE(store.save(key, destination, record));

        auto loaded = store.load(key, destination);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        CHECK((*loaded)->segments[1].bytes_written == 1000);
    }

    SECTION("State directory is created on demand") {
        ResumeStore store(dir / "state" / "nested");
        REQUIRE_FALSE(store.save(key, destination, sample_record(destination.string())));
        CHECK(std::filesystem::exists(store.record_path(key, destination)));
    }

    SECTION("Failed save leaves no temp file") {
        ResumeStore store;
        auto path = store.record_path(key, destination);
        // A non-empty directory in the record's place makes the rename fail
        std::filesystem::create_directories(path / "occupied");

        CHECK(store.save(key, destination, sample_record(destination.string())) ==
              DownloadErrc::state_store_failure);

        auto tmp = path;
        tmp += ".tmp";
        CHECK_FALSE(std::filesystem::exists(tmp));
        CHECK(std::filesystem::is_directory(path));
    }

    SECTION("Remove deletes the record") {
        ResumeStore store;
        REQUIRE_FALSE(store.save(key, destination, sample_record(destination.string())));
        CHECK_FALSE(store.remove(key, destination));
        CHECK_FALSE(std::filesystem::exists(store.record_path(key, destination)));

        // Removing twice is fine
        CHECK_FALSE(store.remove(key, destination));
    }
}

TEST_CASE("ResumeStore rejects malformed records", "[resume]") {
    TempDir dir;
    auto destination = dir / "big.iso";
    auto key = ResumeStore::job_key("https://example.com/big.iso", destination);
    ResumeStore store;
    auto path = store.record_path(key, destination);

    SECTION("Not JSON") {
        rangeget::test::write_file(path, "{ this is not json");
    }

    SECTION("Missing fields") {
        rangeget::test::write_file(path, R"({"version": 1, "url": "x"})");
    }

    SECTION("Unknown format version") {
        auto record = sample_record(destination.string());
        record.version = RESUME_FORMAT_VERSION + 1;
        REQUIRE_FALSE(store.save(key, destination, record));
    }

    SECTION("Progress beyond the segment end") {
        auto record = sample_record(destination.string());
        record.segments[1].bytes_written = 5000;
        REQUIRE_FALSE(store.save(key, destination, record));
    }

    auto loaded = store.load(key, destination);
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error() == DownloadErrc::resume_record_invalid);
}
