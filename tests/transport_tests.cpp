// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/core/transport.hpp>
#include <rangeget/disk/error.hpp>

using namespace rangeget::core;

TEST_CASE("ByteRange", "[transport]") {
    ByteRange bounded{100, 250};
    CHECK(bounded.bounded());
    CHECK(bounded.size() == 150);
    CHECK_FALSE(bounded.empty());

    ByteRange open{4096};
    CHECK_FALSE(open.bounded());
    CHECK(open.size() == 0);

    CHECK(ByteRange{0, 0}.empty());
}

TEST_CASE("parse_content_range", "[transport]") {
    SECTION("Full form") {
        auto cr = parse_content_range("bytes 0-0/1048576");
        REQUIRE(cr.has_value());
        CHECK(cr->first == 0u);
        CHECK(cr->last == 0u);
        CHECK(cr->complete_length == 1048576u);
    }

    SECTION("Unknown complete length") {
        auto cr = parse_content_range("bytes 100-199/*");
        REQUIRE(cr.has_value());
        CHECK(cr->first == 100u);
        CHECK_FALSE(cr->complete_length.has_value());
    }

    SECTION("Unsatisfied range") {
        auto cr = parse_content_range("bytes */0");
        REQUIRE(cr.has_value());
        CHECK_FALSE(cr->first.has_value());
        CHECK(cr->complete_length == 0u);
    }

    SECTION("Malformed values") {
        CHECK_FALSE(parse_content_range("items 0-1/2").has_value());
        CHECK_FALSE(parse_content_range("bytes 5-1/10").has_value());
        CHECK_FALSE(parse_content_range("bytes 0-1").has_value());
        CHECK_FALSE(parse_content_range("bytes a-b/10").has_value());
    }
}

TEST_CASE("decode_headers", "[transport]") {
    HttpResponse response;
    response.status_code = 206;
    response.headers["content-length"] = "1024";
    response.headers["content-range"] = "bytes 1024-2047/4096";
    response.headers["accept-ranges"] = "bytes";
    response.headers["etag"] = "\"abc123\"";
    response.headers["content-type"] = "application/zip";
    response.headers["content-disposition"] = "attachment; filename=\"archive.zip\"";

    decode_headers(response);

    CHECK(response.content_length == 1024u);
    REQUIRE(response.content_range.has_value());
    CHECK(response.content_range->first == 1024u);
    CHECK(response.content_range->complete_length == 4096u);
    CHECK(response.accepts_ranges);
    CHECK(response.etag == "\"abc123\"");
    CHECK(response.content_type == "application/zip");
    CHECK(response.filename == "archive.zip");
}

TEST_CASE("status_to_error", "[transport][error]") {
    CHECK_FALSE(status_to_error(200));
    CHECK_FALSE(status_to_error(206));
    CHECK(status_to_error(404) == DownloadErrc::not_found);
    CHECK(status_to_error(403) == DownloadErrc::permission_denied);
    CHECK(status_to_error(408) == DownloadErrc::timeout);
    CHECK(status_to_error(429) == DownloadErrc::server_error);
    CHECK(status_to_error(416) == DownloadErrc::client_error);
    CHECK(status_to_error(503) == DownloadErrc::server_error);
}

TEST_CASE("Transient error classification", "[error]") {
    CHECK(is_transient(make_error_code(DownloadErrc::connection_lost)));
    CHECK(is_transient(make_error_code(DownloadErrc::timeout)));
    CHECK(is_transient(status_to_error(502)));
    CHECK(is_transient(status_to_error(429)));

    CHECK_FALSE(is_transient(status_to_error(404)));
    CHECK_FALSE(is_transient(make_error_code(DownloadErrc::range_not_honored)));
    CHECK_FALSE(is_transient(make_error_code(DownloadErrc::cancelled)));
    CHECK_FALSE(is_transient(make_error_code(rangeget::disk::DiskErrc::disk_full)));
}

TEST_CASE("Error categories", "[error]") {
    auto ec = make_error_code(DownloadErrc::integrity_mismatch);
    CHECK(std::string(ec.category().name()) == "rangeget::download");
    CHECK_FALSE(ec.message().empty());

    auto disk_ec = rangeget::disk::from_errno(ENOSPC, rangeget::disk::DiskErrc::write_error);
    CHECK(disk_ec == rangeget::disk::DiskErrc::disk_full);
    CHECK(std::string(disk_ec.category().name()) == "rangeget::disk");

    CHECK(rangeget::disk::from_errno(EIO, rangeget::disk::DiskErrc::sync_error)
          == rangeget::disk::DiskErrc::sync_error);
}
