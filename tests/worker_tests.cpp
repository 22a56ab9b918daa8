// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include "fake_transport.hpp"
#include <rangedl/core/cancellation.hpp>
#include <rangedl/core/segment_table.hpp>
#include <rangedl/core/worker.hpp>
#include <rangedl/core/config.hpp>
#include <chrono>
#include <filesystem>

using namespace rangedl::core;
using rangedl::test::FakeTransport;
using rangedl::test::TempDir;
using rangedl::test::make_body;
using rangedl::test::read_file;
using rangedl::test::write_file;

TEST_CASE("RequestOptions::with_range derives a copy", "[worker]") {
    RequestOptions base;
    base.headers["Authorization"] = "Bearer abc";

    auto ranged = base.with_range(10, 19);

    CHECK(ranged.headers.at("Range") == "bytes=10-19");
    CHECK(ranged.headers.at("Authorization") == "Bearer abc");
    CHECK(base.headers.count("Range") == 0);
    CHECK(base.headers.size() == 1);
}

TEST_CASE("SegmentWorker fetches its range", "[worker]") {
    TempDir dir;
    const std::string file = dir.file("f.bin");
    const std::string body = make_body(100);
    FakeTransport transport(body);
    CancellationSignal signal;
    RequestOptions base;

    auto table = partition("https://example.com/f.bin", file, 4, 100);
    REQUIRE(table.has_value());
    const std::string part = table->segments[1].path;

    SECTION("Fresh segment requests its whole range") {
        SegmentWorker worker(*table, 1, signal, transport, base);
        worker.run();

        CHECK(transport.ranges() == std::vector<std::string>{"bytes=25-49"});
        CHECK(worker.state().is_completed());
        CHECK(worker.state().is_finished());
        CHECK(worker.state().downloaded.load() == 25);
        CHECK_FALSE(worker.state().error);
        CHECK(read_file(part) == body.substr(25, 25));
    }

    SECTION("Partial segment resumes after the bytes on disk") {
        write_file(part, body.substr(25, 10));

        SegmentWorker worker(*table, 1, signal, transport, base);
        std::uint64_t downloaded_at_first_chunk = 0;
        transport.hook = [&](const std::string&, std::size_t chunk_index) {
            if (chunk_index == 0) {
                downloaded_at_first_chunk = worker.state().downloaded.load();
            }
        };
        worker.run();

        CHECK(transport.ranges() == std::vector<std::string>{"bytes=35-49"});
        CHECK(downloaded_at_first_chunk == 10);
        CHECK(worker.state().is_completed());
        CHECK(read_file(part) == body.substr(25, 25));
    }

    SECTION("Oversized segment file is discarded and refetched") {
        write_file(part, std::string(40, 'x'));

        SegmentWorker worker(*table, 1, signal, transport, base);
        worker.run();

        CHECK(transport.ranges() == std::vector<std::string>{"bytes=25-49"});
        CHECK(worker.state().is_completed());
        CHECK(read_file(part) == body.substr(25, 25));
    }

    SECTION("Complete segment issues no request") {
        write_file(part, body.substr(25, 25));

        SegmentWorker worker(*table, 1, signal, transport, base);
        worker.run();

        CHECK(transport.ranges().empty());
        CHECK(worker.state().is_completed());
        CHECK(worker.state().downloaded.load() == 25);
    }

    SECTION("Last segment asks for one past the final byte") {
        SegmentWorker worker(*table, 3, signal, transport, base);
        worker.run();

        CHECK(transport.ranges() == std::vector<std::string>{"bytes=75-100"});
        CHECK(worker.state().is_completed());
        CHECK(read_file(table->segments[3].path) == body.substr(75, 25));
    }

    SECTION("Base headers travel with every range request") {
        base.headers["Cookie"] = "session=1";

        SegmentWorker worker(*table, 0, signal, transport, base);
        worker.run();

        auto requests = transport.requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].at("Cookie") == "session=1");
        CHECK(requests[0].at("Range") == "bytes=0-24");
        CHECK(base.headers.count("Range") == 0);
    }

    SECTION("Already cancelled worker stops after one chunk") {
        signal.set();

        SegmentWorker worker(*table, 1, signal, transport, base);
        worker.run();

        CHECK_FALSE(worker.state().is_completed());
        CHECK(worker.state().is_finished());
        CHECK(worker.state().downloaded.load() == 5);
        CHECK_FALSE(worker.state().error);
        CHECK(read_file(part) == body.substr(25, 5));
    }

    SECTION("Stream ending early leaves the segment incomplete") {
        FakeTransport short_transport(body.substr(0, 90));

        SegmentWorker worker(*table, 3, signal, short_transport, base);
        worker.run();

        CHECK_FALSE(worker.state().is_completed());
        CHECK(worker.state().is_finished());
        CHECK(worker.state().downloaded.load() == 15);
        CHECK(worker.state().error == DownloadErrc::incomplete);
        CHECK_FALSE(signal.is_set());
    }
}

TEST_CASE("SegmentWorker failure stops its siblings", "[worker][slow]") {
    TempDir dir;
    const std::string file = dir.file("f.bin");
    const std::string body = make_body(100);
    FakeTransport transport(body);
    transport.fail_at_offset = 25;
    transport.fail_at_chunk = 2;
    CancellationSignal signal;
    RequestOptions base;

    auto table = partition("https://example.com/f.bin", file, 4, 100);
    REQUIRE(table.has_value());

    SegmentWorker worker(*table, 1, signal, transport, base);
    worker.run();

    CHECK(signal.is_set());
    CHECK_FALSE(worker.state().is_completed());
    CHECK(worker.state().is_finished());
    CHECK(worker.state().error == DownloadErrc::network_error);
    // Bytes already written stay on disk for the next attempt
    CHECK(worker.state().downloaded.load() == 10);
    CHECK(read_file(table->segments[1].path) == body.substr(25, 10));
}

TEST_CASE("WholeFileWorker streams the entire resource", "[worker]") {
    TempDir dir;
    const std::string file = dir.file("whole.bin");
    const std::string body = make_body(73);
    FakeTransport transport(body, 8);
    CancellationSignal signal;
    RequestOptions base;

    SECTION("Writes the body without a Range header") {
        WholeFileWorker worker("https://example.com/whole.bin", file, signal, transport, base);
        worker.run();

        CHECK(transport.ranges() == std::vector<std::string>{""});
        CHECK(worker.state().is_completed());
        CHECK(worker.state().downloaded.load() == 73);
        CHECK(read_file(file) == body);
    }

    SECTION("Existing content is replaced") {
        write_file(file, std::string(500, 'z'));

        WholeFileWorker worker("https://example.com/whole.bin", file, signal, transport, base);
        worker.run();

        CHECK(worker.state().is_completed());
        CHECK(read_file(file) == body);
    }

    SECTION("Transport error sets the signal") {
        transport.fail_at_offset = 0;
        transport.fail_at_chunk = 1;

        WholeFileWorker worker("https://example.com/whole.bin", file, signal, transport, base);
        worker.run();

        CHECK(signal.is_set());
        CHECK_FALSE(worker.state().is_completed());
        CHECK(worker.state().is_finished());
        CHECK(worker.state().error == DownloadErrc::network_error);
    }
}

TEST_CASE("SegmentWorker aborts when its file cannot be inspected", "[worker][slow]") {
    TempDir dir;
    // Self-referencing link: stat on anything below it fails with ELOOP
    const auto loop = dir.path() / "loop";
    std::filesystem::create_directory_symlink(loop, loop);
    const std::string file = (loop / "f.bin").string();

    FakeTransport transport(make_body(100));
    CancellationSignal signal;
    RequestOptions base;

    auto table = partition("https://example.com/f.bin", file, 4, 100);
    REQUIRE(table.has_value());

    SegmentWorker worker(*table, 1, signal, transport, base);
    auto started = std::chrono::steady_clock::now();
    worker.run();
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(signal.is_set());
    CHECK(worker.state().error);
    CHECK_FALSE(worker.state().is_completed());
    CHECK(worker.state().is_finished());
    CHECK(transport.ranges().empty());
    // Siblings get the grace period before the worker reports
    CHECK(elapsed >= ERROR_GRACE_PERIOD);
}
