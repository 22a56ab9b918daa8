// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangedl/core/file_path.hpp>
#include <rangedl/core/url.hpp>
#include "fake_transport.hpp"

using namespace rangedl::core;
using rangedl::test::TempDir;

TEST_CASE("URL parsing", "[url]") {
    SECTION("Simple HTTP URL") {
        auto url = Url::parse("http://example.com/file.zip");
        REQUIRE(url.has_value());
        CHECK(url->scheme() == "http");
        CHECK(url->host() == "example.com");
        CHECK(url->path() == "/file.zip");
        CHECK(url->port().empty());
        CHECK(url->query().empty());
    }

    SECTION("HTTPS URL with port") {
        auto url = Url::parse("https://example.com:8443/path/to/file.bin");
        REQUIRE(url.has_value());
        CHECK(url->scheme() == "https");
        CHECK(url->port() == "8443");
        CHECK(url->path() == "/path/to/file.bin");
    }

    SECTION("Scheme is case-insensitive") {
        auto url = Url::parse("HTTPS://Example.com/a");
        REQUIRE(url.has_value());
        CHECK(url->scheme() == "https");
        CHECK(url->str() == "HTTPS://Example.com/a");
    }

    SECTION("Query and fragment") {
        auto url = Url::parse("https://example.com/get?id=1&x=2#part");
        REQUIRE(url.has_value());
        CHECK(url->path() == "/get");
        CHECK(url->query() == "id=1&x=2");
    }

    SECTION("Credentials are not part of the host") {
        auto url = Url::parse("ftp://user:pw@files.example.com/pub/a.tar");
        REQUIRE(url.has_value());
        CHECK(url->host() == "files.example.com");
        CHECK(url->port().empty());
    }

    SECTION("IPv6 literal") {
        auto url = Url::parse("http://[::1]:8080/x");
        REQUIRE(url.has_value());
        CHECK(url->host() == "[::1]");
        CHECK(url->port() == "8080");
    }

    SECTION("Host only") {
        auto url = Url::parse("https://example.com");
        REQUIRE(url.has_value());
        CHECK(url->path() == "/");
    }

    SECTION("Invalid URLs") {
        CHECK_FALSE(Url::parse("not-a-url").has_value());
        CHECK_FALSE(Url::parse("://example.com").has_value());
        CHECK_FALSE(Url::parse("http:///file").has_value());
        CHECK(Url::parse("example.com/file").error() == DownloadErrc::invalid_url);
    }
}

TEST_CASE("URL filename", "[url]") {
    CHECK(Url::parse("https://example.com/dir/file.zip")->filename() == "file.zip");
    CHECK(Url::parse("https://example.com/dir/")->filename() == "index.html");
    CHECK(Url::parse("https://example.com")->filename() == "index.html");
    CHECK(Url::parse("https://example.com/a%20b%2Bc.txt?x=1")->filename() == "a b+c.txt");
}

TEST_CASE("percent_decode", "[url]") {
    CHECK(percent_decode("plain") == "plain");
    CHECK(percent_decode("a%2Fb") == "a/b");
    CHECK(percent_decode("%41%42%43") == "ABC");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz") == "%zz");
    CHECK(percent_decode("%4") == "%4");
}

TEST_CASE("Content-Disposition filename", "[file_path]") {
    CHECK(parse_content_disposition("attachment; filename=\"report.pdf\"") == "report.pdf");
    CHECK(parse_content_disposition("attachment; filename=data.csv; size=10") == "data.csv");
    CHECK(parse_content_disposition("attachment; filename='q.txt'") == "q.txt");
    CHECK(parse_content_disposition("attachment; filename=\"a%20b.txt\"") == "a b.txt");
    CHECK(parse_content_disposition("inline").empty());
}

TEST_CASE("resolve_file_path", "[file_path]") {
    TempDir dir;
    auto url = *Url::parse("https://example.com/pub/archive.tar.gz");
    Headers none;

    SECTION("No requested path uses the URL's name") {
        CHECK(resolve_file_path(url, none, "") == "archive.tar.gz");
    }

    SECTION("Directory gets the name appended") {
        auto path = resolve_file_path(url, none, dir.path().string());
        CHECK(path == (dir.path() / "archive.tar.gz").string());
    }

    SECTION("File path is used verbatim") {
        auto requested = dir.file("custom.bin");
        CHECK(resolve_file_path(url, none, requested) == requested);
    }

    SECTION("Header name replaces the URL's") {
        Headers headers{{"content-disposition", "attachment; filename=\"real.iso\""}};
        CHECK(resolve_file_path(url, headers, "") == "real.iso");
    }

    SECTION("Server cannot choose a directory") {
        Headers headers{{"content-disposition", "attachment; filename=\"../../etc/passwd\""}};
        CHECK(resolve_file_path(url, headers, "") == "passwd");
    }
}
