// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangedl/cli/commands.hpp>
#include <string>
#include <vector>

using namespace rangedl::cli;

namespace {

// Owns argv storage for parse_args
CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "rangedl");
    std::vector<char*> argv;
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("Defaults") {
        auto args = parse({"https://example.com/a.bin"});
        CHECK(args.error.empty());
        REQUIRE(args.urls.size() == 1);
        CHECK(args.urls[0] == "https://example.com/a.bin");
        CHECK(args.segments == rangedl::core::DEFAULT_SEGMENTS);
        CHECK_FALSE(args.single);
        CHECK(args.output.empty());
    }

    SECTION("All options") {
        auto args = parse({"-o", "out/", "-n", "8", "-s", "-q", "-V", "-i",
                           "-H", "Authorization: Bearer t",
                           "https://a.example/1", "http://b.example/2"});
        CHECK(args.error.empty());
        CHECK(args.output == "out/");
        CHECK(args.segments == 8);
        CHECK(args.single);
        CHECK(args.quiet);
        CHECK(args.verbose);
        CHECK(args.info);
        CHECK(args.headers.at("Authorization") == "Bearer t");
        CHECK(args.urls.size() == 2);
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"-h", "--bogus"}).help);
        CHECK(parse({"--version"}).version);
    }

    SECTION("Bad segment counts") {
        CHECK_FALSE(parse({"-n", "0", "https://x.example/"}).error.empty());
        CHECK_FALSE(parse({"-n", "2000", "https://x.example/"}).error.empty());
        CHECK_FALSE(parse({"-n", "4x", "https://x.example/"}).error.empty());
        CHECK_FALSE(parse({"-n"}).error.empty());
    }

    SECTION("Bad headers and unknown flags") {
        CHECK_FALSE(parse({"-H", "no-colon"}).error.empty());
        CHECK_FALSE(parse({"--frobnicate"}).error.empty());
        CHECK_FALSE(parse({"-o"}).error.empty());
    }
}

TEST_CASE("to_options", "[cli]") {
    auto args = parse({"-n", "3", "-s", "-H", "X-Test: 1", "https://x.example/"});
    auto options = to_options(args);

    CHECK(options.segments == 3);
    CHECK_FALSE(options.multi_segment);
    CHECK(options.request.headers.at("X-Test") == "1");
    CHECK(options.request.headers.count("Range") == 0);
}
