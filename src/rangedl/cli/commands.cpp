// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/cli/commands.hpp>
#include <rangedl/cli/progress_bar.hpp>
#include <rangedl/core/http_transport.hpp>
#include <rangedl/version.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

using namespace rangedl::core;

namespace rangedl::cli {

namespace {

// Coordinator that SIGINT should stop
std::atomic<DownloadCoordinator*> g_active{nullptr};

void on_interrupt(int) {
    if (auto* coordinator = g_active.load()) {
        coordinator->cancel();
    }
}

// "Name: value" -> {Name, value}
bool parse_header(std::string_view raw, Headers& out) {
    auto colon = raw.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    auto name = raw.substr(0, colon);
    auto value = raw.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
    }
    out[std::string(name)] = std::string(value);
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-s" || arg == "--single") {
            args.single = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                args.error = "missing value for " + arg;
                return args;
            }
            args.output = argv[++i];
        } else if (arg == "-n" || arg == "--segments") {
            if (i + 1 >= argc) {
                args.error = "missing value for " + arg;
                return args;
            }
            char* end = nullptr;
            unsigned long n = std::strtoul(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || n == 0 || n > 1024) {
                args.error = std::string("invalid segment count: ") + argv[i];
                return args;
            }
            args.segments = static_cast<std::uint32_t>(n);
        } else if (arg == "-H" || arg == "--header") {
            if (i + 1 >= argc || !parse_header(argv[i + 1], args.headers)) {
                args.error = "expected -H \"Name: value\"";
                return args;
            }
            ++i;
        } else if (arg.find("://") != std::string::npos) {
            args.urls.push_back(arg);
        } else {
            args.error = "unknown argument: " + arg;
            return args;
        }
    }

    return args;
}

DownloadOptions to_options(const CliArgs& args) {
    DownloadOptions options;
    options.segments = args.segments;
    options.multi_segment = !args.single;
    options.request.headers = args.headers;
    return options;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& url, const CliArgs& args) noexcept {
    try {
        HttpTransport transport;
        DownloadCoordinator coordinator(transport, to_options(args));

        ProgressBar bar(0, "Downloading");
        if (!args.quiet) {
            coordinator.callback([&bar](const DownloadProgress& p) {
                bar.total(p.total_bytes);
                bar.update(p.downloaded_bytes, p.speed_bps);
            });
        }

        g_active.store(&coordinator);
        auto previous = std::signal(SIGINT, on_interrupt);
        auto result = coordinator.run(url, args.output);
        std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);
        g_active.store(nullptr);

        if (!result) {
            if (!args.quiet) bar.clear();
            std::cerr << "Error: " << result.error().message() << std::endl;
            return std::unexpected(result.error());
        }

        if (*result == DownloadState::done) {
            if (!args.quiet) bar.finish();
            spdlog::info("saved {}", coordinator.file_path());
            return EXIT_DONE;
        }

        if (!args.quiet) bar.clear();
        std::cerr << "Download incomplete: " << coordinator.file_path()
                  << " (run again to resume)" << std::endl;
        return EXIT_INCOMPLETE;
    } catch (const std::exception& e) {
        g_active.store(nullptr);
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

CliResult info(const std::string& url, const CliArgs& args) noexcept {
    try {
        HttpTransport transport;
        RequestOptions request;
        request.headers = args.headers;

        auto response = transport.probe(url, request);
        if (!response) {
            std::cerr << "Error: " << response.error().message() << std::endl;
            return std::unexpected(response.error());
        }

        std::cout << "URL: " << url << '\n';
        std::cout << "Status: " << response->status_code << '\n';
        std::cout << "Content-Length: " << response->content_length << '\n';
        std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << '\n';
        std::cout << "ETag: " << (response->etag.empty() ? "(none)" : response->etag) << std::endl;
        return EXIT_DONE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

void print_help(std::string_view program_name) {
    std::cout << "rangedl " << rangedl::version.to_string() << " - resumable segmented downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, errors only)\n";
    std::cout << "  -o, --output <PATH>     Save to file, or into directory\n";
    std::cout << "  -n, --segments <N>      Number of segments (default: " << DEFAULT_SEGMENTS << ")\n";
    std::cout << "  -s, --single            Download in one stream\n";
    std::cout << "  -H, --header <H>        Extra request header \"Name: value\"\n";
    std::cout << "  -i, --info              Show resource info without downloading\n";
    std::cout << "\n";
    std::cout << "An interrupted download resumes when run again with the same output.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o downloads/ -n 8 https://example.com/large.iso\n";
}

void print_version() {
    std::cout << "rangedl " << rangedl::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace rangedl::cli
