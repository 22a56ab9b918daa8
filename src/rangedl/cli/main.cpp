// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/cli/commands.hpp>
#include <rangedl/core/http_transport.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

using namespace rangedl::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_DONE;
    }
    if (args.version) {
        print_version();
        return EXIT_DONE;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_ERROR;
    }
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_ERROR;
    }

    // Logs go to stderr so they never tear the progress bar
    spdlog::set_default_logger(spdlog::stderr_color_mt("rangedl"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    if (args.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    rangedl::core::HttpTransport::global_init();

    int exit_code = EXIT_DONE;
    for (const auto& url : args.urls) {
        auto result = args.info ? info(url, args) : download(url, args);
        if (!result) {
            exit_code = EXIT_ERROR;
        } else if (*result != EXIT_DONE && exit_code == EXIT_DONE) {
            exit_code = *result;
        }
    }

    rangedl::core::HttpTransport::global_cleanup();
    return exit_code;
}
