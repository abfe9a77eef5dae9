// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/cli/commands.hpp>
#include <rangeget/core/http_session.hpp>
#include <rangeget/log.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace rangeget::cli;

namespace {

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

extern "C" void on_interrupt(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

// Terminate handler to report exceptions escaping noexcept functions
void rangeget_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(rangeget_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }
    if (args.command == Command::none) {
        print_help(argv[0]);
        return EXIT_USAGE;
    }

    // Log lines would tear the in-place progress block, so only warnings by default
    if (args.verbose) {
        rangeget::log::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        rangeget::log::set_level(spdlog::level::err);
    } else {
        rangeget::log::set_level(spdlog::level::warn);
    }

    if (auto ec = rangeget::core::HttpSession::global_init()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return EXIT_FAILED;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    int exit_code = EXIT_OK;
    if (args.command == Command::info) {
        for (const auto& url : args.urls) {
            if (!info(url)) {
                exit_code = EXIT_FAILED;
            }
        }
    } else {
        CliResult result = download(args, g_interrupted);
        exit_code = result ? *result : EXIT_FAILED;
    }

    rangeget::core::HttpSession::global_cleanup();
    return exit_code;
}
