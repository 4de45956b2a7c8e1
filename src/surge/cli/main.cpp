// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <thread>
#include <fmt/format.h>

using namespace surge::cli;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

} // namespace

// An exception escaping a noexcept download path ends up here
static void surge_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::fputs("surge: fatal error, std::terminate called\n", stderr);
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "surge: uncaught exception: %s\n", e.what());
        } catch (...) {
            std::fputs("surge: uncaught non-standard exception\n", stderr);
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(surge_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        fmt::print(stderr, "Error: {}\nUse -h for help\n", args.error);
        return EXIT_FAILURE_STATUS;
    }
    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }

    std::signal(SIGINT, on_sigint);

    // The download runs on a worker so this thread can turn Ctrl-C into a stop request
    std::atomic<bool> finished{false};
    int exit_code = EXIT_FAILURE_STATUS;
    std::jthread worker([&](std::stop_token stop) {
        exit_code = run(args, stop);
        finished.store(true, std::memory_order_release);
    });

    while (!finished.load(std::memory_order_acquire)) {
        if (g_interrupted && !worker.get_stop_token().stop_requested()) {
            worker.request_stop();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.join();

    return exit_code;
}
