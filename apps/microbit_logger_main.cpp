#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "ble_session.h"
#include "http_client.h"
#include "logging.h"
#include "options.h"
#include "session.h"
#include "stop_signal.h"

static std::atomic_int g_interrupts{0};

static void handle_sigint(int) {
    ++g_interrupts;
}

static bool interrupted() {
    return g_interrupts.load() > 0;
}

int main(int argc, char* argv[]) {
    CliArgs args;
    CLI::App app{"Connect to a micro:bit over BLE and print characteristic updates."};
    add_cli_options(app, args);
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_exit_code(app, e, std::cout, std::cerr);
    }

    configure_logging(args.verbose);

    LoggerOptions opts;
    try {
        opts = validate_options(args);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handle_sigint);

    AsioHttpPoster poster;
    SessionHooks hooks;
    hooks.interrupts = [] { return g_interrupts.load(); };
    SessionController session(opts, std::cout, &poster, hooks);
    StopSignal stop;

    try {
        const SessionResult result =
            session.run([&opts] { return connect_microbit(opts, interrupted); }, stop);
        spdlog::info("Session finished: {} snapshot(s), stop reason: {}", result.snapshots,
                     result.stop_reason ? stop_reason_name(*result.stop_reason) : "none");
    } catch (const std::exception& e) {
        if (interrupted()) {
            spdlog::info("Interrupted by user");
            return EXIT_SUCCESS;
        }
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
