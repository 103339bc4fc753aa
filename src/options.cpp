#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>

#include "errors.h"
#include "http_client.h"
#include "options.h"

static std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

void add_cli_options(CLI::App& app, CliArgs& args) {
    const std::string known = join(characteristic_names(), ", ");

    auto* address = app.add_option("--address", args.address, "BLE device address of the micro:bit");
    auto* name = app.add_option("--name", args.name,
                                "Substring to match the advertised device name")
                     ->capture_default_str();
    address->excludes(name);

    app.add_option("--scan-timeout", args.scan_timeout, "Seconds to scan for the device")
        ->capture_default_str();
    app.add_option("--duration", args.duration, "Seconds to listen before disconnecting")
        ->capture_default_str();
    app.add_option("-c,--characteristic", args.characteristics,
                   "Characteristic name(s) to monitor (repeatable). Defaults to " + known)
        ->take_all();
    app.add_flag("-v,--verbose", args.verbose,
                 "Increase logging verbosity; use twice for debug output");

    app.add_option("--webhook-url", args.webhook_url, "POST updates as JSON to this http:// URL");
    app.add_option("--webhook-mode", args.webhook_mode,
                   "batch: one POST per 1 s window, immediate: one POST per update")
        ->capture_default_str();
    app.add_option("--webhook-characteristic", args.webhook_characteristics,
                   "Characteristic(s) to forward (repeatable). Defaults to the subscribed set")
        ->take_all();
    app.add_option("--webhook-timeout", args.webhook_timeout, "Seconds per webhook POST")
        ->capture_default_str();
    app.add_option("--webhook-security-key", args.webhook_security_key,
                   "Token sent as \"securityKey\" in every webhook payload");

    app.add_option("--uart-send", args.uart_send, "Text to send over UART after connecting");
    app.add_option("--led-text", args.led_text, "Text to scroll on the LED matrix after connecting");
    app.add_option("--accelerometer-period", args.accelerometer_period,
                   "Accelerometer sample period in ms");
    app.add_option("--magnetometer-period", args.magnetometer_period,
                   "Magnetometer sample period in ms");
    app.add_option("--temperature-period", args.temperature_period,
                   "Temperature sample period in ms");
}

int cli_exit_code(const CLI::App& app, const CLI::ParseError& e, std::ostream& out,
                  std::ostream& err) {
    const int code = app.exit(e, out, err);
    return code == static_cast<int>(CLI::ExitCodes::Success) ? EXIT_SUCCESS : EXIT_FAILURE;
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    if (!(seconds > 0.0)) return std::chrono::milliseconds(0);
    if (seconds > MAX_SECONDS) seconds = MAX_SECONDS;
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

static std::vector<Characteristic> parse_characteristic_list(const std::vector<std::string>& names) {
    std::vector<Characteristic> out;
    std::vector<std::string> unknown;
    for (const auto& n : names) {
        auto c = parse_characteristic(n);
        if (!c) {
            unknown.push_back(n);
            continue;
        }
        bool seen = false;
        for (auto existing : out) seen = seen || existing == *c;
        if (!seen) out.push_back(*c);
    }
    if (!unknown.empty()) {
        throw ConfigurationError("Unknown characteristic name(s): " + join(unknown, ", ") +
                                 " (choose from " + join(characteristic_names(), ", ") + ")");
    }
    return out;
}

static std::optional<std::uint16_t> parse_period(int ms, const char* flag) {
    if (ms == 0) return std::nullopt;
    if (ms < 1 || ms > 65535) {
        throw ConfigurationError(std::string(flag) + " must be between 1 and 65535 ms");
    }
    return static_cast<std::uint16_t>(ms);
}

LoggerOptions validate_options(const CliArgs& args) {
    LoggerOptions opts;

    if (!args.address.empty()) {
        opts.address = args.address;
    } else if (args.name.empty()) {
        throw ConfigurationError("Either --address or --name must be supplied");
    }
    opts.name = args.name;

    if (!(args.scan_timeout > 0.0)) throw ConfigurationError("--scan-timeout must be positive");
    if (!(args.duration >= 0.0)) throw ConfigurationError("--duration must not be negative");
    opts.scan_timeout = seconds_to_ms(args.scan_timeout);
    opts.duration = seconds_to_ms(args.duration);

    opts.characteristics = args.characteristics.empty()
                               ? all_characteristics()
                               : parse_characteristic_list(args.characteristics);
    opts.verbosity = args.verbose;

    if (!args.webhook_url.empty()) {
        parse_http_url(args.webhook_url);

        WebhookConfig hook;
        hook.url = args.webhook_url;
        auto mode = parse_webhook_mode(args.webhook_mode);
        if (!mode) {
            throw ConfigurationError("--webhook-mode must be 'batch' or 'immediate' (got '" +
                                     args.webhook_mode + "')");
        }
        hook.mode = *mode;
        hook.targets = args.webhook_characteristics.empty()
                           ? opts.characteristics
                           : parse_characteristic_list(args.webhook_characteristics);
        if (!(args.webhook_timeout > 0.0)) {
            throw ConfigurationError("--webhook-timeout must be positive");
        }
        hook.timeout = seconds_to_ms(args.webhook_timeout);
        if (!args.webhook_security_key.empty()) hook.security_key = args.webhook_security_key;
        opts.webhook = std::move(hook);
    }

    if (!args.uart_send.empty()) opts.uart_send = args.uart_send;
    if (!args.led_text.empty()) opts.led_text = args.led_text;
    opts.periods.accelerometer_ms = parse_period(args.accelerometer_period, "--accelerometer-period");
    opts.periods.magnetometer_ms = parse_period(args.magnetometer_period, "--magnetometer-period");
    opts.periods.temperature_ms = parse_period(args.temperature_period, "--temperature-period");

    return opts;
}
