#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "characteristics.h"
#include "webhook.h"

namespace CLI {
class App;
class ParseError;
}

constexpr const char* DEFAULT_DEVICE_NAME = "BBC micro:bit";

// Raw command line as CLI11 fills it in; validated by validate_options().
struct CliArgs {
    std::string address;
    std::string name = DEFAULT_DEVICE_NAME;
    double scan_timeout = 10.0;
    double duration = 10.0;
    std::vector<std::string> characteristics;
    int verbose = 0;

    std::string webhook_url;
    std::string webhook_mode = "batch";
    std::vector<std::string> webhook_characteristics;
    double webhook_timeout = 10.0;
    std::string webhook_security_key;

    std::string uart_send;
    std::string led_text;
    int accelerometer_period = 0;
    int magnetometer_period = 0;
    int temperature_period = 0;
};

struct SensorPeriods {
    std::optional<std::uint16_t> accelerometer_ms;
    std::optional<std::uint16_t> magnetometer_ms;
    std::optional<std::uint16_t> temperature_ms;
};

struct LoggerOptions {
    std::optional<std::string> address;
    std::string name = DEFAULT_DEVICE_NAME;
    std::chrono::milliseconds scan_timeout{10000};
    std::chrono::milliseconds duration{10000};
    std::vector<Characteristic> characteristics;
    int verbosity = 0;
    std::optional<WebhookConfig> webhook;

    std::optional<std::string> uart_send;
    std::optional<std::string> led_text;
    SensorPeriods periods;
};

void add_cli_options(CLI::App& app, CliArgs& args);

// Prints the parse error (or --help text) the way CLI11 does, but maps every
// failure to EXIT_FAILURE. --help and --version give EXIT_SUCCESS.
int cli_exit_code(const CLI::App& app, const CLI::ParseError& e, std::ostream& out,
                  std::ostream& err);

// Throws ConfigurationError on unknown characteristic names, bad webhook
// settings or out-of-range numbers.
LoggerOptions validate_options(const CliArgs& args);

// Times above this (including inf) are clamped, keeping steady_clock deadlines
// representable. Roughly 31 years.
constexpr double MAX_SECONDS = 1e9;

// Non-positive and NaN inputs give zero.
std::chrono::milliseconds seconds_to_ms(double seconds);
