#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

// Closed set of micro:bit characteristics the logger can subscribe to.
enum class Characteristic {
    UartTx,
    Event,
    ButtonA,
    ButtonB,
    Accelerometer,
    Temperature,
    Magnetometer,
    MagnetometerBearing,
};

constexpr std::size_t CHARACTERISTIC_COUNT = 8;

struct CharacteristicInfo {
    Characteristic id;
    const char* name;
    const char* service_uuid;
    const char* characteristic_uuid;
};

// Writable control characteristics (not part of the subscribable set)
constexpr const char* UART_SERVICE_UUID          = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
constexpr const char* UART_RX_UUID               = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";
constexpr const char* LED_SERVICE_UUID           = "e95dd91d-251d-470a-a062-fa1922dfa9a8";
constexpr const char* LED_TEXT_UUID              = "e95d93ee-251d-470a-a062-fa1922dfa9a8";
constexpr const char* ACCELEROMETER_SERVICE_UUID = "e95d0753-251d-470a-a062-fa1922dfa9a8";
constexpr const char* ACCELEROMETER_PERIOD_UUID  = "e95dfb24-251d-470a-a062-fa1922dfa9a8";
constexpr const char* MAGNETOMETER_SERVICE_UUID  = "e95df2d8-251d-470a-a062-fa1922dfa9a8";
constexpr const char* MAGNETOMETER_PERIOD_UUID   = "e95d386c-251d-470a-a062-fa1922dfa9a8";
constexpr const char* TEMPERATURE_SERVICE_UUID   = "e95d6100-251d-470a-a062-fa1922dfa9a8";
constexpr const char* TEMPERATURE_PERIOD_UUID    = "e95d1b25-251d-470a-a062-fa1922dfa9a8";

const std::array<CharacteristicInfo, CHARACTERISTIC_COUNT>& characteristic_table();
const CharacteristicInfo& characteristic_info(Characteristic c);
const char* characteristic_name(Characteristic c);

// Exact, case-sensitive lookup by the CLI name ("button_a", "uart_tx", ...)
std::optional<Characteristic> parse_characteristic(const std::string& name);

// All eight characteristics in their canonical order.
std::vector<Characteristic> all_characteristics();
std::vector<std::string> characteristic_names();
