#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "characteristics.h"

static const std::array<CharacteristicInfo, CHARACTERISTIC_COUNT> g_characteristics{{
    {Characteristic::UartTx, "uart_tx",
     "6e400001-b5a3-f393-e0a9-e50e24dcca9e", "6e400002-b5a3-f393-e0a9-e50e24dcca9e"},
    {Characteristic::Event, "event",
     "e95d93af-251d-470a-a062-fa1922dfa9a8", "e95d0101-251d-470a-a062-fa1922dfa9a8"},
    {Characteristic::ButtonA, "button_a",
     "e95d9882-251d-470a-a062-fa1922dfa9a8", "e95dda90-251d-470a-a062-fa1922dfa9a8"},
    {Characteristic::ButtonB, "button_b",
     "e95d9882-251d-470a-a062-fa1922dfa9a8", "e95dda91-251d-470a-a062-fa1922dfa9a8"},
    {Characteristic::Accelerometer, "accelerometer",
     ACCELEROMETER_SERVICE_UUID, "e95dca4b-251d-470a-a062-fa1922dfa9a8"},
    {Characteristic::Temperature, "temperature",
     TEMPERATURE_SERVICE_UUID, "e95d9250-251d-470a-a062-fa1922dfa9a8"},
    {Characteristic::Magnetometer, "magnetometer",
     MAGNETOMETER_SERVICE_UUID, "e95dfb11-251d-470a-a062-fa1922dfa9a8"},
    {Characteristic::MagnetometerBearing, "magnetometer_bearing",
     MAGNETOMETER_SERVICE_UUID, "e95d9715-251d-470a-a062-fa1922dfa9a8"},
}};

const std::array<CharacteristicInfo, CHARACTERISTIC_COUNT>& characteristic_table() {
    return g_characteristics;
}

const CharacteristicInfo& characteristic_info(Characteristic c) {
    for (const auto& info : g_characteristics) {
        if (info.id == c) return info;
    }
    // Unreachable for a valid enumerator
    throw std::logic_error("characteristic missing from table");
}

const char* characteristic_name(Characteristic c) {
    return characteristic_info(c).name;
}

std::optional<Characteristic> parse_characteristic(const std::string& name) {
    for (const auto& info : g_characteristics) {
        if (name == info.name) return info.id;
    }
    return std::nullopt;
}

std::vector<Characteristic> all_characteristics() {
    std::vector<Characteristic> out;
    out.reserve(g_characteristics.size());
    for (const auto& info : g_characteristics) out.push_back(info.id);
    return out;
}

std::vector<std::string> characteristic_names() {
    std::vector<std::string> out;
    out.reserve(g_characteristics.size());
    for (const auto& info : g_characteristics) out.emplace_back(info.name);
    return out;
}
