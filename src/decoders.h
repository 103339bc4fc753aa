#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "characteristics.h"

using Payload = std::vector<std::uint8_t>;

// Fallback rendering used by every decoder on short input: "raw=<lowercase hex>"
std::string raw_hex(const Payload& data);

std::string decode_event(const Payload& data);
std::string decode_button(const Payload& data);
std::string decode_accelerometer(const Payload& data);
std::string decode_temperature(const Payload& data);
std::string decode_magnetometer(const Payload& data);
std::string decode_bearing(const Payload& data);
// Invalid UTF-8 sequences become U+FFFD, so this never fails.
std::string decode_uart(const Payload& data);

using Decoder = std::string (*)(const Payload&);

Decoder decoder_for(Characteristic c);
std::string decode(Characteristic c, const Payload& data);
