#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "decoders.h"

static std::uint16_t read_u16_le(const Payload& data, std::size_t offset) {
    return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

static std::int16_t read_i16_le(const Payload& data, std::size_t offset) {
    return static_cast<std::int16_t>(read_u16_le(data, offset));
}

std::string raw_hex(const Payload& data) {
    std::ostringstream out;
    out << "raw=";
    for (unsigned char c : data) {
        out << std::hex << std::nouppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(c);
    }
    return out.str();
}

std::string decode_event(const Payload& data) {
    if (data.size() < 4) return raw_hex(data);
    std::ostringstream out;
    out << "event_id=" << read_u16_le(data, 0) << " event_value=" << read_u16_le(data, 2);
    return out.str();
}

std::string decode_button(const Payload& data) {
    if (data.empty()) return raw_hex(data);
    const int state = data[0];
    const char* description = "unknown";
    switch (state) {
        case 0: description = "not pressed"; break;
        case 1: description = "pressed"; break;
        case 2: description = "long press"; break;
        default: break;
    }
    return "state=" + std::to_string(state) + " (" + description + ")";
}

std::string decode_accelerometer(const Payload& data) {
    if (data.size() < 6) return raw_hex(data);
    std::ostringstream out;
    out << "x=" << read_i16_le(data, 0) << "mg"
        << " y=" << read_i16_le(data, 2) << "mg"
        << " z=" << read_i16_le(data, 4) << "mg";
    return out.str();
}

std::string decode_temperature(const Payload& data) {
    if (data.empty()) return raw_hex(data);
    int temp_c = 0;
    if (data.size() == 1) {
        temp_c = static_cast<std::int8_t>(data[0]);
    } else {
        temp_c = read_i16_le(data, 0);
    }
    return std::to_string(temp_c) + "\xC2\xB0" "C";
}

std::string decode_magnetometer(const Payload& data) {
    if (data.size() < 6) return raw_hex(data);
    std::ostringstream out;
    out << "x=" << read_i16_le(data, 0)
        << " y=" << read_i16_le(data, 2)
        << " z=" << read_i16_le(data, 4);
    return out.str();
}

std::string decode_bearing(const Payload& data) {
    if (data.size() < 2) return raw_hex(data);
    return std::to_string(read_u16_le(data, 0)) + "\xC2\xB0";
}

// Length of the valid UTF-8 sequence starting at data[i], or the number of
// bytes forming the maximal invalid prefix (negated) to replace with one U+FFFD.
static int utf8_sequence(const Payload& data, std::size_t i) {
    const std::uint8_t lead = data[i];
    if (lead < 0x80) return 1;

    int need = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return -1;
    }

    int consumed = 1;
    for (int k = 0; k < need; ++k) {
        const std::size_t pos = i + 1 + static_cast<std::size_t>(k);
        if (pos >= data.size()) return -consumed;
        const std::uint8_t b = data[pos];
        const std::uint8_t min = (k == 0) ? lo : 0x80;
        const std::uint8_t max = (k == 0) ? hi : 0xBF;
        if (b < min || b > max) return -consumed;
        ++consumed;
    }
    return consumed;
}

std::string decode_uart(const Payload& data) {
    static constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(data.size());
    std::size_t i = 0;
    while (i < data.size()) {
        const int n = utf8_sequence(data, i);
        if (n > 0) {
            out.append(data.begin() + i, data.begin() + i + n);
            i += static_cast<std::size_t>(n);
        } else {
            out += REPLACEMENT;
            i += static_cast<std::size_t>(-n);
        }
    }
    return out;
}

Decoder decoder_for(Characteristic c) {
    switch (c) {
        case Characteristic::UartTx:              return &decode_uart;
        case Characteristic::Event:               return &decode_event;
        case Characteristic::ButtonA:             return &decode_button;
        case Characteristic::ButtonB:             return &decode_button;
        case Characteristic::Accelerometer:       return &decode_accelerometer;
        case Characteristic::Temperature:         return &decode_temperature;
        case Characteristic::Magnetometer:        return &decode_magnetometer;
        case Characteristic::MagnetometerBearing: return &decode_bearing;
    }
    return &raw_hex;
}

std::string decode(Characteristic c, const Payload& data) {
    return decoder_for(c)(data);
}
