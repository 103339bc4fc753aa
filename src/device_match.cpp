#include <cctype>
#include <string>

#include "device_match.h"

std::string to_lower(std::string v) {
    for (auto& ch : v) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return v;
}

bool matches_device(const std::string& identifier, const std::string& address,
                    const LoggerOptions& opts) {
    if (opts.address) return !address.empty() && to_lower(address) == to_lower(*opts.address);
    if (identifier.empty()) return false;
    return to_lower(identifier).find(to_lower(opts.name)) != std::string::npos;
}
