#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "snapshot.h"

void LatestValueTable::record(Characteristic c, std::string value) {
    for (auto& entry : entries_) {
        if (entry.first == c) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(c, std::move(value));
}

Snapshot LatestValueTable::take(WallTime timestamp) {
    Snapshot snap{timestamp, {}};
    snap.entries.swap(entries_);
    return snap;
}

std::string format_timestamp(WallTime t) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count();
    const std::int64_t whole = ms / 1000;
    const std::int64_t frac = ms % 1000;
    std::ostringstream out;
    out << whole << "." << std::setw(3) << std::setfill('0') << frac;
    return out.str();
}

double to_epoch_seconds(WallTime t) {
    using namespace std::chrono;
    return duration_cast<duration<double>>(t.time_since_epoch()).count();
}
