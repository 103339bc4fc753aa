#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "characteristics.h"

using WallTime = std::chrono::system_clock::time_point;

// Immutable copy of the latest-value table taken at one flush.
struct Snapshot {
    WallTime timestamp;
    std::vector<std::pair<Characteristic, std::string>> entries;

    bool empty() const { return entries.empty(); }
};

// Latest decoded value per characteristic since the last take().
// Entries keep the order in which a characteristic was first recorded in the
// current window; re-recording overwrites in place.
class LatestValueTable {
public:
    void record(Characteristic c, std::string value);
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

    // Move everything out into a snapshot and leave the table empty.
    Snapshot take(WallTime timestamp);

private:
    std::vector<std::pair<Characteristic, std::string>> entries_;
};

// Seconds since the epoch with millisecond precision, e.g. "1712345678.123".
std::string format_timestamp(WallTime t);
double to_epoch_seconds(WallTime t);
