#include <ostream>

#include "console_sink.h"

void ConsoleSink::emit(const Snapshot& snapshot) {
    if (snapshot.empty()) return;
    out_ << "[" << format_timestamp(snapshot.timestamp) << "]\n";
    for (const auto& [c, value] : snapshot.entries) {
        out_ << "  " << characteristic_name(c) << ": " << value << "\n";
    }
    out_ << std::flush;
}
