#pragma once

#include <iosfwd>

#include "snapshot.h"

// Prints each non-empty snapshot as:
//   [1712345678.123]
//     button_a: state=1 (pressed)
class ConsoleSink {
public:
    explicit ConsoleSink(std::ostream& out) : out_(out) {}

    void emit(const Snapshot& snapshot);

private:
    std::ostream& out_;
};
