#pragma once

#include <string>

#include "options.h"

std::string to_lower(std::string v);

// With --address: the peripheral address equals it, ignoring case; the name is
// not consulted. Otherwise the advertised identifier contains --name, ignoring case.
bool matches_device(const std::string& identifier, const std::string& address,
                    const LoggerOptions& opts);
