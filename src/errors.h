#pragma once

#include <stdexcept>
#include <string>

// Invalid command line or option values; raised before any BLE activity.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No matching device advertised within the scan timeout.
class DeviceNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One characteristic could not be subscribed. Fatal only when every one fails.
class SubscriptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Webhook POST failure. Always logged and dropped.
class DeliveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ctrl-C arrived before the session started listening.
class InterruptedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
