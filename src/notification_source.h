#pragma once

#include <functional>
#include <string>

#include "characteristics.h"
#include "decoders.h"

using NotifyCallback = std::function<void(const Payload&)>;

// A connected device that can push characteristic notifications.
// Callbacks may arrive on any thread.
class NotificationSource {
public:
    virtual ~NotificationSource() = default;

    // "BBC micro:bit [zuvip] (e3:1a:...)" style label for logs.
    virtual std::string description() const = 0;

    // Throws SubscriptionError if the characteristic is missing or cannot notify.
    virtual void subscribe(Characteristic c, NotifyCallback on_data) = 0;
    virtual void unsubscribe(Characteristic c) = 0;

    virtual void set_on_disconnected(std::function<void()> on_disconnected) = 0;

    virtual void write(const std::string& service_uuid, const std::string& characteristic_uuid,
                       const Payload& data) = 0;

    // Releases the connection. Called exactly once by the session.
    virtual void disconnect() = 0;
};
