#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "simpleble/SimpleBLE.h"

#include "notification_source.h"
#include "options.h"

// Polled during the scan; true aborts it with InterruptedError.
using InterruptCheck = std::function<bool()>;

// Scans up to opts.scan_timeout for a peripheral accepted by matches_device().
// Throws DeviceNotFoundError or InterruptedError.
SimpleBLE::Peripheral resolve_device(SimpleBLE::Adapter& adapter, const LoggerOptions& opts,
                                     const InterruptCheck& interrupted);

// NotificationSource over a connected SimpleBLE peripheral.
class SimpleBleSource : public NotificationSource {
public:
    explicit SimpleBleSource(SimpleBLE::Peripheral peripheral);
    ~SimpleBleSource() override;

    SimpleBleSource(const SimpleBleSource&) = delete;
    SimpleBleSource& operator=(const SimpleBleSource&) = delete;

    std::string description() const override;
    void subscribe(Characteristic c, NotifyCallback on_data) override;
    void unsubscribe(Characteristic c) override;
    void set_on_disconnected(std::function<void()> on_disconnected) override;
    void write(const std::string& service_uuid, const std::string& characteristic_uuid,
               const Payload& data) override;
    void disconnect() override;

private:
    struct Route {
        SimpleBLE::BluetoothUUID service_uuid;
        SimpleBLE::BluetoothUUID characteristic_uuid;
        bool can_indicate = false;
        bool can_notify = false;
    };

    // Looks in the preferred service first, then in any service. Throws
    // SubscriptionError when the characteristic is nowhere on the device.
    Route locate(const std::string& service_uuid, const std::string& characteristic_uuid);

    mutable SimpleBLE::Peripheral peripheral_;
    std::map<Characteristic, Route> subscribed_;
    bool released_ = false;
};

// Resolving + Connected: first adapter, scan, connect.
std::unique_ptr<NotificationSource> connect_microbit(const LoggerOptions& opts,
                                                     const InterruptCheck& interrupted);
