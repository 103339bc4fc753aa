#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "simpleble/SimpleBLE.h"
#include "ble_session.h"
#include "device_match.h"
#include "errors.h"

constexpr std::chrono::milliseconds SCAN_POLL{100};
constexpr std::chrono::milliseconds CCCD_SETTLE{100};

SimpleBLE::Peripheral resolve_device(SimpleBLE::Adapter& adapter, const LoggerOptions& opts,
                                     const InterruptCheck& interrupted) {
    if (opts.address) {
        spdlog::info("Looking for device with address {}", *opts.address);
    } else {
        spdlog::info("Scanning for device matching name '{}'", opts.name);
    }

    std::mutex mtx;
    std::optional<SimpleBLE::Peripheral> found;

    // The name may only arrive with a later scan response, so updates are checked too
    auto consider = [&](SimpleBLE::Peripheral p) {
        if (!matches_device(p.identifier(), p.address(), opts)) return;
        std::lock_guard<std::mutex> lk(mtx);
        if (!found) found = p;
    };
    auto clear_callbacks = [&adapter] {
        adapter.set_callback_on_scan_found({});
        adapter.set_callback_on_scan_updated({});
        adapter.set_callback_on_scan_start({});
        adapter.set_callback_on_scan_stop({});
    };
    adapter.set_callback_on_scan_found(consider);
    adapter.set_callback_on_scan_updated(consider);
    adapter.set_callback_on_scan_start([]() { spdlog::debug("Scan started"); });
    adapter.set_callback_on_scan_stop([]() { spdlog::debug("Scan stopped"); });

    try {
        adapter.scan_start();
    } catch (const std::exception& e) {
        clear_callbacks();
        throw DeviceNotFoundError(std::string("Scan start failed: ") + e.what());
    }

    bool aborted = false;
    const auto deadline = std::chrono::steady_clock::now() + opts.scan_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (found) break;
        }
        if (interrupted && interrupted()) {
            aborted = true;
            break;
        }
        std::this_thread::sleep_for(SCAN_POLL);
    }

    try {
        adapter.scan_stop();
    } catch (const std::exception& e) {
        spdlog::debug("Scan stop failed: {}", e.what());
    }
    clear_callbacks();

    if (aborted) throw InterruptedError("Scan interrupted");

    std::lock_guard<std::mutex> lk(mtx);
    if (!found) {
        if (opts.address) {
            throw DeviceNotFoundError("Device with address " + *opts.address + " not found");
        }
        throw DeviceNotFoundError("No device found with name containing '" + opts.name + "'");
    }
    spdlog::info("Found device '{}' ({})", found->identifier(), found->address());
    return *found;
}

SimpleBleSource::SimpleBleSource(SimpleBLE::Peripheral peripheral)
    : peripheral_(std::move(peripheral)) {}

SimpleBleSource::~SimpleBleSource() {
    if (released_) return;
    try {
        disconnect();
    } catch (const std::exception& e) {
        spdlog::debug("Disconnect during teardown failed: {}", e.what());
    }
}

std::string SimpleBleSource::description() const {
    return peripheral_.identifier() + " (" + peripheral_.address() + ")";
}

SimpleBleSource::Route SimpleBleSource::locate(const std::string& service_uuid,
                                               const std::string& characteristic_uuid) {
    const std::string want_service = to_lower(service_uuid);
    const std::string want_char = to_lower(characteristic_uuid);

    std::optional<Route> elsewhere;
    for (auto& service : peripheral_.services()) {
        const bool preferred = to_lower(service.uuid()) == want_service;
        for (auto& chr : service.characteristics()) {
            if (to_lower(chr.uuid()) != want_char) continue;
            Route route{service.uuid(), chr.uuid(), chr.can_indicate(), chr.can_notify()};
            if (preferred) return route;
            if (!elsewhere) elsewhere = route;
        }
    }
    if (!elsewhere) throw SubscriptionError("characteristic " + characteristic_uuid + " not found");
    spdlog::debug("{} found under service {} instead of {}", characteristic_uuid,
                  elsewhere->service_uuid, service_uuid);
    return *elsewhere;
}

void SimpleBleSource::subscribe(Characteristic c, NotifyCallback on_data) {
    const CharacteristicInfo& info = characteristic_info(c);
    Route route;
    try {
        route = locate(info.service_uuid, info.characteristic_uuid);
        auto forward = [on_data](SimpleBLE::ByteArray bytes) {
            on_data(Payload(bytes.begin(), bytes.end()));
        };
        if (route.can_indicate) {
            peripheral_.indicate(route.service_uuid, route.characteristic_uuid, forward);
        } else if (route.can_notify) {
            peripheral_.notify(route.service_uuid, route.characteristic_uuid, forward);
        } else {
            throw SubscriptionError("characteristic supports neither indicate nor notify");
        }
    } catch (const SubscriptionError&) {
        throw;
    } catch (const std::exception& e) {
        throw SubscriptionError(e.what());
    }
    spdlog::debug("{} active on {}", route.can_indicate ? "Indication" : "Notification",
                  characteristic_name(c));
    subscribed_[c] = route;
}

void SimpleBleSource::unsubscribe(Characteristic c) {
    auto it = subscribed_.find(c);
    if (it == subscribed_.end()) return;
    const Route route = it->second;
    subscribed_.erase(it);
    peripheral_.unsubscribe(route.service_uuid, route.characteristic_uuid);
}

void SimpleBleSource::set_on_disconnected(std::function<void()> on_disconnected) {
    peripheral_.set_callback_on_disconnected(std::move(on_disconnected));
}

void SimpleBleSource::write(const std::string& service_uuid, const std::string& characteristic_uuid,
                            const Payload& data) {
    const Route route = locate(service_uuid, characteristic_uuid);
    peripheral_.write_request(route.service_uuid, route.characteristic_uuid,
                              SimpleBLE::ByteArray(std::string(data.begin(), data.end())));
}

void SimpleBleSource::disconnect() {
    if (released_) return;
    released_ = true;
    for (auto& [c, route] : subscribed_) {
        try {
            peripheral_.unsubscribe(route.service_uuid, route.characteristic_uuid);
        } catch (const std::exception& e) {
            spdlog::debug("Unsubscribe from {} failed: {}", characteristic_name(c), e.what());
        }
    }
    subscribed_.clear();
    std::this_thread::sleep_for(CCCD_SETTLE);
    peripheral_.set_callback_on_disconnected({});
    if (peripheral_.is_connected()) peripheral_.disconnect();
    spdlog::info("Disconnected from {}", peripheral_.address());
}

std::unique_ptr<NotificationSource> connect_microbit(const LoggerOptions& opts,
                                                     const InterruptCheck& interrupted) {
    std::vector<SimpleBLE::Adapter> adapters;
    try {
        adapters = SimpleBLE::Adapter::get_adapters();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Adapter enumeration failed: ") + e.what());
    }
    if (adapters.empty()) throw std::runtime_error("No Bluetooth adapter found.");
    SimpleBLE::Adapter& adapter = adapters.front();
    spdlog::debug("Using adapter {}", adapter.identifier());

    SimpleBLE::Peripheral p = resolve_device(adapter, opts, interrupted);
    if (interrupted && interrupted()) throw InterruptedError("Interrupted before connecting");
    spdlog::info("Connecting to {} [{}]", p.identifier(), p.address());
    try {
        p.connect();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Connection failed: ") + e.what());
    }
    return std::make_unique<SimpleBleSource>(std::move(p));
}
