#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "errors.h"
#include "http_client.h"
#include "notification_source.h"
#include "snapshot.h"
#include "webhook_queue.h"

inline WallTime at_ms(long long ms) {
    return WallTime(std::chrono::milliseconds(ms));
}

// Wall clock that only moves when told to.
class FixedClock {
public:
    explicit FixedClock(WallTime t) : now_(t) {}
    WallTime now() const { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; }
    std::function<WallTime()> fn() { return [this] { return now_; }; }

private:
    WallTime now_;
};

inline std::vector<WebhookEvent> drain_events(WebhookQueue& queue) {
    std::vector<WebhookEvent> out;
    queue.close();
    WebhookEvent ev;
    while (queue.pop(ev)) {
        out.push_back(ev);
        queue.task_done();
    }
    return out;
}

class RecordingPoster : public HttpPoster {
public:
    HttpResponse post_json(const HttpUrl& url, const std::string& body,
                           std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lk(mtx_);
        hosts.push_back(url.host);
        bodies.push_back(body);
        if (fail_next > 0) {
            --fail_next;
            throw DeliveryError("connection refused");
        }
        return HttpResponse{status, "OK"};
    }

    std::vector<std::string> snapshot_bodies() {
        std::lock_guard<std::mutex> lk(mtx_);
        return bodies;
    }

    int status = 200;
    int fail_next = 0;
    std::vector<std::string> hosts;
    std::vector<std::string> bodies;

private:
    std::mutex mtx_;
};

// Answers 200 after a fixed delay, like an endpoint that is slow to respond.
class SlowPoster : public HttpPoster {
public:
    explicit SlowPoster(std::chrono::milliseconds delay) : delay_(delay) {}

    HttpResponse post_json(const HttpUrl&, const std::string&, std::chrono::milliseconds) override {
        std::this_thread::sleep_for(delay_);
        return HttpResponse{200, "OK"};
    }

private:
    std::chrono::milliseconds delay_;
};

// Scripted device: subscriptions fail for the names in `unavailable`, and the
// test pushes notifications through emit().
class FakeSource : public NotificationSource {
public:
    std::string description() const override { return "BBC micro:bit [fake] (00:11:22:33:44:55)"; }

    void subscribe(Characteristic c, NotifyCallback on_data) override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (unavailable.count(c)) throw SubscriptionError("service not started");
            callbacks_[c] = std::move(on_data);
        }
        if (on_subscribed) on_subscribed(c);
    }

    void unsubscribe(Characteristic c) override {
        std::lock_guard<std::mutex> lk(mtx_);
        unsubscribed.push_back(c);
        callbacks_.erase(c);
        if (fail_unsubscribe) throw std::runtime_error("CCCD write failed");
    }

    void set_on_disconnected(std::function<void()> cb) override {
        std::lock_guard<std::mutex> lk(mtx_);
        on_disconnected_ = std::move(cb);
    }

    void write(const std::string& service_uuid, const std::string& characteristic_uuid,
               const Payload& data) override {
        std::lock_guard<std::mutex> lk(mtx_);
        writes.push_back({service_uuid, characteristic_uuid, data});
    }

    void disconnect() override {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++disconnect_calls;
            cb = on_disconnected_;
        }
        // Real stacks report their own disconnect too
        if (cb) cb();
    }

    // Delivers a notification as the BLE stack would; false if not subscribed.
    bool emit(Characteristic c, const Payload& data) {
        NotifyCallback cb;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = callbacks_.find(c);
            if (it == callbacks_.end()) return false;
            cb = it->second;
        }
        cb(data);
        return true;
    }

    void drop_link() {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cb = on_disconnected_;
        }
        if (cb) cb();
    }

    struct Write {
        std::string service;
        std::string characteristic;
        Payload data;
    };

    std::set<Characteristic> unavailable;
    bool fail_unsubscribe = false;
    std::function<void(Characteristic)> on_subscribed;
    std::vector<Characteristic> unsubscribed;
    std::vector<Write> writes;
    int disconnect_calls = 0;

private:
    std::mutex mtx_;
    std::map<Characteristic, NotifyCallback> callbacks_;
    std::function<void()> on_disconnected_;
};

// Hands the session a forwarding handle so the test keeps the fake alive
// after the session releases its connection.
class SourceRef : public NotificationSource {
public:
    explicit SourceRef(FakeSource& fake) : fake_(fake) {}

    std::string description() const override { return fake_.description(); }
    void subscribe(Characteristic c, NotifyCallback on_data) override { fake_.subscribe(c, std::move(on_data)); }
    void unsubscribe(Characteristic c) override { fake_.unsubscribe(c); }
    void set_on_disconnected(std::function<void()> cb) override { fake_.set_on_disconnected(std::move(cb)); }
    void write(const std::string& service_uuid, const std::string& characteristic_uuid,
               const Payload& data) override {
        fake_.write(service_uuid, characteristic_uuid, data);
    }
    void disconnect() override { fake_.disconnect(); }

private:
    FakeSource& fake_;
};
