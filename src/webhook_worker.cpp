#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "webhook_worker.h"

constexpr std::chrono::milliseconds ABORT_POLL{100};

WebhookWorker::WebhookWorker(WebhookQueue& queue, HttpPoster& poster, HttpUrl url,
                             std::chrono::milliseconds timeout)
    : queue_(queue), poster_(poster), url_(std::move(url)), timeout_(timeout) {}

WebhookWorker::~WebhookWorker() {
    if (thread_.joinable()) {
        queue_.close();
        thread_.join();
    }
}

void WebhookWorker::start() {
    thread_ = std::thread([this] { run(); });
}

void WebhookWorker::drain_and_stop(const std::function<bool()>& abort) {
    if (!thread_.joinable()) return;
    spdlog::debug("Waiting for {} pending webhook event(s)", queue_.size());
    while (!queue_.wait_drained_until(std::chrono::steady_clock::now() + ABORT_POLL)) {
        if (abort && abort()) {
            dropped_ += queue_.discard();
            spdlog::warn("Webhook drain abandoned, dropped {} pending event(s)", dropped());
            break;
        }
    }
    queue_.close();
    thread_.join();
    spdlog::info("Webhook worker stopped ({} delivered, {} failed, {} dropped)", delivered(),
                 failed(), dropped());
}

void WebhookWorker::run() {
    WebhookEvent event;
    while (queue_.pop(event)) {
        deliver(event);
        queue_.task_done();
    }
}

void WebhookWorker::deliver(const WebhookEvent& event) {
    const std::string body = event.to_json().dump();
    try {
        const HttpResponse resp = poster_.post_json(url_, body, timeout_);
        if (!resp.ok()) {
            ++failed_;
            spdlog::warn("Webhook returned HTTP {} {}", resp.status, resp.reason);
            return;
        }
        ++delivered_;
        spdlog::debug("Webhook delivered ({} bytes, HTTP {})", body.size(), resp.status);
    } catch (const std::exception& e) {
        ++failed_;
        spdlog::warn("Webhook delivery failed: {}", e.what());
    }
}
