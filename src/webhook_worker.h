#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>

#include "http_client.h"
#include "webhook_queue.h"

// Single consumer of the webhook queue. POSTs one event at a time, in order;
// failures are logged and dropped. Exits once the queue is closed and empty.
class WebhookWorker {
public:
    WebhookWorker(WebhookQueue& queue, HttpPoster& poster, HttpUrl url,
                  std::chrono::milliseconds timeout);
    ~WebhookWorker();

    WebhookWorker(const WebhookWorker&) = delete;
    WebhookWorker& operator=(const WebhookWorker&) = delete;

    void start();
    // Waits for the queue to empty, closes it, and joins the worker thread.
    // When abort() turns true mid-drain the events still queued are dropped;
    // a POST already in flight runs to its timeout.
    void drain_and_stop(const std::function<bool()>& abort = {});

    std::size_t delivered() const { return delivered_.load(); }
    std::size_t failed() const { return failed_.load(); }
    std::size_t dropped() const { return dropped_.load(); }

private:
    void run();
    void deliver(const WebhookEvent& event);

    WebhookQueue& queue_;
    HttpPoster& poster_;
    HttpUrl url_;
    std::chrono::milliseconds timeout_;
    std::thread thread_;
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> dropped_{0};
};
