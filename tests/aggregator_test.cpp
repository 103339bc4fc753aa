#include <chrono>
#include <sstream>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "console_sink.h"
#include "test_support.h"
#include "update_aggregator.h"
#include "webhook.h"
#include "webhook_queue.h"

namespace {

WebhookConfig hook_config(WebhookMode mode, std::vector<Characteristic> targets) {
    WebhookConfig cfg;
    cfg.url = "http://127.0.0.1:8080/hook";
    cfg.mode = mode;
    cfg.targets = std::move(targets);
    return cfg;
}

}  // namespace

TEST(LatestValueTable, KeepsFirstSeenOrderAndLastValue) {
    LatestValueTable table;
    table.record(Characteristic::Temperature, "20\xC2\xB0" "C");
    table.record(Characteristic::ButtonA, "state=1 (pressed)");
    table.record(Characteristic::Temperature, "21\xC2\xB0" "C");

    const Snapshot snap = table.take(at_ms(5000));
    ASSERT_EQ(snap.entries.size(), 2u);
    EXPECT_EQ(snap.entries[0].first, Characteristic::Temperature);
    EXPECT_EQ(snap.entries[0].second, "21\xC2\xB0" "C");
    EXPECT_EQ(snap.entries[1].first, Characteristic::ButtonA);
    EXPECT_TRUE(table.empty());
}

TEST(UpdateAggregator, RepeatedValueYieldsOneEntry) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(1700000000123));
    UpdateAggregator agg(console, nullptr, clock.fn());

    for (int i = 0; i < 5; ++i) agg.record_update(Characteristic::ButtonA, "state=1 (pressed)");
    agg.record_update(Characteristic::ButtonA, "state=0 (not pressed)");

    EXPECT_TRUE(agg.flush_tick());
    EXPECT_EQ(out.str(), "[1700000000.123]\n  button_a: state=0 (not pressed)\n");
}

TEST(UpdateAggregator, EmptyWindowPrintsNothing) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(1000));
    UpdateAggregator agg(console, nullptr, clock.fn());

    EXPECT_FALSE(agg.flush_tick());
    agg.record_update(Characteristic::Event, "event_id=1 event_value=2");
    EXPECT_TRUE(agg.flush_tick());
    const std::string after_first = out.str();
    EXPECT_FALSE(agg.flush_tick());
    EXPECT_EQ(out.str(), after_first);
    EXPECT_EQ(agg.snapshots_emitted(), 1u);
}

TEST(UpdateAggregator, FlushedValuesAreNotReportedTwice) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(2000));
    UpdateAggregator agg(console, nullptr, clock.fn());

    agg.record_update(Characteristic::Temperature, "20\xC2\xB0" "C");
    agg.flush_tick();
    clock.advance(std::chrono::milliseconds(1000));
    agg.record_update(Characteristic::ButtonB, "state=2 (long press)");
    agg.flush_tick();

    EXPECT_EQ(out.str(),
              "[2.000]\n  temperature: 20\xC2\xB0" "C\n"
              "[3.000]\n  button_b: state=2 (long press)\n");
}

TEST(UpdateAggregator, ImmediateModeQueuesOneEventPerTargetedUpdate) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(10000));
    WebhookQueue queue;
    WebhookDispatcher hook(hook_config(WebhookMode::Immediate, {Characteristic::ButtonA}), queue);
    UpdateAggregator agg(console, &hook, clock.fn());

    agg.record_update(Characteristic::ButtonA, "state=1 (pressed)");
    agg.record_update(Characteristic::Accelerometer, "x=0mg y=0mg z=-1024mg");
    agg.record_update(Characteristic::ButtonA, "state=0 (not pressed)");
    // Queued synchronously, before any flush
    EXPECT_EQ(queue.size(), 2u);

    agg.flush_tick();
    const auto events = drain_events(queue);
    ASSERT_EQ(events.size(), 2u);
    for (const auto& ev : events) {
        ASSERT_TRUE(ev.characteristic.has_value());
        EXPECT_EQ(*ev.characteristic, Characteristic::ButtonA);
        EXPECT_TRUE(ev.values.empty());
    }
    EXPECT_EQ(events[0].value, "state=1 (pressed)");
    EXPECT_EQ(events[1].value, "state=0 (not pressed)");
}

TEST(UpdateAggregator, BatchModeFiltersSnapshotToTargets) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(10000));
    WebhookQueue queue;
    WebhookDispatcher hook(
        hook_config(WebhookMode::Batch, {Characteristic::ButtonA, Characteristic::Temperature}),
        queue);
    UpdateAggregator agg(console, &hook, clock.fn());

    agg.record_update(Characteristic::ButtonA, "state=1 (pressed)");
    agg.record_update(Characteristic::Accelerometer, "x=1mg y=2mg z=3mg");
    agg.record_update(Characteristic::Temperature, "19\xC2\xB0" "C");
    EXPECT_EQ(queue.size(), 0u);
    agg.flush_tick();

    const auto events = drain_events(queue);
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].is_batch());
    ASSERT_EQ(events[0].values.size(), 2u);
    EXPECT_EQ(events[0].values[0].first, Characteristic::ButtonA);
    EXPECT_EQ(events[0].values[1].first, Characteristic::Temperature);
    // Console still shows everything
    EXPECT_NE(out.str().find("accelerometer: x=1mg y=2mg z=3mg"), std::string::npos);
}

TEST(UpdateAggregator, BatchModeSendsNothingWhenNoTargetUpdated) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(10000));
    WebhookQueue queue;
    WebhookDispatcher hook(hook_config(WebhookMode::Batch, {Characteristic::ButtonA}), queue);
    UpdateAggregator agg(console, &hook, clock.fn());

    agg.record_update(Characteristic::Magnetometer, "x=1 y=2 z=3");
    EXPECT_TRUE(agg.flush_tick());
    EXPECT_FALSE(out.str().empty());
    EXPECT_EQ(queue.size(), 0u);
}

TEST(UpdateAggregator, FinalFlushRunsOnceAndStopsRecording) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(10000));
    WebhookQueue queue;
    WebhookDispatcher hook(hook_config(WebhookMode::Batch, {Characteristic::UartTx}), queue);
    UpdateAggregator agg(console, &hook, clock.fn());

    agg.record_update(Characteristic::UartTx, "hello");
    EXPECT_TRUE(agg.final_flush());
    EXPECT_FALSE(agg.final_flush());
    agg.record_update(Characteristic::UartTx, "late");
    EXPECT_FALSE(agg.flush_tick());
    EXPECT_EQ(agg.snapshots_emitted(), 1u);
    EXPECT_EQ(drain_events(queue).size(), 1u);
}

TEST(AggregatorTask, StopRecordsEverythingPostedThenFlushesOnce) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(42000));
    UpdateAggregator agg(console, nullptr, clock.fn());
    // Period long enough that no tick fires during the test
    AggregatorTask task(agg, std::chrono::hours(1));
    task.start();

    task.post(Characteristic::ButtonA, "state=1 (pressed)");
    task.post(Characteristic::Temperature, "22\xC2\xB0" "C");
    task.post(Characteristic::ButtonA, "state=0 (not pressed)");
    task.stop();

    EXPECT_EQ(agg.snapshots_emitted(), 1u);
    EXPECT_TRUE(agg.finished());
    EXPECT_EQ(out.str(),
              "[42.000]\n"
              "  button_a: state=0 (not pressed)\n"
              "  temperature: 22\xC2\xB0" "C\n");

    // Posting after shutdown is dropped
    task.post(Characteristic::ButtonB, "state=1 (pressed)");
    EXPECT_EQ(agg.pending(), 0u);
}

TEST(AggregatorTask, TicksFlushOnTheirOwn) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(0));
    UpdateAggregator agg(console, nullptr, clock.fn());
    AggregatorTask task(agg, std::chrono::milliseconds(20));
    task.start();

    task.post(Characteristic::Event, "event_id=9 event_value=1");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (agg.snapshots_emitted() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    task.stop();

    EXPECT_EQ(agg.snapshots_emitted(), 1u);
    EXPECT_EQ(out.str(), "[0.000]\n  event: event_id=9 event_value=1\n");
}

TEST(AggregatorTask, StopWithoutStartStillFlushes) {
    std::ostringstream out;
    ConsoleSink console(out);
    FixedClock clock(at_ms(1000));
    UpdateAggregator agg(console, nullptr, clock.fn());
    AggregatorTask task(agg);

    task.post(Characteristic::UartTx, "bye");
    task.stop();
    EXPECT_EQ(out.str(), "[1.000]\n  uart_tx: bye\n");
}
