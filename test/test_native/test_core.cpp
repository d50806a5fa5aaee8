// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LumenLink - Core Unit Tests
 *
 * Tests for the poll-driven scheduler and its helpers:
 * - Scheduler (due order, repeating timers, wrap-around)
 * - TimerScope (group cancellation)
 * - EventStream (re-entrant handlers)
 * - BackoffPolicy (exponential delay, jitter bounds)
 * - CancellationSource generations
 */

#include <unity.h>
#include <string>
#include <vector>

#ifndef NATIVE_BUILD
#define NATIVE_BUILD
#endif

#include "../../src/core/Backoff.h"
#include "../../src/core/Cancellation.h"
#include "../../src/core/EventStream.h"
#include "../../src/core/Scheduler.h"
#include "../../src/core/TimerScope.h"
#include "mocks/FakeClock.h"

using namespace lumenlink;
using namespace lumenlink::core;
using lumenlink::test::FakeClock;

//==============================================================================
// Scheduler Tests
//==============================================================================

void test_scheduler_once_fires_only_when_due() {
    FakeClock clock(1000);
    Scheduler scheduler(clock);
    int fired = 0;

    TimerId id = scheduler.scheduleOnce(100, [&fired]() { fired++; });
    TEST_ASSERT_NOT_EQUAL(INVALID_TIMER, id);

    clock.advance(99);
    TEST_ASSERT_EQUAL(0, scheduler.poll());
    TEST_ASSERT_EQUAL_INT(0, fired);

    clock.advance(1);
    TEST_ASSERT_EQUAL(1, scheduler.poll());
    TEST_ASSERT_EQUAL_INT(1, fired);

    // One-shot timers are gone after firing
    clock.advance(1000);
    TEST_ASSERT_EQUAL(0, scheduler.poll());
    TEST_ASSERT_FALSE(scheduler.isPending(id));
}

void test_scheduler_repeating_rearms() {
    FakeClock clock;
    Scheduler scheduler(clock);
    int fired = 0;

    scheduler.scheduleRepeating(50, [&fired]() { fired++; });

    for (int i = 0; i < 4; i++) {
        clock.advance(50);
        scheduler.poll();
    }
    TEST_ASSERT_EQUAL_INT(4, fired);
    TEST_ASSERT_EQUAL(1, scheduler.pendingCount());
}

void test_scheduler_cancel() {
    FakeClock clock;
    Scheduler scheduler(clock);
    int fired = 0;

    TimerId id = scheduler.scheduleOnce(10, [&fired]() { fired++; });
    TEST_ASSERT_TRUE(scheduler.cancel(id));
    TEST_ASSERT_FALSE(scheduler.cancel(id));
    TEST_ASSERT_FALSE(scheduler.cancel(INVALID_TIMER));

    clock.advance(20);
    scheduler.poll();
    TEST_ASSERT_EQUAL_INT(0, fired);
}

void test_scheduler_rejects_empty_callback() {
    FakeClock clock;
    Scheduler scheduler(clock);
    TEST_ASSERT_EQUAL(INVALID_TIMER, scheduler.scheduleOnce(10, TimerCallback()));
    TEST_ASSERT_EQUAL(0, scheduler.pendingCount());
}

void test_scheduler_fires_in_deadline_order() {
    FakeClock clock;
    Scheduler scheduler(clock);
    std::vector<int> order;

    scheduler.scheduleOnce(30, [&order]() { order.push_back(30); });
    scheduler.scheduleOnce(10, [&order]() { order.push_back(10); });
    scheduler.scheduleOnce(20, [&order]() { order.push_back(20); });

    clock.advance(50);
    TEST_ASSERT_EQUAL(3, scheduler.poll());
    TEST_ASSERT_EQUAL(3, order.size());
    TEST_ASSERT_EQUAL_INT(10, order[0]);
    TEST_ASSERT_EQUAL_INT(20, order[1]);
    TEST_ASSERT_EQUAL_INT(30, order[2]);
}

void test_scheduler_timer_added_during_poll_waits_for_next_poll() {
    FakeClock clock;
    Scheduler scheduler(clock);
    int inner = 0;

    scheduler.scheduleOnce(0, [&scheduler, &inner]() {
        scheduler.scheduleOnce(0, [&inner]() { inner++; });
    });

    TEST_ASSERT_EQUAL(1, scheduler.poll());
    TEST_ASSERT_EQUAL_INT(0, inner);
    TEST_ASSERT_EQUAL(1, scheduler.poll());
    TEST_ASSERT_EQUAL_INT(1, inner);
}

void test_scheduler_callback_may_cancel_other_timer() {
    FakeClock clock;
    Scheduler scheduler(clock);
    int victimFired = 0;

    TimerId victim = scheduler.scheduleOnce(20, [&victimFired]() { victimFired++; });
    scheduler.scheduleOnce(10, [&scheduler, victim]() { scheduler.cancel(victim); });

    clock.advance(20);
    TEST_ASSERT_EQUAL(1, scheduler.poll());
    TEST_ASSERT_EQUAL_INT(0, victimFired);
}

void test_scheduler_survives_clock_wrap() {
    FakeClock clock(0xFFFFFF00u);
    Scheduler scheduler(clock);
    int fired = 0;

    scheduler.scheduleOnce(0x200, [&fired]() { fired++; });

    clock.advance(0x1FF);      // now 0x000000FF, past the wrap
    TEST_ASSERT_EQUAL(0, scheduler.poll());

    clock.advance(1);
    TEST_ASSERT_EQUAL(1, scheduler.poll());
    TEST_ASSERT_EQUAL_INT(1, fired);
}

//==============================================================================
// TimerScope Tests
//==============================================================================

void test_timer_scope_cancel_all() {
    FakeClock clock;
    Scheduler scheduler(clock);
    TimerScope scope(scheduler);
    int fired = 0;

    scope.once(10, [&fired]() { fired++; });
    scope.every(5, [&fired]() { fired++; });
    TEST_ASSERT_EQUAL(2, scope.activeCount());

    CancellationToken before = scope.token();
    scope.cancelAll();
    TEST_ASSERT_TRUE(before.isCancelled());
    TEST_ASSERT_FALSE(scope.token().isCancelled());
    TEST_ASSERT_EQUAL(0, scope.activeCount());
    TEST_ASSERT_EQUAL(0, scheduler.pendingCount());

    clock.advance(100);
    scheduler.poll();
    TEST_ASSERT_EQUAL_INT(0, fired);

    // Still usable after cancelAll
    scope.once(1, [&fired]() { fired++; });
    clock.advance(1);
    scheduler.poll();
    TEST_ASSERT_EQUAL_INT(1, fired);
}

void test_timer_scope_destructor_cancels() {
    FakeClock clock;
    Scheduler scheduler(clock);
    int fired = 0;
    {
        TimerScope scope(scheduler);
        scope.every(10, [&fired]() { fired++; });
    }
    TEST_ASSERT_EQUAL(0, scheduler.pendingCount());
    clock.advance(50);
    scheduler.poll();
    TEST_ASSERT_EQUAL_INT(0, fired);
}

void test_timer_scope_cancel_from_own_callback() {
    FakeClock clock;
    Scheduler scheduler(clock);
    TimerScope scope(scheduler);
    int fired = 0;

    scope.every(10, [&scope, &fired]() {
        fired++;
        scope.cancelAll();
    });

    for (int i = 0; i < 5; i++) {
        clock.advance(10);
        scheduler.poll();
    }
    TEST_ASSERT_EQUAL_INT(1, fired);
}

void test_timer_scope_single_cancel() {
    FakeClock clock;
    Scheduler scheduler(clock);
    TimerScope scope(scheduler);
    int a = 0;
    int b = 0;

    TimerId first = scope.once(10, [&a]() { a++; });
    scope.once(10, [&b]() { b++; });
    scope.cancel(first);

    clock.advance(10);
    scheduler.poll();
    TEST_ASSERT_EQUAL_INT(0, a);
    TEST_ASSERT_EQUAL_INT(1, b);
}

//==============================================================================
// EventStream Tests
//==============================================================================

void test_event_stream_publish_and_unsubscribe() {
    EventStream<int> stream;
    int sum = 0;

    SubscriptionId id = stream.subscribe([&sum](const int& v) { sum += v; });
    stream.publish(3);
    stream.publish(4);
    TEST_ASSERT_EQUAL_INT(7, sum);

    TEST_ASSERT_TRUE(stream.unsubscribe(id));
    TEST_ASSERT_FALSE(stream.unsubscribe(id));
    stream.publish(100);
    TEST_ASSERT_EQUAL_INT(7, sum);
    TEST_ASSERT_EQUAL(0, stream.subscriberCount());
}

void test_event_stream_handler_can_unsubscribe_itself() {
    EventStream<std::string> stream;
    SubscriptionId self = 0;
    int calls = 0;

    self = stream.subscribe([&stream, &self, &calls](const std::string&) {
        calls++;
        stream.unsubscribe(self);
    });

    stream.publish("first");
    stream.publish("second");
    TEST_ASSERT_EQUAL_INT(1, calls);
}

//==============================================================================
// Backoff Tests
//==============================================================================

void test_backoff_exponential_with_cap() {
    BackoffPolicy policy;     // 2000ms base, x2, 60s cap

    TEST_ASSERT_EQUAL_UINT32(2000, policy.delayForAttempt(0));
    TEST_ASSERT_EQUAL_UINT32(4000, policy.delayForAttempt(1));
    TEST_ASSERT_EQUAL_UINT32(8000, policy.delayForAttempt(2));
    TEST_ASSERT_EQUAL_UINT32(16000, policy.delayForAttempt(3));
    TEST_ASSERT_EQUAL_UINT32(32000, policy.delayForAttempt(4));
    TEST_ASSERT_EQUAL_UINT32(60000, policy.delayForAttempt(5));
    TEST_ASSERT_EQUAL_UINT32(60000, policy.delayForAttempt(200));
}

void test_backoff_jitter_bounds() {
    BackoffPolicy policy{1000, 2.0f, 60000, 0.2f};

    TEST_ASSERT_EQUAL_UINT32(1000, policy.jitteredDelay(0, 0.5f));
    TEST_ASSERT_UINT32_WITHIN(1, 800, policy.jitteredDelay(0, 0.0f));
    TEST_ASSERT_UINT32_WITHIN(1, 1200, policy.jitteredDelay(0, 1.0f));
    TEST_ASSERT_UINT32_WITHIN(1, 4000, policy.jitteredDelay(2, 0.5f));

    // Jitter never pushes past the cap
    TEST_ASSERT_EQUAL_UINT32(60000, policy.jitteredDelay(10, 1.0f));
}

void test_backoff_without_jitter_ignores_random() {
    BackoffPolicy policy{500, 3.0f, 10000, 0.0f};
    TEST_ASSERT_EQUAL_UINT32(1500, policy.jitteredDelay(1, 0.0f));
    TEST_ASSERT_EQUAL_UINT32(1500, policy.jitteredDelay(1, 0.99f));
    TEST_ASSERT_EQUAL_UINT32(10000, policy.jitteredDelay(4, 0.5f));
}

//==============================================================================
// Cancellation Tests
//==============================================================================

void test_cancellation_generations() {
    CancellationToken never;
    TEST_ASSERT_FALSE(never.isCancelled());

    CancellationSource source;
    CancellationToken first = source.token();
    TEST_ASSERT_FALSE(first.isCancelled());

    source.reset();
    CancellationToken second = source.token();
    TEST_ASSERT_TRUE(first.isCancelled());
    TEST_ASSERT_FALSE(second.isCancelled());

    source.cancel();
    TEST_ASSERT_TRUE(second.isCancelled());
    TEST_ASSERT_TRUE(source.isCancelled());
}

//==============================================================================
// Test Runner
//==============================================================================

void run_core_tests() {
    RUN_TEST(test_scheduler_once_fires_only_when_due);
    RUN_TEST(test_scheduler_repeating_rearms);
    RUN_TEST(test_scheduler_cancel);
    RUN_TEST(test_scheduler_rejects_empty_callback);
    RUN_TEST(test_scheduler_fires_in_deadline_order);
    RUN_TEST(test_scheduler_timer_added_during_poll_waits_for_next_poll);
    RUN_TEST(test_scheduler_callback_may_cancel_other_timer);
    RUN_TEST(test_scheduler_survives_clock_wrap);
    RUN_TEST(test_timer_scope_cancel_all);
    RUN_TEST(test_timer_scope_destructor_cancels);
    RUN_TEST(test_timer_scope_cancel_from_own_callback);
    RUN_TEST(test_timer_scope_single_cancel);
    RUN_TEST(test_event_stream_publish_and_unsubscribe);
    RUN_TEST(test_event_stream_handler_can_unsubscribe_itself);
    RUN_TEST(test_backoff_exponential_with_cap);
    RUN_TEST(test_backoff_jitter_bounds);
    RUN_TEST(test_backoff_without_jitter_ignores_random);
    RUN_TEST(test_cancellation_generations);
}
