// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for capguard::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order, including for Event payloads as queued for telemetry
//   - Non-blocking try_pop() on empty and non-empty queues
//   - Blocking pop() waits for a producer
//   - No lost or duplicated items under concurrent producers and consumers
//
// Threading model:
//   Threads are joined before assertions, so a failing test never leaves a
//   dangling thread behind.
// =============================================================================

#include "capguard/concurrent/thread_safe_queue.hpp"
#include "capguard/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace capguard;

// =============================================================================
// Test fixture: a fresh int queue per test.
// =============================================================================
class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Items come back in push order.
// Why: Telemetry subscribers reconstruct the audit trail from arrival order;
//      a reordered mode change would read as the wrong transition.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "out of order at " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() returns nullopt when empty and the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(7);
  queue.push(8);
  const std::optional<int> first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 7);
  EXPECT_EQ(queue.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Event payloads keep their alternative and fields through the queue.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEventTest, CarriesAuditEvents) {
  ThreadSafeQueue<Event> telemetry;

  ControlModeChangedEvent change;
  change.id = "CC-MODE-0a1b2c3d";
  change.previous_mode = domain::ControlMode::Normal;
  change.new_mode = domain::ControlMode::FreezeConversions;
  telemetry.push(change);

  ActionBlockedEvent blocked;
  blocked.id = "CC-BLOCK-99887766";
  blocked.action = domain::ActionKey::ConvertReservation;
  telemetry.push(blocked);

  const Event first = telemetry.pop();
  ASSERT_TRUE(std::holds_alternative<ControlModeChangedEvent>(first));
  EXPECT_EQ(std::get<ControlModeChangedEvent>(first).new_mode,
            domain::ControlMode::FreezeConversions);

  const Event second = telemetry.pop();
  EXPECT_EQ(eventId(second), "CC-BLOCK-99887766");
  EXPECT_TRUE(telemetry.empty());
}

// -----------------------------------------------------------------------------
// 5. pop() blocks until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 6. Concurrent producers and consumers: every item is delivered once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        if (std::optional<int> item = queue.try_pop()) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "missing or duplicate item at " << i;
  }
}
