/**
 * @file test_mem.cpp
 * @brief Tests for SpscQueue<T> (owning ring used by display channel mailboxes).
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "galley/mem/spsc_queue.hpp"

using galley::mem::SpscError;
using galley::mem::SpscQueue;

/**
 * @test WithCapacity_Validation
 * @brief Zero, one and non-power-of-two capacities are refused at setup.
 */
TEST(SpscQueue, WithCapacity_Validation) {
  auto bad0 = SpscQueue<int>::with_capacity(0);
  ASSERT_FALSE(bad0.has_value());
  EXPECT_EQ(bad0.error(), SpscError::CapacityTooSmall);

  auto bad1 = SpscQueue<int>::with_capacity(1);
  ASSERT_FALSE(bad1.has_value());
  EXPECT_EQ(bad1.error(), SpscError::CapacityTooSmall);

  auto badN = SpscQueue<int>::with_capacity(100);
  ASSERT_FALSE(badN.has_value());
  EXPECT_EQ(badN.error(), SpscError::CapacityNotPowerOfTwo);
  EXPECT_STREQ(galley::mem::to_string(badN.error()), "capacity_not_power_of_two");

  auto ok = SpscQueue<int>::with_capacity(1024);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->capacity(), 1024u);
}

/**
 * @test SingleThread_Basics
 * @brief N-1 usable slots, FIFO order across wrap-around.
 */
TEST(SpscQueue, SingleThread_Basics) {
  constexpr std::size_t CAP = 8;
  auto qexp = SpscQueue<int>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  // fill N-1
  for (int i = 0; i < int(CAP - 1); ++i) EXPECT_TRUE(q.push(i));
  EXPECT_TRUE(q.full());
  EXPECT_FALSE(q.push(999));
  EXPECT_EQ(q.approx_size(), CAP - 1);

  // pop 3
  for (int i = 0; i < 3; ++i) {
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, i);
  }

  // push 3 (wrap)
  for (int i = 100; i < 103; ++i) EXPECT_TRUE(q.push(i));

  std::vector<int> out;
  int v{};
  while (q.pop(v)) out.push_back(v);
  std::vector<int> expected = {3,4,5,6,100,101,102};
  EXPECT_EQ(out, expected);
  EXPECT_TRUE(q.empty());
}

/**
 * @test SharedPtr_Ownership
 * @brief Queued shared_ptrs hold a reference until popped; the destructor releases leftovers.
 */
TEST(SpscQueue, SharedPtr_Ownership) {
  auto msg = std::make_shared<const std::string>("ticket");
  {
    auto qexp = SpscQueue<std::shared_ptr<const std::string>>::with_capacity(4);
    ASSERT_TRUE(qexp);
    auto q = std::move(*qexp);

    EXPECT_TRUE(q.push(msg));
    EXPECT_TRUE(q.push(msg));
    EXPECT_EQ(msg.use_count(), 3);

    std::shared_ptr<const std::string> out;
    ASSERT_TRUE(q.pop(out));
    EXPECT_EQ(*out, "ticket");
    out.reset();
    EXPECT_EQ(msg.use_count(), 2);
  }
  // One element was still queued when the ring went away.
  EXPECT_EQ(msg.use_count(), 1);
}

/**
 * @test MoveOnly_Elements
 * @brief unique_ptr payloads move through the ring.
 */
TEST(SpscQueue, MoveOnly_Elements) {
  auto qexp = SpscQueue<std::unique_ptr<int>>::with_capacity(2);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  EXPECT_TRUE(q.push(std::make_unique<int>(7)));
  EXPECT_FALSE(q.push(std::make_unique<int>(8)));   // capacity 2 -> one usable slot

  std::unique_ptr<int> out;
  ASSERT_TRUE(q.pop(out));
  ASSERT_TRUE(out);
  EXPECT_EQ(*out, 7);
  EXPECT_FALSE(q.pop(out));
}

/**
 * @test ProducerConsumer_Concurrent
 * @brief 1P/1C transfer keeps every element, in order.
 */
TEST(SpscQueue, ProducerConsumer_Concurrent) {
  constexpr std::size_t CAP = 1024, N = 50000;
  auto qexp = SpscQueue<std::uint32_t>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<SpscQueue<std::uint32_t>>(std::move(*qexp));

  std::atomic<std::size_t> consumed{0};
  std::thread prod([&]{
    for (std::size_t i = 0; i < N;) {
      if (q->push(static_cast<std::uint32_t>(i))) ++i;
      else std::this_thread::yield();
    }
  });
  std::vector<std::uint32_t> out; out.reserve(N);
  std::thread cons([&]{
    std::uint32_t v{};
    while (consumed.load(std::memory_order_relaxed) < N) {
      if (q->pop(v)) { out.push_back(v); consumed.fetch_add(1, std::memory_order_relaxed); }
      else std::this_thread::yield();
    }
  });
  prod.join(); cons.join();

  ASSERT_EQ(out.size(), N);
  for (std::size_t i = 0; i < N; ++i) EXPECT_EQ(out[i], i);
  EXPECT_TRUE(q->empty());
}
