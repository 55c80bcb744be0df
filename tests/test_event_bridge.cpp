// Tests for the control loop event queue.
#include "airsync/event_bridge.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <variant>

namespace {

airsync::ControlEvent FrameEvent(uint64_t sequence) {
  auto frame = std::make_shared<airsync::AudioFrame>();
  frame->stream_id = 1;
  frame->sequence = sequence;
  return airsync::FrameArrived{frame};
}

uint64_t SequenceOf(const airsync::ControlEvent& event) {
  return std::get<airsync::FrameArrived>(event).frame->sequence;
}

}  // namespace

TEST(EventBridgeTest, PreservesFifoOrder) {
  airsync::EventBridge bridge(8);
  for (uint64_t i = 1; i <= 5; ++i) {
    ASSERT_TRUE(bridge.Push(FrameEvent(i)));
  }
  ASSERT_TRUE(bridge.Push(airsync::StreamEnded{1}));
  for (uint64_t i = 1; i <= 5; ++i) {
    auto event = bridge.TryPop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(SequenceOf(*event), i);
  }
  auto end = bridge.TryPop();
  ASSERT_TRUE(end.has_value());
  EXPECT_TRUE(std::holds_alternative<airsync::StreamEnded>(*end));
  EXPECT_FALSE(bridge.TryPop().has_value());
}

TEST(EventBridgeTest, FullQueueBlocksInsteadOfDropping) {
  airsync::EventBridge bridge(50);
  for (uint64_t i = 1; i <= 50; ++i) {
    ASSERT_TRUE(bridge.Push(FrameEvent(i)));
  }
  EXPECT_EQ(bridge.size(), 50u);

  std::atomic<bool> pushed{false};
  std::thread producer([&]() {
    pushed = bridge.Push(FrameEvent(51));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(pushed.load());

  uint64_t expected = 1;
  while (expected <= 51) {
    auto event = bridge.Pop(airsync::Clock::now() + std::chrono::seconds(2));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(SequenceOf(*event), expected);
    ++expected;
  }
  producer.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(bridge.saturation_waits(), 1u);
}

TEST(EventBridgeTest, PopTimesOutWhenEmpty) {
  airsync::EventBridge bridge(4);
  const auto start = airsync::Clock::now();
  auto event = bridge.Pop(start + std::chrono::milliseconds(20));
  EXPECT_FALSE(event.has_value());
  EXPECT_GE(airsync::Clock::now() - start, std::chrono::milliseconds(20));
}

TEST(EventBridgeTest, CloseRefusesPushesButDrains) {
  airsync::EventBridge bridge(4);
  ASSERT_TRUE(bridge.Push(FrameEvent(1)));
  bridge.Close();
  EXPECT_TRUE(bridge.closed());
  EXPECT_FALSE(bridge.Push(FrameEvent(2)));
  auto event = bridge.Pop(airsync::Clock::now() + std::chrono::seconds(1));
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(SequenceOf(*event), 1u);
  EXPECT_FALSE(
      bridge.Pop(airsync::Clock::now() + std::chrono::seconds(1)).has_value());
}

TEST(EventBridgeTest, CloseWakesBlockedProducer) {
  airsync::EventBridge bridge(1);
  ASSERT_TRUE(bridge.Push(FrameEvent(1)));
  std::atomic<int> result{-1};
  std::thread producer([&]() { result = bridge.Push(FrameEvent(2)) ? 1 : 0; });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  bridge.Close();
  producer.join();
  EXPECT_EQ(result.load(), 0);
}

TEST(EventBridgeTest, TryPushRefusesWhenFullWithoutWaiting) {
  airsync::EventBridge bridge(2);
  EXPECT_TRUE(bridge.TryPush(FrameEvent(1)));
  EXPECT_TRUE(bridge.TryPush(FrameEvent(2)));
  EXPECT_FALSE(bridge.TryPush(FrameEvent(3)));
  EXPECT_EQ(bridge.size(), 2u);
  EXPECT_EQ(bridge.saturation_waits(), 0u);

  auto first = bridge.TryPop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(SequenceOf(*first), 1u);
  EXPECT_TRUE(bridge.TryPush(FrameEvent(4)));
  bridge.Close();
  EXPECT_FALSE(bridge.TryPush(FrameEvent(5)));
}
