// Tests for the public Coordinator lifecycle and frame path.
#include "airsync/airsync.h"
#include "airsync/control_loop.h"
#include "airsync/test_hooks.h"

#include "fake_transport.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {

const std::string kPatio = "127.0.0.1:7000";

airsync::Config ManualConfig(std::mutex* log_mutex,
                             std::vector<std::string>* log) {
  airsync::Config config;
  config.auto_discovery = false;
  config.buffer_time = 50ms;
  airsync::ManualDevice patio;
  patio.name = "Patio";
  patio.host = "127.0.0.1";
  patio.port = 7000;
  config.manual_devices.push_back(patio);
  config.log_callback = [log_mutex, log](const std::string& line) {
    std::lock_guard<std::mutex> lock(*log_mutex);
    log->push_back(line);
  };
  return config;
}

}  // namespace

TEST(CoordinatorTest, RejectsInvalidConfigOnStart) {
  airsync::Config config;
  config.auto_discovery = false;
  config.buffer_time = -1ms;
  config.log_callback = [](const std::string&) {};
  airsync::Coordinator coordinator(config);
  EXPECT_FALSE(coordinator.Start());
  EXPECT_FALSE(coordinator.GetLastError().empty());
  EXPECT_FALSE(coordinator.PushFrame({1, 2}, 0.0, 10ms));
}

TEST(CoordinatorTest, DeliversFramesToManualDevice) {
  std::mutex log_mutex;
  std::vector<std::string> log;
  airsync::fakes::FakeNetwork network;
  airsync::Coordinator coordinator(ManualConfig(&log_mutex, &log));
  coordinator.SetTransportFactory(network.Factory());
  ASSERT_TRUE(coordinator.Start());
  EXPECT_TRUE(coordinator.GetLastError().empty());

  auto devices = coordinator.GetDevices();
  ASSERT_EQ(devices->size(), 1u);
  EXPECT_EQ((*devices)[0].id, kPatio);
  EXPECT_TRUE((*devices)[0].manual());

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(coordinator.PushFrame({1, 2, 3, 4}, i * 0.01, 10ms));
  }

  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (coordinator.GetStats().frames_delivered < 5 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  auto stats = coordinator.GetStats();
  EXPECT_EQ(stats.frames_ingested, 5u);
  EXPECT_EQ(stats.frames_delivered, 5u);
  EXPECT_EQ(stats.playback_state, airsync::PlaybackState::kPlaying);
  EXPECT_EQ(stats.devices_manual, 1u);
  EXPECT_FALSE(stats.auto_discovery);

  std::vector<uint64_t> expected = {1, 2, 3, 4, 5};
  EXPECT_EQ(network.Endpoint(kPatio)->Sent(), expected);

  auto patio = coordinator.GetDevice(kPatio);
  ASSERT_TRUE(patio.has_value());
  EXPECT_EQ(patio->status, airsync::DeviceStatus::kConnected);

  coordinator.Stop();
  EXPECT_FALSE(coordinator.PushFrame({1}, 1.0, 10ms));
  EXPECT_EQ(coordinator.GetStats().active_sessions, 0u);
}

TEST(CoordinatorTest, CannotRestartAfterStop) {
  std::mutex log_mutex;
  std::vector<std::string> log;
  airsync::fakes::FakeNetwork network;
  airsync::Coordinator coordinator(ManualConfig(&log_mutex, &log));
  coordinator.SetTransportFactory(network.Factory());
  ASSERT_TRUE(coordinator.Start());
  EXPECT_TRUE(coordinator.Start());
  coordinator.Stop();
  EXPECT_FALSE(coordinator.Start());
  EXPECT_EQ(coordinator.GetLastError(),
            "coordinator cannot be restarted after Stop()");
  EXPECT_FALSE(coordinator.SetGlobalDelay(10ms));
}

TEST(CoordinatorTest, UpdatesBeforeStartAreMerged) {
  std::mutex log_mutex;
  std::vector<std::string> log;
  airsync::fakes::FakeNetwork network;
  airsync::Coordinator coordinator(ManualConfig(&log_mutex, &log));
  coordinator.SetTransportFactory(network.Factory());
  EXPECT_TRUE(coordinator.SetGlobalDelay(20ms));
  EXPECT_TRUE(coordinator.SetDeviceDelay(kPatio, 15ms));
  EXPECT_FALSE(coordinator.SetBufferTime(-5ms));
  ASSERT_TRUE(coordinator.Start());

  airsync::ControlLoop* loop = airsync::test::GetControlLoop(coordinator);
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->config().global_delay, 20ms);
  EXPECT_EQ(loop->config().buffer_time, 50ms);
  ASSERT_EQ(loop->config().device_delays.count(kPatio), 1u);
  EXPECT_EQ(loop->config().device_delays.at(kPatio), 15ms);

  auto patio = coordinator.GetDevice(kPatio);
  ASSERT_TRUE(patio.has_value());
  ASSERT_TRUE(patio->delay_override.has_value());
  EXPECT_EQ(*patio->delay_override, 15ms);
  coordinator.Stop();
}

TEST(CoordinatorTest, CallbackMayUpdateConfigWithoutBlocking) {
  std::mutex log_mutex;
  std::vector<std::string> log;
  airsync::fakes::FakeNetwork network;
  airsync::Coordinator coordinator(ManualConfig(&log_mutex, &log));
  coordinator.SetTransportFactory(network.Factory());

  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  bool delay_ok = false;
  bool buffer_ok = false;
  bool discovery_ok = true;
  // Status changes after a connect result are reported on the loop thread.
  coordinator.SetDeviceEventCallback(
      [&](const airsync::DeviceEvent& event) {
        if (event.type != airsync::DeviceEventType::kStatusChanged ||
            event.device.status != airsync::DeviceStatus::kConnected) {
          return;
        }
        const bool delay = coordinator.SetGlobalDelay(30ms);
        const bool buffer = coordinator.SetBufferTime(80ms);
        const bool discovery = coordinator.SetAutoDiscovery(true);
        coordinator.Stop();
        std::lock_guard<std::mutex> lock(mutex);
        delay_ok = delay;
        buffer_ok = buffer;
        discovery_ok = discovery;
        done = true;
        cv.notify_all();
      });
  ASSERT_TRUE(coordinator.Start());
  ASSERT_TRUE(coordinator.PushFrame({1, 2, 3, 4}, 0.0, 10ms));
  {
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 3s, [&]() { return done; }));
  }
  EXPECT_TRUE(delay_ok);
  EXPECT_TRUE(buffer_ok);
  EXPECT_FALSE(discovery_ok);

  // The queued updates are applied by the loop once the callback returns.
  airsync::ControlLoop* loop = airsync::test::GetControlLoop(coordinator);
  ASSERT_NE(loop, nullptr);
  coordinator.Stop();
  EXPECT_EQ(loop->config().global_delay, 30ms);
  EXPECT_EQ(loop->config().buffer_time, 80ms);
  EXPECT_FALSE(loop->config().auto_discovery);

  std::lock_guard<std::mutex> lock(log_mutex);
  EXPECT_NE(std::find(log.begin(), log.end(),
                      "Stop() ignored: called from a device event callback"),
            log.end());
}

TEST(CoordinatorTest, FailedDiscoveryFallsBackToManualDevices) {
  std::mutex log_mutex;
  std::vector<std::string> log;
  airsync::fakes::FakeNetwork network;
  airsync::Config config = ManualConfig(&log_mutex, &log);
  config.auto_discovery = true;
  // No host owns this documentation address, so every bind fails.
  config.discovery_bind_address = "192.0.2.1";
  config.discovery_strategies = {
      airsync::DiscoveryStrategy::kMulticastBoundAddress,
      airsync::DiscoveryStrategy::kUnicastOnly};
  airsync::Coordinator coordinator(config);
  coordinator.SetTransportFactory(network.Factory());
  ASSERT_TRUE(coordinator.Start());

  const auto results = coordinator.GetDiscoveryInitResults();
  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_FALSE(result.ok());
  }

  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(coordinator.PushFrame({1, 2, 3, 4}, i * 0.01, 10ms));
  }
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while ((coordinator.GetStats().frames_delivered < 3 ||
          coordinator.GetStats().auto_discovery) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  const auto stats = coordinator.GetStats();
  EXPECT_FALSE(stats.auto_discovery);
  EXPECT_EQ(stats.frames_delivered, 3u);
  EXPECT_EQ(network.Endpoint(kPatio)->Sent(),
            std::vector<uint64_t>({1, 2, 3}));
  coordinator.Stop();

  std::lock_guard<std::mutex> lock(log_mutex);
  EXPECT_NE(std::find(log.begin(), log.end(),
                      "discovery unavailable on every strategy; continuing "
                      "with manual devices only"),
            log.end());
}
