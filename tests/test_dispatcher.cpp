// Tests for per-device output sessions, backoff and isolation.
#include "airsync/dispatcher.h"

#include "fake_transport.h"

#include <gtest/gtest.h>

#include <condition_variable>
#include <mutex>
#include <stdexcept>

using namespace std::chrono_literals;
using airsync::SendResult;
using airsync::SendResultKind;

namespace {

class ResultCollector {
 public:
  airsync::ResultSink Sink() {
    return [this](SendResult result) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        results_.push_back(std::move(result));
      }
      cv_.notify_all();
      return true;
    };
  }

  bool WaitFor(const std::string& device_id, SendResultKind kind, size_t count,
               std::chrono::milliseconds timeout = 2000ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() {
      return CountLocked(device_id, kind) >= count;
    });
  }

  size_t Count(const std::string& device_id, SendResultKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountLocked(device_id, kind);
  }

  std::vector<SendResult> Results() {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
  }

 private:
  size_t CountLocked(const std::string& device_id, SendResultKind kind) const {
    size_t count = 0;
    for (const auto& result : results_) {
      if (result.device_id == device_id && result.kind == kind) {
        ++count;
      }
    }
    return count;
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<SendResult> results_;
};

airsync::Device MakeDevice(const std::string& id) {
  airsync::Device device;
  device.id = id;
  device.addresses = {"10.0.0.1"};
  device.port = 7000;
  return device;
}

airsync::Emission MakeEmission(const std::string& device_id, uint64_t sequence) {
  auto frame = std::make_shared<airsync::AudioFrame>();
  frame->stream_id = 1;
  frame->sequence = sequence;
  frame->arrival = airsync::Clock::now();
  return airsync::Emission{device_id, frame, frame->arrival + 2000ms};
}

airsync::Dispatcher::Options SmallOptions() {
  airsync::Dispatcher::Options options;
  options.queue_capacity = 8;
  options.initial_backoff = 1000ms;
  options.max_backoff = 3000ms;
  options.reconnect_budget = 2;
  options.connect_timeout = 100ms;
  return options;
}

airsync::Logger QuietLogger(std::vector<std::string>* lines) {
  return airsync::Logger([lines](const std::string& line) {
    lines->push_back(line);
  });
}

}  // namespace

TEST(DispatcherTest, ConnectsAndDeliversFrames) {
  airsync::fakes::FakeNetwork network;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));

  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  EXPECT_FALSE(dispatcher.Open(MakeDevice("a")));
  EXPECT_TRUE(dispatcher.IsEligible("a"));
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kConnected, 1));
  const auto connected = results.Results().front();
  EXPECT_TRUE(dispatcher.IsCurrent(connected));
  dispatcher.OnConnected("a");
  EXPECT_EQ(dispatcher.GetSession("a")->state, airsync::SessionState::kOpen);

  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 1)));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 2)));
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kSent, 2));
  EXPECT_EQ(network.Endpoint("a")->Sent(), std::vector<uint64_t>({1, 2}));
  EXPECT_EQ(dispatcher.GetSession("a")->last_sequence, 2u);
  EXPECT_FALSE(dispatcher.Send(MakeEmission("missing", 1)));
}

TEST(DispatcherTest, FramesWithoutConnectionAreDiscarded) {
  airsync::fakes::FakeNetwork network;
  network.Endpoint("a")->connect_ok = false;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 1)));
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kDiscarded, 1));
  EXPECT_EQ(results.Count("a", SendResultKind::kConnectFailed), 1u);
  EXPECT_TRUE(network.Endpoint("a")->Sent().empty());
}

TEST(DispatcherTest, BackoffDoublesUpToMaximum) {
  airsync::fakes::FakeNetwork network;
  network.Endpoint("a")->connect_ok = false;
  ResultCollector results;
  std::vector<std::string> log;
  auto options = SmallOptions();
  options.reconnect_budget = 10;
  airsync::Dispatcher dispatcher(options, network.Factory(), results.Sink(),
                                 QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  const uint64_t first_generation = dispatcher.GetSession("a")->generation;

  auto now = airsync::Clock::now();
  ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
  EXPECT_FALSE(dispatcher.IsEligible("a"));
  EXPECT_FALSE(dispatcher.Send(MakeEmission("a", 1)));
  EXPECT_NE(dispatcher.GetSession("a")->generation, first_generation);
  ASSERT_TRUE(dispatcher.NextWakeup().has_value());
  EXPECT_EQ(*dispatcher.NextWakeup(), now + 1000ms);
  ASSERT_FALSE(log.empty());
  EXPECT_NE(log.back().find("reconnecting in 1000ms"), std::string::npos);

  EXPECT_TRUE(dispatcher.Tick(now + 999ms).empty());
  EXPECT_FALSE(dispatcher.IsEligible("a"));
  EXPECT_TRUE(dispatcher.Tick(now + 1000ms).empty());
  EXPECT_TRUE(dispatcher.IsEligible("a"));
  EXPECT_EQ(dispatcher.GetSession("a")->reconnect_attempts, 1);

  now += 1000ms;
  ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
  EXPECT_EQ(*dispatcher.GetSession("a")->next_attempt, now + 2000ms);
  dispatcher.Tick(now + 2000ms);
  now += 2000ms;
  ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
  EXPECT_EQ(*dispatcher.GetSession("a")->next_attempt, now + 3000ms);
  dispatcher.Tick(now + 3000ms);
  now += 3000ms;
  ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
  EXPECT_EQ(*dispatcher.GetSession("a")->next_attempt, now + 3000ms);
}

TEST(DispatcherTest, DeliveryResetsBackoff) {
  airsync::fakes::FakeNetwork network;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  const auto now = airsync::Clock::now();
  ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
  dispatcher.Tick(now + 1000ms);
  EXPECT_EQ(dispatcher.GetSession("a")->backoff, 2000ms);
  dispatcher.OnDelivered("a");
  EXPECT_EQ(dispatcher.GetSession("a")->backoff, 1000ms);
  EXPECT_EQ(dispatcher.GetSession("a")->reconnect_attempts, 0);
}

TEST(DispatcherTest, RetryBudgetDestroysSession) {
  airsync::fakes::FakeNetwork network;
  network.Endpoint("a")->connect_ok = false;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  auto now = airsync::Clock::now();
  for (int attempt = 0; attempt < 2; ++attempt) {
    ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
    now += 10s;
    EXPECT_TRUE(dispatcher.Tick(now).empty());
  }
  ASSERT_TRUE(dispatcher.EnterBackoff("a", now));
  now += 10s;
  auto exhausted = dispatcher.Tick(now);
  ASSERT_EQ(exhausted.size(), 1u);
  EXPECT_EQ(exhausted[0], "a");
  EXPECT_FALSE(dispatcher.HasSession("a"));
  EXPECT_EQ(dispatcher.size(), 0u);
}

TEST(DispatcherTest, StaleGenerationResultsAreIgnored) {
  airsync::fakes::FakeNetwork network;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kConnected, 1));
  const SendResult old = results.Results().front();
  ASSERT_TRUE(dispatcher.EnterBackoff("a", airsync::Clock::now()));
  EXPECT_FALSE(dispatcher.IsCurrent(old));

  SendResult other = old;
  other.device_id = "b";
  EXPECT_FALSE(dispatcher.IsCurrent(other));
}

TEST(DispatcherTest, SlowDeviceDoesNotDelayOthers) {
  airsync::fakes::FakeNetwork network;
  network.Endpoint("slow")->send_delay = 300ms;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("slow")));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("fast")));
  for (uint64_t seq = 1; seq <= 5; ++seq) {
    ASSERT_TRUE(dispatcher.Send(MakeEmission("slow", seq)));
    ASSERT_TRUE(dispatcher.Send(MakeEmission("fast", seq)));
  }
  ASSERT_TRUE(results.WaitFor("fast", SendResultKind::kSent, 5, 1000ms));
  EXPECT_LT(results.Count("slow", SendResultKind::kSent), 5u);
  EXPECT_TRUE(dispatcher.WaitIdle(5000ms));
  EXPECT_EQ(network.Endpoint("slow")->Sent().size(), 5u);
}

TEST(DispatcherTest, FullQueueDropsOldestFrame) {
  airsync::fakes::FakeNetwork network;
  auto endpoint = network.Endpoint("a");
  endpoint->gated = true;
  ResultCollector results;
  std::vector<std::string> log;
  auto options = SmallOptions();
  options.queue_capacity = 2;
  airsync::Dispatcher dispatcher(options, network.Factory(), results.Sink(),
                                 QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kConnected, 1));

  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 1)));
  ASSERT_TRUE(endpoint->WaitForSendsStarted(1, 2000ms));
  for (uint64_t seq = 2; seq <= 5; ++seq) {
    ASSERT_TRUE(dispatcher.Send(MakeEmission("a", seq)));
  }
  EXPECT_EQ(dispatcher.overflow_dropped(), 2u);
  endpoint->OpenGate();
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kSent, 3));
  EXPECT_EQ(endpoint->Sent(), std::vector<uint64_t>({1, 4, 5}));
}

TEST(DispatcherTest, GracefulCloseFlushesQueuedFrames) {
  airsync::fakes::FakeNetwork network;
  auto endpoint = network.Endpoint("a");
  endpoint->gated = true;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 1)));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 2)));
  ASSERT_TRUE(dispatcher.Close("a", true));
  EXPECT_FALSE(dispatcher.HasSession("a"));
  EXPECT_EQ(dispatcher.retired(), 1u);
  endpoint->OpenGate();
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kSent, 2));
  EXPECT_TRUE(dispatcher.WaitIdle(2000ms));
  dispatcher.Shutdown();
  EXPECT_EQ(dispatcher.retired(), 0u);
}

TEST(DispatcherTest, HardCloseDiscardsQueuedFrames) {
  airsync::fakes::FakeNetwork network;
  auto endpoint = network.Endpoint("a");
  endpoint->gated = true;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 1)));
  ASSERT_TRUE(endpoint->WaitForSendsStarted(1, 2000ms));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 2)));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 3)));
  ASSERT_TRUE(dispatcher.Close("a", false));
  EXPECT_EQ(dispatcher.discarded(), 2u);
  // The gate stays shut: the hard close must abort the blocked send itself.
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kSendFailed, 1));
  dispatcher.Shutdown();
  EXPECT_TRUE(endpoint->Sent().empty());
  EXPECT_GE(endpoint->cancels, 1);
  EXPECT_EQ(dispatcher.retired(), 0u);
}

TEST(DispatcherTest, ShutdownAbortsBlockedSends) {
  airsync::fakes::FakeNetwork network;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  for (const std::string id : {"a", "b"}) {
    network.Endpoint(id)->gated = true;
    ASSERT_TRUE(dispatcher.Open(MakeDevice(id)));
    ASSERT_TRUE(dispatcher.Send(MakeEmission(id, 1)));
    ASSERT_TRUE(network.Endpoint(id)->WaitForSendsStarted(1, 2000ms));
  }
  // One worker is already retiring gracefully when shutdown starts.
  ASSERT_TRUE(dispatcher.Close("b", true));
  dispatcher.Shutdown();
  EXPECT_EQ(dispatcher.retired(), 0u);
  EXPECT_GE(network.Endpoint("a")->cancels, 1);
  EXPECT_GE(network.Endpoint("b")->cancels, 1);
  EXPECT_EQ(results.Count("a", SendResultKind::kSent), 0u);
}

TEST(DispatcherTest, FlushAllKeepsSessionsOpen) {
  airsync::fakes::FakeNetwork network;
  auto endpoint = network.Endpoint("a");
  endpoint->gated = true;
  ResultCollector results;
  std::vector<std::string> log;
  airsync::Dispatcher dispatcher(SmallOptions(), network.Factory(),
                                 results.Sink(), QuietLogger(&log));
  ASSERT_TRUE(dispatcher.Open(MakeDevice("a")));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 1)));
  ASSERT_TRUE(endpoint->WaitForSendsStarted(1, 2000ms));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 2)));
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 3)));

  EXPECT_EQ(dispatcher.FlushAll(), 2u);
  EXPECT_EQ(dispatcher.discarded(), 2u);
  EXPECT_TRUE(dispatcher.HasSession("a"));
  EXPECT_EQ(dispatcher.retired(), 0u);

  endpoint->OpenGate();
  ASSERT_TRUE(dispatcher.Send(MakeEmission("a", 4)));
  ASSERT_TRUE(results.WaitFor("a", SendResultKind::kSent, 2));
  EXPECT_EQ(endpoint->Sent(), std::vector<uint64_t>({1, 4}));
  EXPECT_EQ(endpoint->connects, 1);
}

TEST(DispatcherTest, FactoryFailureIsReported) {
  ResultCollector results;
  std::vector<std::string> log;
  airsync::TransportFactory factory =
      [](const airsync::Device&) -> std::unique_ptr<airsync::OutputTransport> {
    throw std::runtime_error("no route");
  };
  airsync::Dispatcher dispatcher(SmallOptions(), factory, results.Sink(),
                                 QuietLogger(&log));
  EXPECT_FALSE(dispatcher.Open(MakeDevice("a")));
  ASSERT_FALSE(log.empty());
  EXPECT_NE(log.back().find("no route"), std::string::npos);
}
