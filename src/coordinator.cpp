#include "airsync/airsync.h"

#include "airsync/control_loop.h"
#include "airsync/event_bridge.h"
#include "airsync/logger.h"
#include "airsync/mdns_browser.h"
#include "airsync/stream_ingest.h"
#include "airsync/transport.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace airsync {

struct Coordinator::Impl {
#ifdef AIRSYNC_TESTING
  friend ControlLoop* test::GetControlLoop(Coordinator& coordinator);
#endif

  explicit Impl(Config config)
      : config_(std::move(config)),
        logger_(config_.log_callback),
        bridge_(config_.event_queue_capacity),
        ingest_([this](ControlEvent event) {
          return bridge_.Push(std::move(event));
        }),
        transport_factory_(MakeTcpTransport) {}

  ~Impl() { Stop(); }

  void SetTransportFactory(TransportFactory factory) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ || stopped_) {
      logger_.Log("transport factory ignored: coordinator already started");
      return;
    }
    if (factory) {
      transport_factory_ = std::move(factory);
    } else {
      transport_factory_ = MakeTcpTransport;
    }
  }

  void SetDeviceEventCallback(DeviceEventCallback cb) {
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      device_callback_ = cb;
    }
    if (auto loop = CurrentLoop()) {
      loop->SetDeviceEventCallback(std::move(cb));
    }
  }

  bool Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
      return true;
    }
    start_error_.clear();
    if (stopped_) {
      start_error_ = "coordinator cannot be restarted after Stop()";
      logger_.Log(start_error_);
      return false;
    }
    std::string error;
    if (!config_.Validate(&error)) {
      start_error_ = error;
      logger_.Log(error);
      return false;
    }
    auto loop = std::make_shared<ControlLoop>(config_, bridge_,
                                              transport_factory_, logger_);
    loop->SetDeviceEventCallback(device_callback_);
    try {
      loop_thread_ = std::thread([this, loop]() {
        loop_thread_id_ = std::this_thread::get_id();
        loop->Run();
      });
    } catch (const std::system_error& ex) {
      start_error_ = std::string("thread start failed: ") + ex.what();
      logger_.Log(start_error_);
      return false;
    }
    {
      std::lock_guard<std::mutex> loop_lock(loop_mutex_);
      loop_ = loop;
    }
    running_ = true;
    if (config_.auto_discovery) {
      StartDiscovery();
    }
    return true;
  }

  void Stop() {
    if (OnLoopThread()) {
      logger_.Log("Stop() ignored: called from a device event callback");
      return;
    }
    std::thread loop_thread;
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      if (!running_) {
        return;
      }
      running_ = false;
      stopped_ = true;
      loop_thread = std::move(loop_thread_);
    }
    StopDiscovery();
    if (!bridge_.Push(StopRequested{})) {
      bridge_.Close();
    }
    if (loop_thread.joinable()) {
      loop_thread.join();
    }
  }

  bool PushFrame(std::vector<uint8_t> payload, double capture_timestamp,
                 Clock::duration duration) {
    if (!running_) {
      return false;
    }
    return ingest_.PushFrame(std::move(payload), capture_timestamp, duration);
  }

  bool EndStream() {
    if (!running_) {
      return false;
    }
    return ingest_.EndStream();
  }

  bool Flush() {
    if (!running_) {
      return false;
    }
    return ingest_.Flush();
  }

  bool ApplyConfigUpdate(ConfigUpdate update) {
    std::string error;
    if (!update.Validate(&error)) {
      logger_.Log("config update rejected: " + error);
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      if (stopped_) {
        return false;
      }
      if (!running_) {
        Config candidate = config_;
        update.ApplyTo(&candidate);
        if (!candidate.Validate(&error)) {
          logger_.Log("config update rejected: " + error);
          return false;
        }
        config_ = std::move(candidate);
        return true;
      }
    }
    const std::optional<bool> discovery = update.auto_discovery;
    if (OnLoopThread()) {
      // Only the loop thread drains the bridge, so it must never wait on it.
      if (discovery) {
        logger_.Log("config update rejected: auto discovery cannot change "
                    "from a device event callback");
        return false;
      }
      if (!bridge_.TryPush(ConfigChanged{std::move(update)})) {
        logger_.Log("config update rejected: event queue full");
        return false;
      }
      return true;
    }
    if (!bridge_.Push(ConfigChanged{std::move(update)})) {
      return false;
    }
    if (discovery) {
      if (*discovery) {
        StartDiscovery();
      } else {
        StopDiscovery();
      }
    }
    return true;
  }

  DeviceSnapshot GetDevices() const {
    auto loop = CurrentLoop();
    DeviceSnapshot snapshot = loop ? loop->snapshot() : nullptr;
    if (!snapshot) {
      snapshot = std::make_shared<const std::vector<Device>>();
    }
    return snapshot;
  }

  std::optional<Device> GetDevice(const std::string& device_id) const {
    auto devices = GetDevices();
    auto it = std::find_if(devices->begin(), devices->end(),
                           [&](const Device& device) {
                             return device.id == device_id;
                           });
    if (it == devices->end()) {
      return std::nullopt;
    }
    return *it;
  }

  Stats GetStats() const {
    auto loop = CurrentLoop();
    Stats stats;
    if (loop) {
      stats = loop->stats();
    } else {
      stats.auto_discovery = config_.auto_discovery;
    }
    stats.queue_saturation_waits = bridge_.saturation_waits();
    stats.discovery_resolution_failures += resolution_failures_.load();
    std::lock_guard<std::mutex> lock(discovery_mutex_);
    if (browser_) {
      stats.discovery_resolution_failures += browser_->resolution_failures();
    }
    return stats;
  }

  std::vector<DiscoveryInitResult> GetDiscoveryInitResults() const {
    std::lock_guard<std::mutex> lock(discovery_mutex_);
    return init_results_;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return start_error_;
  }

 private:
  bool OnLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
  }

  std::shared_ptr<ControlLoop> CurrentLoop() const {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    return loop_;
  }

  void StartDiscovery() {
    bool started = false;
    {
      std::lock_guard<std::mutex> lock(discovery_mutex_);
      if (browser_ && browser_->running()) {
        return;
      }
      MdnsBrowser::Options options;
      options.service_types = config_.discovery_service_types;
      options.bind_address = config_.discovery_bind_address;
      options.query_interval = config_.discovery_query_interval;
      options.resolve_timeout = config_.discovery_resolve_timeout;
      options.strategies = config_.discovery_strategies;
      browser_.reset(new MdnsBrowser(
          options,
          [this](DiscoveryEvent event) {
            return bridge_.Push(std::move(event));
          },
          logger_));
      started = browser_->Start();
      init_results_ = browser_->init_results();
      if (!started) {
        browser_.reset();
      }
    }
    if (started) {
      return;
    }
    logger_.Log("discovery unavailable on every strategy; continuing with "
                "manual devices only");
    ConfigUpdate update;
    update.auto_discovery = false;
    if (!bridge_.Push(ConfigChanged{std::move(update)})) {
      logger_.Log("could not disable discovery: control loop stopped");
    }
  }

  // The browser thread may be blocked pushing into the bridge, so it is
  // joined without holding discovery_mutex_.
  void StopDiscovery() {
    std::unique_ptr<MdnsBrowser> browser;
    {
      std::lock_guard<std::mutex> lock(discovery_mutex_);
      browser = std::move(browser_);
    }
    if (browser) {
      browser->Stop();
      resolution_failures_.fetch_add(browser->resolution_failures());
    }
  }

  Config config_;
  Logger logger_;
  EventBridge bridge_;
  StreamIngest ingest_;
  TransportFactory transport_factory_;
  DeviceEventCallback device_callback_;

  mutable std::mutex lifecycle_mutex_;
  std::thread loop_thread_;
  std::atomic<std::thread::id> loop_thread_id_{};
  mutable std::mutex loop_mutex_;
  std::shared_ptr<ControlLoop> loop_;
  std::atomic<bool> running_{false};
  bool stopped_ = false;
  std::string start_error_;

  mutable std::mutex discovery_mutex_;
  std::unique_ptr<MdnsBrowser> browser_;
  std::vector<DiscoveryInitResult> init_results_;
  std::atomic<uint64_t> resolution_failures_{0};
};

Coordinator::Coordinator(Config config) : impl_(new Impl(std::move(config))) {}

Coordinator::~Coordinator() { impl_->Stop(); }

void Coordinator::SetTransportFactory(TransportFactory factory) {
  impl_->SetTransportFactory(std::move(factory));
}

void Coordinator::SetDeviceEventCallback(DeviceEventCallback cb) {
  impl_->SetDeviceEventCallback(std::move(cb));
}

bool Coordinator::Start() { return impl_->Start(); }
void Coordinator::Stop() { impl_->Stop(); }

bool Coordinator::PushFrame(std::vector<uint8_t> payload,
                            double capture_timestamp,
                            Clock::duration duration) {
  return impl_->PushFrame(std::move(payload), capture_timestamp, duration);
}

bool Coordinator::EndStream() { return impl_->EndStream(); }

bool Coordinator::Flush() { return impl_->Flush(); }

bool Coordinator::ApplyConfigUpdate(ConfigUpdate update) {
  return impl_->ApplyConfigUpdate(std::move(update));
}

bool Coordinator::SetGlobalDelay(std::chrono::milliseconds delay) {
  ConfigUpdate update;
  update.global_delay = delay;
  return impl_->ApplyConfigUpdate(std::move(update));
}

bool Coordinator::SetBufferTime(std::chrono::milliseconds buffer_time) {
  ConfigUpdate update;
  update.buffer_time = buffer_time;
  return impl_->ApplyConfigUpdate(std::move(update));
}

bool Coordinator::SetDeviceDelay(
    const std::string& device_id,
    std::optional<std::chrono::milliseconds> delay) {
  ConfigUpdate update;
  update.device_delays[device_id] = delay;
  return impl_->ApplyConfigUpdate(std::move(update));
}

bool Coordinator::SetAutoDiscovery(bool enabled) {
  ConfigUpdate update;
  update.auto_discovery = enabled;
  return impl_->ApplyConfigUpdate(std::move(update));
}

bool Coordinator::SetManualDevices(std::vector<ManualDevice> devices) {
  ConfigUpdate update;
  update.manual_devices = std::move(devices);
  return impl_->ApplyConfigUpdate(std::move(update));
}

Coordinator::DeviceSnapshot Coordinator::GetDevices() const {
  return impl_->GetDevices();
}

std::optional<Device> Coordinator::GetDevice(
    const std::string& device_id) const {
  return impl_->GetDevice(device_id);
}

Stats Coordinator::GetStats() const { return impl_->GetStats(); }

std::vector<DiscoveryInitResult> Coordinator::GetDiscoveryInitResults() const {
  return impl_->GetDiscoveryInitResults();
}

std::string Coordinator::GetLastError() const {
  return impl_->GetLastError();
}

#ifdef AIRSYNC_TESTING
namespace test {

ControlLoop* GetControlLoop(Coordinator& coordinator) {
  return coordinator.impl_->CurrentLoop().get();
}

}  // namespace test
#endif

}  // namespace airsync
