#pragma once

#include "airsync/airsync.h"
#include "airsync/device_registry.h"
#include "airsync/dispatcher.h"
#include "airsync/event_bridge.h"
#include "airsync/logger.h"
#include "airsync/sync_engine.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace airsync {

/**
 * Single owner of the registry, timeline and output sessions.
 *
 * Every mutation happens on the thread running Run() (or, in tests, the
 * thread calling Handle/RunTimers/Pump). Other threads only push events into
 * the bridge and read the published snapshot and stats.
 */
class ControlLoop {
 public:
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

  ControlLoop(Config config, EventBridge& bridge, TransportFactory factory,
              Logger logger);
  ~ControlLoop();

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  /// Set before Run(); invoked on the loop thread.
  void SetDeviceEventCallback(DeviceEventCallback cb);

  /// Consume events until StopRequested, then tear down.
  void Run();

  /// Apply one event at `now`. Returns false for StopRequested.
  bool Handle(ControlEvent event, TimePoint now);
  /// Release due frames, start due reconnects and run housekeeping.
  void RunTimers(TimePoint now);
  /// Apply every queued event without waiting, then run timers.
  size_t Pump(TimePoint now);
  /// Cancel sessions, discard buffered frames and drain the bridge.
  void Teardown();

  /// Latest published device snapshot (any thread).
  std::shared_ptr<const std::vector<Device>> snapshot() const;
  /// Current statistics (any thread).
  Stats stats() const;

  const DeviceRegistry& registry() const { return registry_; }
  const SyncEngine& sync_engine() const { return sync_engine_; }
  Dispatcher& dispatcher() { return dispatcher_; }
  const Config& config() const { return config_; }
  bool playing() const { return playing_; }

 private:
  struct StatsAtomic {
    std::atomic<uint64_t> stream_id{0};
    std::atomic<uint64_t> frames_ingested{0};
    std::atomic<uint64_t> frames_released{0};
    std::atomic<uint64_t> frames_delivered{0};
    std::atomic<uint64_t> frames_stale_dropped{0};
    std::atomic<uint64_t> frames_discarded{0};
    std::atomic<uint64_t> frames_unrouted{0};
    std::atomic<uint64_t> send_failures{0};
    std::atomic<uint64_t> connect_failures{0};
    std::atomic<uint64_t> events_processed{0};
    std::atomic<uint64_t> discovery_resolution_failures{0};
    std::atomic<uint64_t> callback_exceptions{0};
    std::atomic<uint64_t> rejected_transitions{0};
    std::atomic<uint64_t> overflow_dropped{0};
    std::atomic<uint64_t> dispatcher_discarded{0};
    std::atomic<size_t> active_sessions{0};
    std::atomic<bool> playing{false};
    std::atomic<bool> auto_discovery{false};
  };

  void HandleDiscovery(const DiscoveryEvent& event, TimePoint now);
  void HandleFrame(const FrameArrived& event, TimePoint now);
  void HandleStreamEnded(const StreamEnded& event, TimePoint now);
  void HandleStreamFlushed(const StreamFlushed& event);
  void HandleSendResult(const SendResult& result, TimePoint now);
  void HandleConfig(const ConfigUpdate& update, TimePoint now);

  void StartStream(TimePoint now);
  void OpenSession(const std::string& device_id, TimePoint now);
  void CloseSession(const std::string& device_id, bool graceful,
                    TimePoint now);
  void ReturnToIdle(const std::string& device_id, TimePoint now);
  void OnDeviceRemoved(const Device& device, DeviceStatus previous);
  void ApplyManualDevices(const std::vector<ManualDevice>& devices,
                          TimePoint now);
  void ReconcileEligibility();
  void ReleaseFrames(TimePoint now);
  void Housekeeping(TimePoint now);

  bool SetStatus(const std::string& device_id, DeviceStatus to, TimePoint now);
  void NotifyDevice(DeviceEventType type, const Device& device,
                    DeviceStatus previous);
  void NotifyStatus(const std::string& device_id, DeviceStatus previous);
  void Publish();
  TimePoint NextDeadline(TimePoint now) const;

  Config config_;
  EventBridge& bridge_;
  Logger logger_;
  DeviceRegistry registry_;
  SyncEngine sync_engine_;
  Dispatcher dispatcher_;
  std::mutex callback_mutex_;
  DeviceEventCallback device_callback_;

  bool playing_ = false;
  uint64_t current_stream_ = 0;
  bool snapshot_dirty_ = true;
  TimePoint next_housekeeping_;
  TimePoint last_stale_log_;
  uint64_t stale_since_log_ = 0;

  StatsAtomic stats_;
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const std::vector<Device>> snapshot_;
};

}  // namespace airsync
