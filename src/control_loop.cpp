#include "airsync/control_loop.h"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>
#include <utility>
#include <variant>

namespace airsync {

namespace {

constexpr std::chrono::seconds kStaleLogInterval{5};

Dispatcher::Options MakeDispatcherOptions(const Config& config) {
  Dispatcher::Options options;
  options.queue_capacity = config.session_queue_capacity;
  options.initial_backoff = config.reconnect_initial_backoff;
  options.max_backoff = config.reconnect_max_backoff;
  options.reconnect_budget = config.reconnect_budget;
  options.connect_timeout = config.connect_timeout;
  return options;
}

bool IsAvailable(DeviceStatus status) {
  return status == DeviceStatus::kDiscovered ||
         status == DeviceStatus::kConnecting ||
         status == DeviceStatus::kConnected;
}

}  // namespace

ControlLoop::ControlLoop(Config config, EventBridge& bridge,
                         TransportFactory factory, Logger logger)
    : config_(std::move(config)),
      bridge_(bridge),
      logger_(std::move(logger)),
      sync_engine_(config_.buffer_time, config_.global_delay,
                   config_.max_staleness),
      dispatcher_(MakeDispatcherOptions(config_), std::move(factory),
                  [&bridge](SendResult result) {
                    return bridge.Push(std::move(result));
                  },
                  logger_) {
  const TimePoint now = Clock::now();
  for (const auto& entry : config_.device_delays) {
    sync_engine_.SetDeviceDelay(entry.first, entry.second);
  }
  stats_.auto_discovery = config_.auto_discovery;
  ApplyManualDevices(config_.manual_devices, now);
  next_housekeeping_ = now + config_.housekeeping_interval;
  last_stale_log_ = now;
  Publish();
}

ControlLoop::~ControlLoop() {
  bridge_.Close();
  dispatcher_.Shutdown();
}

void ControlLoop::SetDeviceEventCallback(DeviceEventCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  device_callback_ = std::move(cb);
}

void ControlLoop::Run() {
  while (true) {
    RunTimers(Clock::now());
    Publish();
    auto event = bridge_.Pop(NextDeadline(Clock::now()));
    if (!event) {
      if (bridge_.closed()) {
        break;
      }
      continue;
    }
    if (!Handle(std::move(*event), Clock::now())) {
      break;
    }
  }
  Teardown();
}

bool ControlLoop::Handle(ControlEvent event, TimePoint now) {
  stats_.events_processed.fetch_add(1);
  bool keep_running = true;
  if (auto* discovery = std::get_if<DiscoveryEvent>(&event)) {
    HandleDiscovery(*discovery, now);
  } else if (auto* frame = std::get_if<FrameArrived>(&event)) {
    HandleFrame(*frame, now);
  } else if (auto* ended = std::get_if<StreamEnded>(&event)) {
    HandleStreamEnded(*ended, now);
  } else if (auto* flushed = std::get_if<StreamFlushed>(&event)) {
    HandleStreamFlushed(*flushed);
  } else if (auto* result = std::get_if<SendResult>(&event)) {
    HandleSendResult(*result, now);
  } else if (auto* changed = std::get_if<ConfigChanged>(&event)) {
    HandleConfig(changed->update, now);
  } else {
    keep_running = false;
  }
  ReconcileEligibility();
  return keep_running;
}

size_t ControlLoop::Pump(TimePoint now) {
  size_t handled = 0;
  while (auto event = bridge_.TryPop()) {
    ++handled;
    if (!Handle(std::move(*event), now)) {
      break;
    }
  }
  RunTimers(now);
  Publish();
  return handled;
}

void ControlLoop::RunTimers(TimePoint now) {
  for (const auto& device_id : dispatcher_.Tick(now)) {
    const Device* device = registry_.Find(device_id);
    if (device && device->status != DeviceStatus::kUnreachable) {
      SetStatus(device_id, DeviceStatus::kUnreachable, now);
    }
  }
  if (now >= next_housekeeping_) {
    Housekeeping(now);
    next_housekeeping_ = now + config_.housekeeping_interval;
  }
  ReconcileEligibility();
  ReleaseFrames(now);
}

void ControlLoop::HandleDiscovery(const DiscoveryEvent& event, TimePoint now) {
  if (!config_.auto_discovery) {
    return;
  }
  if (event.kind == DiscoveryEventKind::kRemoved) {
    const Device* device = registry_.FindByService(event.record);
    const DeviceStatus previous =
        device ? device->status : DeviceStatus::kDiscovered;
    auto removed = registry_.RemoveService(event.record);
    if (removed) {
      OnDeviceRemoved(*removed, previous);
    } else if (device) {
      NotifyDevice(DeviceEventType::kUpdated, *device, device->status);
    }
    return;
  }

  const Device* before = registry_.FindByService(event.record);
  const DeviceStatus vacated_status =
      before ? before->status : DeviceStatus::kDiscovered;
  auto result = registry_.Upsert(event.record, now);
  if (!result) {
    stats_.discovery_resolution_failures.fetch_add(1);
    logger_.Log("discovery record " + event.record.instance_name +
                " has no usable address");
    return;
  }
  if (result->vacated) {
    OnDeviceRemoved(*result->vacated, vacated_status);
  }
  const std::string& id = result->device.id;
  if (result->is_new) {
    auto delay = config_.device_delays.find(id);
    if (delay != config_.device_delays.end()) {
      registry_.SetDelayOverride(id, delay->second);
    }
    NotifyDevice(DeviceEventType::kAdded, *registry_.Find(id),
                 DeviceStatus::kDiscovered);
  } else if (result->changed) {
    NotifyDevice(DeviceEventType::kUpdated, *registry_.Find(id),
                 result->device.status);
  }

  const Device* device = registry_.Find(id);
  if (!playing_ || !device->capabilities.audio || dispatcher_.HasSession(id)) {
    return;
  }
  if (device->status == DeviceStatus::kDiscovered) {
    OpenSession(id, now);
  } else if (device->status == DeviceStatus::kUnreachable) {
    // Re-announced while idle: try again without leaving Unreachable.
    if (!dispatcher_.Open(*device)) {
      logger_.Log("could not reopen session for " + id);
    }
  }
}

void ControlLoop::HandleFrame(const FrameArrived& event, TimePoint now) {
  stats_.frames_ingested.fetch_add(1);
  const FramePtr& frame = event.frame;
  if (playing_ && frame->stream_id != current_stream_) {
    // A new stream started without an end marker for the previous one.
    HandleStreamEnded(StreamEnded{current_stream_}, now);
  }
  if (!playing_) {
    current_stream_ = frame->stream_id;
    StartStream(now);
  }
  ReconcileEligibility();
  if (!sync_engine_.Admit(frame)) {
    stats_.frames_discarded.fetch_add(1);
    std::ostringstream oss;
    oss << "frame " << frame->sequence << " of stream " << frame->stream_id
        << " arrived out of order, discarded";
    logger_.Log(oss.str());
  }
}

void ControlLoop::StartStream(TimePoint now) {
  playing_ = true;
  stats_.playing = true;
  stats_.stream_id = current_stream_;
  for (const auto& device : registry_.Snapshot()) {
    if (!device.capabilities.audio || dispatcher_.HasSession(device.id)) {
      continue;
    }
    if (device.status == DeviceStatus::kDiscovered) {
      OpenSession(device.id, now);
    } else if (device.status == DeviceStatus::kUnreachable &&
               !dispatcher_.Open(device)) {
      logger_.Log("could not reopen session for " + device.id);
    }
  }
}

void ControlLoop::HandleStreamEnded(const StreamEnded& event, TimePoint now) {
  if (!playing_ || event.stream_id != current_stream_) {
    return;
  }
  stats_.frames_discarded.fetch_add(sync_engine_.Discard());
  for (const auto& session : dispatcher_.Sessions()) {
    CloseSession(session.device_id, true, now);
  }
  playing_ = false;
  stats_.playing = false;
}

void ControlLoop::HandleStreamFlushed(const StreamFlushed& event) {
  if (!playing_ || event.stream_id != current_stream_) {
    return;
  }
  const size_t buffered = sync_engine_.Flush();
  stats_.frames_discarded.fetch_add(buffered);
  const size_t queued = dispatcher_.FlushAll();
  stats_.dispatcher_discarded = dispatcher_.discarded();
  std::ostringstream oss;
  oss << "stream " << event.stream_id << " flushed: " << buffered
      << " buffered and " << queued << " queued frames dropped";
  logger_.Log(oss.str());
}

void ControlLoop::HandleSendResult(const SendResult& result, TimePoint now) {
  const std::string& id = result.device_id;
  switch (result.kind) {
    case SendResultKind::kDiscarded:
      stats_.frames_discarded.fetch_add(1);
      return;
    case SendResultKind::kSent: {
      stats_.frames_delivered.fetch_add(1);
      if (!dispatcher_.IsCurrent(result)) {
        return;
      }
      const Device* device = registry_.Find(id);
      const DeviceStatus previous =
          device ? device->status : DeviceStatus::kDiscovered;
      if (registry_.RecordSuccess(id, now)) {
        NotifyStatus(id, previous);
      }
      dispatcher_.OnDelivered(id);
      return;
    }
    case SendResultKind::kConnected:
      if (dispatcher_.IsCurrent(result)) {
        dispatcher_.OnConnected(id);
      }
      return;
    case SendResultKind::kSendFailed:
    case SendResultKind::kConnectFailed:
      break;
  }

  const bool connect = result.kind == SendResultKind::kConnectFailed;
  if (connect) {
    stats_.connect_failures.fetch_add(1);
  } else {
    stats_.send_failures.fetch_add(1);
  }
  if (!dispatcher_.IsCurrent(result)) {
    return;
  }
  const Device* device = registry_.Find(id);
  if (!device) {
    return;
  }
  const DeviceStatus previous = device->status;
  auto failure = registry_.RecordFailure(id, now, config_.failure_threshold);
  if (connect) {
    logger_.Log("connect to " + id + " failed: " + result.error);
  }
  if (failure.became_unreachable) {
    std::ostringstream oss;
    oss << "device " << id << " unreachable after "
        << failure.consecutive_failures << " consecutive failures";
    if (!result.error.empty()) {
      oss << " (" << result.error << ")";
    }
    logger_.Log(oss.str());
    NotifyStatus(id, previous);
  }
  device = registry_.Find(id);
  if (connect || (device && device->status == DeviceStatus::kUnreachable)) {
    dispatcher_.EnterBackoff(id, now);
  }
}

void ControlLoop::HandleConfig(const ConfigUpdate& update, TimePoint now) {
  std::string error;
  Config candidate = config_;
  update.ApplyTo(&candidate);
  if (!update.Validate(&error) || !candidate.Validate(&error)) {
    logger_.Log("config update rejected: " + error);
    return;
  }
  if (update.global_delay) {
    config_.global_delay = *update.global_delay;
    sync_engine_.SetGlobalDelay(*update.global_delay);
  }
  if (update.buffer_time) {
    config_.buffer_time = *update.buffer_time;
    sync_engine_.SetBufferTime(*update.buffer_time);
  }
  for (const auto& entry : update.device_delays) {
    const std::string& id = entry.first;
    if (entry.second) {
      config_.device_delays[id] = *entry.second;
      sync_engine_.SetDeviceDelay(id, *entry.second);
    } else {
      config_.device_delays.erase(id);
      sync_engine_.ClearDeviceDelay(id);
    }
    if (registry_.SetDelayOverride(id, entry.second)) {
      const Device* device = registry_.Find(id);
      NotifyDevice(DeviceEventType::kUpdated, *device, device->status);
    }
  }
  if (update.auto_discovery) {
    config_.auto_discovery = *update.auto_discovery;
    stats_.auto_discovery = config_.auto_discovery;
  }
  if (update.manual_devices) {
    config_.manual_devices = *update.manual_devices;
    ApplyManualDevices(config_.manual_devices, now);
  }
}

void ControlLoop::ApplyManualDevices(const std::vector<ManualDevice>& devices,
                                     TimePoint now) {
  std::set<std::string> wanted;
  for (const auto& manual : devices) {
    if (!manual.enabled) {
      continue;
    }
    auto result = registry_.UpsertManual(manual, now);
    const std::string& id = result.device.id;
    wanted.insert(id);
    if (result.is_new) {
      auto delay = config_.device_delays.find(id);
      if (delay != config_.device_delays.end()) {
        registry_.SetDelayOverride(id, delay->second);
      }
      NotifyDevice(DeviceEventType::kAdded, *registry_.Find(id),
                   DeviceStatus::kDiscovered);
    } else if (result.changed) {
      NotifyDevice(DeviceEventType::kUpdated, *registry_.Find(id),
                   result.device.status);
    }
    if (playing_ && result.device.status == DeviceStatus::kDiscovered &&
        !dispatcher_.HasSession(id)) {
      OpenSession(id, now);
    }
  }
  for (const auto& device : registry_.Snapshot()) {
    if (device.manual() && wanted.count(device.id) == 0) {
      auto removed = registry_.Remove(device.id);
      if (removed) {
        OnDeviceRemoved(*removed, device.status);
      }
    }
  }
}

void ControlLoop::OpenSession(const std::string& device_id, TimePoint now) {
  const Device* device = registry_.Find(device_id);
  if (!device) {
    return;
  }
  if (!dispatcher_.Open(*device)) {
    logger_.Log("could not open session for " + device_id);
    return;
  }
  SetStatus(device_id, DeviceStatus::kConnecting, now);
}

void ControlLoop::CloseSession(const std::string& device_id, bool graceful,
                               TimePoint now) {
  dispatcher_.Close(device_id, graceful);
  ReturnToIdle(device_id, now);
}

// Unreachable devices keep their grace clock running after the session ends.
void ControlLoop::ReturnToIdle(const std::string& device_id, TimePoint now) {
  const Device* device = registry_.Find(device_id);
  if (device && (device->status == DeviceStatus::kConnecting ||
                 device->status == DeviceStatus::kConnected)) {
    SetStatus(device_id, DeviceStatus::kDiscovered, now);
  }
}

void ControlLoop::OnDeviceRemoved(const Device& device, DeviceStatus previous) {
  dispatcher_.Close(device.id, false);
  sync_engine_.RemoveDevice(device.id);
  NotifyDevice(DeviceEventType::kRemoved, device, previous);
}

void ControlLoop::ReconcileEligibility() {
  for (const auto& device_id : sync_engine_.Devices()) {
    if (!dispatcher_.IsEligible(device_id)) {
      sync_engine_.RemoveDevice(device_id);
    }
  }
  for (const auto& session : dispatcher_.Sessions()) {
    if (dispatcher_.IsEligible(session.device_id) &&
        !sync_engine_.HasDevice(session.device_id)) {
      sync_engine_.AddDevice(session.device_id);
    }
  }
  stats_.active_sessions = dispatcher_.size();
}

void ControlLoop::ReleaseFrames(TimePoint now) {
  ReleaseReport report = sync_engine_.Release(now);
  for (const auto& emission : report.emissions) {
    if (dispatcher_.Send(emission)) {
      stats_.frames_released.fetch_add(1);
    } else {
      stats_.frames_discarded.fetch_add(1);
    }
  }
  stats_.frames_unrouted.fetch_add(report.unrouted);
  stats_.overflow_dropped = dispatcher_.overflow_dropped();
  stats_.dispatcher_discarded = dispatcher_.discarded();
  if (report.stale_dropped > 0) {
    stats_.frames_stale_dropped.fetch_add(report.stale_dropped);
    stale_since_log_ += report.stale_dropped;
  }
  if (stale_since_log_ > 0 && now - last_stale_log_ >= kStaleLogInterval) {
    std::ostringstream oss;
    oss << "dropped " << stale_since_log_ << " stale frame(s) older than "
        << sync_engine_.EffectiveMaxStaleness().count() << "ms";
    logger_.Log(oss.str());
    stale_since_log_ = 0;
    last_stale_log_ = now;
  }
}

void ControlLoop::Housekeeping(TimePoint now) {
  for (const auto& device :
       registry_.ExpireUnreachable(now, config_.unreachable_grace)) {
    logger_.Log("device " + device.id + " removed after grace window");
    OnDeviceRemoved(device, DeviceStatus::kUnreachable);
  }
  for (const auto& device :
       registry_.ExpireStale(now, config_.stale_discovery_timeout)) {
    logger_.Log("device " + device.id + " expired (not seen)");
    OnDeviceRemoved(device, DeviceStatus::kDiscovered);
  }
  dispatcher_.ReapRetired();
}

bool ControlLoop::SetStatus(const std::string& device_id, DeviceStatus to,
                            TimePoint now) {
  const Device* device = registry_.Find(device_id);
  if (!device) {
    return false;
  }
  const DeviceStatus previous = device->status;
  if (!registry_.Transition(device_id, to, now)) {
    stats_.rejected_transitions.fetch_add(1);
    logger_.Log("rejected transition for " + device_id + ": " +
                ToString(previous) + " -> " + ToString(to));
    return false;
  }
  if (previous != to) {
    NotifyStatus(device_id, previous);
  }
  return true;
}

void ControlLoop::NotifyStatus(const std::string& device_id,
                               DeviceStatus previous) {
  const Device* device = registry_.Find(device_id);
  if (device) {
    NotifyDevice(DeviceEventType::kStatusChanged, *device, previous);
  }
}

void ControlLoop::NotifyDevice(DeviceEventType type, const Device& device,
                               DeviceStatus previous) {
  snapshot_dirty_ = true;
  DeviceEventCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = device_callback_;
  }
  if (!cb) {
    return;
  }
  DeviceEvent event;
  event.type = type;
  event.device = device;
  event.previous_status = previous;
  try {
    cb(event);
  } catch (const std::exception& ex) {
    stats_.callback_exceptions.fetch_add(1);
    logger_.Log(std::string("device event callback threw: ") + ex.what());
  } catch (...) {
    stats_.callback_exceptions.fetch_add(1);
    logger_.Log("device event callback threw an unknown exception");
  }
}

void ControlLoop::Publish() {
  if (!snapshot_dirty_) {
    return;
  }
  auto snapshot =
      std::make_shared<const std::vector<Device>>(registry_.Snapshot());
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(snapshot);
  snapshot_dirty_ = false;
}

TimePoint ControlLoop::NextDeadline(TimePoint now) const {
  TimePoint deadline = std::max(now, next_housekeeping_);
  if (auto wakeup = sync_engine_.NextWakeup()) {
    deadline = std::min(deadline, std::max(now, *wakeup));
  }
  if (auto wakeup = dispatcher_.NextWakeup()) {
    deadline = std::min(deadline, std::max(now, *wakeup));
  }
  return deadline;
}

void ControlLoop::Teardown() {
  bridge_.Close();
  const TimePoint now = Clock::now();
  stats_.frames_discarded.fetch_add(sync_engine_.Discard());
  std::vector<std::string> had_sessions;
  for (const auto& session : dispatcher_.Sessions()) {
    had_sessions.push_back(session.device_id);
  }
  dispatcher_.Shutdown();
  for (const auto& device_id : had_sessions) {
    ReturnToIdle(device_id, now);
  }
  // Account for everything still queued so nothing is silently lost.
  while (auto event = bridge_.TryPop()) {
    stats_.events_processed.fetch_add(1);
    if (std::holds_alternative<FrameArrived>(*event)) {
      stats_.frames_ingested.fetch_add(1);
      stats_.frames_discarded.fetch_add(1);
    } else if (auto* result = std::get_if<SendResult>(&*event)) {
      if (result->kind == SendResultKind::kSent) {
        stats_.frames_delivered.fetch_add(1);
      } else if (result->kind == SendResultKind::kDiscarded) {
        stats_.frames_discarded.fetch_add(1);
      }
    }
  }
  stats_.overflow_dropped = dispatcher_.overflow_dropped();
  stats_.dispatcher_discarded = dispatcher_.discarded();
  stats_.active_sessions = 0;
  playing_ = false;
  stats_.playing = false;
  Publish();
}

std::shared_ptr<const std::vector<Device>> ControlLoop::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

Stats ControlLoop::stats() const {
  Stats out;
  out.playback_state =
      stats_.playing.load() ? PlaybackState::kPlaying : PlaybackState::kStopped;
  out.stream_id = stats_.stream_id.load();
  out.frames_ingested = stats_.frames_ingested.load();
  out.frames_released = stats_.frames_released.load();
  out.frames_delivered = stats_.frames_delivered.load();
  out.frames_stale_dropped = stats_.frames_stale_dropped.load();
  out.frames_overflow_dropped = stats_.overflow_dropped.load();
  out.frames_discarded =
      stats_.frames_discarded.load() + stats_.dispatcher_discarded.load();
  out.frames_unrouted = stats_.frames_unrouted.load();
  out.send_failures = stats_.send_failures.load();
  out.connect_failures = stats_.connect_failures.load();
  out.events_processed = stats_.events_processed.load();
  out.queue_saturation_waits = bridge_.saturation_waits();
  out.discovery_resolution_failures =
      stats_.discovery_resolution_failures.load();
  out.callback_exceptions = stats_.callback_exceptions.load();
  out.rejected_transitions = stats_.rejected_transitions.load();
  out.active_sessions = stats_.active_sessions.load();
  out.auto_discovery = stats_.auto_discovery.load();
  auto devices = snapshot();
  if (devices) {
    out.devices_total = devices->size();
    for (const auto& device : *devices) {
      if (IsAvailable(device.status)) {
        ++out.devices_available;
      }
      if (device.manual()) {
        ++out.devices_manual;
      } else {
        ++out.devices_discovered;
      }
    }
  }
  return out;
}

}  // namespace airsync
