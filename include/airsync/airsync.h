#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace airsync {

class ControlLoop;
class Coordinator;
class OutputTransport;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

#ifdef AIRSYNC_TESTING
namespace test {
ControlLoop* GetControlLoop(Coordinator& coordinator);
}  // namespace test
#endif

/**
 * Well-known multicast DNS endpoint used for discovery.
 */
constexpr uint16_t kMdnsPort = 5353;
constexpr const char* kMdnsGroup = "224.0.0.251";

/**
 * Default port assumed for manually configured devices.
 */
constexpr uint16_t kDefaultDevicePort = 7000;

/**
 * Service types browsed for playback endpoints.
 */
constexpr const char* kAirPlayServiceType = "_airplay._tcp.local";
constexpr const char* kRaopServiceType = "_raop._tcp.local";
constexpr const char* kAirportServiceType = "_airport._tcp.local";

enum class DeviceType {
  kSpeaker,
  kSoundSystem,
  kAppleTV,
  kAirportExpress,
  kUnknown,
};

/**
 * Device lifecycle:
 * Discovered -> Connecting -> Connected <-> Unreachable -> Removed.
 * A closed session returns a device to Discovered.
 */
enum class DeviceStatus {
  kDiscovered,
  kConnecting,
  kConnected,
  kUnreachable,
  kRemoved,
};

/**
 * Where a device record came from. Ordered by metadata preference on conflict,
 * highest last.
 */
enum class ServiceKind {
  kAirport,
  kAirPlay,
  kRaop,
  kManual,
};

struct Capabilities {
  bool audio = true;
  bool video = false;
};

using TxtRecord = std::map<std::string, std::string>;

/**
 * A resolved service announcement as delivered by the discovery feed.
 */
struct ServiceRecord {
  ServiceKind kind = ServiceKind::kAirPlay;
  /// Full service type, e.g. "_raop._tcp.local".
  std::string service_type;
  /// Instance label without the service type suffix.
  std::string instance_name;
  /// SRV target host name.
  std::string host_name;
  /// Resolved IPv4 addresses of the SRV target.
  std::vector<std::string> addresses;
  uint16_t port = 0;
  TxtRecord txt;
};

enum class DiscoveryEventKind {
  kAdded,
  kUpdated,
  kRemoved,
};

struct DiscoveryEvent {
  DiscoveryEventKind kind = DiscoveryEventKind::kAdded;
  ServiceRecord record;
};

/**
 * A playback endpoint known to the registry.
 */
struct Device {
  /// "host:port" of the resolved endpoint.
  std::string id;
  std::string name;
  std::vector<std::string> addresses;
  std::string host_name;
  uint16_t port = 0;
  DeviceType type = DeviceType::kUnknown;
  Capabilities capabilities;
  DeviceStatus status = DeviceStatus::kDiscovered;
  /// Service kind whose metadata currently describes this device.
  ServiceKind source = ServiceKind::kAirPlay;
  /// Announcing service instances ("<type>/<instance>").
  std::vector<std::string> service_names;
  std::string model;
  std::string firmware_version;
  std::optional<uint64_t> features;
  TxtRecord txt;
  TimePoint first_seen;
  TimePoint last_seen;
  std::optional<std::chrono::milliseconds> delay_override;
  int consecutive_failures = 0;
  std::optional<TimePoint> unreachable_since;

  bool manual() const { return source == ServiceKind::kManual; }
};

/**
 * One decoded, timestamped chunk of audio. Immutable once admitted.
 */
struct AudioFrame {
  /// Stream generation the frame belongs to (starts at 1).
  uint64_t stream_id = 0;
  /// Monotonic per-stream sequence number (starts at 1).
  uint64_t sequence = 0;
  /// Capture timestamp reported by the receiver, in seconds.
  double capture_timestamp = 0.0;
  /// Local arrival time at the ingest stage.
  TimePoint arrival;
  Clock::duration duration{0};
  std::vector<uint8_t> payload;
};

using FramePtr = std::shared_ptr<const AudioFrame>;

struct ManualDevice {
  std::string name;
  std::string host;
  uint16_t port = kDefaultDevicePort;
  bool enabled = true;
};

/**
 * Error taxonomy; every occurrence is counted in Stats.
 */
enum class ErrorKind {
  kDiscoveryResolution,
  kDispatchConnect,
  kDispatchSend,
  kFrameStale,
  kEventQueueSaturated,
};

/**
 * Discovery socket setups, attempted in order until one succeeds.
 */
enum class DiscoveryStrategy {
  /// Bind the configured address on 5353 and join the group on it.
  kMulticastBoundAddress,
  /// Bind INADDR_ANY on 5353 and join the group on the default interface.
  kMulticastAnyAddress,
  /// Ephemeral port, unicast-response queries only.
  kUnicastOnly,
};

enum class DiscoveryInitFailure {
  kNone,
  kSocket,
  kReuseAddress,
  kBind,
  kJoinGroup,
  kMulticastInterface,
};

struct DiscoveryInitResult {
  DiscoveryStrategy strategy = DiscoveryStrategy::kMulticastBoundAddress;
  DiscoveryInitFailure failure = DiscoveryInitFailure::kNone;
  std::string detail;

  bool ok() const { return failure == DiscoveryInitFailure::kNone; }
};

/**
 * Factory for per-device output transports. Defaults to TCP.
 */
using TransportFactory =
    std::function<std::unique_ptr<OutputTransport>(const Device&)>;

/**
 * Core configuration.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Browse the network for devices.
  bool auto_discovery = true;
  /// Statically configured endpoints.
  std::vector<ManualDevice> manual_devices;

  /// Fixed delay added to every frame to absorb network jitter.
  std::chrono::milliseconds buffer_time{2000};
  /// Uniform offset applied to all devices.
  std::chrono::milliseconds global_delay{0};
  /// Per-device offsets keyed by device id.
  std::map<std::string, std::chrono::milliseconds> device_delays;

  /// Consecutive send failures before a device is Unreachable.
  int failure_threshold = 3;
  /// Time an Unreachable device is kept before removal.
  std::chrono::milliseconds unreachable_grace{60000};
  /// Maximum frame age before it is dropped; 0 means 2x buffer_time.
  std::chrono::milliseconds max_staleness{0};

  /// Reconnect backoff bounds.
  std::chrono::milliseconds reconnect_initial_backoff{1000};
  std::chrono::milliseconds reconnect_max_backoff{30000};
  /// Reconnect attempts before the session is destroyed.
  int reconnect_budget = 5;
  /// Connect timeout for the default transport; also bounds each send.
  std::chrono::milliseconds connect_timeout{5000};

  /// Discovered devices that never connected are dropped after this.
  std::chrono::milliseconds stale_discovery_timeout{300000};

  /// Capacity of the control loop event queue.
  size_t event_queue_capacity = 256;
  /// Frames buffered per device sender.
  size_t session_queue_capacity = 64;

  std::vector<std::string> discovery_service_types = {
      kAirPlayServiceType, kRaopServiceType, kAirportServiceType};
  /// Local address for discovery sockets (usually 0.0.0.0).
  std::string discovery_bind_address = "0.0.0.0";
  std::chrono::milliseconds discovery_query_interval{10000};
  std::chrono::milliseconds discovery_resolve_timeout{3000};
  /// Socket setups tried in order; discovery is disabled if all fail.
  std::vector<DiscoveryStrategy> discovery_strategies = {
      DiscoveryStrategy::kMulticastBoundAddress,
      DiscoveryStrategy::kMulticastAnyAddress,
      DiscoveryStrategy::kUnicastOnly};

  /// How often expiry checks run in the control loop.
  std::chrono::milliseconds housekeeping_interval{1000};

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /// Effective staleness bound.
  std::chrono::milliseconds EffectiveMaxStaleness() const;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * A live configuration change. Unset fields are left untouched; the whole
 * update is applied between two release cycles.
 */
struct ConfigUpdate {
  std::optional<std::chrono::milliseconds> global_delay;
  std::optional<std::chrono::milliseconds> buffer_time;
  /// Set (value) or clear (nullopt) per-device delays.
  std::map<std::string, std::optional<std::chrono::milliseconds>> device_delays;
  std::optional<bool> auto_discovery;
  std::optional<std::vector<ManualDevice>> manual_devices;

  bool empty() const;
  bool Validate(std::string* error = nullptr) const;
  /// Copy the set fields into `config`.
  void ApplyTo(Config* config) const;
};

enum class PlaybackState {
  kStopped,
  kPlaying,
};

/**
 * Counters and gauges for the status surface.
 */
struct Stats {
  PlaybackState playback_state = PlaybackState::kStopped;
  uint64_t stream_id = 0;
  uint64_t frames_ingested = 0;
  /// Frame copies handed to device senders.
  uint64_t frames_released = 0;
  /// Frame copies confirmed sent.
  uint64_t frames_delivered = 0;
  /// Frames dropped for exceeding the staleness bound, counted once per frame.
  /// Staleness is judged against each device's own delayed target, so a frame
  /// too old for one device may still be delivered to a device whose larger
  /// delay keeps it within the bound.
  uint64_t frames_stale_dropped = 0;
  /// Frames dropped from a full per-device queue.
  uint64_t frames_overflow_dropped = 0;
  /// Frames discarded on stream teardown, flush or session close.
  uint64_t frames_discarded = 0;
  /// Frames released while no device was eligible.
  uint64_t frames_unrouted = 0;
  uint64_t send_failures = 0;
  uint64_t connect_failures = 0;
  uint64_t events_processed = 0;
  uint64_t queue_saturation_waits = 0;
  uint64_t discovery_resolution_failures = 0;
  uint64_t callback_exceptions = 0;
  uint64_t rejected_transitions = 0;
  size_t active_sessions = 0;
  size_t devices_total = 0;
  size_t devices_available = 0;
  size_t devices_manual = 0;
  size_t devices_discovered = 0;
  bool auto_discovery = false;
};

enum class DeviceEventType {
  kAdded,
  kUpdated,
  kStatusChanged,
  kRemoved,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kAdded;
  Device device;
  DeviceStatus previous_status = DeviceStatus::kDiscovered;
};

/// "host:port" identifier for an endpoint.
std::string MakeDeviceId(const std::string& host, uint16_t port);

/**
 * Parse "host" or "host:port" into a manual device named after its host.
 *
 * @param error Optional output string describing the failure.
 * @return false on an empty host or a port outside 1-65535.
 */
bool ParseManualDevice(const std::string& text, ManualDevice* device,
                       std::string* error);

const char* ToString(DeviceStatus status);
const char* ToString(DeviceType type);
const char* ToString(ServiceKind kind);
const char* ToString(DiscoveryStrategy strategy);
const char* ToString(DiscoveryInitFailure failure);

/**
 * Discovers playback endpoints and fans a single audio stream out to all of
 * them, time aligned.
 */
class Coordinator {
 public:
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;
  using DeviceSnapshot = std::shared_ptr<const std::vector<Device>>;

  /// Construct a coordinator with the provided configuration.
  explicit Coordinator(Config config);
  /// Stop the control loop, discovery and all device senders.
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  /// Replace the transport factory. Only honored before Start().
  void SetTransportFactory(TransportFactory factory);
  /// Set callback invoked on device lifecycle events (control loop thread).
  void SetDeviceEventCallback(DeviceEventCallback cb);

  /// Start the control loop and, if enabled, discovery.
  bool Start();
  /// Cancel outstanding sends and timers and wait for quiescence.
  void Stop();

  /// Hand a decoded frame to the ingest stage. Blocks while the queue is full.
  bool PushFrame(std::vector<uint8_t> payload, double capture_timestamp,
                 Clock::duration duration);
  /// Signal end of the current stream.
  bool EndStream();
  /// Drop buffered and queued audio (receiver seek or pause) while keeping
  /// the stream and device sessions open.
  bool Flush();

  /// Apply a live configuration change.
  bool ApplyConfigUpdate(ConfigUpdate update);
  bool SetGlobalDelay(std::chrono::milliseconds delay);
  bool SetBufferTime(std::chrono::milliseconds buffer_time);
  bool SetDeviceDelay(const std::string& device_id,
                      std::optional<std::chrono::milliseconds> delay);
  bool SetAutoDiscovery(bool enabled);
  bool SetManualDevices(std::vector<ManualDevice> devices);

  /// Return an immutable snapshot of known devices, ordered by id.
  DeviceSnapshot GetDevices() const;
  /// Return a single device from the latest snapshot, if known.
  std::optional<Device> GetDevice(const std::string& device_id) const;
  /// Return playback and error statistics.
  Stats GetStats() const;
  /// Return every discovery initialization attempt of the last Start().
  std::vector<DiscoveryInitResult> GetDiscoveryInitResults() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef AIRSYNC_TESTING
  friend ControlLoop* test::GetControlLoop(Coordinator& coordinator);
#endif
};

}  // namespace airsync
