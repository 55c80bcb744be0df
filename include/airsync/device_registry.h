#pragma once

#include "airsync/airsync.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace airsync {

/**
 * Source of truth for known devices.
 *
 * Owned by the control loop; not thread-safe. Readers outside the loop get
 * copies through Snapshot().
 */
class DeviceRegistry {
 public:
  struct UpsertResult {
    Device device;
    bool is_new = false;
    /// True when any field visible to readers changed.
    bool changed = false;
    /// Device this service moved away from, if that left it without services
    /// and it was removed.
    std::optional<Device> vacated;
  };

  struct FailureResult {
    bool became_unreachable = false;
    int consecutive_failures = 0;
  };

  /// Apply an Added/Updated record. Returns nullopt if the record has no
  /// usable address.
  std::optional<UpsertResult> Upsert(const ServiceRecord& record, TimePoint now);
  /// Insert or refresh a statically configured device.
  UpsertResult UpsertManual(const ManualDevice& manual, TimePoint now);

  /// Detach a withdrawn service instance. Returns the device when this was
  /// its last announcing service and it was removed.
  std::optional<Device> RemoveService(const ServiceRecord& record);
  /// Remove a device unconditionally.
  std::optional<Device> Remove(const std::string& id);

  /// Force a device to Unreachable and start its grace window.
  bool MarkUnreachable(const std::string& id, TimePoint now);
  /// Apply a status change if the state machine permits it.
  bool Transition(const std::string& id, DeviceStatus to, TimePoint now);

  /// Count a failed send or connect. Crossing the threshold moves the device
  /// to Unreachable.
  FailureResult RecordFailure(const std::string& id, TimePoint now,
                              int threshold);
  /// Count a successful send. Connecting/Unreachable devices become Connected.
  bool RecordSuccess(const std::string& id, TimePoint now);

  /// Remove non-manual devices Unreachable for at least `grace`.
  std::vector<Device> ExpireUnreachable(TimePoint now,
                                        std::chrono::milliseconds grace);
  /// Remove non-manual Discovered devices not refreshed within `timeout`.
  std::vector<Device> ExpireStale(TimePoint now,
                                  std::chrono::milliseconds timeout);

  bool SetDelayOverride(const std::string& id,
                        std::optional<std::chrono::milliseconds> delay);

  const Device* Find(const std::string& id) const;
  /// Device currently announced by the record's service instance.
  const Device* FindByService(const ServiceRecord& record) const;
  /// Read-only copy ordered by id.
  std::vector<Device> Snapshot() const;
  size_t size() const { return devices_.size(); }

  static bool IsValidTransition(DeviceStatus from, DeviceStatus to);
  static DeviceType ClassifyDevice(const std::string& service_type,
                                   const std::string& model,
                                   const Capabilities& caps,
                                   bool has_features);
  /// Parse feature bits from TXT ("ft" or "features", hex, optionally
  /// "low,high").
  static std::optional<uint64_t> ParseFeatures(const TxtRecord& txt);
  static Capabilities CapabilitiesFromFeatures(std::optional<uint64_t> features);
  /// Human readable name for a service instance.
  static std::string DisplayName(ServiceKind kind,
                                 const std::string& instance_name);
  static std::optional<ServiceKind> ServiceKindFromType(
      const std::string& service_type);

 private:
  static std::string ServiceKey(const ServiceRecord& record);
  static int SourceRank(ServiceKind kind);
  void ApplyMetadata(Device& device, const ServiceRecord& record);

  std::map<std::string, Device> devices_;
  /// "<type>/<instance>" -> device id.
  std::map<std::string, std::string> services_;
};

}  // namespace airsync
