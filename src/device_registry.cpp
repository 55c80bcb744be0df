#include "airsync/device_registry.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace airsync {

namespace {

bool StartsWith(const std::string& value, const char* prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string TxtValue(const TxtRecord& txt, const char* key) {
  auto it = txt.find(key);
  return it == txt.end() ? std::string() : it->second;
}

// Compare the fields external readers can observe.
bool SameMetadata(const Device& a, const Device& b) {
  return a.name == b.name && a.addresses == b.addresses &&
         a.host_name == b.host_name && a.port == b.port && a.type == b.type &&
         a.model == b.model && a.firmware_version == b.firmware_version &&
         a.features == b.features && a.txt == b.txt && a.source == b.source &&
         a.service_names == b.service_names &&
         a.capabilities.audio == b.capabilities.audio &&
         a.capabilities.video == b.capabilities.video;
}

}  // namespace

bool DeviceRegistry::IsValidTransition(DeviceStatus from, DeviceStatus to) {
  if (from == to) {
    return true;
  }
  switch (from) {
    case DeviceStatus::kDiscovered:
      return to == DeviceStatus::kConnecting || to == DeviceStatus::kRemoved;
    case DeviceStatus::kConnecting:
      return to == DeviceStatus::kConnected ||
             to == DeviceStatus::kUnreachable ||
             to == DeviceStatus::kDiscovered || to == DeviceStatus::kRemoved;
    case DeviceStatus::kConnected:
      return to == DeviceStatus::kUnreachable ||
             to == DeviceStatus::kDiscovered || to == DeviceStatus::kRemoved;
    case DeviceStatus::kUnreachable:
      // Leaves only by recovering or by expiring out of the grace window.
      return to == DeviceStatus::kConnected || to == DeviceStatus::kRemoved;
    case DeviceStatus::kRemoved:
      return false;
  }
  return false;
}

std::optional<ServiceKind> DeviceRegistry::ServiceKindFromType(
    const std::string& service_type) {
  if (StartsWith(service_type, "_raop.")) {
    return ServiceKind::kRaop;
  }
  if (StartsWith(service_type, "_airplay.")) {
    return ServiceKind::kAirPlay;
  }
  if (StartsWith(service_type, "_airport.")) {
    return ServiceKind::kAirport;
  }
  return std::nullopt;
}

std::string DeviceRegistry::DisplayName(ServiceKind kind,
                                        const std::string& instance_name) {
  if (kind == ServiceKind::kRaop) {
    // RAOP instances are "<MAC>@<Name>".
    auto at = instance_name.find('@');
    if (at != std::string::npos && at + 1 < instance_name.size()) {
      return instance_name.substr(at + 1);
    }
  }
  return instance_name;
}

std::optional<uint64_t> DeviceRegistry::ParseFeatures(const TxtRecord& txt) {
  std::string value = TxtValue(txt, "features");
  if (value.empty()) {
    value = TxtValue(txt, "ft");
  }
  if (value.empty()) {
    return std::nullopt;
  }
  std::string low = value;
  std::string high;
  auto comma = value.find(',');
  if (comma != std::string::npos) {
    low = value.substr(0, comma);
    high = value.substr(comma + 1);
  }
  auto parse_hex = [](const std::string& text, uint64_t* out) {
    if (text.empty()) {
      return false;
    }
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(text.c_str(), &end, 16);
    if (end == text.c_str() || *end != '\0') {
      return false;
    }
    *out = static_cast<uint64_t>(parsed);
    return true;
  };
  uint64_t low_bits = 0;
  if (!parse_hex(low, &low_bits)) {
    return std::nullopt;
  }
  uint64_t high_bits = 0;
  if (!high.empty() && !parse_hex(high, &high_bits)) {
    return std::nullopt;
  }
  return (high_bits << 32) | (low_bits & 0xFFFFFFFFull);
}

Capabilities DeviceRegistry::CapabilitiesFromFeatures(
    std::optional<uint64_t> features) {
  Capabilities caps;
  if (!features) {
    return caps;
  }
  caps.audio = (*features & 0x01) != 0;
  caps.video = (*features & 0x02) != 0;
  return caps;
}

DeviceType DeviceRegistry::ClassifyDevice(const std::string& service_type,
                                          const std::string& model,
                                          const Capabilities& caps,
                                          bool has_features) {
  if (StartsWith(service_type, "_airport.") || StartsWith(model, "AirPort")) {
    return DeviceType::kAirportExpress;
  }
  if (StartsWith(model, "AppleTV")) {
    return DeviceType::kAppleTV;
  }
  if (StartsWith(model, "AudioAccessory") || StartsWith(model, "HomePod")) {
    return DeviceType::kSpeaker;
  }
  if (model.empty() && !has_features) {
    return DeviceType::kUnknown;
  }
  if (caps.video) {
    return DeviceType::kAppleTV;
  }
  return DeviceType::kSoundSystem;
}

std::string DeviceRegistry::ServiceKey(const ServiceRecord& record) {
  return record.service_type + "/" + record.instance_name;
}

int DeviceRegistry::SourceRank(ServiceKind kind) {
  return static_cast<int>(kind);
}

void DeviceRegistry::ApplyMetadata(Device& device,
                                   const ServiceRecord& record) {
  device.source = record.kind;
  device.name = DisplayName(record.kind, record.instance_name);
  device.host_name = record.host_name;
  device.model = TxtValue(record.txt, "am");
  if (device.model.empty()) {
    device.model = TxtValue(record.txt, "md");
  }
  device.firmware_version = TxtValue(record.txt, "fv");
  device.features = ParseFeatures(record.txt);
  device.capabilities = CapabilitiesFromFeatures(device.features);
  device.type = ClassifyDevice(record.service_type, device.model,
                               device.capabilities, device.features.has_value());
  device.txt = record.txt;
}

std::optional<DeviceRegistry::UpsertResult> DeviceRegistry::Upsert(
    const ServiceRecord& record, TimePoint now) {
  if (record.addresses.empty() || record.port == 0) {
    return std::nullopt;
  }
  std::vector<std::string> addresses = record.addresses;
  std::sort(addresses.begin(), addresses.end());
  addresses.erase(std::unique(addresses.begin(), addresses.end()),
                  addresses.end());
  const std::string id = MakeDeviceId(addresses.front(), record.port);
  const std::string key = ServiceKey(record);

  UpsertResult result;

  // The service now resolves to a different endpoint: detach it first.
  auto service_it = services_.find(key);
  if (service_it != services_.end() && service_it->second != id) {
    ServiceRecord previous;
    previous.service_type = record.service_type;
    previous.instance_name = record.instance_name;
    result.vacated = RemoveService(previous);
  }

  auto it = devices_.find(id);
  if (it == devices_.end()) {
    Device device;
    device.id = id;
    device.addresses = addresses;
    device.port = record.port;
    device.status = DeviceStatus::kDiscovered;
    device.first_seen = now;
    device.last_seen = now;
    device.service_names.push_back(key);
    ApplyMetadata(device, record);
    services_[key] = id;
    auto inserted = devices_.emplace(id, std::move(device));
    result.device = inserted.first->second;
    result.is_new = true;
    result.changed = true;
    return result;
  }

  Device& device = it->second;
  const Device before = device;
  device.last_seen = now;
  if (!device.manual()) {
    device.addresses = addresses;
  }
  if (std::find(device.service_names.begin(), device.service_names.end(),
                key) == device.service_names.end()) {
    device.service_names.push_back(key);
  }
  if (SourceRank(record.kind) >= SourceRank(device.source)) {
    ApplyMetadata(device, record);
  }
  services_[key] = id;
  result.device = device;
  result.changed = !SameMetadata(before, device);
  return result;
}

DeviceRegistry::UpsertResult DeviceRegistry::UpsertManual(
    const ManualDevice& manual, TimePoint now) {
  const std::string id = MakeDeviceId(manual.host, manual.port);
  const std::string name = manual.name.empty() ? manual.host : manual.name;
  UpsertResult result;
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    Device device;
    device.id = id;
    device.name = name;
    device.addresses = {manual.host};
    device.host_name = manual.host;
    device.port = manual.port;
    device.source = ServiceKind::kManual;
    device.status = DeviceStatus::kDiscovered;
    device.first_seen = now;
    device.last_seen = now;
    auto inserted = devices_.emplace(id, std::move(device));
    result.device = inserted.first->second;
    result.is_new = true;
    result.changed = true;
    return result;
  }
  Device& device = it->second;
  const Device before = device;
  device.source = ServiceKind::kManual;
  device.name = name;
  device.addresses = {manual.host};
  device.last_seen = now;
  result.device = device;
  result.changed = !SameMetadata(before, device);
  return result;
}

std::optional<Device> DeviceRegistry::RemoveService(
    const ServiceRecord& record) {
  const std::string key = ServiceKey(record);
  auto service_it = services_.find(key);
  if (service_it == services_.end()) {
    return std::nullopt;
  }
  const std::string id = service_it->second;
  services_.erase(service_it);
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  auto& names = it->second.service_names;
  names.erase(std::remove(names.begin(), names.end(), key), names.end());
  if (!names.empty() || it->second.manual()) {
    return std::nullopt;
  }
  return Remove(id);
}

std::optional<Device> DeviceRegistry::Remove(const std::string& id) {
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  for (const auto& key : it->second.service_names) {
    services_.erase(key);
  }
  Device removed = std::move(it->second);
  devices_.erase(it);
  removed.status = DeviceStatus::kRemoved;
  return removed;
}

bool DeviceRegistry::Transition(const std::string& id, DeviceStatus to,
                                TimePoint now) {
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return false;
  }
  Device& device = it->second;
  if (device.status == to) {
    return true;
  }
  if (to == DeviceStatus::kRemoved || !IsValidTransition(device.status, to)) {
    return false;
  }
  device.status = to;
  switch (to) {
    case DeviceStatus::kUnreachable:
      device.unreachable_since = now;
      break;
    case DeviceStatus::kConnected:
    case DeviceStatus::kDiscovered:
    case DeviceStatus::kConnecting:
      device.consecutive_failures = 0;
      device.unreachable_since.reset();
      break;
    case DeviceStatus::kRemoved:
      break;
  }
  return true;
}

bool DeviceRegistry::MarkUnreachable(const std::string& id, TimePoint now) {
  return Transition(id, DeviceStatus::kUnreachable, now);
}

DeviceRegistry::FailureResult DeviceRegistry::RecordFailure(
    const std::string& id, TimePoint now, int threshold) {
  FailureResult result;
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return result;
  }
  Device& device = it->second;
  ++device.consecutive_failures;
  result.consecutive_failures = device.consecutive_failures;
  if (device.status != DeviceStatus::kUnreachable &&
      device.consecutive_failures >= threshold) {
    result.became_unreachable =
        Transition(id, DeviceStatus::kUnreachable, now);
  }
  return result;
}

bool DeviceRegistry::RecordSuccess(const std::string& id, TimePoint now) {
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return false;
  }
  Device& device = it->second;
  device.consecutive_failures = 0;
  if (device.status == DeviceStatus::kConnecting ||
      device.status == DeviceStatus::kUnreachable) {
    return Transition(id, DeviceStatus::kConnected, now);
  }
  return false;
}

std::vector<Device> DeviceRegistry::ExpireUnreachable(
    TimePoint now, std::chrono::milliseconds grace) {
  std::vector<std::string> expired;
  for (const auto& entry : devices_) {
    const Device& device = entry.second;
    if (device.status == DeviceStatus::kUnreachable && !device.manual() &&
        device.unreachable_since && now - *device.unreachable_since >= grace) {
      expired.push_back(entry.first);
    }
  }
  std::vector<Device> removed;
  for (const auto& id : expired) {
    auto device = Remove(id);
    if (device) {
      removed.push_back(std::move(*device));
    }
  }
  return removed;
}

std::vector<Device> DeviceRegistry::ExpireStale(
    TimePoint now, std::chrono::milliseconds timeout) {
  std::vector<std::string> expired;
  for (const auto& entry : devices_) {
    const Device& device = entry.second;
    if (device.status == DeviceStatus::kDiscovered && !device.manual() &&
        now - device.last_seen >= timeout) {
      expired.push_back(entry.first);
    }
  }
  std::vector<Device> removed;
  for (const auto& id : expired) {
    auto device = Remove(id);
    if (device) {
      removed.push_back(std::move(*device));
    }
  }
  return removed;
}

bool DeviceRegistry::SetDelayOverride(
    const std::string& id, std::optional<std::chrono::milliseconds> delay) {
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return false;
  }
  it->second.delay_override = delay;
  return true;
}

const Device* DeviceRegistry::Find(const std::string& id) const {
  auto it = devices_.find(id);
  return it == devices_.end() ? nullptr : &it->second;
}

const Device* DeviceRegistry::FindByService(const ServiceRecord& record) const {
  auto it = services_.find(ServiceKey(record));
  return it == services_.end() ? nullptr : Find(it->second);
}

std::vector<Device> DeviceRegistry::Snapshot() const {
  std::vector<Device> out;
  out.reserve(devices_.size());
  for (const auto& entry : devices_) {
    out.push_back(entry.second);
  }
  return out;
}

}  // namespace airsync
