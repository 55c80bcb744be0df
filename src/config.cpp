#include "airsync/airsync.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <sstream>
#include <string>

namespace airsync {

namespace {

bool IsValidIpv4(const std::string& addr) {
  if (addr.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
}

bool ValidateManualDevices(const std::vector<ManualDevice>& devices,
                           std::string* error) {
  for (const auto& device : devices) {
    if (device.host.empty()) {
      if (error) {
        *error = "manual device host must not be empty";
      }
      return false;
    }
    if (device.port == 0) {
      if (error) {
        *error = "manual device port must be non-zero (" + device.host + ")";
      }
      return false;
    }
  }
  return true;
}

}  // namespace

std::chrono::milliseconds Config::EffectiveMaxStaleness() const {
  if (max_staleness.count() > 0) {
    return max_staleness;
  }
  return buffer_time * 2;
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (buffer_time.count() < 0) {
    return fail("buffer_time must not be negative");
  }
  if (global_delay.count() < 0) {
    return fail("global_delay must not be negative");
  }
  for (const auto& entry : device_delays) {
    if (entry.second.count() < 0) {
      return fail("device delay must not be negative (" + entry.first + ")");
    }
  }
  if (failure_threshold <= 0) {
    return fail("failure_threshold must be positive");
  }
  if (unreachable_grace.count() <= 0 || stale_discovery_timeout.count() <= 0) {
    return fail("device timeouts must be positive");
  }
  if (max_staleness.count() < 0) {
    return fail("max_staleness must not be negative");
  }
  if (EffectiveMaxStaleness().count() <= 0) {
    return fail("max_staleness must be set when buffer_time is zero");
  }
  if (max_staleness.count() > 0 && max_staleness <= buffer_time) {
    // Frames are already buffer_time old when due.
    return fail("max_staleness must exceed buffer_time");
  }
  if (reconnect_initial_backoff.count() <= 0 ||
      reconnect_max_backoff < reconnect_initial_backoff) {
    return fail("reconnect backoff must be positive and max >= initial");
  }
  if (reconnect_budget < 0) {
    return fail("reconnect_budget must not be negative");
  }
  if (connect_timeout.count() <= 0) {
    return fail("connect_timeout must be positive");
  }
  if (event_queue_capacity == 0 || session_queue_capacity == 0) {
    return fail("queue capacities must be non-zero");
  }
  if (auto_discovery && discovery_service_types.empty()) {
    return fail("discovery_service_types must not be empty");
  }
  if (auto_discovery && discovery_strategies.empty()) {
    return fail("discovery_strategies must not be empty");
  }
  if (!IsValidIpv4(discovery_bind_address)) {
    return fail("discovery_bind_address must be a valid IPv4 address");
  }
  if (discovery_query_interval.count() <= 0 ||
      discovery_resolve_timeout.count() <= 0 ||
      housekeeping_interval.count() <= 0) {
    return fail("intervals must be positive");
  }
  return ValidateManualDevices(manual_devices, error);
}

bool ConfigUpdate::empty() const {
  return !global_delay && !buffer_time && device_delays.empty() &&
         !auto_discovery && !manual_devices;
}

bool ConfigUpdate::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (global_delay && global_delay->count() < 0) {
    return fail("global_delay must not be negative");
  }
  if (buffer_time && buffer_time->count() < 0) {
    return fail("buffer_time must not be negative");
  }
  for (const auto& entry : device_delays) {
    if (entry.first.empty()) {
      return fail("device id must not be empty");
    }
    if (entry.second && entry.second->count() < 0) {
      return fail("device delay must not be negative (" + entry.first + ")");
    }
  }
  if (manual_devices) {
    return ValidateManualDevices(*manual_devices, error);
  }
  return true;
}

std::string MakeDeviceId(const std::string& host, uint16_t port) {
  std::ostringstream oss;
  oss << host << ":" << port;
  return oss.str();
}

bool ParseManualDevice(const std::string& text, ManualDevice* device,
                       std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  ManualDevice parsed;
  const auto colon = text.rfind(':');
  parsed.host = text.substr(0, colon);
  if (colon != std::string::npos) {
    const std::string port = text.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos) {
      return fail("invalid port '" + port + "'");
    }
    const unsigned long value = std::stoul(port);
    if (value == 0 || value > 65535) {
      return fail("port " + port + " out of range 1-65535");
    }
    parsed.port = static_cast<uint16_t>(value);
  }
  if (parsed.host.empty()) {
    return fail("empty host");
  }
  parsed.name = parsed.host;
  if (device) {
    *device = parsed;
  }
  return true;
}

const char* ToString(DeviceStatus status) {
  switch (status) {
    case DeviceStatus::kDiscovered:
      return "discovered";
    case DeviceStatus::kConnecting:
      return "connecting";
    case DeviceStatus::kConnected:
      return "connected";
    case DeviceStatus::kUnreachable:
      return "unreachable";
    case DeviceStatus::kRemoved:
      return "removed";
  }
  return "unknown";
}

const char* ToString(DeviceType type) {
  switch (type) {
    case DeviceType::kSpeaker:
      return "speaker";
    case DeviceType::kSoundSystem:
      return "soundsystem";
    case DeviceType::kAppleTV:
      return "appletv";
    case DeviceType::kAirportExpress:
      return "airport-express";
    case DeviceType::kUnknown:
      return "unknown";
  }
  return "unknown";
}

const char* ToString(ServiceKind kind) {
  switch (kind) {
    case ServiceKind::kAirport:
      return "airport";
    case ServiceKind::kAirPlay:
      return "airplay";
    case ServiceKind::kRaop:
      return "raop";
    case ServiceKind::kManual:
      return "manual";
  }
  return "unknown";
}

const char* ToString(DiscoveryStrategy strategy) {
  switch (strategy) {
    case DiscoveryStrategy::kMulticastBoundAddress:
      return "multicast-bound-address";
    case DiscoveryStrategy::kMulticastAnyAddress:
      return "multicast-any-address";
    case DiscoveryStrategy::kUnicastOnly:
      return "unicast-only";
  }
  return "unknown";
}

const char* ToString(DiscoveryInitFailure failure) {
  switch (failure) {
    case DiscoveryInitFailure::kNone:
      return "none";
    case DiscoveryInitFailure::kSocket:
      return "socket";
    case DiscoveryInitFailure::kReuseAddress:
      return "reuse-address";
    case DiscoveryInitFailure::kBind:
      return "bind";
    case DiscoveryInitFailure::kJoinGroup:
      return "join-group";
    case DiscoveryInitFailure::kMulticastInterface:
      return "multicast-interface";
  }
  return "unknown";
}

void ConfigUpdate::ApplyTo(Config* config) const {
  if (global_delay) {
    config->global_delay = *global_delay;
  }
  if (buffer_time) {
    config->buffer_time = *buffer_time;
  }
  for (const auto& entry : device_delays) {
    if (entry.second) {
      config->device_delays[entry.first] = *entry.second;
    } else {
      config->device_delays.erase(entry.first);
    }
  }
  if (auto_discovery) {
    config->auto_discovery = *auto_discovery;
  }
  if (manual_devices) {
    config->manual_devices = *manual_devices;
  }
}

}  // namespace airsync
