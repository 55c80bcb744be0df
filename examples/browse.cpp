// Example: browse the network for playback endpoints and print lifecycle events.
#include "airsync/airsync.h"

#include <iostream>
#include <string>

int main() {
  airsync::Config config;

  airsync::Coordinator coordinator(config);
  coordinator.SetDeviceEventCallback([](const airsync::DeviceEvent& event) {
    const auto& device = event.device;
    const char* type = "added";
    switch (event.type) {
      case airsync::DeviceEventType::kAdded:
        type = "added";
        break;
      case airsync::DeviceEventType::kUpdated:
        type = "updated";
        break;
      case airsync::DeviceEventType::kStatusChanged:
        type = "status";
        break;
      case airsync::DeviceEventType::kRemoved:
        type = "removed";
        break;
    }
    std::cout << "device " << type << ": " << device.name << " (" << device.id
              << ") type=" << airsync::ToString(device.type)
              << " via=" << airsync::ToString(device.source)
              << " status=" << airsync::ToString(device.status);
    if (!device.model.empty()) {
      std::cout << " model=" << device.model;
    }
    std::cout << std::endl;
  });

  if (!coordinator.Start()) {
    std::cerr << "Failed to start coordinator: " << coordinator.GetLastError()
              << std::endl;
    return 1;
  }
  for (const auto& result : coordinator.GetDiscoveryInitResults()) {
    std::cout << "discovery " << airsync::ToString(result.strategy) << ": "
              << (result.ok() ? "ok" : airsync::ToString(result.failure));
    if (!result.detail.empty()) {
      std::cout << " (" << result.detail << ")";
    }
    std::cout << std::endl;
  }

  std::cout << "Browsing. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);

  const auto devices = coordinator.GetDevices();
  std::cout << "Known devices: " << devices->size() << std::endl;
  for (const auto& device : *devices) {
    std::cout << " - " << device.name << " (" << device.id << ")" << std::endl;
  }
  coordinator.Stop();
  return 0;
}
