// Example: read 16-bit stereo 44.1kHz PCM from stdin and play it on every
// discovered device plus any endpoints given on the command line.
//
//   arecord -f cd -t raw | airsync_server [host[:port] ...]
#include "airsync/airsync.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr size_t kFramesPerPacket = 352;
constexpr size_t kBytesPerFrame = 4;
constexpr double kSampleRate = 44100.0;

}  // namespace

int main(int argc, char** argv) {
  airsync::Config config;
  for (int i = 1; i < argc; ++i) {
    airsync::ManualDevice device;
    std::string error;
    if (!airsync::ParseManualDevice(argv[i], &device, &error)) {
      std::cerr << "Invalid endpoint " << argv[i] << ": " << error
                << std::endl;
      return 1;
    }
    config.manual_devices.push_back(device);
  }

  airsync::Coordinator coordinator(config);
  coordinator.SetDeviceEventCallback([](const airsync::DeviceEvent& event) {
    if (event.type == airsync::DeviceEventType::kStatusChanged) {
      std::cout << event.device.name << ": "
                << airsync::ToString(event.previous_status) << " -> "
                << airsync::ToString(event.device.status) << std::endl;
    }
  });
  if (!coordinator.Start()) {
    std::cerr << "Failed to start coordinator: " << coordinator.GetLastError()
              << std::endl;
    return 1;
  }

  const auto packet_duration =
      std::chrono::duration_cast<airsync::Clock::duration>(
          std::chrono::duration<double>(kFramesPerPacket / kSampleRate));
  std::vector<uint8_t> packet(kFramesPerPacket * kBytesPerFrame);
  uint64_t samples = 0;
  while (std::cin.read(reinterpret_cast<char*>(packet.data()),
                       static_cast<std::streamsize>(packet.size()))) {
    if (!coordinator.PushFrame(packet, samples / kSampleRate,
                               packet_duration)) {
      std::cerr << "Coordinator stopped accepting frames" << std::endl;
      break;
    }
    samples += kFramesPerPacket;
  }
  coordinator.EndStream();

  const auto stats = coordinator.GetStats();
  std::cout << "ingested=" << stats.frames_ingested
            << " delivered=" << stats.frames_delivered
            << " stale=" << stats.frames_stale_dropped
            << " overflow=" << stats.frames_overflow_dropped
            << " send_failures=" << stats.send_failures << std::endl;
  coordinator.Stop();
  return 0;
}
