#pragma once

#include "airsync/airsync.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace airsync {

/**
 * Timing parameters shared by every device of the current stream.
 */
struct Timeline {
  std::chrono::milliseconds global_delay{0};
  std::chrono::milliseconds buffer_time{2000};
  /// Arrival time of the first frame of the current stream.
  std::optional<TimePoint> stream_start;
};

/**
 * A frame due for one device.
 */
struct Emission {
  std::string device_id;
  FramePtr frame;
  TimePoint target;
};

struct ReleaseReport {
  std::vector<Emission> emissions;
  /// Frames dropped for exceeding the staleness bound (once per frame, even
  /// if other devices still received it).
  uint64_t stale_dropped = 0;
  /// Frames that left the buffer without any eligible device.
  uint64_t unrouted = 0;
};

/**
 * Per-stream frame buffer and release scheduler.
 *
 * target(frame, device) = arrival + buffer_time + global_delay + delay(device).
 * Each device has its own cursor (next sequence to release), so delivery per
 * device is strictly in sequence order and a device added mid-stream starts
 * at the next frame not yet admitted. Delay changes affect only frames that
 * have not been released yet.
 */
class SyncEngine {
 public:
  /// `max_staleness` of zero means twice the buffer time.
  SyncEngine(std::chrono::milliseconds buffer_time,
             std::chrono::milliseconds global_delay,
             std::chrono::milliseconds max_staleness);

  /// Buffer a frame. Frames at or below the last admitted sequence are
  /// rejected.
  bool Admit(FramePtr frame);
  /// Release every frame whose target time has arrived.
  ReleaseReport Release(TimePoint now);
  /// Earliest pending target time, if any frame is buffered.
  std::optional<TimePoint> NextWakeup() const;
  /// Drop all buffered frames and reset the stream. Returns the number of
  /// frames discarded.
  size_t Discard();
  /// Drop all buffered frames but keep the stream. Every cursor moves past
  /// the dropped frames. Returns the number of frames dropped.
  size_t Flush();

  void AddDevice(const std::string& device_id);
  void RemoveDevice(const std::string& device_id);
  bool HasDevice(const std::string& device_id) const;
  std::vector<std::string> Devices() const;
  /// Next sequence to be released to the device.
  std::optional<uint64_t> Cursor(const std::string& device_id) const;

  void SetDeviceDelay(const std::string& device_id,
                      std::chrono::milliseconds delay);
  void ClearDeviceDelay(const std::string& device_id);
  void SetGlobalDelay(std::chrono::milliseconds delay);
  void SetBufferTime(std::chrono::milliseconds buffer_time);

  std::chrono::milliseconds DeviceDelay(const std::string& device_id) const;
  std::chrono::milliseconds EffectiveMaxStaleness() const;
  TimePoint TargetFor(const AudioFrame& frame,
                      const std::string& device_id) const;

  const Timeline& timeline() const { return timeline_; }
  size_t buffered() const { return buffer_.size(); }
  uint64_t next_sequence() const { return next_sequence_; }

 private:
  struct Pending {
    FramePtr frame;
    bool stale = false;
    /// Released to at least one device.
    bool routed = false;
  };

  bool IsStale(const AudioFrame& frame, std::chrono::milliseconds offset,
               TimePoint now) const;
  void Prune(ReleaseReport& report);

  Timeline timeline_;
  std::chrono::milliseconds max_staleness_{0};
  std::map<uint64_t, Pending> buffer_;
  std::map<std::string, uint64_t> cursors_;
  std::map<std::string, std::chrono::milliseconds> device_delays_;
  /// One past the highest admitted sequence.
  uint64_t next_sequence_ = 1;
};

}  // namespace airsync
