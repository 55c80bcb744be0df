#include "airsync/sync_engine.h"

#include <algorithm>
#include <utility>

namespace airsync {

SyncEngine::SyncEngine(std::chrono::milliseconds buffer_time,
                       std::chrono::milliseconds global_delay,
                       std::chrono::milliseconds max_staleness)
    : max_staleness_(max_staleness) {
  timeline_.buffer_time = buffer_time;
  timeline_.global_delay = global_delay;
}

bool SyncEngine::Admit(FramePtr frame) {
  if (!frame || frame->sequence < next_sequence_) {
    return false;
  }
  if (!timeline_.stream_start) {
    timeline_.stream_start = frame->arrival;
  }
  next_sequence_ = frame->sequence + 1;
  Pending pending;
  pending.frame = std::move(frame);
  buffer_.emplace(pending.frame->sequence, std::move(pending));
  return true;
}

std::chrono::milliseconds SyncEngine::EffectiveMaxStaleness() const {
  if (max_staleness_.count() > 0) {
    return max_staleness_;
  }
  return timeline_.buffer_time * 2;
}

std::chrono::milliseconds SyncEngine::DeviceDelay(
    const std::string& device_id) const {
  auto it = device_delays_.find(device_id);
  return it == device_delays_.end() ? std::chrono::milliseconds(0) : it->second;
}

TimePoint SyncEngine::TargetFor(const AudioFrame& frame,
                                const std::string& device_id) const {
  return frame.arrival + timeline_.buffer_time + timeline_.global_delay +
         DeviceDelay(device_id);
}

// Age counts only the time spent beyond the frame's intentional offsets.
bool SyncEngine::IsStale(const AudioFrame& frame,
                         std::chrono::milliseconds offset,
                         TimePoint now) const {
  const auto age = now - (frame.arrival + timeline_.global_delay + offset);
  return age > EffectiveMaxStaleness();
}

ReleaseReport SyncEngine::Release(TimePoint now) {
  ReleaseReport report;
  if (cursors_.empty()) {
    // Nobody to deliver to: frames leave at their base target time.
    for (auto it = buffer_.begin(); it != buffer_.end();) {
      const AudioFrame& frame = *it->second.frame;
      if (frame.arrival + timeline_.buffer_time + timeline_.global_delay > now) {
        break;
      }
      if (IsStale(frame, std::chrono::milliseconds(0), now)) {
        ++report.stale_dropped;
      } else {
        ++report.unrouted;
      }
      it = buffer_.erase(it);
    }
    return report;
  }

  for (auto& cursor : cursors_) {
    const std::string& device_id = cursor.first;
    const auto delay = DeviceDelay(device_id);
    for (auto it = buffer_.lower_bound(cursor.second); it != buffer_.end();
         ++it) {
      Pending& pending = it->second;
      const AudioFrame& frame = *pending.frame;
      if (TargetFor(frame, device_id) > now) {
        break;
      }
      cursor.second = it->first + 1;
      if (IsStale(frame, delay, now)) {
        if (!pending.stale) {
          pending.stale = true;
          ++report.stale_dropped;
        }
        continue;
      }
      pending.routed = true;
      report.emissions.push_back(
          Emission{device_id, pending.frame, TargetFor(frame, device_id)});
    }
  }
  Prune(report);
  return report;
}

// Drop frames every device has moved past.
void SyncEngine::Prune(ReleaseReport& report) {
  uint64_t low = next_sequence_;
  for (const auto& cursor : cursors_) {
    low = std::min(low, cursor.second);
  }
  for (auto it = buffer_.begin(); it != buffer_.end() && it->first < low;) {
    if (!it->second.routed && !it->second.stale) {
      ++report.unrouted;
    }
    it = buffer_.erase(it);
  }
}

std::optional<TimePoint> SyncEngine::NextWakeup() const {
  if (buffer_.empty()) {
    return std::nullopt;
  }
  if (cursors_.empty()) {
    const AudioFrame& frame = *buffer_.begin()->second.frame;
    return frame.arrival + timeline_.buffer_time + timeline_.global_delay;
  }
  std::optional<TimePoint> earliest;
  for (const auto& cursor : cursors_) {
    auto it = buffer_.lower_bound(cursor.second);
    if (it == buffer_.end()) {
      continue;
    }
    const TimePoint target = TargetFor(*it->second.frame, cursor.first);
    if (!earliest || target < *earliest) {
      earliest = target;
    }
  }
  return earliest;
}

size_t SyncEngine::Discard() {
  const size_t discarded = buffer_.size();
  buffer_.clear();
  timeline_.stream_start.reset();
  next_sequence_ = 1;
  for (auto& cursor : cursors_) {
    cursor.second = 1;
  }
  return discarded;
}

size_t SyncEngine::Flush() {
  const size_t flushed = buffer_.size();
  buffer_.clear();
  for (auto& cursor : cursors_) {
    cursor.second = next_sequence_;
  }
  return flushed;
}

void SyncEngine::AddDevice(const std::string& device_id) {
  cursors_.emplace(device_id, next_sequence_);
}

void SyncEngine::RemoveDevice(const std::string& device_id) {
  cursors_.erase(device_id);
}

bool SyncEngine::HasDevice(const std::string& device_id) const {
  return cursors_.count(device_id) > 0;
}

std::vector<std::string> SyncEngine::Devices() const {
  std::vector<std::string> out;
  out.reserve(cursors_.size());
  for (const auto& cursor : cursors_) {
    out.push_back(cursor.first);
  }
  return out;
}

std::optional<uint64_t> SyncEngine::Cursor(const std::string& device_id) const {
  auto it = cursors_.find(device_id);
  if (it == cursors_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SyncEngine::SetDeviceDelay(const std::string& device_id,
                                std::chrono::milliseconds delay) {
  device_delays_[device_id] = delay;
}

void SyncEngine::ClearDeviceDelay(const std::string& device_id) {
  device_delays_.erase(device_id);
}

void SyncEngine::SetGlobalDelay(std::chrono::milliseconds delay) {
  timeline_.global_delay = delay;
}

void SyncEngine::SetBufferTime(std::chrono::milliseconds buffer_time) {
  timeline_.buffer_time = buffer_time;
}

}  // namespace airsync
