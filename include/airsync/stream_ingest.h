#pragma once

#include "airsync/airsync.h"
#include "airsync/event_bridge.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace airsync {

/**
 * Entry point for decoded frames from the receiver.
 *
 * Stamps each frame with its stream id, a monotonic sequence number and the
 * local arrival time, then forwards it through the sink. Safe to call from
 * any thread; frames and the end marker keep their call order.
 */
class StreamIngest {
 public:
  using Sink = std::function<bool(ControlEvent)>;

  explicit StreamIngest(Sink sink);

  /// Forward one frame, opening a new stream if none is active.
  bool PushFrame(std::vector<uint8_t> payload, double capture_timestamp,
                 Clock::duration duration, TimePoint arrival = Clock::now());
  /// Close the active stream. Returns false if no stream is open.
  bool EndStream();
  /// Ask for the active stream's buffered frames to be dropped. The stream
  /// stays open and keeps its sequence numbering.
  bool Flush();

  bool streaming() const;
  uint64_t stream_id() const;
  /// Sequence number the next frame will carry.
  uint64_t next_sequence() const;

 private:
  Sink sink_;
  mutable std::mutex mutex_;
  uint64_t stream_id_ = 0;
  uint64_t next_sequence_ = 1;
  bool streaming_ = false;
};

}  // namespace airsync
