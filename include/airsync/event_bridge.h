#pragma once

#include "airsync/airsync.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace airsync {

/**
 * A decoded frame admitted by the ingest stage.
 */
struct FrameArrived {
  FramePtr frame;
};

/**
 * End-of-stream marker, queued behind the stream's last frame.
 */
struct StreamEnded {
  uint64_t stream_id = 0;
};

/**
 * Drop everything buffered for the stream but keep it and its sessions open.
 */
struct StreamFlushed {
  uint64_t stream_id = 0;
};

enum class SendResultKind {
  kConnected,
  kConnectFailed,
  kSent,
  kSendFailed,
  /// Frame dropped by the sender without a send attempt (not connected).
  kDiscarded,
};

/**
 * Outcome of one job run by a device sender.
 */
struct SendResult {
  std::string device_id;
  /// Session generation the job was issued under.
  uint64_t generation = 0;
  SendResultKind kind = SendResultKind::kSent;
  uint64_t sequence = 0;
  std::string error;
};

struct ConfigChanged {
  ConfigUpdate update;
};

struct StopRequested {};

using ControlEvent =
    std::variant<DiscoveryEvent, FrameArrived, StreamEnded, StreamFlushed,
                 SendResult, ConfigChanged, StopRequested>;

/**
 * Bounded FIFO from producer threads into the control loop.
 *
 * Push blocks while the queue is full instead of dropping. A single FIFO keeps
 * the relative order of everything pushed by one producer, which covers every
 * event about a given device. Events pushed before the consumer starts simply
 * wait; after Close() pushes fail and Pop() drains what is left.
 */
class EventBridge {
 public:
  explicit EventBridge(size_t capacity);

  EventBridge(const EventBridge&) = delete;
  EventBridge& operator=(const EventBridge&) = delete;

  /// Queue an event, waiting for space. Returns false once closed.
  bool Push(ControlEvent event);
  /// Queue an event only if there is space. Used from the consumer thread.
  bool TryPush(ControlEvent event);
  /// Wait for the next event until the deadline. Returns nullopt on timeout
  /// or when closed and empty.
  std::optional<ControlEvent> Pop(TimePoint deadline);
  /// Take the next event without waiting.
  std::optional<ControlEvent> TryPop();

  /// Refuse new events and wake all waiters. Queued events stay poppable.
  void Close();

  bool closed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }
  /// Number of pushes that had to wait for space.
  uint64_t saturation_waits() const { return saturation_waits_.load(); }

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<ControlEvent> queue_;
  bool closed_ = false;
  std::atomic<uint64_t> saturation_waits_{0};
};

}  // namespace airsync
