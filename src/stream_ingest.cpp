#include "airsync/stream_ingest.h"

#include <memory>
#include <utility>

namespace airsync {

StreamIngest::StreamIngest(Sink sink) : sink_(std::move(sink)) {}

bool StreamIngest::PushFrame(std::vector<uint8_t> payload,
                             double capture_timestamp, Clock::duration duration,
                             TimePoint arrival) {
  // Held across the push so sequence order equals queue order.
  std::lock_guard<std::mutex> lock(mutex_);
  if (!streaming_) {
    ++stream_id_;
    next_sequence_ = 1;
    streaming_ = true;
  }
  auto frame = std::make_shared<AudioFrame>();
  frame->stream_id = stream_id_;
  frame->sequence = next_sequence_;
  frame->capture_timestamp = capture_timestamp;
  frame->arrival = arrival;
  frame->duration = duration;
  frame->payload = std::move(payload);
  if (!sink_(FrameArrived{std::move(frame)})) {
    return false;
  }
  ++next_sequence_;
  return true;
}

bool StreamIngest::EndStream() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!streaming_) {
    return false;
  }
  if (!sink_(StreamEnded{stream_id_})) {
    return false;
  }
  streaming_ = false;
  next_sequence_ = 1;
  return true;
}

bool StreamIngest::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!streaming_) {
    return false;
  }
  return sink_(StreamFlushed{stream_id_});
}

bool StreamIngest::streaming() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streaming_;
}

uint64_t StreamIngest::stream_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_id_;
}

uint64_t StreamIngest::next_sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_sequence_;
}

}  // namespace airsync
