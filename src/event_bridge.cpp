#include "airsync/event_bridge.h"

#include <utility>

namespace airsync {

EventBridge::EventBridge(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool EventBridge::Push(ControlEvent event) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!closed_ && queue_.size() >= capacity_) {
    saturation_waits_.fetch_add(1);
    not_full_.wait(lock, [this]() {
      return closed_ || queue_.size() < capacity_;
    });
  }
  if (closed_) {
    return false;
  }
  queue_.push_back(std::move(event));
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

bool EventBridge::TryPush(ControlEvent event) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_ || queue_.size() >= capacity_) {
    return false;
  }
  queue_.push_back(std::move(event));
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

std::optional<ControlEvent> EventBridge::Pop(TimePoint deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait_until(lock, deadline, [this]() {
    return closed_ || !queue_.empty();
  });
  if (queue_.empty()) {
    return std::nullopt;
  }
  ControlEvent event = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return event;
}

std::optional<ControlEvent> EventBridge::TryPop() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  ControlEvent event = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return event;
}

void EventBridge::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool EventBridge::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t EventBridge::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace airsync
