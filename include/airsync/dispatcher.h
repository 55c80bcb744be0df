#pragma once

#include "airsync/airsync.h"
#include "airsync/event_bridge.h"
#include "airsync/logger.h"
#include "airsync/sync_engine.h"
#include "airsync/transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace airsync {

/// Receives sender results; returns false once results can no longer be
/// delivered (bridge closed).
using ResultSink = std::function<bool(SendResult)>;

/**
 * Background sender for one device.
 *
 * Runs connect, frame and disconnect jobs in order on its own thread so a
 * slow endpoint only ever stalls itself. Frame jobs are bounded; when the
 * queue is full the oldest frame is dropped. Every job outcome is reported
 * through the ResultSink, never by touching shared state.
 */
class SessionWorker {
 public:
  SessionWorker(std::string device_id, std::string host, uint16_t port,
                std::unique_ptr<OutputTransport> transport,
                size_t queue_capacity, std::chrono::milliseconds connect_timeout,
                ResultSink sink);
  ~SessionWorker();

  SessionWorker(const SessionWorker&) = delete;
  SessionWorker& operator=(const SessionWorker&) = delete;

  bool Start(std::string* error);

  void PostConnect(uint64_t generation);
  /// Queue a frame. Returns the number of frames dropped to make room.
  size_t PostFrame(uint64_t generation, FramePtr frame,
                   double presentation_time);
  void PostDisconnect(uint64_t generation);
  /// Drop every queued frame job. Returns how many were dropped.
  size_t Flush();

  /// Ask the thread to exit; a graceful stop finishes queued jobs first.
  void RequestStop(bool graceful);
  /// Abort a connect or send the thread is blocked in. Safe from any thread.
  void Cancel();
  void Join();
  /// True once the thread has exited.
  bool Finished() const;
  /// True when no job is queued or running.
  bool Idle() const;
  /// Wait until Idle() or the timeout elapses.
  bool WaitIdle(std::chrono::milliseconds timeout) const;

  size_t queued_frames() const;
  /// Results the sink refused after the bridge closed.
  uint64_t undelivered_results() const { return undelivered_results_.load(); }

 private:
  struct Job {
    enum class Kind { kConnect, kFrame, kDisconnect };
    Kind kind = Kind::kFrame;
    uint64_t generation = 0;
    FramePtr frame;
    double presentation_time = 0.0;
  };

  void Run();
  void RunJob(const Job& job);
  void Report(SendResult result);

  const std::string device_id_;
  const std::string host_;
  const uint16_t port_;
  std::unique_ptr<OutputTransport> transport_;
  const size_t queue_capacity_;
  const std::chrono::milliseconds connect_timeout_;
  ResultSink sink_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  mutable std::condition_variable idle_cv_;
  std::deque<Job> jobs_;
  size_t queued_frames_ = 0;
  bool busy_ = false;
  bool stop_ = false;
  bool graceful_ = false;
  bool finished_ = false;
  bool connected_ = false;
  std::atomic<uint64_t> undelivered_results_{0};
  std::thread thread_;
};

enum class SessionState {
  kConnecting,
  kOpen,
  kBackoff,
};

/**
 * Dispatcher-side view of one output session.
 */
struct SessionInfo {
  std::string device_id;
  SessionState state = SessionState::kConnecting;
  /// Incremented on every (re)connect; results from older generations are
  /// stale.
  uint64_t generation = 0;
  /// Reconnect attempts since the last successful delivery.
  int reconnect_attempts = 0;
  std::chrono::milliseconds backoff{0};
  std::optional<TimePoint> next_attempt;
  uint64_t last_sequence = 0;
  uint64_t frames_queued = 0;
};

/**
 * Owns one OutputSession per active device. Driven only from the control
 * loop thread; the blocking work happens in each session's SessionWorker.
 */
class Dispatcher {
 public:
  struct Options {
    size_t queue_capacity = 64;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    int reconnect_budget = 5;
    std::chrono::milliseconds connect_timeout{5000};
  };

  Dispatcher(Options options, TransportFactory factory, ResultSink sink,
             Logger logger);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /// Create a session and start connecting. Fails if one already exists.
  bool Open(const Device& device);
  /// Queue a released frame for its device. Returns false when the device has
  /// no eligible session.
  bool Send(const Emission& emission);

  /// True if the result belongs to the device's live session generation.
  bool IsCurrent(const SendResult& result) const;
  void OnConnected(const std::string& device_id);
  /// Reset reconnect accounting after a confirmed delivery.
  void OnDelivered(const std::string& device_id);
  /// Stop sending, drop queued frames and schedule a reconnect.
  bool EnterBackoff(const std::string& device_id, TimePoint now);
  /// Start due reconnects. Returns devices whose retry budget ran out; their
  /// sessions are destroyed.
  std::vector<std::string> Tick(TimePoint now);

  /// Destroy a session; graceful lets queued frames go out first.
  bool Close(const std::string& device_id, bool graceful);
  void CloseAll(bool graceful);
  /// Drop queued frames on every session without closing any. Returns the
  /// number dropped, which is also added to discarded().
  size_t FlushAll();
  /// Join workers that have already exited. Never blocks.
  void ReapRetired();
  /// Stop and join every worker. Call after the result sink is closed.
  void Shutdown();

  bool HasSession(const std::string& device_id) const;
  /// Connecting or open sessions accept frames.
  bool IsEligible(const std::string& device_id) const;
  std::optional<SessionInfo> GetSession(const std::string& device_id) const;
  std::vector<SessionInfo> Sessions() const;
  size_t size() const { return sessions_.size(); }
  size_t retired() const { return retired_.size(); }
  std::optional<TimePoint> NextWakeup() const;

  /// Wait for every worker to drain its queue.
  bool WaitIdle(std::chrono::milliseconds timeout) const;

  uint64_t overflow_dropped() const { return overflow_dropped_; }
  uint64_t discarded() const { return discarded_; }

 private:
  struct Session {
    SessionInfo info;
    std::unique_ptr<SessionWorker> worker;
  };

  Options options_;
  TransportFactory factory_;
  ResultSink sink_;
  Logger logger_;
  std::map<std::string, Session> sessions_;
  std::vector<std::unique_ptr<SessionWorker>> retired_;
  uint64_t next_generation_ = 1;
  uint64_t overflow_dropped_ = 0;
  uint64_t discarded_ = 0;
};

}  // namespace airsync
