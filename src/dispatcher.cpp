#include "airsync/dispatcher.h"

#include <algorithm>
#include <exception>
#include <sstream>
#include <system_error>
#include <utility>

namespace airsync {

SessionWorker::SessionWorker(std::string device_id, std::string host,
                             uint16_t port,
                             std::unique_ptr<OutputTransport> transport,
                             size_t queue_capacity,
                             std::chrono::milliseconds connect_timeout,
                             ResultSink sink)
    : device_id_(std::move(device_id)),
      host_(std::move(host)),
      port_(port),
      transport_(std::move(transport)),
      queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity),
      connect_timeout_(connect_timeout),
      sink_(std::move(sink)) {}

SessionWorker::~SessionWorker() {
  RequestStop(false);
  Join();
}

bool SessionWorker::Start(std::string* error) {
  try {
    thread_ = std::thread([this]() { Run(); });
  } catch (const std::system_error& ex) {
    if (error) {
      *error = std::string("thread start failed: ") + ex.what();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    return false;
  }
  return true;
}

void SessionWorker::PostConnect(uint64_t generation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      return;
    }
    Job job;
    job.kind = Job::Kind::kConnect;
    job.generation = generation;
    jobs_.push_back(std::move(job));
  }
  work_cv_.notify_one();
}

size_t SessionWorker::PostFrame(uint64_t generation, FramePtr frame,
                                double presentation_time) {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      // Stopping workers take no new frames; count it as dropped.
      return 1;
    }
    if (queued_frames_ >= queue_capacity_) {
      auto oldest = std::find_if(jobs_.begin(), jobs_.end(), [](const Job& job) {
        return job.kind == Job::Kind::kFrame;
      });
      if (oldest != jobs_.end()) {
        jobs_.erase(oldest);
        --queued_frames_;
        dropped = 1;
      }
    }
    Job job;
    job.kind = Job::Kind::kFrame;
    job.generation = generation;
    job.frame = std::move(frame);
    job.presentation_time = presentation_time;
    jobs_.push_back(std::move(job));
    ++queued_frames_;
  }
  work_cv_.notify_one();
  return dropped;
}

void SessionWorker::PostDisconnect(uint64_t generation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      return;
    }
    Job job;
    job.kind = Job::Kind::kDisconnect;
    job.generation = generation;
    jobs_.push_back(std::move(job));
  }
  work_cv_.notify_one();
}

size_t SessionWorker::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t before = jobs_.size();
  jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(),
                             [](const Job& job) {
                               return job.kind == Job::Kind::kFrame;
                             }),
              jobs_.end());
  queued_frames_ = 0;
  if (jobs_.empty() && !busy_) {
    idle_cv_.notify_all();
  }
  return before - jobs_.size();
}

void SessionWorker::RequestStop(bool graceful) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      // A later hard stop overrides an earlier graceful one.
      graceful_ = graceful_ && graceful;
    } else {
      stop_ = true;
      graceful_ = graceful;
    }
  }
  work_cv_.notify_all();
}

void SessionWorker::Cancel() { transport_->Cancel(); }

void SessionWorker::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool SessionWorker::Finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

bool SessionWorker::Idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_ || (jobs_.empty() && !busy_);
}

bool SessionWorker::WaitIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() {
    return finished_ || (jobs_.empty() && !busy_);
  });
}

size_t SessionWorker::queued_frames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queued_frames_;
}

void SessionWorker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    work_cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
    if (stop_ && (!graceful_ || jobs_.empty())) {
      break;
    }
    Job job = std::move(jobs_.front());
    jobs_.pop_front();
    if (job.kind == Job::Kind::kFrame) {
      --queued_frames_;
    }
    busy_ = true;
    lock.unlock();
    RunJob(job);
    lock.lock();
    busy_ = false;
    if (jobs_.empty()) {
      idle_cv_.notify_all();
    }
  }
  jobs_.clear();
  queued_frames_ = 0;
  lock.unlock();

  if (connected_) {
    transport_->Close();
    connected_ = false;
  }

  lock.lock();
  finished_ = true;
  idle_cv_.notify_all();
}

void SessionWorker::RunJob(const Job& job) {
  SendResult result;
  result.device_id = device_id_;
  result.generation = job.generation;
  switch (job.kind) {
    case Job::Kind::kConnect: {
      std::string error;
      bool ok = false;
      try {
        ok = transport_->Connect(host_, port_, connect_timeout_, &error);
      } catch (const std::exception& ex) {
        error = std::string("transport exception: ") + ex.what();
      } catch (...) {
        error = "transport exception: unknown error";
      }
      connected_ = ok;
      result.kind = ok ? SendResultKind::kConnected
                       : SendResultKind::kConnectFailed;
      result.error = error;
      break;
    }
    case Job::Kind::kFrame: {
      result.sequence = job.frame->sequence;
      if (!connected_) {
        result.kind = SendResultKind::kDiscarded;
        break;
      }
      std::string error;
      bool ok = false;
      try {
        ok = transport_->Send(*job.frame, job.presentation_time, &error);
      } catch (const std::exception& ex) {
        error = std::string("transport exception: ") + ex.what();
      } catch (...) {
        error = "transport exception: unknown error";
      }
      result.kind = ok ? SendResultKind::kSent : SendResultKind::kSendFailed;
      result.error = error;
      break;
    }
    case Job::Kind::kDisconnect:
      if (connected_) {
        transport_->Close();
        connected_ = false;
      }
      return;
  }
  Report(std::move(result));
}

void SessionWorker::Report(SendResult result) {
  if (!sink_) {
    return;
  }
  // Fails only once the bridge is closed for teardown.
  if (!sink_(std::move(result))) {
    undelivered_results_.fetch_add(1);
  }
}

Dispatcher::Dispatcher(Options options, TransportFactory factory,
                       ResultSink sink, Logger logger)
    : options_(options),
      factory_(std::move(factory)),
      sink_(std::move(sink)),
      logger_(std::move(logger)) {}

Dispatcher::~Dispatcher() { Shutdown(); }

bool Dispatcher::Open(const Device& device) {
  if (sessions_.count(device.id) > 0) {
    return false;
  }
  if (device.addresses.empty()) {
    logger_.Log("no address for device " + device.id);
    return false;
  }
  std::unique_ptr<OutputTransport> transport;
  try {
    transport = factory_ ? factory_(device) : MakeTcpTransport(device);
  } catch (const std::exception& ex) {
    logger_.Log("transport factory failed for " + device.id + ": " + ex.what());
    return false;
  }
  if (!transport) {
    logger_.Log("transport factory returned no transport for " + device.id);
    return false;
  }
  auto worker = std::make_unique<SessionWorker>(
      device.id, device.addresses.front(), device.port, std::move(transport),
      options_.queue_capacity, options_.connect_timeout, sink_);
  std::string error;
  if (!worker->Start(&error)) {
    logger_.Log("session start failed for " + device.id + ": " + error);
    return false;
  }
  Session session;
  session.info.device_id = device.id;
  session.info.state = SessionState::kConnecting;
  session.info.generation = next_generation_++;
  session.info.backoff = options_.initial_backoff;
  worker->PostConnect(session.info.generation);
  session.worker = std::move(worker);
  sessions_.emplace(device.id, std::move(session));
  return true;
}

bool Dispatcher::Send(const Emission& emission) {
  auto it = sessions_.find(emission.device_id);
  if (it == sessions_.end() || it->second.info.state == SessionState::kBackoff) {
    return false;
  }
  Session& session = it->second;
  const double presentation_time =
      PresentationTime(*emission.frame, emission.target);
  overflow_dropped_ += session.worker->PostFrame(
      session.info.generation, emission.frame, presentation_time);
  session.info.last_sequence = emission.frame->sequence;
  ++session.info.frames_queued;
  return true;
}

bool Dispatcher::IsCurrent(const SendResult& result) const {
  auto it = sessions_.find(result.device_id);
  return it != sessions_.end() &&
         it->second.info.generation == result.generation;
}

void Dispatcher::OnConnected(const std::string& device_id) {
  auto it = sessions_.find(device_id);
  if (it != sessions_.end() &&
      it->second.info.state == SessionState::kConnecting) {
    it->second.info.state = SessionState::kOpen;
  }
}

void Dispatcher::OnDelivered(const std::string& device_id) {
  auto it = sessions_.find(device_id);
  if (it != sessions_.end()) {
    it->second.info.reconnect_attempts = 0;
    it->second.info.backoff = options_.initial_backoff;
  }
}

bool Dispatcher::EnterBackoff(const std::string& device_id, TimePoint now) {
  auto it = sessions_.find(device_id);
  if (it == sessions_.end()) {
    return false;
  }
  SessionInfo& info = it->second.info;
  if (info.state == SessionState::kBackoff) {
    return true;
  }
  discarded_ += it->second.worker->Flush();
  info.generation = next_generation_++;
  it->second.worker->PostDisconnect(info.generation);
  info.state = SessionState::kBackoff;
  info.next_attempt = now + info.backoff;
  std::ostringstream oss;
  oss << "device " << device_id << " unavailable, reconnecting in "
      << info.backoff.count() << "ms";
  logger_.Log(oss.str());
  info.backoff = std::min(info.backoff * 2, options_.max_backoff);
  return true;
}

std::vector<std::string> Dispatcher::Tick(TimePoint now) {
  std::vector<std::string> exhausted;
  for (auto& entry : sessions_) {
    SessionInfo& info = entry.second.info;
    if (info.state != SessionState::kBackoff || !info.next_attempt ||
        *info.next_attempt > now) {
      continue;
    }
    if (info.reconnect_attempts >= options_.reconnect_budget) {
      exhausted.push_back(entry.first);
      continue;
    }
    ++info.reconnect_attempts;
    info.state = SessionState::kConnecting;
    info.next_attempt.reset();
    entry.second.worker->PostConnect(info.generation);
  }
  for (const auto& device_id : exhausted) {
    logger_.Log("reconnect budget exhausted for device " + device_id);
    Close(device_id, false);
  }
  return exhausted;
}

bool Dispatcher::Close(const std::string& device_id, bool graceful) {
  auto it = sessions_.find(device_id);
  if (it == sessions_.end()) {
    return false;
  }
  std::unique_ptr<SessionWorker> worker = std::move(it->second.worker);
  sessions_.erase(it);
  if (!graceful) {
    discarded_ += worker->Flush();
  }
  worker->RequestStop(graceful);
  if (!graceful) {
    worker->Cancel();
  }
  retired_.push_back(std::move(worker));
  return true;
}

void Dispatcher::CloseAll(bool graceful) {
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    ids.push_back(entry.first);
  }
  for (const auto& id : ids) {
    Close(id, graceful);
  }
}

size_t Dispatcher::FlushAll() {
  size_t flushed = 0;
  for (auto& entry : sessions_) {
    flushed += entry.second.worker->Flush();
  }
  discarded_ += flushed;
  return flushed;
}

void Dispatcher::ReapRetired() {
  for (auto it = retired_.begin(); it != retired_.end();) {
    if ((*it)->Finished()) {
      (*it)->Join();
      it = retired_.erase(it);
    } else {
      ++it;
    }
  }
}

void Dispatcher::Shutdown() {
  CloseAll(false);
  for (auto& worker : retired_) {
    discarded_ += worker->Flush();
    worker->RequestStop(false);
    worker->Cancel();
  }
  for (auto& worker : retired_) {
    worker->Join();
  }
  retired_.clear();
}

bool Dispatcher::HasSession(const std::string& device_id) const {
  return sessions_.count(device_id) > 0;
}

bool Dispatcher::IsEligible(const std::string& device_id) const {
  auto it = sessions_.find(device_id);
  return it != sessions_.end() &&
         it->second.info.state != SessionState::kBackoff;
}

std::optional<SessionInfo> Dispatcher::GetSession(
    const std::string& device_id) const {
  auto it = sessions_.find(device_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

std::vector<SessionInfo> Dispatcher::Sessions() const {
  std::vector<SessionInfo> out;
  out.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    out.push_back(entry.second.info);
  }
  return out;
}

std::optional<TimePoint> Dispatcher::NextWakeup() const {
  std::optional<TimePoint> earliest;
  for (const auto& entry : sessions_) {
    const auto& next = entry.second.info.next_attempt;
    if (next && (!earliest || *next < *earliest)) {
      earliest = next;
    }
  }
  return earliest;
}

bool Dispatcher::WaitIdle(std::chrono::milliseconds timeout) const {
  const auto deadline = Clock::now() + timeout;
  auto remaining = [&]() {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  };
  bool idle = true;
  for (const auto& entry : sessions_) {
    idle = entry.second.worker->WaitIdle(remaining()) && idle;
  }
  for (const auto& worker : retired_) {
    idle = worker->WaitIdle(remaining()) && idle;
  }
  return idle;
}

}  // namespace airsync
