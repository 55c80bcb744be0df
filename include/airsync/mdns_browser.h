#pragma once

#include "airsync/airsync.h"
#include "airsync/dns_message.h"
#include "airsync/logger.h"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct sockaddr_in;

namespace airsync {

/**
 * UDP socket configured for one discovery strategy.
 */
class MdnsSocket {
 public:
  MdnsSocket() = default;
  ~MdnsSocket() { Close(); }

  MdnsSocket(const MdnsSocket&) = delete;
  MdnsSocket& operator=(const MdnsSocket&) = delete;

  /// Attempt one setup. The result names the step that failed, if any.
  DiscoveryInitResult Open(DiscoveryStrategy strategy,
                           const std::string& bind_address);
  void Close();

  int fd() const { return fd_; }
  bool multicast() const { return multicast_; }

  bool SendToGroup(const std::vector<uint8_t>& data, std::string* error);
  ssize_t Receive(uint8_t* buffer, size_t length, sockaddr_in* from);

 private:
  int fd_ = -1;
  bool multicast_ = false;
};

/**
 * Multicast DNS service browser.
 *
 * Periodically asks for every configured service type, tracks the PTR, SRV,
 * TXT and A records it hears and hands each resolved instance to the sink
 * as an Added, Updated or Removed event. Runs on its own thread and never
 * touches registry state. Instances that do not resolve within the resolve
 * timeout are dropped and counted; there is no retry beyond one follow-up
 * query.
 */
class MdnsBrowser {
 public:
  using Sink = std::function<bool(DiscoveryEvent)>;

  struct Options {
    std::vector<std::string> service_types = {
        kAirPlayServiceType, kRaopServiceType, kAirportServiceType};
    std::string bind_address = "0.0.0.0";
    std::chrono::milliseconds query_interval{10000};
    std::chrono::milliseconds resolve_timeout{3000};
    /// Socket setups tried in order until one succeeds.
    std::vector<DiscoveryStrategy> strategies = {
        DiscoveryStrategy::kMulticastBoundAddress,
        DiscoveryStrategy::kMulticastAnyAddress,
        DiscoveryStrategy::kUnicastOnly};
  };

  MdnsBrowser(Options options, Sink sink, Logger logger);
  ~MdnsBrowser();

  MdnsBrowser(const MdnsBrowser&) = delete;
  MdnsBrowser& operator=(const MdnsBrowser&) = delete;

  /// Open the socket and start browsing. Returns false if every strategy
  /// failed; see init_results() for each attempt.
  bool Start();
  void Stop();
  bool running() const { return running_.load(); }

  std::vector<DiscoveryInitResult> init_results() const;
  std::optional<DiscoveryStrategy> active_strategy() const;
  uint64_t resolution_failures() const { return resolution_failures_.load(); }

  /// PTR query for every browsed service type.
  std::vector<uint8_t> BuildBrowseQuery() const;

  /**
   * Process one received datagram. Called on the browser thread; exposed so
   * tests can feed packets without a socket.
   */
  void HandlePacket(const uint8_t* data, size_t length, TimePoint now);
  /// Drop instances still unresolved after the resolve timeout.
  void ExpireResolutions(TimePoint now);

  size_t instance_count() const { return instances_.size(); }
  /// Host names with at least one known address.
  size_t host_count() const { return hosts_.size(); }
  size_t resolved_count() const;

 private:
  struct Instance {
    ServiceKind kind = ServiceKind::kAirPlay;
    std::string service_type;
    std::string instance_name;
    std::string host;
    uint16_t port = 0;
    bool has_srv = false;
    TxtRecord txt;
    TimePoint first_seen;
    bool announced = false;
    bool follow_up_sent = false;
    ServiceRecord last_emitted;
  };

  void Run();
  /// Match a name against browsed types; returns the type and the instance
  /// label of "<label>.<type>" names.
  bool SplitInstanceName(const std::string& name, std::string* service_type,
                         std::string* instance_name) const;
  Instance* EnsureInstance(const std::string& full_name,
                           const std::string& service_type,
                           const std::string& instance_name, TimePoint now);
  void Resolve(Instance& instance);
  void SendFollowUp(Instance& instance);
  void Emit(DiscoveryEventKind kind, const ServiceRecord& record);

  Options options_;
  Sink sink_;
  Logger logger_;

  MdnsSocket socket_;
  std::atomic<bool> running_{false};
  std::thread thread_;
  mutable std::mutex results_mutex_;
  std::vector<DiscoveryInitResult> init_results_;
  std::optional<DiscoveryStrategy> active_strategy_;
  std::atomic<uint64_t> resolution_failures_{0};

  /// Browser thread state, keyed by lowercase full instance name.
  std::map<std::string, Instance> instances_;
  /// Lowercase host name -> IPv4 addresses.
  std::map<std::string, std::set<std::string>> hosts_;
};

}  // namespace airsync
