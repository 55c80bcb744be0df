#include "airsync/mdns_browser.h"

#include "airsync/device_registry.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>
#include <utility>

namespace airsync {

namespace {

constexpr int kMulticastTtl = 255;
constexpr std::chrono::milliseconds kInitialQuerySpacing{1000};
constexpr int kInitialQueries = 3;

std::string ErrnoText(const std::string& what) {
  return what + " failed: " + std::strerror(errno);
}

}  // namespace

DiscoveryInitResult MdnsSocket::Open(DiscoveryStrategy strategy,
                                     const std::string& bind_address) {
  Close();
  DiscoveryInitResult result;
  result.strategy = strategy;
  auto fail = [&](DiscoveryInitFailure failure, const std::string& detail) {
    result.failure = failure;
    result.detail = detail;
    Close();
    return result;
  };

  in_addr local{};
  if (inet_pton(AF_INET, bind_address.c_str(), &local) != 1) {
    return fail(DiscoveryInitFailure::kBind,
                "invalid bind address: " + bind_address);
  }
  if (strategy == DiscoveryStrategy::kMulticastAnyAddress) {
    local.s_addr = htonl(INADDR_ANY);
  }
  const bool multicast = strategy != DiscoveryStrategy::kUnicastOnly;
  const uint16_t port = multicast ? kMdnsPort : 0;

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    return fail(DiscoveryInitFailure::kSocket, ErrnoText("socket()"));
  }
  if (multicast) {
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      return fail(DiscoveryInitFailure::kReuseAddress,
                  ErrnoText("setsockopt(SO_REUSEADDR)"));
    }
#ifdef SO_REUSEPORT
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
      return fail(DiscoveryInitFailure::kReuseAddress,
                  ErrnoText("setsockopt(SO_REUSEPORT)"));
    }
#endif
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr = local;
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    char text[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &local, text, sizeof(text));
    std::ostringstream oss;
    oss << "bind(" << text << ":" << port << ") failed: "
        << std::strerror(errno);
    return fail(DiscoveryInitFailure::kBind, oss.str());
  }

  if (multicast) {
    ip_mreq mreq{};
    inet_pton(AF_INET, kMdnsGroup, &mreq.imr_multiaddr);
    mreq.imr_interface = local;
    if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) <
        0) {
      return fail(DiscoveryInitFailure::kJoinGroup,
                  ErrnoText("setsockopt(IP_ADD_MEMBERSHIP)"));
    }
    if (local.s_addr != htonl(INADDR_ANY) &&
        ::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &local, sizeof(local)) <
            0) {
      return fail(DiscoveryInitFailure::kMulticastInterface,
                  ErrnoText("setsockopt(IP_MULTICAST_IF)"));
    }
  }
  const int ttl = kMulticastTtl;
  if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
    return fail(DiscoveryInitFailure::kMulticastInterface,
                ErrnoText("setsockopt(IP_MULTICAST_TTL)"));
  }
  multicast_ = multicast;
  return result;
}

void MdnsSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  multicast_ = false;
}

bool MdnsSocket::SendToGroup(const std::vector<uint8_t>& data,
                             std::string* error) {
  if (fd_ < 0) {
    if (error) {
      *error = "socket not open";
    }
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(kMdnsPort);
  inet_pton(AF_INET, kMdnsGroup, &addr.sin_addr);
  const ssize_t sent =
      ::sendto(fd_, data.data(), data.size(), 0,
               reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  if (sent < 0 || static_cast<size_t>(sent) != data.size()) {
    if (error) {
      *error = sent < 0 ? ErrnoText("sendto()") : "short sendto()";
    }
    return false;
  }
  return true;
}

ssize_t MdnsSocket::Receive(uint8_t* buffer, size_t length, sockaddr_in* from) {
  socklen_t from_len = sizeof(*from);
  return ::recvfrom(fd_, buffer, length, 0, reinterpret_cast<sockaddr*>(from),
                    &from_len);
}

MdnsBrowser::MdnsBrowser(Options options, Sink sink, Logger logger)
    : options_(std::move(options)),
      sink_(std::move(sink)),
      logger_(std::move(logger)) {}

MdnsBrowser::~MdnsBrowser() { Stop(); }

bool MdnsBrowser::Start() {
  if (running_.load()) {
    return true;
  }
  std::vector<DiscoveryInitResult> results;
  std::optional<DiscoveryStrategy> active;
  for (const auto strategy : options_.strategies) {
    DiscoveryInitResult result = socket_.Open(strategy, options_.bind_address);
    results.push_back(result);
    if (result.ok()) {
      active = strategy;
      break;
    }
    logger_.Log(std::string("discovery init (") + ToString(strategy) +
                ") failed at " + ToString(result.failure) + ": " +
                result.detail);
  }
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    init_results_ = results;
    active_strategy_ = active;
  }
  if (!active) {
    return false;
  }
  running_ = true;
  try {
    thread_ = std::thread([this]() { Run(); });
  } catch (const std::system_error& ex) {
    logger_.Log(std::string("discovery thread start failed: ") + ex.what());
    running_ = false;
    socket_.Close();
    return false;
  }
  return true;
}

void MdnsBrowser::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  socket_.Close();
  instances_.clear();
  hosts_.clear();
}

std::vector<DiscoveryInitResult> MdnsBrowser::init_results() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return init_results_;
}

std::optional<DiscoveryStrategy> MdnsBrowser::active_strategy() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return active_strategy_;
}

size_t MdnsBrowser::resolved_count() const {
  size_t count = 0;
  for (const auto& entry : instances_) {
    if (entry.second.announced) {
      ++count;
    }
  }
  return count;
}

std::vector<uint8_t> MdnsBrowser::BuildBrowseQuery() const {
  const bool unicast = socket_.fd() >= 0 && !socket_.multicast();
  std::vector<DnsQuestion> questions;
  questions.reserve(options_.service_types.size());
  for (const auto& type : options_.service_types) {
    questions.push_back(DnsQuestion::FromName(type, kDnsTypePtr, unicast));
  }
  return BuildDnsQuery(questions);
}

void MdnsBrowser::Run() {
  std::array<uint8_t, 9000> buffer{};
  TimePoint next_query = Clock::now();
  int queries_sent = 0;
  while (running_) {
    const TimePoint now = Clock::now();
    if (now >= next_query) {
      std::string error;
      if (!socket_.SendToGroup(BuildBrowseQuery(), &error)) {
        logger_.Log("discovery query failed: " + error);
      }
      ++queries_sent;
      next_query = now + (queries_sent < kInitialQueries
                              ? kInitialQuerySpacing
                              : options_.query_interval);
    }
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(socket_.fd(), &readfds);
    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 200000;
    const int ready = ::select(socket_.fd() + 1, &readfds, nullptr, nullptr, &tv);
    if (ready > 0 && FD_ISSET(socket_.fd(), &readfds)) {
      sockaddr_in from{};
      const ssize_t bytes = socket_.Receive(buffer.data(), buffer.size(), &from);
      if (bytes > 0) {
        HandlePacket(buffer.data(), static_cast<size_t>(bytes), Clock::now());
      }
    }
    ExpireResolutions(Clock::now());
  }
}

bool MdnsBrowser::SplitInstanceName(const std::string& name,
                                    std::string* service_type,
                                    std::string* instance_name) const {
  const std::string lower = DnsLower(name);
  for (const auto& type : options_.service_types) {
    const std::string suffix = "." + DnsLower(type);
    if (lower.size() > suffix.size() &&
        lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) ==
            0) {
      *service_type = type;
      *instance_name = name.substr(0, name.size() - suffix.size());
      return true;
    }
  }
  return false;
}

MdnsBrowser::Instance* MdnsBrowser::EnsureInstance(
    const std::string& full_name, const std::string& service_type,
    const std::string& instance_name, TimePoint now) {
  const std::string key = DnsLower(full_name);
  auto it = instances_.find(key);
  if (it != instances_.end()) {
    return &it->second;
  }
  auto kind = DeviceRegistry::ServiceKindFromType(service_type);
  if (!kind) {
    return nullptr;
  }
  Instance instance;
  instance.kind = *kind;
  instance.service_type = service_type;
  instance.instance_name = instance_name;
  instance.first_seen = now;
  return &instances_.emplace(key, std::move(instance)).first->second;
}

void MdnsBrowser::HandlePacket(const uint8_t* data, size_t length,
                               TimePoint now) {
  DnsMessage message;
  std::string error;
  if (!ParseDnsMessage(data, length, &message, &error)) {
    logger_.Log("discovery: malformed packet: " + error);
    return;
  }
  if (!message.is_response()) {
    return;
  }

  std::set<std::string> touched;
  std::set<std::string> touched_hosts;
  for (const auto& record : message.records) {
    if (record.type != kDnsTypeA) {
      continue;
    }
    const std::string host = DnsLower(record.name);
    if (record.ttl == 0) {
      auto it = hosts_.find(host);
      if (it == hosts_.end()) {
        continue;
      }
      it->second.erase(record.address);
      if (it->second.empty()) {
        hosts_.erase(it);
      }
    } else {
      hosts_[host].insert(record.address);
    }
    touched_hosts.insert(host);
  }

  for (const auto& record : message.records) {
    if (record.type != kDnsTypePtr) {
      continue;
    }
    std::string service_type;
    std::string instance_name;
    if (!SplitInstanceName(record.target, &service_type, &instance_name) ||
        DnsLower(service_type) != DnsLower(record.name)) {
      continue;
    }
    const std::string key = DnsLower(record.target);
    if (record.ttl == 0) {
      auto it = instances_.find(key);
      if (it != instances_.end()) {
        if (it->second.announced) {
          Emit(DiscoveryEventKind::kRemoved, it->second.last_emitted);
        }
        instances_.erase(it);
      }
      touched.erase(key);
      continue;
    }
    if (EnsureInstance(record.target, service_type, instance_name, now)) {
      touched.insert(key);
    }
  }

  for (const auto& record : message.records) {
    if ((record.type != kDnsTypeSrv && record.type != kDnsTypeTxt) ||
        record.ttl == 0) {
      continue;
    }
    std::string service_type;
    std::string instance_name;
    if (!SplitInstanceName(record.name, &service_type, &instance_name)) {
      continue;
    }
    Instance* instance =
        EnsureInstance(record.name, service_type, instance_name, now);
    if (instance == nullptr) {
      continue;
    }
    if (record.type == kDnsTypeSrv) {
      instance->host = DnsLower(record.target);
      instance->port = record.port;
      instance->has_srv = true;
    } else {
      instance->txt = record.txt;
    }
    touched.insert(DnsLower(record.name));
  }

  for (const auto& entry : instances_) {
    if (entry.second.has_srv && touched_hosts.count(entry.second.host) > 0) {
      touched.insert(entry.first);
    }
  }
  for (const auto& key : touched) {
    auto it = instances_.find(key);
    if (it != instances_.end()) {
      Resolve(it->second);
    }
  }
}

void MdnsBrowser::Resolve(Instance& instance) {
  auto host_it = hosts_.find(instance.host);
  if (!instance.has_srv || host_it == hosts_.end() || host_it->second.empty()) {
    SendFollowUp(instance);
    return;
  }
  ServiceRecord record;
  record.kind = instance.kind;
  record.service_type = instance.service_type;
  record.instance_name = instance.instance_name;
  record.host_name = instance.host;
  record.addresses.assign(host_it->second.begin(), host_it->second.end());
  record.port = instance.port;
  record.txt = instance.txt;
  const bool added = !instance.announced;
  instance.announced = true;
  instance.last_emitted = record;
  Emit(added ? DiscoveryEventKind::kAdded : DiscoveryEventKind::kUpdated,
       record);
}

void MdnsBrowser::SendFollowUp(Instance& instance) {
  if (instance.follow_up_sent || socket_.fd() < 0) {
    return;
  }
  instance.follow_up_sent = true;
  const bool unicast = !socket_.multicast();
  DnsQuestion srv = DnsQuestion::FromName(instance.service_type, kDnsTypeSrv,
                                          unicast);
  srv.labels.insert(srv.labels.begin(), instance.instance_name);
  DnsQuestion txt = srv;
  txt.type = kDnsTypeTxt;
  std::vector<DnsQuestion> questions = {srv, txt};
  if (!instance.host.empty()) {
    questions.push_back(
        DnsQuestion::FromName(instance.host, kDnsTypeA, unicast));
  }
  std::string error;
  if (!socket_.SendToGroup(BuildDnsQuery(questions), &error)) {
    logger_.Log("discovery follow-up query failed: " + error);
  }
}

void MdnsBrowser::ExpireResolutions(TimePoint now) {
  for (auto it = instances_.begin(); it != instances_.end();) {
    const Instance& instance = it->second;
    if (!instance.announced &&
        now - instance.first_seen >= options_.resolve_timeout) {
      resolution_failures_.fetch_add(1);
      std::ostringstream oss;
      oss << "discovery: could not resolve " << instance.instance_name << "."
          << instance.service_type << " within "
          << options_.resolve_timeout.count() << "ms";
      logger_.Log(oss.str());
      it = instances_.erase(it);
    } else {
      ++it;
    }
  }
}

void MdnsBrowser::Emit(DiscoveryEventKind kind, const ServiceRecord& record) {
  if (!sink_) {
    return;
  }
  if (!sink_(DiscoveryEvent{kind, record})) {
    logger_.Log("discovery event for " + record.instance_name +
                " not delivered: control loop stopped");
  }
}

}  // namespace airsync
