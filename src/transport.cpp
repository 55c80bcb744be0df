#include "airsync/transport.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace airsync {

namespace {

constexpr size_t kPresentationTimeOffset = 0;
constexpr size_t kSequenceOffset = 8;
constexpr size_t kPayloadLengthOffset = 12;

void WriteBe32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>((value >> 24) & 0xff);
  data[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xff);
  data[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xff);
  data[offset + 3] = static_cast<uint8_t>(value & 0xff);
}

void WriteBe64(std::vector<uint8_t>& data, size_t offset, uint64_t value) {
  WriteBe32(data, offset, static_cast<uint32_t>(value >> 32));
  WriteBe32(data, offset + 4, static_cast<uint32_t>(value & 0xffffffff));
}

uint32_t ReadBe32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

uint64_t ReadBe64(const uint8_t* data, size_t offset) {
  return (static_cast<uint64_t>(ReadBe32(data, offset)) << 32) |
         ReadBe32(data, offset + 4);
}

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

std::vector<uint8_t> EncodeFramePacket(const AudioFrame& frame,
                                       double presentation_time) {
  std::vector<uint8_t> packet(kFrameHeaderSize + frame.payload.size(), 0);
  uint64_t bits = 0;
  static_assert(sizeof(bits) == sizeof(presentation_time),
                "double must be 64-bit");
  std::memcpy(&bits, &presentation_time, sizeof(bits));
  WriteBe64(packet, kPresentationTimeOffset, bits);
  WriteBe32(packet, kSequenceOffset, static_cast<uint32_t>(frame.sequence));
  WriteBe32(packet, kPayloadLengthOffset,
            static_cast<uint32_t>(frame.payload.size()));
  std::copy(frame.payload.begin(), frame.payload.end(),
            packet.begin() + kFrameHeaderSize);
  return packet;
}

std::optional<FrameHeader> DecodeFrameHeader(const uint8_t* data,
                                             size_t length) {
  if (data == nullptr || length < kFrameHeaderSize) {
    return std::nullopt;
  }
  FrameHeader header;
  const uint64_t bits = ReadBe64(data, kPresentationTimeOffset);
  std::memcpy(&header.presentation_time, &bits, sizeof(bits));
  header.sequence = ReadBe32(data, kSequenceOffset);
  header.payload_length = ReadBe32(data, kPayloadLengthOffset);
  return header;
}

double PresentationTime(const AudioFrame& frame, TimePoint target) {
  const std::chrono::duration<double> offset = target - frame.arrival;
  return frame.capture_timestamp + offset.count();
}

TcpTransport::~TcpTransport() { Close(); }

bool TcpTransport::Connect(const std::string& host, uint16_t port,
                           std::chrono::milliseconds timeout,
                           std::string* error) {
  Close();
  if (host.empty()) {
    SetError(error, "invalid address: empty host");
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
      SetError(error, "could not resolve " + host + ": " +
                          std::string(rc != 0 ? ::gai_strerror(rc)
                                              : "no IPv4 address"));
      return false;
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(found->ai_addr)->sin_addr;
    ::freeaddrinfo(found);
  }
  {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (cancelled_) {
      SetError(error, "cancelled");
      return false;
    }
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  }
  if (fd_ < 0) {
    SetError(error, "socket() failed: " + std::string(std::strerror(errno)));
    return false;
  }
  const int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    SetError(error, "fcntl(O_NONBLOCK) failed: " +
                        std::string(std::strerror(errno)));
    Close();
    return false;
  }

  std::ostringstream target;
  target << host << ":" << port;
  int result = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (result < 0 && errno != EINPROGRESS) {
    SetError(error, "connect(" + target.str() + ") failed: " +
                        std::string(std::strerror(errno)));
    Close();
    return false;
  }
  if (result < 0) {
    fd_set write_set;
    FD_ZERO(&write_set);
    FD_SET(fd_, &write_set);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    result = ::select(fd_ + 1, nullptr, &write_set, nullptr, &tv);
    if (result <= 0) {
      SetError(error, "connect(" + target.str() + ") " +
                          (result == 0 ? std::string("timed out")
                                       : std::string(std::strerror(errno))));
      Close();
      return false;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
        so_error != 0) {
      SetError(error, "connect(" + target.str() + ") failed: " +
                          std::string(std::strerror(so_error ? so_error : errno)));
      Close();
      return false;
    }
  }
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    cancelled = cancelled_;
  }
  if (cancelled) {
    SetError(error, "connect(" + target.str() + ") cancelled");
    Close();
    return false;
  }
  if (::fcntl(fd_, F_SETFL, flags) < 0) {
    SetError(error, "fcntl(restore) failed: " +
                        std::string(std::strerror(errno)));
    Close();
    return false;
  }
  int nodelay = 1;
  if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) <
      0) {
    SetError(error, "setsockopt(TCP_NODELAY) failed: " +
                        std::string(std::strerror(errno)));
    Close();
    return false;
  }
  timeval send_tv{};
  send_tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  send_tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &send_tv, sizeof(send_tv)) <
      0) {
    SetError(error, "setsockopt(SO_SNDTIMEO) failed: " +
                        std::string(std::strerror(errno)));
    Close();
    return false;
  }
  send_timeout_ = timeout;
  return true;
}

bool TcpTransport::Send(const AudioFrame& frame, double presentation_time,
                        std::string* error) {
  if (fd_ < 0) {
    SetError(error, "not connected");
    return false;
  }
  const std::vector<uint8_t> packet = EncodeFramePacket(frame, presentation_time);
  size_t sent = 0;
  while (sent < packet.size()) {
    ssize_t result =
        ::send(fd_, packet.data() + sent, packet.size() - sent, MSG_NOSIGNAL);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        SetError(error, "send() timed out after " +
                            std::to_string(send_timeout_.count()) + "ms");
        return false;
      }
      SetError(error, "send() failed: " + std::string(std::strerror(errno)));
      return false;
    }
    sent += static_cast<size_t>(result);
  }
  return true;
}

void TcpTransport::Close() {
  std::lock_guard<std::mutex> lock(fd_mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void TcpTransport::Cancel() {
  std::lock_guard<std::mutex> lock(fd_mutex_);
  cancelled_ = true;
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

bool TcpTransport::connected() const {
  std::lock_guard<std::mutex> lock(fd_mutex_);
  return fd_ >= 0;
}

std::unique_ptr<OutputTransport> MakeTcpTransport(const Device&) {
  return std::make_unique<TcpTransport>();
}

}  // namespace airsync
