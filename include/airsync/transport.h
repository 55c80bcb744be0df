#pragma once

#include "airsync/airsync.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace airsync {

/// Size of the header preceding every frame on the wire.
constexpr size_t kFrameHeaderSize = 16;

/**
 * Connection to one playback endpoint. Used from a single sender thread,
 * except for Cancel() which may be called from any thread.
 */
class OutputTransport {
 public:
  virtual ~OutputTransport() = default;

  /**
   * Open the connection.
   *
   * @param error Optional output string describing the failure.
   * @return true once connected.
   */
  virtual bool Connect(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout,
                       std::string* error) = 0;
  /// Send one frame scheduled to play at `presentation_time` (seconds).
  virtual bool Send(const AudioFrame& frame, double presentation_time,
                    std::string* error) = 0;
  virtual void Close() = 0;
  /// Unblock a Connect or Send in progress and fail every later call.
  virtual void Cancel() = 0;
};

/**
 * Frame transport over a plain TCP connection.
 *
 * Each frame is written as a 16-byte big-endian header (presentation time as
 * IEEE-754 double, uint32 sequence, uint32 payload length) plus the payload.
 * The connect timeout also bounds every blocking send. Hosts may be IPv4
 * literals or names resolved to an IPv4 address.
 */
class TcpTransport : public OutputTransport {
 public:
  TcpTransport() = default;
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  bool Connect(const std::string& host, uint16_t port,
               std::chrono::milliseconds timeout, std::string* error) override;
  bool Send(const AudioFrame& frame, double presentation_time,
            std::string* error) override;
  void Close() override;
  void Cancel() override;

  bool connected() const;

 private:
  // Guards fd_ writes and cancelled_; fd_ is only written by the sender thread.
  mutable std::mutex fd_mutex_;
  int fd_ = -1;
  bool cancelled_ = false;
  std::chrono::milliseconds send_timeout_{0};
};

struct FrameHeader {
  double presentation_time = 0.0;
  uint32_t sequence = 0;
  uint32_t payload_length = 0;
};

/// Serialize a frame with its wire header.
std::vector<uint8_t> EncodeFramePacket(const AudioFrame& frame,
                                       double presentation_time);
/// Parse a wire header. Returns nullopt if fewer than 16 bytes are given.
std::optional<FrameHeader> DecodeFrameHeader(const uint8_t* data,
                                             size_t length);

/// Receiver-clock presentation time for a frame released at `target`.
double PresentationTime(const AudioFrame& frame, TimePoint target);

/// Default TransportFactory: a TcpTransport for every device.
std::unique_ptr<OutputTransport> MakeTcpTransport(const Device& device);

}  // namespace airsync
