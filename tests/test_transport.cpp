// Tests for the frame wire format and TCP transport.
#include "airsync/transport.h"
#include "airsync/dispatcher.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <future>
#include <thread>

namespace {

airsync::AudioFrame MakeFrame(uint64_t sequence, std::vector<uint8_t> payload) {
  airsync::AudioFrame frame;
  frame.stream_id = 1;
  frame.sequence = sequence;
  frame.capture_timestamp = 12.5;
  frame.arrival = airsync::Clock::now();
  frame.payload = std::move(payload);
  return frame;
}

// Listening socket on an ephemeral loopback port.
class LoopbackListener {
 public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }
  ~LoopbackListener() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  uint16_t port() const { return port_; }
  int Accept() { return ::accept(fd_, nullptr, nullptr); }
  void Close() {
    ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
};

}  // namespace

TEST(FrameHeaderTest, EncodesBigEndianHeader) {
  const auto frame = MakeFrame(0x01020304, {0xAA, 0xBB, 0xCC});
  const auto packet = airsync::EncodeFramePacket(frame, 1.0);
  ASSERT_EQ(packet.size(), airsync::kFrameHeaderSize + 3);

  // 1.0 as IEEE-754 double is 0x3FF0000000000000.
  const std::vector<uint8_t> time_bytes = {0x3F, 0xF0, 0, 0, 0, 0, 0, 0};
  EXPECT_TRUE(std::equal(time_bytes.begin(), time_bytes.end(), packet.begin()));
  EXPECT_EQ(packet[8], 0x01);
  EXPECT_EQ(packet[9], 0x02);
  EXPECT_EQ(packet[10], 0x03);
  EXPECT_EQ(packet[11], 0x04);
  EXPECT_EQ(packet[15], 3);
  EXPECT_EQ(packet[16], 0xAA);
  EXPECT_EQ(packet[18], 0xCC);

  auto header = airsync::DecodeFrameHeader(packet.data(), packet.size());
  ASSERT_TRUE(header.has_value());
  EXPECT_DOUBLE_EQ(header->presentation_time, 1.0);
  EXPECT_EQ(header->sequence, 0x01020304u);
  EXPECT_EQ(header->payload_length, 3u);
}

TEST(FrameHeaderTest, RejectsShortHeader) {
  const std::vector<uint8_t> data(airsync::kFrameHeaderSize - 1, 0);
  EXPECT_FALSE(airsync::DecodeFrameHeader(data.data(), data.size()).has_value());
}

TEST(FrameHeaderTest, PresentationTimeFollowsTarget) {
  const auto frame = MakeFrame(1, {});
  const auto target = frame.arrival + std::chrono::milliseconds(2500);
  EXPECT_NEAR(airsync::PresentationTime(frame, target), 15.0, 1e-6);
}

TEST(TcpTransportTest, SendsFramesOverLoopback) {
  LoopbackListener listener;
  airsync::TcpTransport transport;
  std::string error;
  ASSERT_TRUE(transport.Connect("127.0.0.1", listener.port(),
                                std::chrono::milliseconds(1000), &error))
      << error;
  EXPECT_TRUE(transport.connected());
  const int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  const auto frame = MakeFrame(7, {1, 2, 3, 4});
  ASSERT_TRUE(transport.Send(frame, 3.25, &error)) << error;

  std::vector<uint8_t> received(airsync::kFrameHeaderSize + 4);
  size_t total = 0;
  while (total < received.size()) {
    const ssize_t got = ::recv(peer, received.data() + total,
                               received.size() - total, 0);
    ASSERT_GT(got, 0);
    total += static_cast<size_t>(got);
  }
  auto header = airsync::DecodeFrameHeader(received.data(), received.size());
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->sequence, 7u);
  EXPECT_EQ(header->payload_length, 4u);
  EXPECT_DOUBLE_EQ(header->presentation_time, 3.25);
  EXPECT_EQ(received.back(), 4);

  transport.Close();
  EXPECT_FALSE(transport.connected());
  ::close(peer);
}

TEST(TcpTransportTest, ReportsRefusedConnection) {
  uint16_t port = 0;
  {
    LoopbackListener listener;
    port = listener.port();
  }
  airsync::TcpTransport transport;
  std::string error;
  EXPECT_FALSE(transport.Connect("127.0.0.1", port,
                                 std::chrono::milliseconds(500), &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(transport.connected());
}

TEST(TcpTransportTest, RejectsEmptyHost) {
  airsync::TcpTransport transport;
  std::string error;
  EXPECT_FALSE(transport.Connect("", 7000, std::chrono::milliseconds(100),
                                 &error));
  EXPECT_EQ(error, "invalid address: empty host");
}

TEST(TcpTransportTest, ResolvesHostNames) {
  LoopbackListener listener;
  airsync::TcpTransport transport;
  std::string error;
  ASSERT_TRUE(transport.Connect("localhost", listener.port(),
                                std::chrono::milliseconds(1000), &error))
      << error;
  EXPECT_TRUE(transport.connected());
  const int peer = listener.Accept();
  ASSERT_GE(peer, 0);
  EXPECT_TRUE(transport.Send(MakeFrame(1, {9}), 0.0, &error)) << error;
  ::close(peer);
}

TEST(TcpTransportTest, SendToStalledPeerTimesOut) {
  LoopbackListener listener;
  airsync::TcpTransport transport;
  std::string error;
  ASSERT_TRUE(transport.Connect("127.0.0.1", listener.port(),
                                std::chrono::milliseconds(200), &error))
      << error;
  const int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  // The peer never reads, so the socket buffers fill and send blocks.
  const auto frame = MakeFrame(1, std::vector<uint8_t>(1 << 20, 0x5a));
  const auto start = std::chrono::steady_clock::now();
  bool failed = false;
  for (int i = 0; i < 256 && !failed; ++i) {
    failed = !transport.Send(frame, 0.0, &error);
  }
  EXPECT_TRUE(failed);
  EXPECT_NE(error.find("timed out"), std::string::npos) << error;
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  ::close(peer);
}

TEST(TcpTransportTest, CancelUnblocksStalledSend) {
  LoopbackListener listener;
  airsync::TcpTransport transport;
  std::string error;
  ASSERT_TRUE(transport.Connect("127.0.0.1", listener.port(),
                                std::chrono::seconds(30), &error))
      << error;
  const int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  std::string send_error;
  auto sender = std::async(std::launch::async, [&]() {
    const auto frame = MakeFrame(1, std::vector<uint8_t>(1 << 20, 0x5a));
    for (int i = 0; i < 256; ++i) {
      if (!transport.Send(frame, 0.0, &send_error)) {
        return false;
      }
    }
    return true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  transport.Cancel();
  ASSERT_EQ(sender.wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  EXPECT_FALSE(sender.get());
  EXPECT_FALSE(send_error.empty());

  // A cancelled transport stays unusable.
  EXPECT_FALSE(transport.Connect("127.0.0.1", listener.port(),
                                 std::chrono::milliseconds(200), &error));
  EXPECT_EQ(error, "cancelled");
  ::close(peer);
}

TEST(TcpTransportTest, DispatcherShutdownDoesNotWaitOnStalledPeer) {
  LoopbackListener listener;
  airsync::Dispatcher::Options options;
  options.connect_timeout = std::chrono::seconds(30);
  airsync::Dispatcher dispatcher(options, airsync::MakeTcpTransport,
                                 [](airsync::SendResult) { return true; },
                                 airsync::Logger([](const std::string&) {}));
  airsync::Device device;
  device.id = "stalled";
  device.addresses = {"127.0.0.1"};
  device.port = listener.port();
  ASSERT_TRUE(dispatcher.Open(device));
  const int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  auto frame = std::make_shared<airsync::AudioFrame>(
      MakeFrame(1, std::vector<uint8_t>(1 << 20, 0x5a)));
  for (int i = 0; i < 16; ++i) {
    EXPECT_TRUE(
        dispatcher.Send(airsync::Emission{device.id, frame, frame->arrival}));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto shutdown =
      std::async(std::launch::async, [&]() { dispatcher.Shutdown(); });
  EXPECT_EQ(shutdown.wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  shutdown.wait();
  ::close(peer);
}

TEST(TcpTransportTest, SendWithoutConnectFails) {
  airsync::TcpTransport transport;
  std::string error;
  EXPECT_FALSE(transport.Send(MakeFrame(1, {}), 0.0, &error));
  EXPECT_FALSE(error.empty());
}
