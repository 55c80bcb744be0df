#pragma once

#include "airsync/airsync.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace airsync {

/**
 * DNS record types used by service discovery.
 */
constexpr uint16_t kDnsTypeA = 1;
constexpr uint16_t kDnsTypePtr = 12;
constexpr uint16_t kDnsTypeTxt = 16;
constexpr uint16_t kDnsTypeSrv = 33;
constexpr uint16_t kDnsTypeAny = 255;
constexpr uint16_t kDnsClassIn = 1;

struct DnsQuestion {
  /// Name labels, e.g. {"_raop", "_tcp", "local"}.
  std::vector<std::string> labels;
  uint16_t type = kDnsTypePtr;
  /// Ask for a unicast reply (mDNS "QU" bit).
  bool unicast_response = false;

  /// Build a question from a dotted name without escaped dots.
  static DnsQuestion FromName(const std::string& name, uint16_t type,
                              bool unicast_response);
};

/**
 * One resource record from any section of a message. Only the fields of its
 * type are filled in.
 */
struct DnsRecord {
  /// Owner name, dotted, without trailing dot.
  std::string name;
  uint16_t type = 0;
  uint16_t rrclass = kDnsClassIn;
  /// mDNS cache-flush bit.
  bool cache_flush = false;
  uint32_t ttl = 0;
  /// PTR target or SRV target host.
  std::string target;
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  TxtRecord txt;
  /// A record address in dotted quad form.
  std::string address;
};

struct DnsMessage {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<DnsQuestion> questions;
  /// Answer, authority and additional records in wire order.
  std::vector<DnsRecord> records;

  bool is_response() const { return (flags & 0x8000) != 0; }
};

/// Encode a query message for the given questions.
std::vector<uint8_t> BuildDnsQuery(const std::vector<DnsQuestion>& questions);

/**
 * Decode a DNS message, following name compression pointers.
 *
 * @param error Optional output string describing why parsing failed.
 * @return true if the whole message was well formed.
 */
bool ParseDnsMessage(const uint8_t* data, size_t length, DnsMessage* out,
                     std::string* error = nullptr);

/// Lowercase ASCII copy, for case-insensitive DNS name comparison.
std::string DnsLower(const std::string& name);

}  // namespace airsync
