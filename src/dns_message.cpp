#include "airsync/dns_message.h"

#ifdef AIRSYNC_TESTING
#include "airsync/test_hooks.h"
#endif

#include <algorithm>
#include <cctype>
#include <sstream>

namespace airsync {

namespace {

constexpr size_t kHeaderSize = 12;
constexpr size_t kMaxLabelLength = 63;
constexpr size_t kMaxNameLength = 255;
constexpr int kMaxPointerJumps = 32;
constexpr uint16_t kUnicastResponseBit = 0x8000;
constexpr uint16_t kCacheFlushBit = 0x8000;

uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t ReadBe32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

void AppendBe16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  out.push_back(static_cast<uint8_t>(value & 0xff));
}

void AppendLabels(std::vector<uint8_t>& out,
                  const std::vector<std::string>& labels) {
  for (const auto& label : labels) {
    const size_t label_length = std::min(label.size(), kMaxLabelLength);
    out.push_back(static_cast<uint8_t>(label_length));
    out.insert(out.end(), label.begin(), label.begin() + label_length);
  }
  out.push_back(0);
}

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

// Read a possibly compressed name starting at *offset. On success *offset
// points past the name as it appears at its original position.
bool ReadName(const uint8_t* data, size_t length, size_t* offset,
              std::string* out) {
  std::string name;
  size_t pos = *offset;
  bool jumped = false;
  int jumps = 0;
  while (true) {
    if (pos >= length) {
      return false;
    }
    const uint8_t label_length = data[pos];
    if ((label_length & 0xC0) == 0xC0) {
      if (pos + 1 >= length) {
        return false;
      }
      const size_t pointer =
          (static_cast<size_t>(label_length & 0x3F) << 8) | data[pos + 1];
      if (!jumped) {
        *offset = pos + 2;
        jumped = true;
      }
      if (++jumps > kMaxPointerJumps || pointer >= length) {
        return false;
      }
      pos = pointer;
      continue;
    }
    if ((label_length & 0xC0) != 0) {
      return false;
    }
    if (label_length == 0) {
      if (!jumped) {
        *offset = pos + 1;
      }
      break;
    }
    if (pos + 1 + label_length > length) {
      return false;
    }
    if (!name.empty()) {
      name.push_back('.');
    }
    name.append(reinterpret_cast<const char*>(data + pos + 1), label_length);
    if (name.size() > kMaxNameLength) {
      return false;
    }
    pos += 1 + label_length;
  }
  *out = name;
  return true;
}

TxtRecord ParseTxt(const uint8_t* data, size_t length) {
  TxtRecord txt;
  size_t pos = 0;
  while (pos < length) {
    const size_t entry_length = data[pos];
    ++pos;
    if (entry_length == 0) {
      continue;
    }
    if (pos + entry_length > length) {
      break;
    }
    std::string entry(reinterpret_cast<const char*>(data + pos), entry_length);
    pos += entry_length;
    const auto equals = entry.find('=');
    std::string key = entry.substr(0, equals);
    if (key.empty()) {
      continue;
    }
    key = DnsLower(key);
    // The first occurrence of a key wins.
    if (txt.count(key) == 0) {
      txt[key] = equals == std::string::npos ? std::string()
                                              : entry.substr(equals + 1);
    }
  }
  return txt;
}

bool ParseRecord(const uint8_t* data, size_t length, size_t* offset,
                 DnsRecord* record, std::string* error) {
  if (!ReadName(data, length, offset, &record->name)) {
    return Fail(error, "malformed record name");
  }
  if (*offset + 10 > length) {
    return Fail(error, "truncated record header");
  }
  record->type = ReadBe16(data, *offset);
  const uint16_t raw_class = ReadBe16(data, *offset + 2);
  record->cache_flush = (raw_class & kCacheFlushBit) != 0;
  record->rrclass = static_cast<uint16_t>(raw_class & ~kCacheFlushBit);
  record->ttl = ReadBe32(data, *offset + 4);
  const size_t rdlength = ReadBe16(data, *offset + 8);
  const size_t rdata = *offset + 10;
  if (rdata + rdlength > length) {
    return Fail(error, "truncated record data");
  }
  switch (record->type) {
    case kDnsTypeA: {
      if (rdlength != 4) {
        return Fail(error, "A record with bad length");
      }
      std::ostringstream oss;
      oss << static_cast<int>(data[rdata]) << "."
          << static_cast<int>(data[rdata + 1]) << "."
          << static_cast<int>(data[rdata + 2]) << "."
          << static_cast<int>(data[rdata + 3]);
      record->address = oss.str();
      break;
    }
    case kDnsTypePtr: {
      size_t pos = rdata;
      if (!ReadName(data, length, &pos, &record->target)) {
        return Fail(error, "malformed PTR target");
      }
      break;
    }
    case kDnsTypeSrv: {
      if (rdlength < 7) {
        return Fail(error, "SRV record too short");
      }
      record->priority = ReadBe16(data, rdata);
      record->weight = ReadBe16(data, rdata + 2);
      record->port = ReadBe16(data, rdata + 4);
      size_t pos = rdata + 6;
      if (!ReadName(data, length, &pos, &record->target)) {
        return Fail(error, "malformed SRV target");
      }
      break;
    }
    case kDnsTypeTxt:
      record->txt = ParseTxt(data + rdata, rdlength);
      break;
    default:
      break;
  }
  *offset = rdata + rdlength;
  return true;
}

}  // namespace

std::string DnsLower(const std::string& name) {
  std::string out = name;
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

DnsQuestion DnsQuestion::FromName(const std::string& name, uint16_t type,
                                  bool unicast_response) {
  DnsQuestion question;
  question.type = type;
  question.unicast_response = unicast_response;
  size_t start = 0;
  while (start < name.size()) {
    auto dot = name.find('.', start);
    if (dot == std::string::npos) {
      dot = name.size();
    }
    if (dot > start) {
      question.labels.push_back(name.substr(start, dot - start));
    }
    start = dot + 1;
  }
  return question;
}

std::vector<uint8_t> BuildDnsQuery(const std::vector<DnsQuestion>& questions) {
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + questions.size() * 32);
  AppendBe16(out, 0);  // id
  AppendBe16(out, 0);  // flags: standard query
  AppendBe16(out, static_cast<uint16_t>(questions.size()));
  AppendBe16(out, 0);
  AppendBe16(out, 0);
  AppendBe16(out, 0);
  for (const auto& question : questions) {
    AppendLabels(out, question.labels);
    AppendBe16(out, question.type);
    AppendBe16(out, static_cast<uint16_t>(
                        kDnsClassIn |
                        (question.unicast_response ? kUnicastResponseBit : 0)));
  }
  return out;
}

bool ParseDnsMessage(const uint8_t* data, size_t length, DnsMessage* out,
                     std::string* error) {
  if (data == nullptr || out == nullptr) {
    return Fail(error, "null input");
  }
  if (length < kHeaderSize) {
    return Fail(error, "message shorter than header");
  }
  DnsMessage message;
  message.id = ReadBe16(data, 0);
  message.flags = ReadBe16(data, 2);
  const size_t question_count = ReadBe16(data, 4);
  const size_t record_count = static_cast<size_t>(ReadBe16(data, 6)) +
                              ReadBe16(data, 8) + ReadBe16(data, 10);
  size_t offset = kHeaderSize;
  for (size_t i = 0; i < question_count; ++i) {
    std::string name;
    if (!ReadName(data, length, &offset, &name)) {
      return Fail(error, "malformed question name");
    }
    if (offset + 4 > length) {
      return Fail(error, "truncated question");
    }
    const uint16_t raw_class = ReadBe16(data, offset + 2);
    DnsQuestion question = DnsQuestion::FromName(
        name, ReadBe16(data, offset), (raw_class & kUnicastResponseBit) != 0);
    message.questions.push_back(std::move(question));
    offset += 4;
  }
  for (size_t i = 0; i < record_count; ++i) {
    DnsRecord record;
    if (!ParseRecord(data, length, &offset, &record, error)) {
      return false;
    }
    message.records.push_back(std::move(record));
  }
  *out = std::move(message);
  return true;
}

#ifdef AIRSYNC_TESTING
namespace test {

std::vector<uint8_t> BuildDnsResponse(const std::vector<DnsRecord>& records) {
  std::vector<uint8_t> out;
  AppendBe16(out, 0);
  AppendBe16(out, 0x8400);  // response, authoritative
  AppendBe16(out, 0);
  AppendBe16(out, static_cast<uint16_t>(records.size()));
  AppendBe16(out, 0);
  AppendBe16(out, 0);
  auto labels = [](const std::string& name) {
    return DnsQuestion::FromName(name, 0, false).labels;
  };
  for (const auto& record : records) {
    AppendLabels(out, labels(record.name));
    AppendBe16(out, record.type);
    const uint16_t flush = record.cache_flush ? kCacheFlushBit : 0;
    AppendBe16(out, static_cast<uint16_t>(record.rrclass | flush));
    AppendBe16(out, static_cast<uint16_t>(record.ttl >> 16));
    AppendBe16(out, static_cast<uint16_t>(record.ttl & 0xffff));
    std::vector<uint8_t> rdata;
    switch (record.type) {
      case kDnsTypeA: {
        unsigned a = 0, b = 0, c = 0, d = 0;
        char dot = 0;
        std::istringstream iss(record.address);
        iss >> a >> dot >> b >> dot >> c >> dot >> d;
        rdata = {static_cast<uint8_t>(a), static_cast<uint8_t>(b),
                 static_cast<uint8_t>(c), static_cast<uint8_t>(d)};
        break;
      }
      case kDnsTypePtr:
        AppendLabels(rdata, labels(record.target));
        break;
      case kDnsTypeSrv:
        AppendBe16(rdata, record.priority);
        AppendBe16(rdata, record.weight);
        AppendBe16(rdata, record.port);
        AppendLabels(rdata, labels(record.target));
        break;
      case kDnsTypeTxt:
        for (const auto& entry : record.txt) {
          const std::string text = entry.first + "=" + entry.second;
          rdata.push_back(static_cast<uint8_t>(text.size()));
          rdata.insert(rdata.end(), text.begin(), text.end());
        }
        if (rdata.empty()) {
          rdata.push_back(0);
        }
        break;
      default:
        break;
    }
    AppendBe16(out, static_cast<uint16_t>(rdata.size()));
    out.insert(out.end(), rdata.begin(), rdata.end());
  }
  return out;
}

}  // namespace test
#endif

}  // namespace airsync
