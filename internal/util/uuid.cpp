#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace trajectory::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

struct Sequence {
  std::mutex      mutex;
  std::uint64_t   last_millis = 0;
  std::uint16_t   counter     = 0;
  std::mt19937_64 rng{std::random_device{}()};
};

Sequence& GlobalSequence() {
  static Sequence sequence;
  return sequence;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool IsDashPosition(std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::string NewId() {
  std::array<std::uint8_t, 16> bytes{};
  std::uint64_t                millis  = 0;
  std::uint16_t                counter = 0;
  {
    auto&           sequence = GlobalSequence();
    std::lock_guard lock(sequence.mutex);

    millis = ToUnixMillis(Now());
    if (millis > sequence.last_millis) {
      sequence.last_millis = millis;
      sequence.counter     = static_cast<std::uint16_t>(sequence.rng() & 0x07FF); // leave headroom
    } else {
      // same millisecond or clock stepped back: keep counting on the last one
      millis = sequence.last_millis;
      if (++sequence.counter > 0x0FFF) {
        sequence.counter = 0;
        millis = ++sequence.last_millis;
      }
    }
    counter = sequence.counter;

    const std::uint64_t random = sequence.rng();
    for (std::size_t i = 0; i < 8; ++i) {
      bytes[8 + i] = static_cast<std::uint8_t>(random >> (8 * i));
    }
  }

  for (std::size_t i = 0; i < 6; ++i) {
    bytes[i] = static_cast<std::uint8_t>(millis >> (8 * (5 - i)));
  }
  bytes[6] = static_cast<std::uint8_t>(0x70 | ((counter >> 8) & 0x0F));
  bytes[7] = static_cast<std::uint8_t>(counter & 0xFF);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[bytes[i] >> 4]);
    out.push_back(kHexDigits[bytes[i] & 0x0F]);
  }
  return out;
}

bool IsValidId(const std::string& id) {
  if (id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (IsDashPosition(i) ? id[i] != '-' : HexValue(id[i]) < 0) {
      return false;
    }
  }
  // version nibble, then RFC variant bits 10xx
  return id[14] == '7' && (HexValue(id[19]) & 0xC) == 0x8;
}

std::optional<TimePoint> IdCreatedAt(const std::string& id) {
  if (!IsValidId(id)) {
    return std::nullopt;
  }

  std::uint64_t millis = 0;
  int           digits = 0;
  for (std::size_t i = 0; digits < 12; ++i) {
    if (IsDashPosition(i)) continue;
    millis = (millis << 4) | static_cast<std::uint64_t>(HexValue(id[i]));
    ++digits;
  }
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis));
}

} // namespace trajectory::util
