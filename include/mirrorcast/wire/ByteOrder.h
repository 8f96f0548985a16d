#ifndef MIRRORCAST_WIRE_BYTE_ORDER_H_
#define MIRRORCAST_WIRE_BYTE_ORDER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mirrorcast::wire {

// Big-endian append/read helpers. Readers do no bounds checking; callers
// validate the buffer length first.

inline void AppendU16BE(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void AppendU32BE(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value >> 24));
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline uint16_t ReadU16BE(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline uint32_t ReadU32BE(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) |
         static_cast<uint32_t>(p[3]);
}

}  // namespace mirrorcast::wire

#endif  // MIRRORCAST_WIRE_BYTE_ORDER_H_
