// Repository: MirrorCast
// Component: Identifiers
// Purpose: Session UUIDs and numeric pairing codes.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/common/Identifiers.h"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace mirrorcast {

namespace {

std::mutex& GeneratorMutex() {
  static std::mutex mutex;
  return mutex;
}

std::mt19937_64& Generator() {
  static std::mt19937_64 generator{std::random_device{}()};
  return generator;
}

}  // namespace

std::string GenerateUuidV4() {
  std::array<uint8_t, 16> bytes{};
  {
    std::lock_guard<std::mutex> lock(GeneratorMutex());
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& byte : bytes) {
      byte = static_cast<uint8_t>(dist(Generator()));
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

std::string GeneratePairingCode(std::size_t digits) {
  std::string code;
  code.reserve(digits);
  std::lock_guard<std::mutex> lock(GeneratorMutex());
  std::uniform_int_distribution<int> dist(0, 9);
  for (std::size_t i = 0; i < digits; ++i) {
    code.push_back(static_cast<char>('0' + dist(Generator())));
  }
  return code;
}

bool IsValidPairingCode(const std::string& code, std::size_t digits) {
  if (code.size() != digits) {
    return false;
  }
  for (char c : code) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace mirrorcast
