// Repository: MirrorCast
// Component: Identifiers
// Purpose: Session UUIDs and numeric pairing codes.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_COMMON_IDENTIFIERS_H_
#define MIRRORCAST_COMMON_IDENTIFIERS_H_

#include <cstddef>
#include <string>

namespace mirrorcast {

constexpr std::size_t kDefaultPairingCodeLength = 4;

// Returns a random RFC 4122 version 4 UUID in canonical lowercase form.
std::string GenerateUuidV4();

// Returns a random numeric code of `digits` characters (leading zeros kept).
std::string GeneratePairingCode(std::size_t digits = kDefaultPairingCodeLength);

// True when `code` is exactly `digits` ASCII decimal characters.
bool IsValidPairingCode(const std::string& code,
                        std::size_t digits = kDefaultPairingCodeLength);

}  // namespace mirrorcast

#endif  // MIRRORCAST_COMMON_IDENTIFIERS_H_
