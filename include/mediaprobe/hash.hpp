#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace mediaprobe {

// 128-bit tag of a remote resource identity, carried by every cache entry.
// Equal keys do not imply equal identities; compare the strings as well.
using ResourceKey = std::array<std::uint8_t, 16>;

ResourceKey MakeResourceKey(const std::string& resource);

std::string ToHex(const ResourceKey& key);

// First 8 hex digits of the key, for log lines.
std::string ShortTag(const ResourceKey& key);

} // namespace mediaprobe
