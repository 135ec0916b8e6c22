#include "mediaprobe/hash.hpp"
#include "mediaprobe/errors.hpp"
#include "xxhash.h"

#include <vector>
#include <iomanip>
#include <sstream>
#include <cstring>

namespace mediaprobe {

namespace {

constexpr std::uint8_t kKeyVersion = 1;

// Helper to append little-endian data to a vector
template <typename T>
void append_le(std::vector<std::uint8_t>& buf, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

} // namespace

ResourceKey MakeResourceKey(const std::string& resource) {
    if (resource.empty()) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "Resource identity is empty.");
    }
    if (resource.length() > UINT32_MAX) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "Resource identity is too long.");
    }

    std::vector<std::uint8_t> serialization_buffer;
    serialization_buffer.reserve(1 + sizeof(std::uint32_t) + resource.length());

    // 1. Version
    serialization_buffer.push_back(kKeyVersion);

    // 2. Identity
    append_le(serialization_buffer, static_cast<std::uint32_t>(resource.length()));
    serialization_buffer.insert(serialization_buffer.end(), resource.begin(), resource.end());

    XXH128_hash_t hash = XXH3_128bits(serialization_buffer.data(), serialization_buffer.size());

    // Canonical (big-endian) form so the hex string is stable across platforms
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, hash);

    ResourceKey key;
    std::memcpy(key.data(), canonical.digest, key.size());
    return key;
}

std::string ToHex(const ResourceKey& key) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : key) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::string ShortTag(const ResourceKey& key) {
    return ToHex(key).substr(0, 8);
}

} // namespace mediaprobe
