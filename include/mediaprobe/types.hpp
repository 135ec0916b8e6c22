#pragma once

#include "hash.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace mediaprobe {

// Read-only view over bytes someone else owns (std::span is C++20).
class bytes_view {
public:
    bytes_view() = default;
    bytes_view(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit bytes_view(const std::vector<std::uint8_t>& vec) : data_(vec.data()), size_(vec.size()) {}

    const std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    std::uint8_t operator[](std::size_t i) const { return data_[i]; }

private:
    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
};

// Half-open interval [offset, offset + length) of a remote resource.
struct ByteRange {
    std::int64_t offset = 0;
    std::int64_t length = 0;

    std::int64_t End() const { return offset + length; }
    bool Contains(std::int64_t pos) const { return pos >= offset && pos < End(); }
};

// One downloaded range, owned by the RangeCache. Callers only ever hold
// it through a shared_ptr<const CachedRange>, so the bytes stay put for as
// long as a loan is outstanding even if the cache flushes meanwhile.
struct CachedRange {
    ByteRange range;
    ResourceKey resource_key;
    std::vector<std::uint8_t> bytes;

    bool Contains(std::int64_t pos) const { return range.Contains(pos); }
    bytes_view View() const { return bytes_view(bytes); }
};

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t fetches = 0;
    std::uint64_t flushes = 0;
    std::uint64_t fetched_bytes = 0;
};

struct Config {
    std::uint64_t chunk_length_bytes = 4ull * 1024 * 1024;   // 4 MiB
    std::uint64_t capacity_bytes = 32ull * 1024 * 1024;      // 32 MiB
    std::uint32_t max_iterations = 65536;
    std::string log_level;

    // S3 Configuration
    std::string s3_endpoint;
    std::string s3_region;
    std::string s3_bucket;
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    bool s3_use_path_style = true;
};

} // namespace mediaprobe
