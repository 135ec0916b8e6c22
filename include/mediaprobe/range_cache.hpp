#pragma once

#include "types.hpp"
#include "remote_reader.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace mediaprobe {

// Forward declaration of internal state
class RangeCacheImpl;

/**
 * @class RangeCache
 * @brief Byte ranges downloaded from one remote resource at a time.
 *
 * Misses are rounded up to Config::chunk_length_bytes. Switching to another
 * resource drops every entry. When a miss would bring the cached total to
 * Config::capacity_bytes or beyond, every entry is dropped before fetching,
 * so the cap can be overshot by at most the one fetch that follows.
 *
 * All operations are serialized on one internal mutex, including the remote
 * fetch on a miss.
 */
class RangeCache {
public:
    RangeCache(const Config& cfg, RemoteReader& reader);
    ~RangeCache();

    /**
     * @brief Returns a cached range containing 'desired_offset', fetching one
     * from the remote reader on a miss.
     *
     * The returned pointer is a read-only loan. The bytes behind it stay valid
     * and unmoved until the last copy of the pointer is released, even if the
     * cache flushes meanwhile.
     *
     * @throws AnalysisError kInvalidArgument for a negative offset or an empty
     *         resource identity, kRemoteFetch when the fetch fails or yields
     *         no bytes at 'desired_offset'.
     */
    std::shared_ptr<const CachedRange> GetOrFetch(const std::string& resource,
                                                  std::int64_t desired_offset);

    // Drops every entry and resets UsedBytes() to zero.
    void Flush();

    // Introspection
    std::uint64_t UsedBytes() const;
    std::uint64_t CapacityBytes() const;
    void SetCapacityBytes(std::uint64_t cap);
    std::uint64_t ChunkLengthBytes() const;
    std::size_t EntryCount() const;
    std::string CurrentResource() const;
    CacheStats Stats() const;

private:
    // PIMPL Idiom
    std::unique_ptr<RangeCacheImpl> p_impl;

    // Disable copy/move
    RangeCache(const RangeCache&) = delete;
    RangeCache& operator=(const RangeCache&) = delete;
    RangeCache(RangeCache&&) = delete;
    RangeCache& operator=(RangeCache&&) = delete;
};

} // namespace mediaprobe
