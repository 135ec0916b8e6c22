#include "mediaprobe/range_cache.hpp"
#include "mediaprobe/errors.hpp"
#include "mediaprobe/hash.hpp"
#include "mediaprobe/settings.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <utility>

namespace mediaprobe {

// PIMPL: Private Implementation
class RangeCacheImpl {
public:
    RangeCacheImpl(const Config& cfg, RemoteReader& reader);

    std::shared_ptr<const CachedRange> GetOrFetch(const std::string& resource,
                                                  std::int64_t desired_offset);
    void Flush();

    std::uint64_t UsedBytes() const;
    std::uint64_t CapacityBytes() const;
    void SetCapacityBytes(std::uint64_t cap);
    std::uint64_t ChunkLengthBytes() const;
    std::size_t EntryCount() const;
    std::string CurrentResource() const;
    CacheStats Stats() const;

private:
    std::shared_ptr<const CachedRange> find_containing(std::int64_t offset) const;
    std::shared_ptr<const CachedRange> fetch_and_insert(const std::string& resource,
                                                        std::int64_t desired_offset);
    void flush_all(const char* reason);

    RemoteReader& reader_;
    std::uint64_t chunk_length_bytes_;

    // Thread-safe state
    mutable std::mutex mutex_;
    std::uint64_t used_bytes_ = 0;
    std::uint64_t capacity_bytes_;
    CacheStats stats_;

    // Identity of the resource every entry belongs to
    bool has_resource_ = false;
    ResourceKey resource_key_{};
    std::string resource_;

    // start offset -> entry
    std::map<std::int64_t, std::shared_ptr<const CachedRange>> entries_;
};


// --- RangeCacheImpl Implementation ---

RangeCacheImpl::RangeCacheImpl(const Config& cfg, RemoteReader& reader)
    : reader_(reader),
      chunk_length_bytes_(cfg.chunk_length_bytes),
      capacity_bytes_(cfg.capacity_bytes) {
    ValidateConfig(cfg);
}

std::shared_ptr<const CachedRange> RangeCacheImpl::find_containing(std::int64_t offset) const {
    // Assumes lock is held. Walk entries starting at or before 'offset' from
    // the largest start down; the first one that reaches past 'offset' wins.
    auto it = entries_.upper_bound(offset);
    while (it != entries_.begin()) {
        --it;
        if (it->second->Contains(offset)) {
            return it->second;
        }
    }
    return nullptr;
}

void RangeCacheImpl::flush_all(const char* reason) {
    // Assumes lock is held
    if (entries_.empty()) {
        used_bytes_ = 0;
        return;
    }

    spdlog::info("range cache flush ({}): dropping {} entries, {} bytes of {}",
                 reason, entries_.size(), used_bytes_, resource_);
    entries_.clear();
    used_bytes_ = 0;
    ++stats_.flushes;
}

std::shared_ptr<const CachedRange> RangeCacheImpl::fetch_and_insert(const std::string& resource,
                                                                    std::int64_t desired_offset) {
    // Assumes lock is held
    const auto requested = static_cast<std::int64_t>(chunk_length_bytes_);

    std::vector<std::uint8_t> bytes;
    try {
        bytes = reader_.FetchRange(resource, desired_offset, requested);
    } catch (const RemoteReadError& e) {
        spdlog::error("range download failed for {} at {}: {} ({})",
                      resource, desired_offset, e.what(), ToString(e.Reason()));
        throw AnalysisError(ErrorKind::kRemoteFetch,
                            std::string("Could not download content: ") + e.what(),
                            resource, desired_offset, e.Reason());
    }

    if (bytes.empty()) {
        throw AnalysisError(ErrorKind::kRemoteFetch,
                            "Remote reader returned no bytes; offset is past the end of the resource.",
                            resource, desired_offset, RemoteFailure::kMalformedResponse);
    }
    if (static_cast<std::int64_t>(bytes.size()) > requested) {
        throw AnalysisError(ErrorKind::kRemoteFetch,
                            "Remote reader returned " + std::to_string(bytes.size()) +
                                " bytes for a request of " + std::to_string(requested) + ".",
                            resource, desired_offset, RemoteFailure::kMalformedResponse);
    }

    auto entry = std::make_shared<CachedRange>();
    entry->range = ByteRange{desired_offset, static_cast<std::int64_t>(bytes.size())};
    entry->resource_key = resource_key_;
    entry->bytes = std::move(bytes);

    used_bytes_ += entry->bytes.size();
    ++stats_.fetches;
    stats_.fetched_bytes += entry->bytes.size();
    entries_[desired_offset] = entry;

    spdlog::info("range downloaded for {} [{}]: offset {}, length {}, cached {} bytes",
                 resource, ShortTag(resource_key_), entry->range.offset, entry->range.length, used_bytes_);
    return entry;
}

std::shared_ptr<const CachedRange> RangeCacheImpl::GetOrFetch(const std::string& resource,
                                                              std::int64_t desired_offset) {
    if (desired_offset < 0) {
        throw AnalysisError(ErrorKind::kInvalidArgument,
                            "Desired offset must not be negative.", resource, desired_offset);
    }
    if (resource.empty()) {
        throw AnalysisError(ErrorKind::kInvalidArgument,
                            "Resource identity is empty.", resource, desired_offset);
    }
    const ResourceKey key = MakeResourceKey(resource);

    std::lock_guard<std::mutex> lock(mutex_);

    // Entries are only ever valid for one resource. Starting over for a new
    // one drops everything held for the previous one.
    if (!has_resource_ || key != resource_key_ || resource != resource_) {
        flush_all("resource switch");
        has_resource_ = true;
        resource_key_ = key;
        resource_ = resource;
    } else if (auto hit = find_containing(desired_offset)) {
        ++stats_.hits;
        spdlog::debug("range cache hit for {} at {} in [{}, {})",
                      resource, desired_offset, hit->range.offset, hit->range.End());
        return hit;
    }

    ++stats_.misses;

    // Nothing suitable cached. Clean out everything if the download would
    // bring the total to the cap.
    if (used_bytes_ + chunk_length_bytes_ >= capacity_bytes_) {
        flush_all("capacity");
    }

    return fetch_and_insert(resource, desired_offset);
}

void RangeCacheImpl::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_all("requested");
}

std::uint64_t RangeCacheImpl::UsedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

std::uint64_t RangeCacheImpl::CapacityBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_bytes_;
}

void RangeCacheImpl::SetCapacityBytes(std::uint64_t cap) {
    if (cap == 0) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "capacity_bytes must be greater than zero.");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // A lower cap takes effect on the next miss
    capacity_bytes_ = cap;
}

std::uint64_t RangeCacheImpl::ChunkLengthBytes() const {
    return chunk_length_bytes_;
}

std::size_t RangeCacheImpl::EntryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string RangeCacheImpl::CurrentResource() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resource_;
}

CacheStats RangeCacheImpl::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}


// --- RangeCache Public API (forwarding to PIMPL) ---

RangeCache::RangeCache(const Config& cfg, RemoteReader& reader)
    : p_impl(std::make_unique<RangeCacheImpl>(cfg, reader)) {}
RangeCache::~RangeCache() = default;
std::shared_ptr<const CachedRange> RangeCache::GetOrFetch(const std::string& resource, std::int64_t desired_offset) {
    return p_impl->GetOrFetch(resource, desired_offset);
}
void RangeCache::Flush() { p_impl->Flush(); }
std::uint64_t RangeCache::UsedBytes() const { return p_impl->UsedBytes(); }
std::uint64_t RangeCache::CapacityBytes() const { return p_impl->CapacityBytes(); }
void RangeCache::SetCapacityBytes(std::uint64_t cap) { p_impl->SetCapacityBytes(cap); }
std::uint64_t RangeCache::ChunkLengthBytes() const { return p_impl->ChunkLengthBytes(); }
std::size_t RangeCache::EntryCount() const { return p_impl->EntryCount(); }
std::string RangeCache::CurrentResource() const { return p_impl->CurrentResource(); }
CacheStats RangeCache::Stats() const { return p_impl->Stats(); }

} // namespace mediaprobe
