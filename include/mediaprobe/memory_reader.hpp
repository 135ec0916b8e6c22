#pragma once

#include "remote_reader.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediaprobe {

/**
 * @class MemoryReader
 * @brief RemoteReader over objects held in memory.
 *
 * Used by rangebench and the tests. Thread-safe. An optional per-fetch delay
 * stands in for network latency.
 */
class MemoryReader : public RemoteReader {
public:
    MemoryReader() = default;

    void Put(const std::string& resource, std::vector<std::uint8_t> bytes);
    bool Remove(const std::string& resource);
    void SetFetchDelay(std::chrono::microseconds delay);

    std::vector<std::uint8_t> FetchRange(const std::string& resource,
                                         std::int64_t offset,
                                         std::int64_t length) override;
    std::int64_t ProbeLength(const std::string& resource) override;

    std::uint64_t FetchCount() const;
    std::uint64_t ProbeCount() const;
    std::uint64_t BytesServed() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::uint8_t>> objects_;
    std::chrono::microseconds fetch_delay_{0};
    std::uint64_t fetch_count_ = 0;
    std::uint64_t probe_count_ = 0;
    std::uint64_t bytes_served_ = 0;
};

// Deterministic object content: byte i is a function of (seed, i).
std::vector<std::uint8_t> MakePatternBytes(std::size_t length, std::uint32_t seed = 0);

} // namespace mediaprobe
