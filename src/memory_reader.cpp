#include "mediaprobe/memory_reader.hpp"
#include "mediaprobe/errors.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace mediaprobe {

void MemoryReader::Put(const std::string& resource, std::vector<std::uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[resource] = std::move(bytes);
}

bool MemoryReader::Remove(const std::string& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.erase(resource) > 0;
}

void MemoryReader::SetFetchDelay(std::chrono::microseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_delay_ = delay;
}

std::vector<std::uint8_t> MemoryReader::FetchRange(const std::string& resource,
                                                   std::int64_t offset,
                                                   std::int64_t length) {
    if (offset < 0 || length < 0) {
        throw RemoteReadError(RemoteFailure::kMalformedResponse, "Negative range requested from " + resource);
    }

    std::vector<std::uint8_t> out;
    std::chrono::microseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(resource);
        if (it == objects_.end()) {
            throw RemoteReadError(RemoteFailure::kNotFound, "No such object: " + resource);
        }
        const auto& data = it->second;
        const auto size = static_cast<std::int64_t>(data.size());
        if (offset < size) {
            std::int64_t end = std::min(size, offset + length);
            out.assign(data.begin() + offset, data.begin() + end);
        }
        ++fetch_count_;
        bytes_served_ += out.size();
        delay = fetch_delay_;
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    return out;
}

std::int64_t MemoryReader::ProbeLength(const std::string& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(resource);
    if (it == objects_.end()) {
        throw RemoteReadError(RemoteFailure::kNotFound, "No such object: " + resource);
    }
    ++probe_count_;
    return static_cast<std::int64_t>(it->second.size());
}

std::uint64_t MemoryReader::FetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

std::uint64_t MemoryReader::ProbeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_count_;
}

std::uint64_t MemoryReader::BytesServed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_served_;
}

std::vector<std::uint8_t> MakePatternBytes(std::size_t length, std::uint32_t seed) {
    std::vector<std::uint8_t> bytes(length);
    for (std::size_t i = 0; i < length; ++i) {
        bytes[i] = static_cast<std::uint8_t>((i * 31 + seed * 7 + (i >> 8)) & 0xFF);
    }
    return bytes;
}

} // namespace mediaprobe
