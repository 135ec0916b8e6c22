#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>

namespace mediaprobe {

// NextRequestedOffset() value meaning "give me the bytes that follow".
constexpr std::int64_t kForwardSentinel = -1;

// Status reported after each buffer handoff. The flags are independent.
struct EngineStatus {
    bool accepted = false;
    bool filled = false;
    bool updated = false;
    bool finalized = false;

    static constexpr std::uint32_t kAcceptedBit = 0x01;
    static constexpr std::uint32_t kFilledBit = 0x02;
    static constexpr std::uint32_t kUpdatedBit = 0x04;
    static constexpr std::uint32_t kFinalizedBit = 0x08;

    static EngineStatus FromBits(std::uint32_t bits) {
        EngineStatus s;
        s.accepted = (bits & kAcceptedBit) != 0;
        s.filled = (bits & kFilledBit) != 0;
        s.updated = (bits & kUpdatedBit) != 0;
        s.finalized = (bits & kFinalizedBit) != 0;
        return s;
    }
};

/**
 * @class AnalysisEngine
 * @brief Buffer-fed format analysis engine.
 *
 * One engine instance serves one session. The driver calls InitBuffer and
 * FeedBuffer once per iteration, asks NextRequestedOffset while the engine
 * has not finalized, then calls Finalize and GetReport exactly once.
 * Failures are reported by throwing any std::exception.
 */
class AnalysisEngine {
public:
    virtual ~AnalysisEngine() = default;

    // Announces the absolute offset of the buffer passed to the next FeedBuffer.
    virtual void InitBuffer(std::int64_t total_length, std::int64_t buffer_start_offset) = 0;

    // The view is only valid for the duration of this call.
    virtual EngineStatus FeedBuffer(bytes_view buffer) = 0;

    // Absolute offset the engine wants next, kForwardSentinel, or the total
    // length to signal logical end of resource.
    virtual std::int64_t NextRequestedOffset() = 0;

    virtual void Finalize() = 0;

    virtual std::string GetReport() = 0;
};

} // namespace mediaprobe
