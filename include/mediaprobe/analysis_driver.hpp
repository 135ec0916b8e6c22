#pragma once

#include "types.hpp"
#include "analysis_engine.hpp"
#include "range_cache.hpp"
#include "remote_reader.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace mediaprobe {

enum class DriveState {
    kProbing,
    kFeeding,
    kFinalizing,
    kDone,
    kFailed,
};

const char* ToString(DriveState state);

// Caller-owned abort flag, polled by the driver between blocking calls.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct SessionStats {
    std::uint32_t iterations = 0;
    std::uint32_t forward_reads = 0;
    std::uint32_t seeks = 0;
    std::uint64_t bytes_fed = 0;
};

struct AnalysisReport {
    std::string resource;
    std::int64_t content_length = 0;
    std::string text;
    SessionStats stats;
};

/**
 * @class StreamingAnalysisDriver
 * @brief Feeds a remote resource to an AnalysisEngine range by range.
 *
 * The engine decides which bytes it needs: after every buffer it either
 * finalizes, asks for the following bytes, seeks, or reports end of resource.
 * Ranges come from the shared RangeCache, so bytes the engine revisits are not
 * downloaded twice.
 *
 * One driver runs one session at a time. Several drivers may share a cache.
 */
class StreamingAnalysisDriver {
public:
    StreamingAnalysisDriver(const Config& cfg, RangeCache& cache, RemoteReader& reader);

    /**
     * @brief Runs a full session for 'resource' and returns the engine report.
     *
     * @throws AnalysisError on any failure, annotated with the resource and
     *         the offset in play. No partial report is ever returned.
     */
    AnalysisReport Analyze(const std::string& resource,
                           AnalysisEngine& engine,
                           const CancellationToken* cancel = nullptr);

    // State the last Analyze call ended in (kDone or kFailed once it returns).
    DriveState LastState() const { return state_; }

private:
    struct Session;

    void probe(Session& session);
    void feed(Session& session, AnalysisEngine& engine);
    std::string finish(Session& session, AnalysisEngine& engine);
    void check_cancelled(const Session& session, const char* before) const;
    void enter(DriveState next, const Session& session);

    RangeCache& cache_;
    RemoteReader& reader_;
    std::uint32_t max_iterations_;
    DriveState state_ = DriveState::kDone;
};

} // namespace mediaprobe
