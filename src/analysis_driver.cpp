#include "mediaprobe/analysis_driver.hpp"
#include "mediaprobe/errors.hpp"
#include "mediaprobe/settings.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace mediaprobe {

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

const char* ToString(DriveState state) {
    switch (state) {
        case DriveState::kProbing:    return "Probing";
        case DriveState::kFeeding:    return "Feeding";
        case DriveState::kFinalizing: return "Finalizing";
        case DriveState::kDone:       return "Done";
        case DriveState::kFailed:     return "Failed";
    }
    return "Unknown";
}

struct StreamingAnalysisDriver::Session {
    std::string resource;
    const CancellationToken* cancel = nullptr;
    std::int64_t content_length = 0;
    std::int64_t current_offset = 0;
    SessionStats stats;

    // Runs one engine call, turning whatever it throws into 'kind'.
    template <typename Fn>
    auto Engine(ErrorKind kind, const char* call, Fn&& fn) const -> decltype(fn()) {
        try {
            return fn();
        } catch (const std::exception& e) {
            throw AnalysisError(kind,
                                std::string("Analysis engine threw on ") + call + ": " + e.what(),
                                resource, current_offset);
        }
    }
};

StreamingAnalysisDriver::StreamingAnalysisDriver(const Config& cfg, RangeCache& cache, RemoteReader& reader)
    : cache_(cache), reader_(reader), max_iterations_(cfg.max_iterations) {
    ValidateConfig(cfg);
}

void StreamingAnalysisDriver::enter(DriveState next, const Session& session) {
    spdlog::debug("analysis of {}: {} -> {} at offset {}",
                  session.resource, ToString(state_), ToString(next), session.current_offset);
    state_ = next;
}

void StreamingAnalysisDriver::check_cancelled(const Session& session, const char* before) const {
    if (session.cancel && session.cancel->IsCancelled()) {
        throw AnalysisError(ErrorKind::kCancelled,
                            std::string("Analysis cancelled before ") + before + ".",
                            session.resource, session.current_offset);
    }
}

void StreamingAnalysisDriver::probe(Session& session) {
    check_cancelled(session, "probing length");

    std::int64_t length = 0;
    try {
        length = reader_.ProbeLength(session.resource);
    } catch (const RemoteReadError& e) {
        throw AnalysisError(ErrorKind::kRemoteFetch,
                            std::string("Could not probe content length: ") + e.what(),
                            session.resource, -1, e.Reason());
    }

    if (length == 0) {
        throw AnalysisError(ErrorKind::kConfiguration, "Content length 0.", session.resource, 0);
    }
    if (length < 0) {
        throw AnalysisError(ErrorKind::kRemoteFetch,
                            "Remote reader reported a negative content length.",
                            session.resource, length, RemoteFailure::kMalformedResponse);
    }

    session.content_length = length;
    session.current_offset = 0;
    spdlog::info("analysis of {} started, content length {}", session.resource, length);
}

void StreamingAnalysisDriver::feed(Session& session, AnalysisEngine& engine) {
    SessionStats& stats = session.stats;

    while (true) {
        if (stats.iterations >= max_iterations_) {
            throw AnalysisError(ErrorKind::kProtocolDivergence,
                                "Engine did not finish within " + std::to_string(max_iterations_) +
                                    " buffers.",
                                session.resource, session.current_offset);
        }
        check_cancelled(session, "fetching");
        ++stats.iterations;

        // Keeps the buffer alive and in place for the whole handoff below.
        std::shared_ptr<const CachedRange> loan = cache_.GetOrFetch(session.resource, session.current_offset);
        const ByteRange fed = loan->range;

        check_cancelled(session, "buffer init");
        session.Engine(ErrorKind::kEngineInit, "InitBuffer", [&] {
            engine.InitBuffer(session.content_length, fed.offset);
        });

        check_cancelled(session, "buffer feed");
        const EngineStatus status = session.Engine(ErrorKind::kEngineFeed, "FeedBuffer", [&] {
            return engine.FeedBuffer(loan->View());
        });
        stats.bytes_fed += static_cast<std::uint64_t>(fed.length);
        loan.reset();

        if (status.finalized) {
            spdlog::info("analysis of {}: engine finalized after {} buffers", session.resource, stats.iterations);
            return;
        }

        check_cancelled(session, "offset negotiation");
        const std::int64_t next = session.Engine(ErrorKind::kEngineFeed, "NextRequestedOffset", [&] {
            return engine.NextRequestedOffset();
        });

        if (next == session.content_length) {
            spdlog::debug("analysis of {}: engine requested end of file at {}", session.resource, next);
            session.current_offset = next;
            return;
        } else if (next == kForwardSentinel) {
            // Continue after the buffer just fed, not after what was asked for.
            session.current_offset = fed.End();
            ++stats.forward_reads;
            spdlog::debug("analysis of {}: engine reads forward from {}", session.resource, session.current_offset);
        } else if (next < 0) {
            throw AnalysisError(ErrorKind::kInvalidArgument,
                                "Engine requested negative offset " + std::to_string(next) + ".",
                                session.resource, session.current_offset);
        } else {
            session.current_offset = next;
            ++stats.seeks;
            spdlog::debug("analysis of {}: engine seeks to {}", session.resource, next);
        }

        if (session.current_offset >= session.content_length) {
            spdlog::info("analysis of {}: offset {} is at or past content length {}, finalizing",
                         session.resource, session.current_offset, session.content_length);
            return;
        }
    }
}

std::string StreamingAnalysisDriver::finish(Session& session, AnalysisEngine& engine) {
    check_cancelled(session, "finalize");
    session.Engine(ErrorKind::kEngineFinalize, "Finalize", [&] { engine.Finalize(); });

    check_cancelled(session, "report");
    std::string text = session.Engine(ErrorKind::kEngineFinalize, "GetReport", [&] {
        return engine.GetReport();
    });

    if (IsBlank(text)) {
        throw AnalysisError(ErrorKind::kEmptyReport, "Engine produced an empty report.",
                            session.resource, session.current_offset);
    }
    if (!nlohmann::json::accept(text)) {
        throw AnalysisError(ErrorKind::kMalformedReport, "Engine produced a report that is not well-formed JSON.",
                            session.resource, session.current_offset);
    }
    return text;
}

AnalysisReport StreamingAnalysisDriver::Analyze(const std::string& resource,
                                                AnalysisEngine& engine,
                                                const CancellationToken* cancel) {
    Session session;
    session.resource = resource;
    session.cancel = cancel;

    state_ = DriveState::kProbing;
    try {
        probe(session);
        enter(DriveState::kFeeding, session);
        feed(session, engine);
        enter(DriveState::kFinalizing, session);

        AnalysisReport report;
        report.text = finish(session, engine);
        report.resource = resource;
        report.content_length = session.content_length;
        report.stats = session.stats;

        enter(DriveState::kDone, session);
        spdlog::info("analysis of {} done: {} buffers, {} bytes fed, {} seeks",
                     resource, report.stats.iterations, report.stats.bytes_fed, report.stats.seeks);
        return report;
    } catch (const AnalysisError& e) {
        const AnalysisError annotated = e.Annotate(resource, session.current_offset);
        spdlog::error("analysis of {} failed in {}: {}", resource, ToString(state_), annotated.what());
        state_ = DriveState::kFailed;
        throw annotated;
    } catch (...) {
        state_ = DriveState::kFailed;
        throw;
    }
}

} // namespace mediaprobe
