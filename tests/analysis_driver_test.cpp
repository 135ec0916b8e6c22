#include "mediaprobe/analysis_driver.hpp"
#include "mediaprobe/errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace mediaprobe {
namespace {

using fakes::EngineStep;
using fakes::Finalized;
using fakes::Forward;
using fakes::RecordingReader;
using fakes::ScriptedEngine;
using fakes::SeekTo;
using fakes::SmallConfig;

const char kResource[] = "s3://media/clip.mp4";

class AnalysisDriverTest : public ::testing::Test {
protected:
    void Use(std::size_t length, std::uint64_t chunk, std::uint64_t capacity) {
        object_ = MakePatternBytes(length, 7);
        reader_.Put(kResource, object_);
        cfg_ = SmallConfig(chunk, capacity);
        cache_ = std::make_unique<RangeCache>(cfg_, reader_);
        driver_ = std::make_unique<StreamingAnalysisDriver>(cfg_, *cache_, reader_);
    }

    AnalysisError ExpectFailure(ScriptedEngine& engine, const CancellationToken* cancel = nullptr) {
        try {
            driver_->Analyze(kResource, engine, cancel);
        } catch (const AnalysisError& e) {
            EXPECT_EQ(DriveState::kFailed, driver_->LastState());
            EXPECT_EQ(kResource, e.Resource());
            return e;
        }
        ADD_FAILURE() << "expected AnalysisError";
        return AnalysisError(ErrorKind::kConfiguration, "no failure");
    }

    RecordingReader reader_;
    std::vector<std::uint8_t> object_;
    Config cfg_;
    std::unique_ptr<RangeCache> cache_;
    std::unique_ptr<StreamingAnalysisDriver> driver_;
};

TEST_F(AnalysisDriverTest, ReadsForwardThroughTheWholeResource) {
    Use(9000000, 4194304, 33554432);
    ScriptedEngine engine({Forward()});

    AnalysisReport report = driver_->Analyze(kResource, engine);

    EXPECT_EQ(DriveState::kDone, driver_->LastState());
    EXPECT_EQ(std::vector<std::int64_t>({0, 4194304, 8388608}), reader_.fetch_offsets);
    EXPECT_EQ(std::vector<std::int64_t>({4194304, 4194304, 611696}), engine.fed_lengths);
    EXPECT_EQ(std::vector<std::int64_t>({0, 4194304, 8388608}), engine.init_offsets);
    for (std::int64_t total : engine.init_totals) {
        EXPECT_EQ(9000000, total);
    }
    EXPECT_EQ(0u, cache_->Stats().flushes);
    EXPECT_EQ(1, engine.finalize_calls);
    EXPECT_FALSE(report.text.empty());
    EXPECT_EQ(engine.report, report.text);
    EXPECT_EQ(kResource, report.resource);
    EXPECT_EQ(9000000, report.content_length);
    EXPECT_EQ(3u, report.stats.iterations);
    EXPECT_EQ(3u, report.stats.forward_reads);
    EXPECT_EQ(0u, report.stats.seeks);
    EXPECT_EQ(9000000u, report.stats.bytes_fed);
}

TEST_F(AnalysisDriverTest, ForwardReadContinuesAfterTheRangeFed) {
    Use(10000, 4096, 1 << 20);
    // Leave [100, 4196) in the cache so a seek to 100 is served from it
    cache_->GetOrFetch(kResource, 100);
    ScriptedEngine engine({SeekTo(100), Forward(), Finalized()});

    driver_->Analyze(kResource, engine);

    EXPECT_EQ(std::vector<std::int64_t>({0, 100, 4196}), engine.init_offsets);
    EXPECT_EQ(std::vector<std::int64_t>({100, 0, 4196}), reader_.fetch_offsets);
    EXPECT_EQ(object_[4196], engine.fed_first_bytes[2]);
}

TEST_F(AnalysisDriverTest, EngineRequestingEndOfFileStopsAfterOneBuffer) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({SeekTo(10000)});

    AnalysisReport report = driver_->Analyze(kResource, engine);

    EXPECT_EQ(1u, report.stats.iterations);
    EXPECT_EQ(1u, engine.fed_lengths.size());
    EXPECT_EQ(1, engine.next_calls);
    EXPECT_EQ(1, engine.finalize_calls);
    EXPECT_EQ(1, engine.report_calls);
    EXPECT_EQ(DriveState::kDone, driver_->LastState());
}

TEST_F(AnalysisDriverTest, FinalizedStatusSkipsOffsetNegotiation) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Finalized()});

    driver_->Analyze(kResource, engine);

    EXPECT_EQ(0, engine.next_calls);
    EXPECT_EQ(1, engine.finalize_calls);
    EXPECT_EQ(1u, reader_.FetchCount());
}

TEST_F(AnalysisDriverTest, SeekPastEndFinalizes) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({SeekTo(20000)});

    AnalysisReport report = driver_->Analyze(kResource, engine);

    EXPECT_EQ(1u, report.stats.iterations);
    EXPECT_EQ(1u, report.stats.seeks);
    EXPECT_EQ(1u, reader_.FetchCount());
}

TEST_F(AnalysisDriverTest, SeeksAreServedFromCacheWhenCovered) {
    Use(10000, 4096, 1 << 20);
    // Read the header, jump to the tail, come back into the header
    ScriptedEngine engine({SeekTo(8000), SeekTo(2000), Finalized()});

    AnalysisReport report = driver_->Analyze(kResource, engine);

    EXPECT_EQ(std::vector<std::int64_t>({0, 8000}), reader_.fetch_offsets);
    EXPECT_EQ(std::vector<std::int64_t>({0, 8000, 0}), engine.init_offsets);
    EXPECT_EQ(2u, report.stats.seeks);
    EXPECT_EQ(1u, cache_->Stats().hits);
}

TEST_F(AnalysisDriverTest, SecondSessionOnSameResourceReusesCache) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine first({Forward()});
    driver_->Analyze(kResource, first);
    const std::uint64_t fetches = reader_.FetchCount();

    ScriptedEngine second({Forward()});
    AnalysisReport report = driver_->Analyze(kResource, second);

    EXPECT_EQ(fetches, reader_.FetchCount());
    EXPECT_EQ(first.init_offsets, second.init_offsets);
    EXPECT_EQ(10000u, report.stats.bytes_fed);
}

TEST_F(AnalysisDriverTest, ZeroLengthResourceFailsWithoutFetching) {
    Use(0, 4096, 1 << 20);
    ScriptedEngine engine({Forward()});

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kConfiguration, e.Kind());
    EXPECT_EQ(0u, reader_.FetchCount());
    EXPECT_TRUE(engine.init_offsets.empty());
    EXPECT_EQ(0, engine.finalize_calls);
}

TEST_F(AnalysisDriverTest, ProbeFailureIsRemoteFetchError) {
    Use(10000, 4096, 1 << 20);
    reader_.fail_probe = RemoteFailure::kNotFound;
    ScriptedEngine engine({Forward()});

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kRemoteFetch, e.Kind());
    EXPECT_EQ(RemoteFailure::kNotFound, e.Remote());
    EXPECT_EQ(0, e.Offset());
}

TEST_F(AnalysisDriverTest, FetchFailureReportsTheOffsetInPlay) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({SeekTo(5000)});
    engine.on_feed = [&](std::size_t) { reader_.fail_fetch = RemoteFailure::kTransientIO; };

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kRemoteFetch, e.Kind());
    EXPECT_EQ(RemoteFailure::kTransientIO, e.Remote());
    EXPECT_EQ(5000, e.Offset());
    EXPECT_EQ(0, engine.finalize_calls);
}

TEST_F(AnalysisDriverTest, EngineInitFailure) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Forward()});
    engine.throw_on_init = true;

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kEngineInit, e.Kind());
    EXPECT_EQ(0, e.Offset());
    EXPECT_NE(std::string::npos, e.Message().find("init rejected"));
}

TEST_F(AnalysisDriverTest, EngineFeedFailure) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Forward()});
    engine.throw_on_feed = true;

    EXPECT_EQ(ErrorKind::kEngineFeed, ExpectFailure(engine).Kind());
}

TEST_F(AnalysisDriverTest, NextOffsetFailureIsFeedError) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Forward()});
    engine.throw_on_next = true;

    EXPECT_EQ(ErrorKind::kEngineFeed, ExpectFailure(engine).Kind());
}

TEST_F(AnalysisDriverTest, FinalizeFailure) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Finalized()});
    engine.throw_on_finalize = true;

    EXPECT_EQ(ErrorKind::kEngineFinalize, ExpectFailure(engine).Kind());
    EXPECT_EQ(0, engine.report_calls);
}

TEST_F(AnalysisDriverTest, EmptyReportFails) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Finalized()});
    engine.report = "";

    EXPECT_EQ(ErrorKind::kEmptyReport, ExpectFailure(engine).Kind());
}

TEST_F(AnalysisDriverTest, BlankReportFails) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Finalized()});
    engine.report = " \n\t ";

    EXPECT_EQ(ErrorKind::kEmptyReport, ExpectFailure(engine).Kind());
}

TEST_F(AnalysisDriverTest, TruncatedReportFails) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Finalized()});
    engine.report = "{\"media\": [truncated";

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kMalformedReport, e.Kind());
    EXPECT_EQ(1, engine.report_calls);
}

TEST_F(AnalysisDriverTest, FilledAndUpdatedWithoutFinalizedKeepsNegotiating) {
    Use(10000, 4096, 1 << 20);
    EngineStep busy;
    busy.status = EngineStatus::FromBits(EngineStatus::kFilledBit | EngineStatus::kUpdatedBit);
    busy.next = kForwardSentinel;
    ScriptedEngine engine({busy, Finalized()});

    AnalysisReport report = driver_->Analyze(kResource, engine);

    EXPECT_EQ(1, engine.next_calls);
    EXPECT_EQ(2u, report.stats.iterations);
    EXPECT_EQ(std::vector<std::int64_t>({0, 4096}), engine.init_offsets);
}

TEST_F(AnalysisDriverTest, NegativeOffsetOtherThanForwardIsRejected) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({SeekTo(-7)});

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kInvalidArgument, e.Kind());
    EXPECT_EQ(1u, engine.fed_lengths.size());
}

TEST_F(AnalysisDriverTest, EngineThatNeverFinishesHitsIterationCeiling) {
    Use(10000, 4096, 1 << 20);
    cfg_.max_iterations = 5;
    driver_ = std::make_unique<StreamingAnalysisDriver>(cfg_, *cache_, reader_);
    ScriptedEngine engine({SeekTo(0)});

    AnalysisError e = ExpectFailure(engine);

    EXPECT_EQ(ErrorKind::kProtocolDivergence, e.Kind());
    EXPECT_EQ(5u, engine.fed_lengths.size());
    EXPECT_EQ(1u, reader_.FetchCount());
    EXPECT_EQ(0, engine.finalize_calls);
}

TEST_F(AnalysisDriverTest, CancelledBeforeStartDoesNothing) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Forward()});
    CancellationToken token;
    token.Cancel();

    AnalysisError e = ExpectFailure(engine, &token);

    EXPECT_EQ(ErrorKind::kCancelled, e.Kind());
    EXPECT_EQ(0u, reader_.ProbeCount());
    EXPECT_EQ(0u, reader_.FetchCount());
}

TEST_F(AnalysisDriverTest, CancelledMidSessionReturnsNoReport) {
    Use(10000, 1000, 1 << 20);
    ScriptedEngine engine({Forward()});
    CancellationToken token;
    engine.on_feed = [&](std::size_t i) {
        if (i == 1) token.Cancel();
    };

    AnalysisError e = ExpectFailure(engine, &token);

    EXPECT_EQ(ErrorKind::kCancelled, e.Kind());
    EXPECT_EQ(1000, e.Offset());
    EXPECT_EQ(2u, engine.fed_lengths.size());
    EXPECT_EQ(1, engine.next_calls);
    EXPECT_EQ(0, engine.finalize_calls);
    EXPECT_EQ(0, engine.report_calls);
}

TEST_F(AnalysisDriverTest, ErrorMessageNamesResourceAndOffset) {
    Use(10000, 4096, 1 << 20);
    ScriptedEngine engine({Forward()});
    engine.throw_on_feed = true;

    AnalysisError e = ExpectFailure(engine);
    std::string what = e.what();

    EXPECT_NE(std::string::npos, what.find("EngineFeedError"));
    EXPECT_NE(std::string::npos, what.find(kResource));
    EXPECT_NE(std::string::npos, what.find("offset=0"));
}

TEST(DriveStateTest, Names) {
    EXPECT_STREQ("Probing", ToString(DriveState::kProbing));
    EXPECT_STREQ("Feeding", ToString(DriveState::kFeeding));
    EXPECT_STREQ("Finalizing", ToString(DriveState::kFinalizing));
    EXPECT_STREQ("Done", ToString(DriveState::kDone));
    EXPECT_STREQ("Failed", ToString(DriveState::kFailed));
}

} // namespace
} // namespace mediaprobe
