#pragma once

#include "analysis_engine.hpp"

#include <memory>
#include <string>

namespace MediaInfoLib {
    class MediaInfo;
}

namespace mediaprobe {

/**
 * @class MediaInfoEngine
 * @brief AnalysisEngine backed by MediaInfoLib's buffer API.
 *
 * The report is MediaInfo's "Complete" inform output in JSON.
 */
class MediaInfoEngine : public AnalysisEngine {
public:
    // Throws AnalysisError(kEngineInit) if the library cannot report a version.
    MediaInfoEngine();
    ~MediaInfoEngine() override;

    void InitBuffer(std::int64_t total_length, std::int64_t buffer_start_offset) override;
    EngineStatus FeedBuffer(bytes_view buffer) override;
    std::int64_t NextRequestedOffset() override;
    void Finalize() override;
    std::string GetReport() override;

private:
    std::unique_ptr<MediaInfoLib::MediaInfo> mi_;
    std::string version_;

    MediaInfoEngine(const MediaInfoEngine&) = delete;
    MediaInfoEngine& operator=(const MediaInfoEngine&) = delete;
};

} // namespace mediaprobe
