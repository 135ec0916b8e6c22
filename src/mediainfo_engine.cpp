#include "mediaprobe/mediainfo_engine.hpp"
#include "mediaprobe/errors.hpp"

#include <MediaInfo/MediaInfo.h>
#include <ZenLib/Ztring.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <string>

namespace mediaprobe {

namespace {

// MediaInfoLib::String is std::wstring in UNICODE builds and std::string otherwise.
std::string ToUtf8(const MediaInfoLib::String& s) {
    return ZenLib::Ztring(s).To_UTF8();
}

} // namespace

MediaInfoEngine::MediaInfoEngine() : mi_(std::make_unique<MediaInfoLib::MediaInfo>()) {
    version_ = ToUtf8(mi_->Option(__T("Info_Version"), __T("")));
    if (version_.empty() || version_ == "Unable to load MediaInfo library") {
        throw AnalysisError(ErrorKind::kEngineInit, "Unable to load MediaInfo library.");
    }
    mi_->Option(__T("Complete"), __T("1"));
    mi_->Option(__T("Output"), __T("JSON"));
    spdlog::info("analysis engine: {}", version_);
}

MediaInfoEngine::~MediaInfoEngine() = default;

void MediaInfoEngine::InitBuffer(std::int64_t total_length, std::int64_t buffer_start_offset) {
    mi_->Open_Buffer_Init(static_cast<ZenLib::int64u>(total_length),
                          static_cast<ZenLib::int64u>(buffer_start_offset));
}

EngineStatus MediaInfoEngine::FeedBuffer(bytes_view buffer) {
    const std::size_t bits = mi_->Open_Buffer_Continue(buffer.data(), buffer.size());
    return EngineStatus::FromBits(static_cast<std::uint32_t>(bits));
}

std::int64_t MediaInfoEngine::NextRequestedOffset() {
    const ZenLib::int64u go_to = mi_->Open_Buffer_Continue_GoTo_Get();
    if (go_to == std::numeric_limits<ZenLib::int64u>::max()) {
        return kForwardSentinel;
    }
    return static_cast<std::int64_t>(go_to);
}

void MediaInfoEngine::Finalize() {
    mi_->Open_Buffer_Finalize();
}

std::string MediaInfoEngine::GetReport() {
    return ToUtf8(mi_->Inform());
}

} // namespace mediaprobe
