#include "mediaprobe/errors.hpp"

#include <sstream>
#include <utility>

namespace mediaprobe {

namespace {

std::string FormatWhat(ErrorKind kind,
                       const std::string& message,
                       const std::string& resource,
                       std::int64_t offset,
                       RemoteFailure remote) {
    std::ostringstream ss;
    ss << ToString(kind) << ": " << message;
    if (remote != RemoteFailure::kNone) {
        ss << " (" << ToString(remote) << ")";
    }
    if (!resource.empty() || offset >= 0) {
        ss << " [resource=" << resource << ", offset=" << offset << "]";
    }
    return ss.str();
}

} // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kConfiguration:      return "ConfigurationError";
        case ErrorKind::kInvalidArgument:    return "InvalidArgument";
        case ErrorKind::kRemoteFetch:        return "RemoteFetchError";
        case ErrorKind::kEngineInit:         return "EngineInitError";
        case ErrorKind::kEngineFeed:         return "EngineFeedError";
        case ErrorKind::kEngineFinalize:     return "EngineFinalizeError";
        case ErrorKind::kEmptyReport:        return "EmptyReportError";
        case ErrorKind::kMalformedReport:    return "MalformedReportError";
        case ErrorKind::kCancelled:          return "Cancelled";
        case ErrorKind::kProtocolDivergence: return "ProtocolDivergenceError";
    }
    return "UnknownError";
}

const char* ToString(RemoteFailure reason) {
    switch (reason) {
        case RemoteFailure::kNone:              return "None";
        case RemoteFailure::kNotFound:          return "NotFound";
        case RemoteFailure::kTransientIO:       return "TransientIOError";
        case RemoteFailure::kPermissionDenied:  return "PermissionDenied";
        case RemoteFailure::kMalformedResponse: return "MalformedResponse";
    }
    return "Unknown";
}

RemoteReadError::RemoteReadError(RemoteFailure reason, const std::string& message)
    : std::runtime_error(message), reason_(reason) {}

AnalysisError::AnalysisError(ErrorKind kind,
                             const std::string& message,
                             std::string resource,
                             std::int64_t offset,
                             RemoteFailure remote)
    : std::runtime_error(FormatWhat(kind, message, resource, offset, remote)),
      kind_(kind),
      message_(message),
      resource_(std::move(resource)),
      offset_(offset),
      remote_(remote) {}

AnalysisError AnalysisError::Annotate(const std::string& resource, std::int64_t offset) const {
    return AnalysisError(kind_,
                         message_,
                         resource_.empty() ? resource : resource_,
                         offset_ < 0 ? offset : offset_,
                         remote_);
}

} // namespace mediaprobe
