#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mediaprobe {

enum class ErrorKind {
    kConfiguration,      // resource reports zero length at probe time
    kInvalidArgument,    // negative offset, bad configuration value
    kRemoteFetch,
    kEngineInit,
    kEngineFeed,
    kEngineFinalize,
    kEmptyReport,
    kMalformedReport,    // report text is not well-formed JSON
    kCancelled,
    kProtocolDivergence, // engine kept the session feeding past max_iterations
};

// Why a RemoteReader could not serve a request.
enum class RemoteFailure {
    kNone,
    kNotFound,
    kTransientIO,
    kPermissionDenied,
    kMalformedResponse,
};

const char* ToString(ErrorKind kind);
const char* ToString(RemoteFailure reason);

/**
 * @class RemoteReadError
 * @brief Thrown by RemoteReader implementations.
 */
class RemoteReadError : public std::runtime_error {
public:
    RemoteReadError(RemoteFailure reason, const std::string& message);

    RemoteFailure Reason() const { return reason_; }

private:
    RemoteFailure reason_;
};

/**
 * @class AnalysisError
 * @brief The one failure type surfaced by the cache and the driver.
 *
 * Every instance names the resource and the byte offset that was in play when
 * the failure happened, so a log line alone is enough to locate the problem in
 * the byte stream. Offset is -1 when no offset applies.
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind,
                  const std::string& message,
                  std::string resource = std::string(),
                  std::int64_t offset = -1,
                  RemoteFailure remote = RemoteFailure::kNone);

    ErrorKind Kind() const { return kind_; }
    const std::string& Message() const { return message_; }
    const std::string& Resource() const { return resource_; }
    std::int64_t Offset() const { return offset_; }
    RemoteFailure Remote() const { return remote_; }

    // Copy of this error with the resource and offset filled in where unset.
    AnalysisError Annotate(const std::string& resource, std::int64_t offset) const;

private:
    ErrorKind kind_;
    std::string message_;
    std::string resource_;
    std::int64_t offset_;
    RemoteFailure remote_;
};

} // namespace mediaprobe
