#include "mediaprobe/s3_client.hpp"
#include "mediaprobe/errors.hpp"
#include "mediaprobe/object_uri.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <spdlog/spdlog.h>

#include <iterator>
#include <sstream>

namespace mediaprobe {

namespace {

RemoteFailure ClassifyResponse(Aws::Http::HttpResponseCode code) {
    switch (code) {
        case Aws::Http::HttpResponseCode::NOT_FOUND:
            return RemoteFailure::kNotFound;
        case Aws::Http::HttpResponseCode::UNAUTHORIZED:
        case Aws::Http::HttpResponseCode::FORBIDDEN:
            return RemoteFailure::kPermissionDenied;
        default:
            return RemoteFailure::kTransientIO;
    }
}

template <typename Outcome>
RemoteReadError MakeError(const char* op, const std::string& resource, const Outcome& outcome) {
    const auto& error = outcome.GetError();
    const int code = static_cast<int>(error.GetResponseCode());
    std::ostringstream ss;
    ss << op << " " << resource << " failed, HTTP " << code << ": " << error.GetMessage();
    spdlog::warn("{}", ss.str());
    return RemoteReadError(ClassifyResponse(error.GetResponseCode()), ss.str());
}

} // namespace

// PIMPL for hiding AWS SDK headers
struct S3Client::S3ClientImpl {
    Aws::SDKOptions aws_options;
    std::unique_ptr<Aws::S3::S3Client> s3;
    std::string bucket;
};

S3Client::S3Client(const Config& cfg) : p_impl(std::make_unique<S3ClientImpl>()) {
    p_impl->aws_options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
    Aws::InitAPI(p_impl->aws_options);

    Aws::Client::ClientConfiguration aws_cfg;
    if (!cfg.s3_region.empty()) {
        aws_cfg.region = cfg.s3_region;
    }
    if (!cfg.s3_endpoint.empty()) {
        aws_cfg.endpointOverride = cfg.s3_endpoint;
    }

    Aws::Auth::AWSCredentials creds;
    if (!cfg.aws_access_key_id.empty() && !cfg.aws_secret_access_key.empty()) {
        creds.SetAWSAccessKeyId(cfg.aws_access_key_id.c_str());
        creds.SetAWSSecretKey(cfg.aws_secret_access_key.c_str());
    }

    // The AWS C++ SDK uses 'useVirtualAddressing'. Path style is the inverse.
    bool useVirtualAddressing = !cfg.s3_use_path_style;

    p_impl->s3 = std::make_unique<Aws::S3::S3Client>(creds, aws_cfg,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        useVirtualAddressing);

    p_impl->bucket = cfg.s3_bucket;
}

S3Client::~S3Client() {
    p_impl->s3.reset();
    Aws::ShutdownAPI(p_impl->aws_options);
}

std::vector<std::uint8_t> S3Client::FetchRange(const std::string& resource,
                                               std::int64_t offset,
                                               std::int64_t length) {
    if (offset < 0 || length <= 0) {
        throw RemoteReadError(RemoteFailure::kMalformedResponse,
                              "Invalid range requested for " + resource);
    }
    const ObjectLocation loc = ParseObjectUri(resource, p_impl->bucket);

    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(loc.bucket);
    request.SetKey(loc.key);
    // HTTP ranges are inclusive on both ends
    request.SetRange("bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1));

    auto outcome = p_impl->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        if (outcome.GetError().GetResponseCode() ==
            Aws::Http::HttpResponseCode::REQUESTED_RANGE_NOT_SATISFIABLE) {
            return {};
        }
        throw MakeError("GetObject", resource, outcome);
    }

    auto& body = outcome.GetResult().GetBody();
    std::vector<std::uint8_t> data;
    data.reserve(static_cast<std::size_t>(outcome.GetResult().GetContentLength()));
    data.assign(std::istreambuf_iterator<char>(body), std::istreambuf_iterator<char>());
    if (body.bad()) {
        throw RemoteReadError(RemoteFailure::kTransientIO, "Reading GetObject body failed for " + resource);
    }
    return data;
}

std::int64_t S3Client::ProbeLength(const std::string& resource) {
    const ObjectLocation loc = ParseObjectUri(resource, p_impl->bucket);

    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(loc.bucket);
    request.SetKey(loc.key);

    auto outcome = p_impl->s3->HeadObject(request);
    if (!outcome.IsSuccess()) {
        throw MakeError("HeadObject", resource, outcome);
    }
    return static_cast<std::int64_t>(outcome.GetResult().GetContentLength());
}

} // namespace mediaprobe
