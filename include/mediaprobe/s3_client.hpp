#pragma once

#include "types.hpp"
#include "remote_reader.hpp"

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace Aws {
    namespace S3 {
        class S3Client;
    }
}

namespace mediaprobe {

/**
 * @class S3Client
 * @brief RemoteReader over S3-compatible object storage.
 *
 * Resources are "s3://bucket/key" or bare keys in Config::s3_bucket.
 */
class S3Client : public RemoteReader {
public:
    explicit S3Client(const Config& cfg);
    ~S3Client() override;

    // Ranged GetObject. A range starting past the end yields no bytes.
    std::vector<std::uint8_t> FetchRange(const std::string& resource,
                                         std::int64_t offset,
                                         std::int64_t length) override;

    // HeadObject ContentLength.
    std::int64_t ProbeLength(const std::string& resource) override;

private:
    struct S3ClientImpl;
    std::unique_ptr<S3ClientImpl> p_impl;

    S3Client(const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;
};

} // namespace mediaprobe
