#pragma once

#include <string>

namespace mediaprobe {

struct ObjectLocation {
    std::string bucket;
    std::string key;
};

// Accepts "s3://bucket/key" or a bare key in 'default_bucket'.
// Throws AnalysisError(kInvalidArgument) when no bucket or key can be found.
ObjectLocation ParseObjectUri(const std::string& resource, const std::string& default_bucket);

} // namespace mediaprobe
