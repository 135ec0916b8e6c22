#include "mediaprobe/object_uri.hpp"
#include "mediaprobe/errors.hpp"

namespace mediaprobe {

ObjectLocation ParseObjectUri(const std::string& resource, const std::string& default_bucket) {
    static const std::string kScheme = "s3://";

    ObjectLocation loc;
    if (resource.compare(0, kScheme.size(), kScheme) == 0) {
        std::string rest = resource.substr(kScheme.size());
        auto slash = rest.find('/');
        if (slash == std::string::npos || slash == 0) {
            throw AnalysisError(ErrorKind::kInvalidArgument, "Malformed object URI.", resource);
        }
        loc.bucket = rest.substr(0, slash);
        loc.key = rest.substr(slash + 1);
    } else {
        loc.bucket = default_bucket;
        loc.key = resource;
        // Tolerate a leading slash on bare keys
        if (!loc.key.empty() && loc.key[0] == '/') {
            loc.key.erase(0, 1);
        }
    }

    if (loc.bucket.empty()) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "No bucket for object.", resource);
    }
    if (loc.key.empty()) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "Empty object key.", resource);
    }
    return loc;
}

} // namespace mediaprobe
