#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mediaprobe {

/**
 * @class RemoteReader
 * @brief Read access to remote objects by byte range.
 *
 * Implementations throw RemoteReadError on failure and must be safe to call
 * from several threads at once.
 */
class RemoteReader {
public:
    virtual ~RemoteReader() = default;

    /**
     * @brief Reads up to 'length' bytes starting at 'offset'.
     * @return The bytes read. Shorter than 'length' only at end of resource,
     *         empty when 'offset' is at or past the end.
     */
    virtual std::vector<std::uint8_t> FetchRange(const std::string& resource,
                                                 std::int64_t offset,
                                                 std::int64_t length) = 0;

    /**
     * @brief Returns the total length of the resource in bytes.
     */
    virtual std::int64_t ProbeLength(const std::string& resource) = 0;
};

} // namespace mediaprobe
