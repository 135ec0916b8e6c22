#include "mediaprobe/settings.hpp"
#include "mediaprobe/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <limits>

namespace mediaprobe {

std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    std::string s(value);
    if (s == "1" || s == "true" || s == "TRUE") return true;
    if (s == "0" || s == "false" || s == "FALSE") return false;
    return defaultValue;
}

std::uint64_t GetEnvPositive(const char* name, std::uint64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;

    // Digits only: strtoull alone would accept " -5" and wrap it
    const bool digits = *value != '\0' &&
        std::all_of(value, value + std::strlen(value), [](unsigned char c) { return std::isdigit(c) != 0; });

    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = digits ? std::strtoull(value, &end, 10) : 0;
    if (!digits || errno != 0 || *end != '\0' || parsed == 0) {
        throw AnalysisError(ErrorKind::kInvalidArgument,
                            std::string(name) + " must be a positive integer, got '" + value + "'.");
    }
    return static_cast<std::uint64_t>(parsed);
}

void ApplyConfigDefaults(Config& cfg) {
    cfg.chunk_length_bytes = GetEnvPositive("MPROBE_CHUNK_BYTES", cfg.chunk_length_bytes);
    cfg.capacity_bytes = GetEnvPositive("MPROBE_CAPACITY_BYTES", cfg.capacity_bytes);

    std::uint64_t iterations = GetEnvPositive("MPROBE_MAX_ITERATIONS", cfg.max_iterations);
    if (iterations > std::numeric_limits<std::uint32_t>::max()) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "MPROBE_MAX_ITERATIONS is out of range.");
    }
    cfg.max_iterations = static_cast<std::uint32_t>(iterations);

    if (cfg.log_level.empty())
        cfg.log_level = GetEnv("MPROBE_LOG_LEVEL", settings_defaults::kLogLevel);
    if (cfg.s3_endpoint.empty())
        cfg.s3_endpoint = GetEnv("MPROBE_S3_ENDPOINT", settings_defaults::kEndpoint);
    if (cfg.s3_region.empty())
        cfg.s3_region = GetEnv("MPROBE_S3_REGION", settings_defaults::kRegion);
    if (cfg.s3_bucket.empty())
        cfg.s3_bucket = GetEnv("MPROBE_S3_BUCKET", settings_defaults::kBucket);
    if (cfg.aws_access_key_id.empty())
        cfg.aws_access_key_id = GetEnv("MPROBE_AWS_ACCESS_KEY_ID", settings_defaults::kAccessKeyId);
    if (cfg.aws_secret_access_key.empty())
        cfg.aws_secret_access_key = GetEnv("MPROBE_AWS_SECRET_ACCESS_KEY", settings_defaults::kSecretAccessKey);

    cfg.s3_use_path_style = GetEnvBool("MPROBE_S3_USE_PATH_STYLE", cfg.s3_use_path_style);
}

void ValidateConfig(const Config& cfg) {
    if (cfg.chunk_length_bytes == 0) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "chunk_length_bytes must be greater than zero.");
    }
    if (cfg.capacity_bytes == 0) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "capacity_bytes must be greater than zero.");
    }
    constexpr auto kMaxBytes = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (cfg.chunk_length_bytes > kMaxBytes || cfg.capacity_bytes > kMaxBytes) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "chunk_length_bytes and capacity_bytes must fit in int64.");
    }
    if (cfg.max_iterations == 0) {
        throw AnalysisError(ErrorKind::kInvalidArgument, "max_iterations must be greater than zero.");
    }
}

void ConfigureLogging(const Config& cfg) {
    const std::string name = cfg.log_level.empty() ? settings_defaults::kLogLevel : cfg.log_level;
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str falls back to "off" for names it does not know
    if (level == spdlog::level::off && name != "off") {
        throw AnalysisError(ErrorKind::kInvalidArgument, "Unknown log level '" + name + "'.");
    }
    spdlog::set_level(level);
}

} // namespace mediaprobe
