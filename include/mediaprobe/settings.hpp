#pragma once

#include "types.hpp"

#include <string>
#include <cstdint>

namespace mediaprobe {

namespace settings_defaults {
    constexpr char kLogLevel[] = "info";
    constexpr char kEndpoint[] = "http://127.0.0.1:9000";
    constexpr char kRegion[] = "us-east-1";
    constexpr char kBucket[] = "media";
    constexpr char kAccessKeyId[] = "minioadmin";
    constexpr char kSecretAccessKey[] = "minioadmin";
}

std::string GetEnv(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);

// Unset -> defaultValue. Set but not a positive integer -> InvalidArgument.
std::uint64_t GetEnvPositive(const char* name, std::uint64_t defaultValue);

// Fills empty string fields from MPROBE_* environment variables, then from
// settings_defaults; a string set in cfg wins over the environment.
// Numeric fields and s3_use_path_style have no "unset" state, so a set
// variable always overrides them.
void ApplyConfigDefaults(Config& cfg);

// Throws AnalysisError(kInvalidArgument) on a zero chunk, capacity or
// iteration ceiling.
void ValidateConfig(const Config& cfg);

// Applies cfg.log_level to the default spdlog logger.
void ConfigureLogging(const Config& cfg);

} // namespace mediaprobe
