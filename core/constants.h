#ifndef APPCMD_CORE_CONSTANTS_H_
#define APPCMD_CORE_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

namespace appcmd {

// REST endpoint of the command service.
constexpr char kDefaultApiBaseUrl[] = "https://discord.com/api/v10";
constexpr char kUserAgent[] = "DiscordBot (https://github.com/appcmd/appcmd, 0.3.0)";

// Validation limits enforced locally before anything reaches the network.
constexpr size_t kMaxNameLength = 32;
constexpr size_t kMaxDescriptionLength = 100;
constexpr size_t kMaxChoiceNameLength = 100;
constexpr size_t kMaxOptions = 25;
constexpr size_t kMaxChoices = 25;
constexpr size_t kMaxChildren = 25;

constexpr char kNoDescription[] = "No Description";

// Milliseconds between the Unix epoch and the snowflake epoch (2015-01-01).
constexpr int64_t kSnowflakeEpochMs = 1420070400000;

}  // namespace appcmd

#endif  // APPCMD_CORE_CONSTANTS_H_
