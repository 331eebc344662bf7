#ifndef APPCMD_CORE_SNOWFLAKE_H_
#define APPCMD_CORE_SNOWFLAKE_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include <nlohmann/json.hpp>

namespace appcmd {

// Platform identifiers. They travel as decimal strings on the wire.
using Snowflake = uint64_t;

// Scope key of the global command set. Guild scopes use the guild id.
constexpr Snowflake kGlobalScope = 0;

// Accepts both the string and the numeric encoding.
absl::StatusOr<Snowflake> ParseSnowflake(const nlohmann::json& value);

// Like ParseSnowflake but returns 0 for missing, null or malformed values.
Snowflake SnowflakeOrZero(const nlohmann::json& object, const char* key);

std::string FormatSnowflake(Snowflake id);

// Creation time encoded in the upper 42 bits of the id.
absl::Time SnowflakeTime(Snowflake id);

}  // namespace appcmd

#endif  // APPCMD_CORE_SNOWFLAKE_H_
