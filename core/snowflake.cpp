#include "core/snowflake.h"

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

#include "core/constants.h"

namespace appcmd {

absl::StatusOr<Snowflake> ParseSnowflake(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer()) {
    int64_t signed_value = value.get<int64_t>();
    if (signed_value < 0) {
      return absl::InvalidArgumentError(absl::StrCat("Negative snowflake: ", signed_value));
    }
    return static_cast<Snowflake>(signed_value);
  }
  if (value.is_string()) {
    Snowflake id = 0;
    if (!absl::SimpleAtoi(value.get<std::string>(), &id)) {
      return absl::InvalidArgumentError(absl::StrCat("Malformed snowflake: ", value.get<std::string>()));
    }
    return id;
  }
  return absl::InvalidArgumentError(absl::StrCat("Snowflake must be a string or integer, got ", value.type_name()));
}

Snowflake SnowflakeOrZero(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) return 0;
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return 0;
  auto id = ParseSnowflake(*it);
  return id.ok() ? *id : 0;
}

std::string FormatSnowflake(Snowflake id) { return absl::StrCat(id); }

absl::Time SnowflakeTime(Snowflake id) {
  return absl::FromUnixMillis(static_cast<int64_t>(id >> 22) + kSnowflakeEpochMs);
}

}  // namespace appcmd
