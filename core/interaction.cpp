#include "core/interaction.h"

#include "absl/strings/str_cat.h"

namespace appcmd {

namespace {

constexpr int kChannelMessageWithSource = 4;
constexpr int kDeferredChannelMessageWithSource = 5;
constexpr int kEphemeralFlag = 1 << 6;

std::string StringOr(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

InteractionOption ParseOption(const nlohmann::json& j) {
  InteractionOption option;
  option.name = StringOr(j, "name");
  if (j.contains("type") && j["type"].is_number_integer()) option.type = j["type"].get<int>();
  if (j.contains("value")) option.value = j["value"];
  if (j.contains("focused") && j["focused"].is_boolean()) option.focused = j["focused"].get<bool>();
  if (j.contains("options") && j["options"].is_array()) {
    for (const auto& child : j["options"]) {
      if (child.is_object()) option.options.push_back(ParseOption(child));
    }
  }
  return option;
}

}  // namespace

absl::StatusOr<Interaction> Interaction::FromJson(const nlohmann::json& payload) {
  if (!payload.is_object()) {
    return absl::InvalidArgumentError("Interaction payload must be a JSON object");
  }
  if (!payload.contains("type") || !payload["type"].is_number_integer()) {
    return absl::InvalidArgumentError("Interaction payload has no type");
  }
  int type = payload["type"].get<int>();
  if (type < static_cast<int>(InteractionType::kPing) || type > static_cast<int>(InteractionType::kModalSubmit)) {
    return absl::InvalidArgumentError(absl::StrCat("Unknown interaction type ", type));
  }

  Interaction interaction;
  interaction.raw_ = payload;
  interaction.type_ = static_cast<InteractionType>(type);
  interaction.id_ = SnowflakeOrZero(payload, "id");
  interaction.application_id_ = SnowflakeOrZero(payload, "application_id");
  interaction.token_ = StringOr(payload, "token");
  interaction.guild_id_ = SnowflakeOrZero(payload, "guild_id");
  interaction.channel_id_ = SnowflakeOrZero(payload, "channel_id");
  interaction.locale_ = StringOr(payload, "locale");
  interaction.guild_locale_ = StringOr(payload, "guild_locale");

  if (payload.contains("member") && payload["member"].is_object()) {
    Member member;
    from_json(payload["member"], member);
    interaction.user_ = member.user;
    interaction.member_ = std::move(member);
  } else if (payload.contains("user") && payload["user"].is_object()) {
    from_json(payload["user"], interaction.user_);
  }

  bool is_command = interaction.type_ == InteractionType::kApplicationCommand ||
                    interaction.type_ == InteractionType::kAutocomplete;
  if (!is_command) return interaction;

  if (!payload.contains("data") || !payload["data"].is_object()) {
    return absl::InvalidArgumentError("Command interaction has no data");
  }
  const auto& data = payload["data"];
  CommandData& out = interaction.data_;
  out.name = StringOr(data, "name");
  if (out.name.empty()) {
    return absl::InvalidArgumentError("Command interaction has no command name");
  }
  out.id = SnowflakeOrZero(data, "id");
  if (data.contains("type") && data["type"].is_number_integer()) out.type = data["type"].get<int>();
  out.guild_id = SnowflakeOrZero(data, "guild_id");
  out.target_id = SnowflakeOrZero(data, "target_id");
  if (data.contains("options") && data["options"].is_array()) {
    for (const auto& option : data["options"]) {
      if (option.is_object()) out.options.push_back(ParseOption(option));
    }
  }
  if (data.contains("resolved") && data["resolved"].is_object()) {
    from_json(data["resolved"], out.resolved);
  }
  return interaction;
}

void Interaction::Reply(const std::string& content, bool ephemeral) {
  nlohmann::json data = {{"content", content}};
  if (ephemeral) data["flags"] = kEphemeralFlag;
  responses_.push_back({{"type", kChannelMessageWithSource}, {"data", std::move(data)}});
}

void Interaction::Defer(bool ephemeral) {
  nlohmann::json response = {{"type", kDeferredChannelMessageWithSource}};
  if (ephemeral) response["data"] = {{"flags", kEphemeralFlag}};
  responses_.push_back(std::move(response));
}

}  // namespace appcmd
