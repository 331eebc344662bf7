#include "commands/example_commands.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

#include "core/status_macros.h"

namespace appcmd {

namespace {

constexpr int kMaxSettingValueLength = 100;

absl::StatusOr<Option> StringOption(std::string name, std::string description, bool required = true) {
  Option::Params params;
  params.type = OptionType::kString;
  params.name = std::move(name);
  params.description = std::move(description);
  params.required = required;
  return Option::Create(std::move(params));
}

absl::StatusOr<Option> SettingKeyOption() {
  Option::Params params;
  params.type = OptionType::kString;
  params.name = "key";
  params.description = "Setting to use";
  for (const auto& key : SettingsStore::Keys()) {
    ASSIGN_OR_RETURN(OptionChoice choice, OptionChoice::Create(key, key));
    params.choices.push_back(std::move(choice));
  }
  return Option::Create(std::move(params));
}

absl::StatusOr<bool> CanManageGuild(const Interaction& interaction) {
  if (!interaction.member().has_value()) return false;
  uint64_t permissions = 0;
  if (!absl::SimpleAtoi(interaction.member()->permissions, &permissions)) return false;
  return (permissions & kManageGuildPermission) != 0;
}

std::string AvatarUrl(const User& user) {
  if (user.avatar.empty()) return "";
  return absl::StrCat("https://cdn.discordapp.com/avatars/", user.id, "/", user.avatar, ".png");
}

std::string RgbOf(const std::string& hex) {
  int value = 0;
  if (hex.size() != 7 || !absl::SimpleHexAtoi(hex.substr(1), &value)) return hex;
  return absl::StrCat("rgb(", (value >> 16) & 0xff, ", ", (value >> 8) & 0xff, ", ", value & 0xff, ")");
}

absl::Status RegisterPing(Registry& registry, const std::vector<Snowflake>& guild_ids) {
  SlashCommandSpec spec;
  spec.name = "ping";
  spec.description = "Check that the bot is responsive";
  spec.guild_ids = guild_ids;
  CommandHandler handler = [](Interaction& interaction, const Arguments&) {
    interaction.Reply("Pong!");
    return absl::OkStatus();
  };
  return registry.RegisterSlashCommand(std::move(spec), std::move(handler)).status();
}

absl::Status RegisterConfig(Registry& registry, const std::vector<Snowflake>& guild_ids,
                            const std::shared_ptr<SettingsStore>& settings) {
  auto under_config = [&guild_ids](SlashCommandSpec& spec) {
    spec.base_name = "config";
    spec.base_description = "Server configuration";
    spec.default_member_permissions = kManageGuildPermission;
    spec.allow_dm = false;
    spec.guild_ids = guild_ids;
  };

  SlashCommandSpec get;
  under_config(get);
  get.group_name = "settings";
  get.group_description = "Read and change settings";
  get.name = "get";
  get.description = "Show the value of a setting";
  ASSIGN_OR_RETURN(Option get_key, SettingKeyOption());
  get.options.push_back(std::move(get_key));
  CommandHandler get_handler = [settings](Interaction& interaction, const Arguments& args) -> absl::Status {
    ASSIGN_OR_RETURN(std::string key, args.Get<std::string>("key"));
    std::optional<std::string> value = settings->Get(interaction.guild_id(), key);
    interaction.Reply(value ? absl::StrCat(key, " = ", *value) : absl::StrCat(key, " is not set"), true);
    return absl::OkStatus();
  };
  RETURN_IF_ERROR(registry.RegisterSlashCommand(std::move(get), std::move(get_handler)).status());

  SlashCommandSpec set;
  under_config(set);
  set.group_name = "settings";
  set.name = "set";
  set.description = "Change a setting";
  ASSIGN_OR_RETURN(Option set_key, SettingKeyOption());
  ASSIGN_OR_RETURN(Option set_value, StringOption("value", "New value"));
  set.options.push_back(std::move(set_key));
  set.options.push_back(std::move(set_value));
  set.connector = {{"new_value", "value"}};
  CommandHandler set_handler = [settings](Interaction& interaction, const Arguments& args) -> absl::Status {
    ASSIGN_OR_RETURN(std::string key, args.Get<std::string>("key"));
    ASSIGN_OR_RETURN(std::string value, args.Get<std::string>("new_value"));
    if (value.size() > kMaxSettingValueLength) {
      return absl::InvalidArgumentError(absl::StrCat("Values are limited to ", kMaxSettingValueLength, " characters"));
    }
    settings->Set(interaction.guild_id(), key, value);
    interaction.Reply(absl::StrCat("Set ", key, " to ", value), true);
    return absl::OkStatus();
  };
  ASSIGN_OR_RETURN(CommandHandle set_handle, registry.RegisterSlashCommand(std::move(set), std::move(set_handler)));
  set_handle.AddCheck(CanManageGuild).OnError([](Interaction& interaction, const absl::Status& error) {
    interaction.Reply(absl::StrCat("Could not change the setting: ", error.message()), true);
  });

  SlashCommandSpec reset;
  under_config(reset);
  reset.name = "reset";
  reset.description = "Clear every setting of this server";
  CommandHandler reset_handler = [settings](Interaction& interaction, const Arguments&) {
    size_t cleared = settings->Reset(interaction.guild_id());
    interaction.Reply(absl::StrCat("Cleared ", cleared, " setting(s)"), true);
    return absl::OkStatus();
  };
  ASSIGN_OR_RETURN(CommandHandle reset_handle,
                   registry.RegisterSlashCommand(std::move(reset), std::move(reset_handler)));
  reset_handle.AddCheck(CanManageGuild);
  return absl::OkStatus();
}

absl::StatusOr<std::vector<OptionChoice>> CompleteColor(Interaction&, const Arguments& args) {
  std::string typed = absl::AsciiStrToLower(args.GetOr<std::string>("color_name", ""));
  std::vector<OptionChoice> choices;
  for (const auto& [color, hex] : ColorTable()) {
    if (!absl::StartsWith(color, typed)) continue;
    ASSIGN_OR_RETURN(OptionChoice choice, OptionChoice::Create(color, color));
    choices.push_back(std::move(choice));
  }
  return choices;
}

absl::Status RegisterColor(Registry& registry, const std::vector<Snowflake>& guild_ids) {
  SlashCommandSpec spec;
  spec.name = "color";
  spec.description = "Look up a named color";
  spec.guild_ids = guild_ids;
  ASSIGN_OR_RETURN(spec.name_localizations, Localizations::Create({{"en-GB", "colour"}, {"fr", "couleur"}}));

  Option::Params name;
  name.type = OptionType::kString;
  name.name = "name";
  name.description = "Color name";
  name.autocomplete = true;
  ASSIGN_OR_RETURN(Option name_option, Option::Create(std::move(name)));

  Option::Params format;
  format.type = OptionType::kString;
  format.name = "format";
  format.description = "Output format";
  format.required = false;
  format.default_value = std::string("hex");
  ASSIGN_OR_RETURN(OptionChoice hex, OptionChoice::Create("hex", std::string("hex")));
  ASSIGN_OR_RETURN(OptionChoice rgb, OptionChoice::Create("rgb", std::string("rgb")));
  format.choices = {hex, rgb};
  ASSIGN_OR_RETURN(Option format_option, Option::Create(std::move(format)));

  spec.options = {std::move(name_option), std::move(format_option)};
  spec.connector = {{"color_name", "name"}};

  CommandHandler handler = [](Interaction& interaction, const Arguments& args) -> absl::Status {
    ASSIGN_OR_RETURN(std::string color, args.Get<std::string>("color_name"));
    auto it = ColorTable().find(absl::AsciiStrToLower(color));
    if (it == ColorTable().end()) return absl::NotFoundError(absl::StrCat("Unknown color '", color, "'"));
    std::string format = args.GetOr<std::string>("format", "hex");
    interaction.Reply(absl::StrCat(it->first, ": ", format == "rgb" ? RgbOf(it->second) : it->second));
    return absl::OkStatus();
  };
  ASSIGN_OR_RETURN(CommandHandle handle, registry.RegisterSlashCommand(std::move(spec), std::move(handler)));
  handle.OnAutocomplete(CompleteColor);
  return absl::OkStatus();
}

absl::Status RegisterContextCommands(Registry& registry, const std::vector<Snowflake>& guild_ids) {
  ContextCommandSpec avatar;
  avatar.name = "Show Avatar";
  avatar.guild_ids = guild_ids;
  CommandHandler avatar_handler = [](Interaction& interaction, const Arguments& args) -> absl::Status {
    User user;
    if (absl::StatusOr<Member> member = args.Get<Member>("target"); member.ok()) {
      user = member->user;
    } else {
      ASSIGN_OR_RETURN(user, args.Get<User>("target"));
    }
    std::string url = AvatarUrl(user);
    interaction.Reply(url.empty() ? absl::StrCat(user.display_name(), " has no avatar") : url, true);
    return absl::OkStatus();
  };
  RETURN_IF_ERROR(registry.RegisterUserCommand(std::move(avatar), std::move(avatar_handler)).status());

  ContextCommandSpec quote;
  quote.name = "Quote";
  quote.guild_ids = guild_ids;
  CommandHandler quote_handler = [](Interaction& interaction, const Arguments& args) -> absl::Status {
    ASSIGN_OR_RETURN(Message message, args.Get<Message>("target"));
    interaction.Reply(absl::StrCat("> ", message.content, "\n- ", message.author.display_name()));
    return absl::OkStatus();
  };
  return registry.RegisterMessageCommand(std::move(quote), std::move(quote_handler)).status();
}

}  // namespace

const std::vector<std::string>& SettingsStore::Keys() {
  static const auto* keys = new std::vector<std::string>{"language", "prefix", "timezone"};
  return *keys;
}

std::optional<std::string> SettingsStore::Get(Snowflake guild, const std::string& key) const {
  absl::MutexLock lock(&mu_);
  auto it = values_.find(guild);
  if (it == values_.end()) return std::nullopt;
  auto value = it->second.find(key);
  if (value == it->second.end()) return std::nullopt;
  return value->second;
}

void SettingsStore::Set(Snowflake guild, const std::string& key, std::string value) {
  absl::MutexLock lock(&mu_);
  values_[guild][key] = std::move(value);
}

size_t SettingsStore::Reset(Snowflake guild) {
  absl::MutexLock lock(&mu_);
  auto it = values_.find(guild);
  if (it == values_.end()) return 0;
  size_t cleared = it->second.size();
  values_.erase(it);
  return cleared;
}

const std::map<std::string, std::string>& ColorTable() {
  static const auto* colors = new std::map<std::string, std::string>{
      {"black", "#000000"}, {"blue", "#0000ff"},  {"blurple", "#5865f2"}, {"cyan", "#00ffff"},
      {"gold", "#ffd700"},  {"green", "#008000"}, {"grey", "#808080"},    {"magenta", "#ff00ff"},
      {"orange", "#ffa500"}, {"purple", "#800080"}, {"red", "#ff0000"},   {"white", "#ffffff"},
      {"yellow", "#ffff00"},
  };
  return *colors;
}

absl::Status RegisterExampleCommands(Registry& registry, const std::vector<Snowflake>& guild_ids,
                                     std::shared_ptr<SettingsStore> settings) {
  if (settings == nullptr) return absl::InvalidArgumentError("SettingsStore cannot be null");
  RETURN_IF_ERROR(RegisterPing(registry, guild_ids));
  RETURN_IF_ERROR(RegisterConfig(registry, guild_ids, settings));
  RETURN_IF_ERROR(RegisterColor(registry, guild_ids));
  return RegisterContextCommands(registry, guild_ids);
}

CommandUnit ExampleCommandsUnit(std::vector<Snowflake> guild_ids, std::shared_ptr<SettingsStore> settings) {
  CommandUnit unit;
  unit.name = "examples";
  unit.setup = [guild_ids = std::move(guild_ids), settings = std::move(settings)](Registry& registry) {
    return RegisterExampleCommands(registry, guild_ids, settings);
  };
  return unit;
}

}  // namespace appcmd
