#include "core/dispatcher.h"

#include <map>
#include <set>
#include <utility>
#include <variant>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace appcmd {

namespace {

std::string RawValue(const nlohmann::json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return "";
  return value.dump();
}

// Accepts a bare id as well as the mention forms "<@id>", "<@!id>" and "<@&id>".
Snowflake MentionId(const std::string& raw) {
  std::string digits;
  for (char c : raw) {
    if (absl::ascii_isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
  }
  Snowflake id = 0;
  if (digits.empty() || !absl::SimpleAtoi(digits, &id)) return 0;
  return id;
}

ArgumentValue ResolveUser(Snowflake id, const std::string& raw, const ResolvedData& resolved) {
  if (const Member* member = resolved.FindMember(id)) return *member;
  if (const User* user = resolved.FindUser(id)) return *user;
  return raw;
}

bool IsRouteLayer(const InteractionOption& option) {
  return option.type == static_cast<int>(OptionType::kSubCommand) ||
         option.type == static_cast<int>(OptionType::kSubCommandGroup);
}

}  // namespace

ArgumentValue ResolveArgument(const InteractionOption& supplied, OptionType type, const ResolvedData& resolved) {
  const nlohmann::json& value = supplied.value;
  std::string raw = RawValue(value);
  switch (type) {
    case OptionType::kString:
      return raw;
    case OptionType::kInteger:
      if (value.is_number_integer()) return value.get<int64_t>();
      if (value.is_number_float()) return static_cast<int64_t>(value.get<double>());
      // Partial input of an autocomplete invocation arrives as text.
      return raw;
    case OptionType::kNumber:
      if (value.is_number()) return value.get<double>();
      return raw;
    case OptionType::kBoolean:
      if (value.is_boolean()) return value.get<bool>();
      return raw;
    case OptionType::kUser:
      return ResolveUser(MentionId(raw), raw, resolved);
    case OptionType::kRole:
      if (const Role* role = resolved.FindRole(MentionId(raw))) return *role;
      return raw;
    case OptionType::kChannel:
      if (const Channel* channel = resolved.FindChannel(MentionId(raw))) return *channel;
      return raw;
    case OptionType::kMentionable: {
      Snowflake id = MentionId(raw);
      if (raw.find('&') != std::string::npos) {
        if (const Role* role = resolved.FindRole(id)) return *role;
        return raw;
      }
      ArgumentValue user = ResolveUser(id, raw, resolved);
      if (!std::holds_alternative<std::string>(user)) return user;
      // A bare id carries no marker; the role bundle is the last resort.
      if (const Role* role = resolved.FindRole(id)) return *role;
      return raw;
    }
    case OptionType::kAttachment:
      if (const Attachment* attachment = resolved.FindAttachment(MentionId(raw))) return *attachment;
      return raw;
    case OptionType::kSubCommand:
    case OptionType::kSubCommandGroup:
      break;
  }
  return raw;
}

Arguments BindArguments(const std::vector<InteractionOption>& supplied, const std::vector<Option>& declared,
                        const ConnectorMap& connector, const ResolvedData& resolved) {
  std::map<std::string, std::string> parameter_of;
  for (const auto& [parameter, option] : connector) parameter_of[option] = parameter;
  auto parameter_name = [&parameter_of](const std::string& option) {
    auto it = parameter_of.find(option);
    return it == parameter_of.end() ? option : it->second;
  };

  std::map<std::string, const Option*> declared_by_name;
  for (const auto& option : declared) declared_by_name[option.name()] = &option;

  Arguments args;
  std::set<std::string> seen;
  for (const auto& option : supplied) {
    if (IsRouteLayer(option)) continue;
    seen.insert(option.name);
    OptionType type = OptionType::kString;
    auto it = declared_by_name.find(option.name);
    if (it != declared_by_name.end()) {
      type = it->second->type();
    } else if (absl::StatusOr<OptionType> wire_type = OptionTypeFromInt(option.type); wire_type.ok()) {
      type = *wire_type;
    }
    args.Set(parameter_name(option.name), ResolveArgument(option, type, resolved));
  }

  for (const auto& option : declared) {
    if (seen.count(option.name()) > 0 || !option.has_default()) continue;
    const OptionDefault& fallback = option.default_value();
    if (const auto* text = std::get_if<std::string>(&fallback); text != nullptr && text->empty()) continue;
    args.Set(parameter_name(option.name()),
             std::visit([](const auto& value) -> ArgumentValue { return value; }, fallback));
  }
  return args;
}

nlohmann::json Dispatcher::Outcome::AutocompleteResponse() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& choice : choices) list.push_back(choice.ToJson());
  return {{"type", 8}, {"data", {{"choices", list}}}};
}

Registry::CommandPtr Dispatcher::Lookup(const CommandData& data, CommandKind kind) const {
  Registry::CommandPtr by_id;
  if (data.id != 0) {
    by_id = registry_->FindById(data.id);
    if (by_id != nullptr && (by_id->kind() != kind || by_id->name() != data.name)) by_id = nullptr;
    if (by_id != nullptr && !by_id->disabled()) return by_id;
  }
  // A reloaded command is live under its name before it is bound again.
  Registry::CommandPtr by_name = registry_->Find(data.guild_id, kind, data.name);
  return by_name != nullptr ? by_name : by_id;
}

Dispatcher::Outcome Dispatcher::RoutingError(const CommandRef& ref, Interaction& interaction,
                                             const std::string& message) const {
  Outcome outcome;
  outcome.result = Result::UNKNOWN_COMMAND;
  outcome.qualified_name = ref.qualified_name;
  outcome.status = absl::NotFoundError(message);
  sink_->OnCommandError(ref, interaction, outcome.status);
  return outcome;
}

Dispatcher::Outcome Dispatcher::Dispatch(Interaction& interaction) const {
  Outcome outcome;
  if (interaction.type() != InteractionType::kApplicationCommand && !interaction.is_autocomplete()) {
    VLOG(1) << "Ignoring interaction " << interaction.id() << " of type " << static_cast<int>(interaction.type());
    return outcome;
  }

  const CommandData& data = interaction.data();
  CommandRef ref;
  ref.qualified_name = data.name;
  ref.kind = data.type;
  ref.command_id = data.id;
  ref.guild_id = data.guild_id;

  absl::StatusOr<CommandKind> kind = CommandKindFromInt(data.type);
  if (!kind.ok()) return RoutingError(ref, interaction, std::string(kind.status().message()));

  Registry::CommandPtr command = Lookup(data, *kind);
  if (command == nullptr) {
    return RoutingError(ref, interaction, absl::StrCat("Command '", data.name, "' is not registered locally"));
  }
  if (command->disabled()) {
    return RoutingError(ref, interaction, absl::StrCat("Command '", data.name, "' was removed from code"));
  }

  const Invocable* target = nullptr;
  Arguments args;
  if (const auto* context = std::get_if<ContextCommand>(&command->node())) {
    target = context;
    if (*kind == CommandKind::kUser) {
      args.Set("target", ResolveUser(data.target_id, FormatSnowflake(data.target_id), data.resolved));
    } else if (const Message* message = data.resolved.FindMessage(data.target_id)) {
      args.Set("target", *message);
    } else {
      args.Set("target", FormatSnowflake(data.target_id));
    }
  } else {
    const auto& slash = std::get<SlashCommand>(command->node());
    const std::vector<InteractionOption>* supplied = &data.options;
    const SubCommand* sub_command = nullptr;
    if (slash.is_container()) {
      if (supplied->empty() || !IsRouteLayer(supplied->front())) {
        return RoutingError(ref, interaction, absl::StrCat("Command '", data.name, "' needs a sub-command"));
      }
      const InteractionOption& layer = supplied->front();
      ref.qualified_name = absl::StrCat(ref.qualified_name, " ", layer.name);
      if (layer.type == static_cast<int>(OptionType::kSubCommandGroup)) {
        const SubCommandGroup* group = slash.FindGroup(layer.name);
        if (group == nullptr) {
          return RoutingError(ref, interaction, absl::StrCat("Unknown sub-command group '", ref.qualified_name, "'"));
        }
        if (layer.options.empty() || layer.options.front().type != static_cast<int>(OptionType::kSubCommand)) {
          return RoutingError(ref, interaction, absl::StrCat("Group '", ref.qualified_name, "' needs a sub-command"));
        }
        const InteractionOption& nested = layer.options.front();
        ref.qualified_name = absl::StrCat(ref.qualified_name, " ", nested.name);
        sub_command = group->Find(nested.name);
        supplied = &nested.options;
      } else {
        sub_command = slash.FindSubCommand(layer.name);
        supplied = &layer.options;
      }
      if (sub_command == nullptr) {
        return RoutingError(ref, interaction, absl::StrCat("Unknown sub-command '", ref.qualified_name, "'"));
      }
      target = sub_command;
      args = BindArguments(*supplied, sub_command->options(), sub_command->connector(), data.resolved);
    } else {
      if (!supplied->empty() && IsRouteLayer(supplied->front())) {
        return RoutingError(ref, interaction, absl::StrCat("Command '", data.name, "' has no sub-commands"));
      }
      target = &slash;
      args = BindArguments(*supplied, slash.options(), slash.connector(), data.resolved);
    }

    if (interaction.is_autocomplete()) {
      for (const auto& option : *supplied) {
        if (option.focused) interaction.set_focused_option(option.name);
      }
    }
  }

  outcome.qualified_name = ref.qualified_name;
  if (interaction.is_autocomplete()) {
    absl::StatusOr<std::vector<OptionChoice>> choices = target->InvokeAutocomplete(ref, interaction, args, sink_);
    if (choices.ok()) {
      outcome.result = Result::AUTOCOMPLETED;
      outcome.choices = *std::move(choices);
      return outcome;
    }
    outcome.status = choices.status();
  } else {
    outcome.status = target->Invoke(ref, interaction, args, sink_);
    if (outcome.status.ok()) {
      outcome.result = Result::HANDLED;
      return outcome;
    }
  }
  outcome.result = IsCheckFailure(outcome.status) ? Result::CHECK_FAILED : Result::HANDLER_ERROR;
  return outcome;
}

}  // namespace appcmd
