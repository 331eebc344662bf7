#include "core/option.h"

#include <cmath>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"

#include "core/constants.h"
#include "core/status_macros.h"
#include "core/validation.h"

namespace appcmd {

namespace {

nlohmann::json ChoiceValueToJson(const ChoiceValue& value) {
  return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

absl::Status CheckChoiceKind(OptionType type, const OptionChoice& choice) {
  bool ok = false;
  switch (type) {
    case OptionType::kString:
      ok = std::holds_alternative<std::string>(choice.value());
      break;
    case OptionType::kInteger:
      ok = std::holds_alternative<int64_t>(choice.value());
      break;
    case OptionType::kNumber:
      ok = !std::holds_alternative<std::string>(choice.value());
      break;
    default:
      break;
  }
  if (!ok) {
    return absl::InvalidArgumentError(absl::Substitute("The value of choice '$0' does not match the option type $1.",
                                                       choice.name(), OptionTypeName(type)));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<OptionType> OptionTypeFromInt(int value) {
  if (value < static_cast<int>(OptionType::kSubCommand) || value > static_cast<int>(OptionType::kAttachment)) {
    return absl::InvalidArgumentError(absl::StrCat("Unknown option type ", value));
  }
  return static_cast<OptionType>(value);
}

absl::string_view OptionTypeName(OptionType type) {
  switch (type) {
    case OptionType::kSubCommand:
      return "sub_command";
    case OptionType::kSubCommandGroup:
      return "sub_command_group";
    case OptionType::kString:
      return "string";
    case OptionType::kInteger:
      return "integer";
    case OptionType::kBoolean:
      return "boolean";
    case OptionType::kUser:
      return "user";
    case OptionType::kChannel:
      return "channel";
    case OptionType::kRole:
      return "role";
    case OptionType::kMentionable:
      return "mentionable";
    case OptionType::kNumber:
      return "number";
    case OptionType::kAttachment:
      return "attachment";
  }
  return "unknown";
}

bool IsContainerType(OptionType type) {
  return type == OptionType::kSubCommand || type == OptionType::kSubCommandGroup;
}

bool IsNumericType(OptionType type) { return type == OptionType::kInteger || type == OptionType::kNumber; }

bool SupportsChoices(OptionType type) {
  return type == OptionType::kString || type == OptionType::kInteger || type == OptionType::kNumber;
}

absl::StatusOr<OptionChoice> OptionChoice::Create(std::string name, ChoiceValue value,
                                                  Localizations name_localizations) {
  size_t length = Utf8Length(name);
  if (length < 1 || length > kMaxChoiceNameLength) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The name of a choice must be between 1 and $0 characters long, got $1.", kMaxChoiceNameLength, length));
  }
  return OptionChoice(std::move(name), std::move(value), std::move(name_localizations));
}

nlohmann::json OptionChoice::ToJson() const {
  nlohmann::json j = {{"name", name_}, {"value", ChoiceValueToJson(value_)}};
  if (!name_localizations_.empty()) j["name_localizations"] = name_localizations_.ToJson();
  return j;
}

absl::StatusOr<Option> Option::Create(Params params) {
  RETURN_IF_ERROR(ValidateName(params.name, "option"));
  RETURN_IF_ERROR(ValidateDescription(params.description, "option"));
  RETURN_IF_ERROR(params.name_localizations.ValidateEach(
      [](const std::string& text) { return ValidateName(text, "option"); }));
  RETURN_IF_ERROR(params.description_localizations.ValidateEach(
      [](const std::string& text) { return ValidateDescription(text, "option"); }));

  if (params.choices.size() > kMaxChoices) {
    return absl::InvalidArgumentError(
        absl::Substitute("The maximum of choices per option is $0, got $1. Use autocomplete for larger sets.",
                         kMaxChoices, params.choices.size()));
  }
  if (!params.choices.empty()) {
    if (!SupportsChoices(params.type)) {
      return absl::InvalidArgumentError("Only options of type string, integer or number can have choices.");
    }
    if (params.autocomplete) {
      return absl::InvalidArgumentError("Options with choices can not have autocomplete.");
    }
    for (const auto& choice : params.choices) {
      RETURN_IF_ERROR(CheckChoiceKind(params.type, choice));
    }
  }
  if (params.autocomplete && !SupportsChoices(params.type)) {
    return absl::InvalidArgumentError("Only options of type string, integer or number can have autocomplete.");
  }
  if ((params.min_value || params.max_value) && !IsNumericType(params.type)) {
    return absl::InvalidArgumentError("Only options of type integer or number can have a min_value or max_value.");
  }
  if (params.type == OptionType::kInteger) {
    for (const auto* bound : {&params.min_value, &params.max_value}) {
      if (*bound && (!std::isfinite(**bound) || std::trunc(**bound) != **bound)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Bounds of integer option '", params.name, "' must be whole numbers, got ", **bound));
      }
    }
  }
  if (params.min_value && params.max_value && *params.min_value > *params.max_value) {
    return absl::InvalidArgumentError(
        absl::StrCat("min_value ", *params.min_value, " is greater than max_value ", *params.max_value));
  }
  if (!params.channel_types.empty() && params.type != OptionType::kChannel) {
    return absl::InvalidArgumentError("Only options of type channel can have channel_types.");
  }

  if (IsContainerType(params.type)) {
    if (params.type == OptionType::kSubCommandGroup && params.options.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Sub-command-group option '", params.name, "' needs at least one sub-command."));
    }
    size_t limit = params.type == OptionType::kSubCommandGroup ? kMaxChildren : kMaxOptions;
    if (params.options.size() > limit) {
      return absl::InvalidArgumentError(
          absl::Substitute("Option '$0' can have at most $1 children, got $2.", params.name, limit,
                           params.options.size()));
    }
    absl::flat_hash_set<std::string> seen;
    for (const auto& child : params.options) {
      if (params.type == OptionType::kSubCommandGroup && child.type() != OptionType::kSubCommand) {
        return absl::InvalidArgumentError("A sub-command-group may only contain sub-commands.");
      }
      if (params.type == OptionType::kSubCommand && IsContainerType(child.type())) {
        return absl::InvalidArgumentError("A sub-command can not contain nested sub-commands.");
      }
      if (!seen.insert(child.name()).second) {
        return absl::InvalidArgumentError(
            absl::Substitute("Duplicate option name '$0' in '$1'.", child.name(), params.name));
      }
    }
  } else if (!params.options.empty()) {
    return absl::InvalidArgumentError(absl::StrCat("Option type ", OptionTypeName(params.type),
                                                   " can not contain nested options."));
  }

  return Option(std::move(params));
}

nlohmann::json Option::ToJson() const {
  nlohmann::json j = {
      {"type", static_cast<int>(params_.type)},
      {"name", params_.name},
      {"name_localizations", params_.name_localizations.ToJson()},
      {"description", params_.description},
      {"description_localizations", params_.description_localizations.ToJson()},
  };
  if (params_.required && !IsContainerType(params_.type)) j["required"] = true;
  if (!params_.choices.empty()) {
    nlohmann::json choices = nlohmann::json::array();
    for (const auto& choice : params_.choices) choices.push_back(choice.ToJson());
    j["choices"] = std::move(choices);
  } else if (params_.autocomplete) {
    j["autocomplete"] = true;
  } else if (!params_.options.empty()) {
    nlohmann::json options = nlohmann::json::array();
    for (const auto& option : params_.options) options.push_back(option.ToJson());
    j["options"] = std::move(options);
  }
  // Integer bounds go out as integers so they compare equal to what the service echoes back.
  if (params_.min_value) {
    j["min_value"] = params_.type == OptionType::kInteger ? nlohmann::json(static_cast<int64_t>(*params_.min_value))
                                                          : nlohmann::json(*params_.min_value);
  }
  if (params_.max_value) {
    j["max_value"] = params_.type == OptionType::kInteger ? nlohmann::json(static_cast<int64_t>(*params_.max_value))
                                                          : nlohmann::json(*params_.max_value);
  }
  if (!params_.channel_types.empty()) {
    nlohmann::json types = nlohmann::json::array();
    for (ChannelType type : params_.channel_types) types.push_back(static_cast<int>(type));
    j["channel_types"] = std::move(types);
  }
  return j;
}

}  // namespace appcmd
