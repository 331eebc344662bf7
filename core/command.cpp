#include "core/command.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"

#include "core/constants.h"
#include "core/status_macros.h"
#include "core/validation.h"
#include "core/wire_compare.h"

namespace appcmd {

namespace {

constexpr char kCheckFailurePrefix[] = "The check functions for command '";

// Runs `fn`, turning an escaping std::exception into an Internal status.
template <typename Fn>
auto Guarded(const std::string& what, Fn fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& e) {
    return absl::InternalError(absl::StrCat(what, " raised an exception: ", e.what()));
  }
}

void ClearCallbacks(const Invocable& node) {
  auto& callbacks = *node.callbacks();
  callbacks.handler = nullptr;
  callbacks.autocomplete = nullptr;
}

absl::Status ValidateLocalizedText(const Localizations& names, const Localizations& descriptions,
                                   absl::string_view what) {
  RETURN_IF_ERROR(names.ValidateEach([what](const std::string& text) { return ValidateName(text, what); }));
  return descriptions.ValidateEach([what](const std::string& text) { return ValidateDescription(text, what); });
}

// Leaf option lists: scalar options only, unique names, connector entries
// pointing at declared options.
absl::Status ValidateLeafOptions(const std::string& owner, const std::vector<Option>& options,
                                 const ConnectorMap& connector) {
  if (options.size() > kMaxOptions) {
    return absl::InvalidArgumentError(
        absl::Substitute("'$0' has $1 options, the maximum is $2.", owner, options.size(), kMaxOptions));
  }
  absl::flat_hash_set<std::string> names;
  for (const auto& option : options) {
    if (IsContainerType(option.type())) {
      return absl::InvalidArgumentError(absl::Substitute(
          "'$0' declares '$1' as an option; register sub-commands through a base instead.", owner, option.name()));
    }
    if (!names.insert(option.name()).second) {
      return absl::InvalidArgumentError(absl::Substitute("Duplicate option '$0' in '$1'.", option.name(), owner));
    }
  }
  for (const auto& [parameter, option_name] : connector) {
    if (!names.contains(option_name)) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Connector of '$0' maps parameter '$1' to unknown option '$2'.", owner, parameter, option_name));
    }
  }
  return absl::OkStatus();
}

nlohmann::json OptionsToJson(const std::vector<Option>& options) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& option : options) out.push_back(option.ToJson());
  return out;
}

const std::string& ChildName(const SlashCommand::Child& child) {
  return std::visit([](const auto& c) -> const std::string& { return c.name(); }, child);
}

void AddPermissionFields(nlohmann::json& j, const std::optional<uint64_t>& default_member_permissions, bool allow_dm,
                         bool nsfw, bool global_scope) {
  j["default_member_permissions"] =
      default_member_permissions ? nlohmann::json(absl::StrCat(*default_member_permissions)) : nlohmann::json();
  if (global_scope) j["dm_permission"] = allow_dm;
  j["nsfw"] = nsfw;
}

std::string StringOr(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

}  // namespace

absl::StatusOr<CommandKind> CommandKindFromInt(int value) {
  if (value < static_cast<int>(CommandKind::kChatInput) || value > static_cast<int>(CommandKind::kMessage)) {
    return absl::InvalidArgumentError(absl::StrCat("Unknown command type ", value));
  }
  return static_cast<CommandKind>(value);
}

absl::string_view CommandKindName(CommandKind kind) {
  switch (kind) {
    case CommandKind::kChatInput:
      return "chat_input";
    case CommandKind::kUser:
      return "user";
    case CommandKind::kMessage:
      return "message";
  }
  return "unknown";
}

bool IsCheckFailure(const absl::Status& status) {
  return absl::IsFailedPrecondition(status) && absl::StartsWith(status.message(), kCheckFailurePrefix);
}

// ---- Invocable ----

Invocable::Invocable(CommandHandler handler) : callbacks_(std::make_shared<Callbacks>()) {
  callbacks_->handler = std::move(handler);
}

void Invocable::ClearHandlers() { ClearCallbacks(*this); }

absl::Status Invocable::RunChecks(const Interaction& interaction) const {
  const Callbacks& callbacks = *callbacks_;
  for (const auto* checks : {&callbacks.unit_checks, &callbacks.checks}) {
    for (const auto& check : *checks) {
      absl::StatusOr<bool> passed = Guarded("A check", [&]() { return check(interaction); });
      if (!passed.ok()) return passed.status();
      if (!*passed) {
        return absl::FailedPreconditionError(
            absl::StrCat(kCheckFailurePrefix, interaction.data().name, "' failed."));
      }
    }
  }
  return absl::OkStatus();
}

void Invocable::ReportError(const CommandRef& ref, Interaction& interaction, const absl::Status& error,
                            ErrorSink* sink) const {
  if (callbacks_->on_error) {
    absl::Status handled = Guarded("Error handler", [&]() {
      callbacks_->on_error(interaction, error);
      return absl::OkStatus();
    });
    if (handled.ok()) return;
    LOG(ERROR) << "Error handler of '" << ref.qualified_name << "' failed: " << handled;
  }
  if (sink != nullptr) {
    sink->OnCommandError(ref, interaction, error);
  } else {
    LOG(ERROR) << "Unhandled error in command '" << ref.qualified_name << "': " << error;
  }
}

absl::Status Invocable::Invoke(const CommandRef& ref, Interaction& interaction, const Arguments& args,
                               ErrorSink* sink) const {
  absl::Status status = RunChecks(interaction);
  if (status.ok()) {
    if (!callbacks_->handler) {
      status = absl::UnimplementedError(absl::StrCat("Command '", ref.qualified_name, "' has no handler"));
    } else {
      status = Guarded("Command", [&]() { return callbacks_->handler(interaction, args); });
    }
  }
  if (!status.ok()) ReportError(ref, interaction, status, sink);
  return status;
}

absl::StatusOr<std::vector<OptionChoice>> Invocable::InvokeAutocomplete(const CommandRef& ref,
                                                                        Interaction& interaction,
                                                                        const Arguments& args,
                                                                        ErrorSink* sink) const {
  absl::Status status = RunChecks(interaction);
  if (!status.ok()) {
    ReportError(ref, interaction, status, sink);
    return status;
  }
  if (!callbacks_->autocomplete) {
    LOG(WARNING) << "Command '" << ref.qualified_name
                 << "' has options with autocomplete enabled but no autocomplete handler.";
    return std::vector<OptionChoice>();
  }
  absl::StatusOr<std::vector<OptionChoice>> choices =
      Guarded("Autocomplete handler", [&]() { return callbacks_->autocomplete(interaction, args); });
  if (!choices.ok()) {
    ReportError(ref, interaction, choices.status(), sink);
    return choices.status();
  }
  if (choices->size() > kMaxChoices) {
    LOG(WARNING) << "Autocomplete of '" << ref.qualified_name << "' returned " << choices->size()
                 << " choices; only the first " << kMaxChoices << " are sent.";
    choices->erase(choices->begin() + kMaxChoices, choices->end());
  }
  return choices;
}

// ---- SubCommand ----

absl::StatusOr<SubCommand> SubCommand::Create(Params params, CommandHandler handler) {
  RETURN_IF_ERROR(ValidateName(params.name, "sub-command"));
  RETURN_IF_ERROR(ValidateDescription(params.description, "sub-command"));
  RETURN_IF_ERROR(ValidateLocalizedText(params.name_localizations, params.description_localizations, "sub-command"));
  RETURN_IF_ERROR(ValidateLeafOptions(params.name, params.options, params.connector));
  return SubCommand(std::move(params), std::move(handler));
}

nlohmann::json SubCommand::ToJson() const {
  return {
      {"type", static_cast<int>(OptionType::kSubCommand)},
      {"name", params_.name},
      {"name_localizations", params_.name_localizations.ToJson()},
      {"description", params_.description},
      {"description_localizations", params_.description_localizations.ToJson()},
      {"options", OptionsToJson(params_.options)},
  };
}

// ---- SubCommandGroup ----

absl::StatusOr<SubCommandGroup> SubCommandGroup::Create(Params params, std::vector<SubCommand> sub_commands) {
  RETURN_IF_ERROR(ValidateName(params.name, "sub-command-group"));
  RETURN_IF_ERROR(ValidateDescription(params.description, "sub-command-group"));
  RETURN_IF_ERROR(
      ValidateLocalizedText(params.name_localizations, params.description_localizations, "sub-command-group"));
  if (sub_commands.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sub-command-group '", params.name, "' needs at least one sub-command."));
  }
  SubCommandGroup group(std::move(params));
  for (auto& sub_command : sub_commands) {
    RETURN_IF_ERROR(group.Add(std::move(sub_command)));
  }
  return group;
}

const SubCommand* SubCommandGroup::Find(const std::string& name) const {
  for (const auto& sub_command : sub_commands_) {
    if (sub_command.name() == name) return &sub_command;
  }
  return nullptr;
}

absl::Status SubCommandGroup::Add(SubCommand sub_command) {
  if (Find(sub_command.name()) != nullptr) {
    return absl::AlreadyExistsError(absl::Substitute("Sub-command-group '$0' already has a sub-command '$1'.",
                                                     params_.name, sub_command.name()));
  }
  if (sub_commands_.size() >= kMaxChildren) {
    return absl::InvalidArgumentError(
        absl::Substitute("Sub-command-group '$0' already has $1 sub-commands.", params_.name, kMaxChildren));
  }
  sub_commands_.push_back(std::move(sub_command));
  return absl::OkStatus();
}

absl::Status SubCommandGroup::Upsert(SubCommand sub_command) {
  for (auto& existing : sub_commands_) {
    if (existing.name() == sub_command.name()) {
      existing = std::move(sub_command);
      return absl::OkStatus();
    }
  }
  return Add(std::move(sub_command));
}

bool SubCommandGroup::Remove(const std::string& name) {
  auto it = std::find_if(sub_commands_.begin(), sub_commands_.end(),
                         [&](const SubCommand& s) { return s.name() == name; });
  if (it == sub_commands_.end()) return false;
  sub_commands_.erase(it);
  return true;
}

absl::Status SubCommandGroup::Update(const Params& params) {
  RETURN_IF_ERROR(ValidateDescription(params.description, "sub-command-group"));
  RETURN_IF_ERROR(
      ValidateLocalizedText(params.name_localizations, params.description_localizations, "sub-command-group"));
  params_.description = params.description;
  params_.name_localizations.Merge(params.name_localizations);
  params_.description_localizations.Merge(params.description_localizations);
  return absl::OkStatus();
}

nlohmann::json SubCommandGroup::ToJson() const {
  nlohmann::json options = nlohmann::json::array();
  for (const auto& sub_command : sub_commands_) options.push_back(sub_command.ToJson());
  return {
      {"type", static_cast<int>(OptionType::kSubCommandGroup)},
      {"name", params_.name},
      {"name_localizations", params_.name_localizations.ToJson()},
      {"description", params_.description},
      {"description_localizations", params_.description_localizations.ToJson()},
      {"options", std::move(options)},
  };
}

// ---- SlashCommand ----

absl::StatusOr<SlashCommand> SlashCommand::Create(Params params, CommandHandler handler) {
  RETURN_IF_ERROR(ValidateName(params.name, "command"));
  RETURN_IF_ERROR(ValidateDescription(params.description, "command"));
  RETURN_IF_ERROR(ValidateLocalizedText(params.name_localizations, params.description_localizations, "command"));
  RETURN_IF_ERROR(ValidateLeafOptions(params.name, params.options, params.connector));
  return SlashCommand(std::move(params), std::move(handler), /*container=*/false);
}

absl::StatusOr<SlashCommand> SlashCommand::CreateContainer(Params params, std::vector<Child> children) {
  RETURN_IF_ERROR(ValidateName(params.name, "command"));
  RETURN_IF_ERROR(ValidateDescription(params.description, "command"));
  RETURN_IF_ERROR(ValidateLocalizedText(params.name_localizations, params.description_localizations, "command"));
  if (!params.options.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Command '", params.name, "' can not have both options and sub-commands."));
  }
  if (children.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Command '", params.name, "' needs at least one sub-command or sub-command-group."));
  }
  SlashCommand command(std::move(params), nullptr, /*container=*/true);
  for (auto& child : children) {
    RETURN_IF_ERROR(command.AddChild(std::move(child)));
  }
  return command;
}

const SubCommand* SlashCommand::FindSubCommand(const std::string& name) const {
  for (const auto& child : children_) {
    if (const auto* sub_command = std::get_if<SubCommand>(&child); sub_command && sub_command->name() == name) {
      return sub_command;
    }
  }
  return nullptr;
}

const SubCommandGroup* SlashCommand::FindGroup(const std::string& name) const {
  for (const auto& child : children_) {
    if (const auto* group = std::get_if<SubCommandGroup>(&child); group && group->name() == name) return group;
  }
  return nullptr;
}

SubCommandGroup* SlashCommand::MutableGroup(const std::string& name) {
  return const_cast<SubCommandGroup*>(FindGroup(name));
}

absl::Status SlashCommand::AddChild(Child child) {
  if (!container_) {
    return absl::FailedPreconditionError(
        absl::StrCat("Command '", params_.name, "' has options and can not contain sub-commands."));
  }
  const std::string& name = ChildName(child);
  for (const auto& existing : children_) {
    if (ChildName(existing) == name) {
      return absl::AlreadyExistsError(
          absl::Substitute("Command '$0' already has a sub-command or group named '$1'.", params_.name, name));
    }
  }
  if (children_.size() >= kMaxChildren) {
    return absl::InvalidArgumentError(
        absl::Substitute("Command '$0' already has $1 sub-commands and groups.", params_.name, kMaxChildren));
  }
  children_.push_back(std::move(child));
  return absl::OkStatus();
}

absl::Status SlashCommand::UpsertSubCommand(SubCommand sub_command) {
  for (auto& child : children_) {
    if (ChildName(child) != sub_command.name()) continue;
    if (std::holds_alternative<SubCommandGroup>(child)) {
      return absl::AlreadyExistsError(absl::Substitute("Command '$0' already has a group named '$1'.",
                                                       params_.name, sub_command.name()));
    }
    child = std::move(sub_command);
    return absl::OkStatus();
  }
  return AddChild(std::move(sub_command));
}

bool SlashCommand::RemoveChild(const std::string& name) {
  auto it = std::find_if(children_.begin(), children_.end(), [&](const Child& c) { return ChildName(c) == name; });
  if (it == children_.end()) return false;
  children_.erase(it);
  return true;
}

absl::Status SlashCommand::SetDescription(std::string description) {
  RETURN_IF_ERROR(ValidateDescription(description, "command"));
  params_.description = std::move(description);
  return absl::OkStatus();
}

absl::Status SlashCommand::MergeLocalizations(const Localizations& name_localizations,
                                              const Localizations& description_localizations) {
  RETURN_IF_ERROR(ValidateLocalizedText(name_localizations, description_localizations, "command"));
  params_.name_localizations.Merge(name_localizations);
  params_.description_localizations.Merge(description_localizations);
  return absl::OkStatus();
}

nlohmann::json SlashCommand::ToJson(bool global_scope) const {
  nlohmann::json j = {
      {"type", static_cast<int>(CommandKind::kChatInput)},
      {"name", params_.name},
      {"name_localizations", params_.name_localizations.ToJson()},
      {"description", params_.description},
      {"description_localizations", params_.description_localizations.ToJson()},
  };
  AddPermissionFields(j, params_.default_member_permissions, params_.allow_dm, params_.nsfw, global_scope);
  if (container_) {
    nlohmann::json options = nlohmann::json::array();
    for (const auto& child : children_) {
      options.push_back(std::visit([](const auto& c) { return c.ToJson(); }, child));
    }
    j["options"] = std::move(options);
  } else {
    j["options"] = OptionsToJson(params_.options);
  }
  return j;
}

// ---- ContextCommand ----

absl::StatusOr<ContextCommand> ContextCommand::Create(Params params, CommandHandler handler) {
  if (params.kind == CommandKind::kChatInput) {
    return absl::InvalidArgumentError("Context commands must be user or message commands.");
  }
  absl::string_view what = params.kind == CommandKind::kUser ? "user command" : "message command";
  RETURN_IF_ERROR(ValidateContextName(params.name, what));
  RETURN_IF_ERROR(params.name_localizations.ValidateEach(
      [what](const std::string& text) { return ValidateContextName(text, what); }));
  return ContextCommand(std::move(params), std::move(handler));
}

nlohmann::json ContextCommand::ToJson(bool global_scope) const {
  nlohmann::json j = {
      {"type", static_cast<int>(params_.kind)},
      {"name", params_.name},
      {"name_localizations", params_.name_localizations.ToJson()},
      {"description", ""},
  };
  AddPermissionFields(j, params_.default_member_permissions, params_.allow_dm, params_.nsfw, global_scope);
  return j;
}

// ---- ApplicationCommand ----

absl::StatusOr<std::shared_ptr<ApplicationCommand>> ApplicationCommand::RemoteOnly(const nlohmann::json& remote,
                                                                                   Snowflake scope) {
  int type = remote.contains("type") && remote["type"].is_number_integer() ? remote["type"].get<int>() : 1;
  ASSIGN_OR_RETURN(CommandKind kind, CommandKindFromInt(type));
  std::string name = StringOr(remote, "name");

  std::optional<CommandNode> node;
  if (kind == CommandKind::kChatInput) {
    SlashCommand::Params params;
    params.name = name;
    params.description = StringOr(remote, "description");
    if (params.description.empty()) params.description = kNoDescription;
    ASSIGN_OR_RETURN(SlashCommand command, SlashCommand::Create(std::move(params), nullptr));
    node.emplace(std::move(command));
  } else {
    ContextCommand::Params params;
    params.kind = kind;
    params.name = name;
    ASSIGN_OR_RETURN(ContextCommand command, ContextCommand::Create(std::move(params), nullptr));
    node.emplace(std::move(command));
  }
  auto command = std::make_shared<ApplicationCommand>(std::move(*node), std::set<Snowflake>{scope});
  command->Bind(scope, remote);
  command->disabled_ = true;
  return command;
}

CommandKind ApplicationCommand::kind() const {
  if (const auto* context = std::get_if<ContextCommand>(&node_)) return context->kind();
  return CommandKind::kChatInput;
}

const std::string& ApplicationCommand::name() const {
  return std::visit([](const auto& n) -> const std::string& { return n.name(); }, node_);
}

nlohmann::json ApplicationCommand::ToWire(Snowflake scope) const {
  bool global_scope = scope == kGlobalScope;
  return std::visit([global_scope](const auto& n) { return n.ToJson(global_scope); }, node_);
}

bool ApplicationCommand::Matches(const nlohmann::json& remote, Snowflake scope) const {
  return CommandWireEquals(ToWire(scope), remote, scope == kGlobalScope);
}

void ApplicationCommand::Bind(Snowflake scope, const nlohmann::json& remote) {
  RemoteBinding binding;
  binding.id = SnowflakeOrZero(remote, "id");
  binding.application_id = SnowflakeOrZero(remote, "application_id");
  if (binding.id != 0) binding.created_at = SnowflakeTime(binding.id);
  if (remote.contains("permissions")) binding.permissions = remote["permissions"];
  bindings_[scope] = std::move(binding);
}

const RemoteBinding* ApplicationCommand::binding(Snowflake scope) const {
  auto it = bindings_.find(scope);
  return it == bindings_.end() ? nullptr : &it->second;
}

Snowflake ApplicationCommand::id(Snowflake scope) const {
  const RemoteBinding* b = binding(scope);
  return b == nullptr ? 0 : b->id;
}

std::vector<std::shared_ptr<Callbacks>> ApplicationCommand::AllCallbacks() const {
  if (const auto* context = std::get_if<ContextCommand>(&node_)) return {context->callbacks()};
  const auto& slash = std::get<SlashCommand>(node_);
  std::vector<std::shared_ptr<Callbacks>> out = {slash.callbacks()};
  for (const auto& child : slash.children()) {
    if (const auto* sub_command = std::get_if<SubCommand>(&child)) {
      out.push_back(sub_command->callbacks());
    } else {
      for (const auto& nested : std::get<SubCommandGroup>(child).sub_commands()) out.push_back(nested.callbacks());
    }
  }
  return out;
}

void ApplicationCommand::Disable() {
  disabled_ = true;
  for (const auto& callbacks : AllCallbacks()) {
    callbacks->handler = nullptr;
    callbacks->autocomplete = nullptr;
  }
}

const std::string& ApplicationCommand::unit() const {
  return std::visit([](const auto& n) -> const std::string& { return n.callbacks()->unit; }, node_);
}

}  // namespace appcmd
