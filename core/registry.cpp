#include "core/registry.h"

#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"

#include "core/constants.h"
#include "core/status_macros.h"

namespace appcmd {

namespace {

std::string ScopeName(Snowflake scope) {
  return scope == kGlobalScope ? "globally" : absl::StrCat("in guild ", scope);
}

std::string OrNoDescription(const std::string& description) {
  return description.empty() ? kNoDescription : description;
}

// Adds `sub_command` to `base`, inside the named group when there is one.
absl::Status AddToBase(SlashCommand& base, const SlashCommandSpec& spec, const SubCommand& sub_command) {
  if (spec.group_name.empty()) return base.AddChild(sub_command);

  SubCommandGroup::Params params;
  params.name = spec.group_name;
  params.name_localizations = spec.group_name_localizations;
  params.description_localizations = spec.group_description_localizations;
  if (SubCommandGroup* group = base.MutableGroup(spec.group_name)) {
    params.description = spec.group_description.empty() ? group->description() : spec.group_description;
    RETURN_IF_ERROR(group->Update(params));
    return group->Add(sub_command);
  }
  params.description = OrNoDescription(spec.group_description);
  ASSIGN_OR_RETURN(SubCommandGroup group, SubCommandGroup::Create(std::move(params), {sub_command}));
  return base.AddChild(std::move(group));
}

// Later registrations under an existing base update its metadata.
absl::Status UpdateBase(SlashCommand& base, const SlashCommandSpec& spec) {
  if (!base.is_container()) {
    return absl::FailedPreconditionError(absl::Substitute(
        "Command '$0' already exists with options of its own; '$1' can not be added to it.", base.name(),
        spec.name));
  }
  if (!spec.base_description.empty()) RETURN_IF_ERROR(base.SetDescription(spec.base_description));
  if (spec.allow_dm) base.set_allow_dm(*spec.allow_dm);
  if (spec.nsfw) base.set_nsfw(*spec.nsfw);
  if (spec.default_member_permissions) base.set_default_member_permissions(*spec.default_member_permissions);
  return base.MergeLocalizations(spec.base_name_localizations, spec.base_description_localizations);
}

}  // namespace

CommandHandle& CommandHandle::OnError(ErrorHandler handler) {
  callbacks_->on_error = std::move(handler);
  return *this;
}

CommandHandle& CommandHandle::OnAutocomplete(AutocompleteHandler handler) {
  callbacks_->autocomplete = std::move(handler);
  return *this;
}

CommandHandle& CommandHandle::AddCheck(Check check) {
  callbacks_->checks.push_back(std::move(check));
  return *this;
}

std::set<Snowflake> Registry::ScopesOf(const std::vector<Snowflake>& guild_ids) const {
  if (guild_ids.empty()) return {kGlobalScope};
  return std::set<Snowflake>(guild_ids.begin(), guild_ids.end());
}

absl::StatusOr<CommandHandle> Registry::RegisterSlashCommand(SlashCommandSpec spec, CommandHandler handler) {
  if (!spec.group_name.empty() && spec.base_name.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sub-command '", spec.name, "' names group '", spec.group_name, "' but no base command."));
  }
  for (Snowflake guild_id : spec.guild_ids) {
    if (guild_id == kGlobalScope) return absl::InvalidArgumentError("Guild ids must be non-zero.");
  }
  spec.description = OrNoDescription(spec.description);
  std::set<Snowflake> scopes = ScopesOf(spec.guild_ids);
  if (spec.base_name.empty()) return RegisterLeaf(std::move(spec), std::move(handler), scopes);
  return RegisterUnderBase(std::move(spec), std::move(handler), scopes);
}

absl::StatusOr<CommandHandle> Registry::RegisterLeaf(SlashCommandSpec spec, CommandHandler handler,
                                                     const std::set<Snowflake>& scopes) {
  SlashCommand::Params params;
  params.name = std::move(spec.name);
  params.description = std::move(spec.description);
  params.name_localizations = std::move(spec.name_localizations);
  params.description_localizations = std::move(spec.description_localizations);
  params.options = std::move(spec.options);
  params.connector = std::move(spec.connector);
  params.default_member_permissions = spec.default_member_permissions;
  params.allow_dm = spec.allow_dm.value_or(true);
  params.nsfw = spec.nsfw.value_or(false);
  ASSIGN_OR_RETURN(SlashCommand command, SlashCommand::Create(std::move(params), std::move(handler)));
  RETURN_IF_ERROR(CheckNameFree(scopes, CommandKind::kChatInput, command.name()));

  AdoptUnit(command.callbacks());
  std::shared_ptr<Callbacks> callbacks = command.callbacks();
  auto app = std::make_shared<ApplicationCommand>(std::move(command), scopes);
  Insert(app);
  VLOG(1) << "Registered slash command '" << app->name() << "' in " << scopes.size() << " scope(s)";
  return CommandHandle(std::move(callbacks), app->name());
}

absl::StatusOr<CommandHandle> Registry::RegisterUnderBase(SlashCommandSpec spec, CommandHandler handler,
                                                          const std::set<Snowflake>& scopes) {
  SubCommand::Params params;
  params.name = spec.name;
  params.description = spec.description;
  params.name_localizations = spec.name_localizations;
  params.description_localizations = spec.description_localizations;
  params.options = std::move(spec.options);
  params.connector = std::move(spec.connector);
  ASSIGN_OR_RETURN(SubCommand sub_command, SubCommand::Create(std::move(params), std::move(handler)));
  AdoptUnit(sub_command.callbacks());

  std::string qualified_name = spec.base_name;
  if (!spec.group_name.empty()) absl::StrAppend(&qualified_name, " ", spec.group_name);
  absl::StrAppend(&qualified_name, " ", spec.name);

  // Scopes are grouped by the base they currently hold. Every distinct base
  // is updated on a copy so a failure leaves the registry untouched.
  struct Pending {
    CommandPtr base;
    std::set<Snowflake> scopes;
    std::optional<SlashCommand> updated;
  };
  std::map<const ApplicationCommand*, Pending> existing;
  std::set<Snowflake> fresh;
  for (Snowflake scope : scopes) {
    CommandPtr base = Find(scope, CommandKind::kChatInput, spec.base_name);
    if (base == nullptr) {
      fresh.insert(scope);
      continue;
    }
    Pending& pending = existing[base.get()];
    pending.base = base;
    pending.scopes.insert(scope);
  }
  for (auto& [unused, pending] : existing) {
    SlashCommand copy = std::get<SlashCommand>(pending.base->node());
    RETURN_IF_ERROR(UpdateBase(copy, spec));
    RETURN_IF_ERROR(AddToBase(copy, spec, sub_command));
    pending.updated.emplace(std::move(copy));
  }

  std::optional<SlashCommand> new_base;
  if (!fresh.empty()) {
    SlashCommand::Params base_params;
    base_params.name = spec.base_name;
    base_params.description = OrNoDescription(spec.base_description);
    base_params.name_localizations = spec.base_name_localizations;
    base_params.description_localizations = spec.base_description_localizations;
    base_params.default_member_permissions = spec.default_member_permissions;
    base_params.allow_dm = spec.allow_dm.value_or(true);
    base_params.nsfw = spec.nsfw.value_or(false);
    std::vector<SlashCommand::Child> children;
    if (spec.group_name.empty()) {
      children.emplace_back(sub_command);
    } else {
      SubCommandGroup::Params group_params;
      group_params.name = spec.group_name;
      group_params.description = OrNoDescription(spec.group_description);
      group_params.name_localizations = spec.group_name_localizations;
      group_params.description_localizations = spec.group_description_localizations;
      ASSIGN_OR_RETURN(SubCommandGroup group, SubCommandGroup::Create(std::move(group_params), {sub_command}));
      children.emplace_back(std::move(group));
    }
    ASSIGN_OR_RETURN(SlashCommand base, SlashCommand::CreateContainer(std::move(base_params), std::move(children)));
    AdoptUnit(base.callbacks());
    new_base.emplace(std::move(base));
  }

  // Commit.
  for (auto& [unused, pending] : existing) {
    if (pending.base->scopes() == pending.scopes) {
      pending.base->mutable_node() = std::move(*pending.updated);
      continue;
    }
    // The base is shared with guilds outside this registration: split the
    // registered guilds off so the others keep exactly what they had.
    auto split = std::make_shared<ApplicationCommand>(std::move(*pending.updated), pending.scopes);
    for (Snowflake scope : pending.scopes) {
      if (const RemoteBinding* binding = pending.base->binding(scope)) {
        split->SetBinding(scope, *binding);
        if (binding->id != 0) by_id_[binding->id] = split;
        pending.base->Unbind(scope);
      }
      pending.base->RemoveScope(scope);
    }
    Insert(split);
    VLOG(1) << "Split base command '" << spec.base_name << "' for " << pending.scopes.size() << " guild(s)";
  }
  if (new_base) Insert(std::make_shared<ApplicationCommand>(std::move(*new_base), fresh));

  VLOG(1) << "Registered sub-command '" << qualified_name << "' in " << scopes.size() << " scope(s)";
  return CommandHandle(sub_command.callbacks(), qualified_name);
}

absl::StatusOr<CommandHandle> Registry::RegisterUserCommand(ContextCommandSpec spec, CommandHandler handler) {
  return RegisterContext(CommandKind::kUser, std::move(spec), std::move(handler));
}

absl::StatusOr<CommandHandle> Registry::RegisterMessageCommand(ContextCommandSpec spec, CommandHandler handler) {
  return RegisterContext(CommandKind::kMessage, std::move(spec), std::move(handler));
}

absl::StatusOr<CommandHandle> Registry::RegisterContext(CommandKind kind, ContextCommandSpec spec,
                                                        CommandHandler handler) {
  for (Snowflake guild_id : spec.guild_ids) {
    if (guild_id == kGlobalScope) return absl::InvalidArgumentError("Guild ids must be non-zero.");
  }
  std::set<Snowflake> scopes = ScopesOf(spec.guild_ids);
  ContextCommand::Params params;
  params.kind = kind;
  params.name = std::move(spec.name);
  params.name_localizations = std::move(spec.name_localizations);
  params.default_member_permissions = spec.default_member_permissions;
  params.allow_dm = spec.allow_dm;
  params.nsfw = spec.nsfw;
  ASSIGN_OR_RETURN(ContextCommand command, ContextCommand::Create(std::move(params), std::move(handler)));
  RETURN_IF_ERROR(CheckNameFree(scopes, kind, command.name()));

  AdoptUnit(command.callbacks());
  std::shared_ptr<Callbacks> callbacks = command.callbacks();
  auto app = std::make_shared<ApplicationCommand>(std::move(command), scopes);
  Insert(app);
  VLOG(1) << "Registered " << CommandKindName(kind) << " command '" << app->name() << "'";
  return CommandHandle(std::move(callbacks), app->name());
}

absl::Status Registry::CheckNameFree(const std::set<Snowflake>& scopes, CommandKind kind,
                                     const std::string& name) const {
  for (Snowflake scope : scopes) {
    if (Find(scope, kind, name) != nullptr) {
      return absl::AlreadyExistsError(absl::Substitute("A $0 command named '$1' is already registered $2.",
                                                       CommandKindName(kind), name, ScopeName(scope)));
    }
  }
  return absl::OkStatus();
}

void Registry::Insert(const CommandPtr& command) {
  for (Snowflake scope : command->scopes()) {
    scopes_[scope][KindIndex(command->kind())][command->name()] = command;
  }
}

void Registry::Remove(const CommandPtr& command) {
  for (Snowflake scope : command->scopes()) {
    auto table = scopes_.find(scope);
    if (table == scopes_.end()) continue;
    NameMap& names = table->second[KindIndex(command->kind())];
    auto it = names.find(command->name());
    if (it != names.end() && it->second == command) names.erase(it);
  }
}

void Registry::AdoptUnit(const std::shared_ptr<Callbacks>& callbacks) const {
  if (loading_unit_ == nullptr) return;
  callbacks->unit = loading_unit_->name;
  callbacks->unit_checks = loading_unit_->checks;
}

std::vector<Registry::CommandPtr> Registry::Commands(Snowflake scope, CommandKind kind) const {
  std::vector<CommandPtr> out;
  auto table = scopes_.find(scope);
  if (table == scopes_.end()) return out;
  for (const auto& [name, command] : table->second[KindIndex(kind)]) out.push_back(command);
  return out;
}

std::vector<Registry::CommandPtr> Registry::Commands(Snowflake scope) const {
  std::vector<CommandPtr> out;
  for (CommandKind kind : {CommandKind::kChatInput, CommandKind::kUser, CommandKind::kMessage}) {
    for (auto& command : Commands(scope, kind)) out.push_back(std::move(command));
  }
  return out;
}

std::set<Snowflake> Registry::GuildScopes() const {
  std::set<Snowflake> out;
  for (const auto& [scope, table] : scopes_) {
    if (scope == kGlobalScope) continue;
    for (const auto& names : table) {
      if (!names.empty()) {
        out.insert(scope);
        break;
      }
    }
  }
  return out;
}

Registry::CommandPtr Registry::Find(Snowflake scope, CommandKind kind, const std::string& name) const {
  auto table = scopes_.find(scope);
  if (table == scopes_.end()) return nullptr;
  const NameMap& names = table->second[KindIndex(kind)];
  auto it = names.find(name);
  return it == names.end() ? nullptr : it->second;
}

Registry::CommandPtr Registry::FindById(Snowflake id) const {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : it->second;
}

void Registry::Bind(const CommandPtr& command, Snowflake scope, const nlohmann::json& remote) {
  command->Bind(scope, remote);
  Snowflake id = command->id(scope);
  if (id != 0) by_id_[id] = command;
}

void Registry::IndexRemoteOnly(const CommandPtr& command) {
  for (const auto& [scope, binding] : command->bindings()) {
    if (binding.id == 0) continue;
    // A live command bound to the same id wins.
    auto it = by_id_.find(binding.id);
    if (it != by_id_.end() && !it->second->disabled()) continue;
    by_id_[binding.id] = command;
  }
}

absl::Status Registry::LoadUnit(CommandUnit unit) {
  if (unit.name.empty()) return absl::InvalidArgumentError("Unit name must not be empty");
  if (!unit.setup) return absl::InvalidArgumentError(absl::StrCat("Unit '", unit.name, "' has no setup function"));
  if (units_.count(unit.name) > 0) {
    return absl::AlreadyExistsError(absl::StrCat("Unit '", unit.name, "' is already loaded"));
  }
  std::string name = unit.name;
  auto [it, inserted] = units_.emplace(name, std::move(unit));
  loading_unit_ = &it->second;
  absl::Status status = it->second.setup(*this);
  loading_unit_ = nullptr;
  if (!status.ok()) {
    LOG(ERROR) << "Failed to load unit '" << name << "': " << status;
    absl::Status cleanup = UnloadUnit(name);
    if (!cleanup.ok()) LOG(WARNING) << "Cleanup of unit '" << name << "' failed: " << cleanup;
    return status;
  }
  LOG(INFO) << "Loaded unit '" << name << "'";
  return absl::OkStatus();
}

bool Registry::StripUnit(SlashCommand& command, const std::string& unit) const {
  std::vector<std::string> drop_children;
  std::vector<std::pair<std::string, std::string>> drop_nested;
  for (const auto& child : command.children()) {
    if (const auto* sub_command = std::get_if<SubCommand>(&child)) {
      if (sub_command->callbacks()->unit == unit) drop_children.push_back(sub_command->name());
      continue;
    }
    const auto& group = std::get<SubCommandGroup>(child);
    size_t dropped = 0;
    for (const auto& nested : group.sub_commands()) {
      if (nested.callbacks()->unit != unit) continue;
      drop_nested.emplace_back(group.name(), nested.name());
      ++dropped;
    }
    if (dropped == group.sub_commands().size()) drop_children.push_back(group.name());
  }
  for (const auto& [group_name, sub_name] : drop_nested) {
    if (SubCommandGroup* group = command.MutableGroup(group_name)) group->Remove(sub_name);
  }
  for (const auto& name : drop_children) command.RemoveChild(name);
  return command.children().empty();
}

absl::Status Registry::UnloadUnit(const std::string& name) {
  auto unit = units_.find(name);
  if (unit == units_.end()) return absl::NotFoundError(absl::StrCat("Unit '", name, "' is not loaded"));

  absl::flat_hash_set<const ApplicationCommand*> seen;
  std::vector<CommandPtr> removed;
  for (auto& [scope, table] : scopes_) {
    for (auto& names : table) {
      for (auto& [command_name, command] : names) {
        if (!seen.insert(command.get()).second) continue;
        auto* slash = std::get_if<SlashCommand>(&command->mutable_node());
        if (slash != nullptr && slash->is_container()) {
          if (StripUnit(*slash, name)) removed.push_back(command);
        } else if (command->unit() == name) {
          removed.push_back(command);
        }
      }
    }
  }
  for (const auto& command : removed) {
    Remove(command);
    command->Disable();
  }
  units_.erase(unit);
  LOG(INFO) << "Unloaded unit '" << name << "', " << removed.size() << " command(s) removed";
  return absl::OkStatus();
}

Registry::SavedState Registry::Save() const {
  SavedState saved;
  saved.scopes = scopes_;
  saved.by_id = by_id_;
  saved.units = units_;
  absl::flat_hash_set<const ApplicationCommand*> seen;
  for (const auto& [scope, table] : scopes_) {
    for (const auto& names : table) {
      for (const auto& [name, command] : names) {
        if (!seen.insert(command.get()).second) continue;
        // Node copies share their callback blocks, so those are saved by value.
        saved.nodes.emplace_back(command, command->node());
        for (const auto& callbacks : command->AllCallbacks()) saved.callbacks.emplace_back(callbacks, *callbacks);
        if (!command->disabled()) saved.enabled.push_back(command);
      }
    }
  }
  return saved;
}

void Registry::Restore(SavedState saved) {
  scopes_ = std::move(saved.scopes);
  by_id_ = std::move(saved.by_id);
  units_ = std::move(saved.units);
  for (auto& [command, node] : saved.nodes) command->mutable_node() = std::move(node);
  for (auto& [callbacks, value] : saved.callbacks) *callbacks = std::move(value);
  for (const auto& command : saved.enabled) command->Enable();
}

absl::Status Registry::ReloadUnit(const std::string& name) {
  auto it = units_.find(name);
  if (it == units_.end()) return absl::NotFoundError(absl::StrCat("Unit '", name, "' is not loaded"));
  CommandUnit unit = it->second;
  SavedState saved = Save();
  RETURN_IF_ERROR(UnloadUnit(name));
  absl::Status status = LoadUnit(std::move(unit));
  if (!status.ok()) {
    Restore(std::move(saved));
    LOG(WARNING) << "Reload of unit '" << name << "' failed, previous commands restored";
  }
  return status;
}

std::vector<std::string> Registry::UnitNames() const {
  std::vector<std::string> out;
  for (const auto& [name, unit] : units_) out.push_back(name);
  return out;
}

size_t Registry::size() const {
  absl::flat_hash_set<const ApplicationCommand*> seen;
  for (const auto& [scope, table] : scopes_) {
    for (const auto& names : table) {
      for (const auto& [name, command] : names) seen.insert(command.get());
    }
  }
  return seen.size();
}

}  // namespace appcmd
