#ifndef APPCMD_CORE_REGISTRY_H_
#define APPCMD_CORE_REGISTRY_H_

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "core/command.h"
#include "core/localizations.h"
#include "core/option.h"
#include "core/snowflake.h"

namespace appcmd {

class Registry;

// Everything needed to register one chat input command, optionally as a
// sub-command of `base_name` (and of `group_name` inside it).
struct SlashCommandSpec {
  std::string name;
  // Empty means "No Description".
  std::string description;
  Localizations name_localizations;
  Localizations description_localizations;
  std::vector<Option> options;
  ConnectorMap connector;
  std::optional<uint64_t> default_member_permissions;
  // Unset keeps the current value of an existing base, or the default.
  std::optional<bool> allow_dm;
  std::optional<bool> nsfw;
  // Empty registers globally.
  std::vector<Snowflake> guild_ids;

  std::string base_name;
  std::string base_description;
  Localizations base_name_localizations;
  Localizations base_description_localizations;

  std::string group_name;
  std::string group_description;
  Localizations group_name_localizations;
  Localizations group_description_localizations;
};

struct ContextCommandSpec {
  std::string name;
  Localizations name_localizations;
  std::optional<uint64_t> default_member_permissions;
  bool allow_dm = true;
  bool nsfw = false;
  std::vector<Snowflake> guild_ids;
};

/**
 * @brief Returned by the Register* calls to attach the remaining handlers.
 * Writes reach every scope the command was registered in.
 */
class CommandHandle {
 public:
  CommandHandle(std::shared_ptr<Callbacks> callbacks, std::string qualified_name)
      : callbacks_(std::move(callbacks)), qualified_name_(std::move(qualified_name)) {}

  CommandHandle& OnError(ErrorHandler handler);
  CommandHandle& OnAutocomplete(AutocompleteHandler handler);
  CommandHandle& AddCheck(Check check);

  const std::string& qualified_name() const { return qualified_name_; }

 private:
  std::shared_ptr<Callbacks> callbacks_;
  std::string qualified_name_;
};

// A reloadable group of commands sharing checks.
struct CommandUnit {
  std::string name;
  std::function<absl::Status(Registry&)> setup;
  // Run before the checks of every command the unit registers.
  std::vector<Check> checks;
};

/**
 * @brief All locally defined commands, partitioned by scope and kind.
 *
 * Scope 0 is the global set; every other key is a guild id. A command
 * registered for several guilds is one ApplicationCommand present in each of
 * those scopes.
 */
class Registry {
 public:
  using CommandPtr = std::shared_ptr<ApplicationCommand>;

  Registry() = default;
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  /**
   * @brief Registers a chat input command, or a sub-command when
   * `spec.base_name` is set.
   *
   * Everything is validated before the registry changes: on failure nothing
   * is registered. Fails with InvalidArgument on invalid names, descriptions
   * or options and on `group_name` without `base_name`, AlreadyExists on a
   * name clash, and FailedPrecondition when the base is a command with
   * options of its own.
   */
  absl::StatusOr<CommandHandle> RegisterSlashCommand(SlashCommandSpec spec, CommandHandler handler);
  absl::StatusOr<CommandHandle> RegisterUserCommand(ContextCommandSpec spec, CommandHandler handler);
  absl::StatusOr<CommandHandle> RegisterMessageCommand(ContextCommandSpec spec, CommandHandler handler);

  // Live commands of one scope and kind, ordered by name.
  std::vector<CommandPtr> Commands(Snowflake scope, CommandKind kind) const;
  // Live commands of one scope, all kinds.
  std::vector<CommandPtr> Commands(Snowflake scope) const;
  // Guild ids with at least one live command.
  std::set<Snowflake> GuildScopes() const;
  CommandPtr Find(Snowflake scope, CommandKind kind, const std::string& name) const;

  // Bound commands by remote id, including disabled ones.
  CommandPtr FindById(Snowflake id) const;
  // Binds `command` in `scope` and indexes the remote id.
  void Bind(const CommandPtr& command, Snowflake scope, const nlohmann::json& remote);
  // Remembers a command that exists only on the service.
  void IndexRemoteOnly(const CommandPtr& command);

  absl::Status LoadUnit(CommandUnit unit);
  // Soft removal of everything the unit registered.
  absl::Status UnloadUnit(const std::string& name);
  // Unloads and loads the unit again. When the new setup fails, the unit and
  // its previous commands are restored and the setup error is returned.
  absl::Status ReloadUnit(const std::string& name);
  bool HasUnit(const std::string& name) const { return units_.count(name) > 0; }
  std::vector<std::string> UnitNames() const;

  // Number of live commands over all scopes.
  size_t size() const;

 private:
  using NameMap = std::map<std::string, CommandPtr>;
  using ScopeTable = std::array<NameMap, 3>;

  static size_t KindIndex(CommandKind kind) { return static_cast<size_t>(kind) - 1; }

  std::set<Snowflake> ScopesOf(const std::vector<Snowflake>& guild_ids) const;
  absl::StatusOr<CommandHandle> RegisterLeaf(SlashCommandSpec spec, CommandHandler handler,
                                             const std::set<Snowflake>& scopes);
  absl::StatusOr<CommandHandle> RegisterUnderBase(SlashCommandSpec spec, CommandHandler handler,
                                                  const std::set<Snowflake>& scopes);
  absl::StatusOr<CommandHandle> RegisterContext(CommandKind kind, ContextCommandSpec spec, CommandHandler handler);
  absl::Status CheckNameFree(const std::set<Snowflake>& scopes, CommandKind kind, const std::string& name) const;
  void Insert(const CommandPtr& command);
  void Remove(const CommandPtr& command);
  void AdoptUnit(const std::shared_ptr<Callbacks>& callbacks) const;
  // Drops the unit's sub-commands from `command`; true when nothing remains.
  bool StripUnit(SlashCommand& command, const std::string& unit) const;

  // Everything UnloadUnit() and LoadUnit() may change.
  struct SavedState {
    std::map<Snowflake, ScopeTable> scopes;
    absl::flat_hash_map<Snowflake, CommandPtr> by_id;
    std::map<std::string, CommandUnit> units;
    std::vector<std::pair<CommandPtr, CommandNode>> nodes;
    std::vector<std::pair<std::shared_ptr<Callbacks>, Callbacks>> callbacks;
    std::vector<CommandPtr> enabled;
  };
  SavedState Save() const;
  void Restore(SavedState saved);

  std::map<Snowflake, ScopeTable> scopes_;
  absl::flat_hash_map<Snowflake, CommandPtr> by_id_;
  std::map<std::string, CommandUnit> units_;
  // Set while a unit's setup runs.
  const CommandUnit* loading_unit_ = nullptr;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_REGISTRY_H_
