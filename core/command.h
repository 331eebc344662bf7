#ifndef APPCMD_CORE_COMMAND_H_
#define APPCMD_CORE_COMMAND_H_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

#include "core/arguments.h"
#include "core/error_sink.h"
#include "core/interaction.h"
#include "core/localizations.h"
#include "core/option.h"
#include "core/snowflake.h"

#include <nlohmann/json.hpp>

namespace appcmd {

// Invocation surface of a top-level command.
enum class CommandKind : int {
  kChatInput = 1,
  kUser = 2,
  kMessage = 3,
};

absl::StatusOr<CommandKind> CommandKindFromInt(int value);
absl::string_view CommandKindName(CommandKind kind);

using CommandHandler = std::function<absl::Status(Interaction&, const Arguments&)>;
using AutocompleteHandler =
    std::function<absl::StatusOr<std::vector<OptionChoice>>(Interaction&, const Arguments&)>;
using ErrorHandler = std::function<void(Interaction&, const absl::Status&)>;
// Returning false or an error aborts the invocation.
using Check = std::function<absl::StatusOr<bool>(const Interaction&)>;

// True for the status produced when a check rejects an invocation.
bool IsCheckFailure(const absl::Status& status);

// Handlers of one addressable node. Copies of a node share this block, so
// setters reach every per-guild variant of the same logical command.
struct Callbacks {
  CommandHandler handler;
  AutocompleteHandler autocomplete;
  ErrorHandler on_error;
  std::vector<Check> checks;
  // Owning unit and its checks, empty outside units.
  std::string unit;
  std::vector<Check> unit_checks;
};

/**
 * @brief Shared invocation contract of leaf commands and sub-commands.
 */
class Invocable {
 public:
  void OnError(ErrorHandler handler) { callbacks_->on_error = std::move(handler); }
  void OnAutocomplete(AutocompleteHandler handler) { callbacks_->autocomplete = std::move(handler); }
  void AddCheck(Check check) { callbacks_->checks.push_back(std::move(check)); }
  void ClearHandlers();

  bool has_handler() const { return static_cast<bool>(callbacks_->handler); }
  const std::shared_ptr<Callbacks>& callbacks() const { return callbacks_; }

  /**
   * @brief Runs unit checks, node checks and then the handler.
   * Any failure, including a std::exception escaping a check or the handler,
   * is delivered once to the node's error handler, or to `sink` when the node
   * has none, and returned. Nothing is rethrown.
   */
  absl::Status Invoke(const CommandRef& ref, Interaction& interaction, const Arguments& args,
                      ErrorSink* sink) const;

  // Same checks and error routing as Invoke(). A node without an
  // autocomplete handler yields no choices.
  absl::StatusOr<std::vector<OptionChoice>> InvokeAutocomplete(const CommandRef& ref, Interaction& interaction,
                                                               const Arguments& args, ErrorSink* sink) const;

 protected:
  explicit Invocable(CommandHandler handler);

 private:
  absl::Status RunChecks(const Interaction& interaction) const;
  void ReportError(const CommandRef& ref, Interaction& interaction, const absl::Status& error,
                   ErrorSink* sink) const;

  std::shared_ptr<Callbacks> callbacks_;
};

// Handler parameter name -> declared option name.
using ConnectorMap = std::map<std::string, std::string>;

class SubCommand : public Invocable {
 public:
  struct Params {
    std::string name;
    std::string description;
    Localizations name_localizations;
    Localizations description_localizations;
    std::vector<Option> options;
    ConnectorMap connector;
  };

  static absl::StatusOr<SubCommand> Create(Params params, CommandHandler handler);

  const std::string& name() const { return params_.name; }
  const std::string& description() const { return params_.description; }
  const std::vector<Option>& options() const { return params_.options; }
  const ConnectorMap& connector() const { return params_.connector; }

  nlohmann::json ToJson() const;

 private:
  SubCommand(Params params, CommandHandler handler) : Invocable(std::move(handler)), params_(std::move(params)) {}

  Params params_;
};

class SubCommandGroup {
 public:
  struct Params {
    std::string name;
    std::string description;
    Localizations name_localizations;
    Localizations description_localizations;
  };

  // A group needs at least one sub-command.
  static absl::StatusOr<SubCommandGroup> Create(Params params, std::vector<SubCommand> sub_commands);

  const std::string& name() const { return params_.name; }
  const std::string& description() const { return params_.description; }
  const std::vector<SubCommand>& sub_commands() const { return sub_commands_; }

  const SubCommand* Find(const std::string& name) const;
  // Fails on a duplicate name or when the group is full.
  absl::Status Add(SubCommand sub_command);
  // Replaces the sub-command of the same name, or adds it.
  absl::Status Upsert(SubCommand sub_command);
  bool Remove(const std::string& name);

  absl::Status Update(const Params& params);

  nlohmann::json ToJson() const;

 private:
  explicit SubCommandGroup(Params params) : params_(std::move(params)) {}

  Params params_;
  std::vector<SubCommand> sub_commands_;
};

/**
 * @brief A top-level chat input command.
 *
 * Either a leaf that owns options and a handler, or a container of
 * sub-commands and sub-command-groups that is never invoked itself.
 */
class SlashCommand : public Invocable {
 public:
  struct Params {
    std::string name;
    std::string description;
    Localizations name_localizations;
    Localizations description_localizations;
    std::vector<Option> options;
    ConnectorMap connector;
    // Permission bitmask a member needs by default. Unset means everyone.
    std::optional<uint64_t> default_member_permissions;
    bool allow_dm = true;
    bool nsfw = false;
  };

  using Child = std::variant<SubCommand, SubCommandGroup>;

  static absl::StatusOr<SlashCommand> Create(Params params, CommandHandler handler);
  static absl::StatusOr<SlashCommand> CreateContainer(Params params, std::vector<Child> children);

  const std::string& name() const { return params_.name; }
  const std::string& description() const { return params_.description; }
  const Params& params() const { return params_; }
  const std::vector<Option>& options() const { return params_.options; }
  const ConnectorMap& connector() const { return params_.connector; }
  bool is_container() const { return container_; }
  const std::vector<Child>& children() const { return children_; }

  const SubCommand* FindSubCommand(const std::string& name) const;
  const SubCommandGroup* FindGroup(const std::string& name) const;
  SubCommandGroup* MutableGroup(const std::string& name);

  // Container only. Fails on a duplicate name or when the container is full.
  absl::Status AddChild(Child child);
  // Replaces the sub-command of the same name, or adds it.
  absl::Status UpsertSubCommand(SubCommand sub_command);
  bool RemoveChild(const std::string& name);

  // Re-registration through a path updates the base's metadata.
  absl::Status SetDescription(std::string description);
  void set_allow_dm(bool allow_dm) { params_.allow_dm = allow_dm; }
  void set_nsfw(bool nsfw) { params_.nsfw = nsfw; }
  void set_default_member_permissions(uint64_t permissions) { params_.default_member_permissions = permissions; }
  absl::Status MergeLocalizations(const Localizations& name_localizations,
                                  const Localizations& description_localizations);

  nlohmann::json ToJson(bool global_scope) const;

 private:
  SlashCommand(Params params, CommandHandler handler, bool container)
      : Invocable(std::move(handler)), params_(std::move(params)), container_(container) {}

  Params params_;
  bool container_;
  std::vector<Child> children_;
};

// User and message commands: a name, metadata and one handler.
class ContextCommand : public Invocable {
 public:
  struct Params {
    CommandKind kind = CommandKind::kUser;
    std::string name;
    Localizations name_localizations;
    std::optional<uint64_t> default_member_permissions;
    bool allow_dm = true;
    bool nsfw = false;
  };

  static absl::StatusOr<ContextCommand> Create(Params params, CommandHandler handler);

  CommandKind kind() const { return params_.kind; }
  const std::string& name() const { return params_.name; }
  const Params& params() const { return params_; }

  nlohmann::json ToJson(bool global_scope) const;

 private:
  ContextCommand(Params params, CommandHandler handler) : Invocable(std::move(handler)), params_(std::move(params)) {}

  Params params_;
};

using CommandNode = std::variant<SlashCommand, ContextCommand>;

// What the service told us about a command in one scope.
struct RemoteBinding {
  Snowflake id = 0;
  Snowflake application_id = 0;
  absl::Time created_at = absl::InfinitePast();
  // Permission overwrites, when the service sent them.
  nlohmann::json permissions;
};

/**
 * @brief One logical command and its per-scope remote state.
 *
 * The same value may be registered in several scopes (global or a list of
 * guilds); each scope gets its own RemoteBinding while the handlers are
 * shared.
 */
class ApplicationCommand {
 public:
  ApplicationCommand(CommandNode node, std::set<Snowflake> scopes)
      : node_(std::move(node)), scopes_(std::move(scopes)) {}

  // A disabled, bound entry for a command that only exists on the service.
  static absl::StatusOr<std::shared_ptr<ApplicationCommand>> RemoteOnly(const nlohmann::json& remote,
                                                                        Snowflake scope);

  CommandKind kind() const;
  const std::string& name() const;
  const CommandNode& node() const { return node_; }
  CommandNode& mutable_node() { return node_; }

  const std::set<Snowflake>& scopes() const { return scopes_; }
  void AddScope(Snowflake scope) { scopes_.insert(scope); }
  void RemoveScope(Snowflake scope) { scopes_.erase(scope); }

  // The wire form sent to the service for `scope`.
  nlohmann::json ToWire(Snowflake scope) const;
  // Structural equality of ToWire(scope) and a fetched entry.
  bool Matches(const nlohmann::json& remote, Snowflake scope) const;

  // Records id, application id, creation time and permissions of `remote`.
  void Bind(Snowflake scope, const nlohmann::json& remote);
  void SetBinding(Snowflake scope, RemoteBinding binding) { bindings_[scope] = std::move(binding); }
  void Unbind(Snowflake scope) { bindings_.erase(scope); }
  const RemoteBinding* binding(Snowflake scope) const;
  // 0 while unregistered in `scope`.
  Snowflake id(Snowflake scope) const;
  const std::map<Snowflake, RemoteBinding>& bindings() const { return bindings_; }

  // Soft removal: clears every handler and keeps the bindings.
  void Disable();
  // Only for undoing Disable() once the callbacks have been put back.
  void Enable() { disabled_ = false; }
  bool disabled() const { return disabled_; }

  // Callback blocks of the command and of every sub-command in it.
  std::vector<std::shared_ptr<Callbacks>> AllCallbacks() const;

  // Unit that registered the command. For a container this is the unit that
  // created the base; its sub-commands carry their own.
  const std::string& unit() const;

 private:
  CommandNode node_;
  std::set<Snowflake> scopes_;
  std::map<Snowflake, RemoteBinding> bindings_;
  bool disabled_ = false;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_COMMAND_H_
