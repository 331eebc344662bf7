#ifndef APPCMD_CORE_SYNCHRONIZER_H_
#define APPCMD_CORE_SYNCHRONIZER_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

#include "core/cancellation.h"
#include "core/command.h"
#include "core/command_transport.h"
#include "core/registry.h"
#include "core/scope_task_runner.h"

#include <nlohmann/json.hpp>

namespace appcmd {

struct SyncOptions {
  // When false, the startup pass only collects what the service has and binds
  // ids; nothing is written.
  bool sync_commands = false;
  // Remote commands without a local definition are deleted by the bulk
  // overwrite. When false they are sent back unchanged.
  bool delete_not_existing_commands = true;
  // After a unit reload, run a full synchronization instead of re-binding
  // cached metadata.
  bool sync_commands_on_reload = false;
  bool concurrent_guilds = false;
  int max_parallel_guilds = 4;
  // Per-guild budget for fetch, write and re-fetch. A guild that runs out is
  // skipped like one we lack access to.
  absl::Duration guild_timeout = absl::Seconds(30);
  // Guilds to inspect besides those with local commands, so commands removed
  // from code can be cleaned up there too.
  std::vector<Snowflake> known_guild_ids;
};

// Desired wire form of one local command in one scope.
struct LocalCommand {
  CommandKind kind = CommandKind::kChatInput;
  std::string name;
  nlohmann::json wire;
};

// Outcome of diffing one scope.
struct ScopePlan {
  // Local commands the service does not have.
  std::vector<nlohmann::json> new_commands;
  // Local wire forms carrying the remote id of the entry they replace.
  std::vector<nlohmann::json> updates;
  // Remote entries that already match.
  std::vector<nlohmann::json> carry_over;
  // Remote entries with no local definition.
  std::vector<nlohmann::json> removal_candidates;
};

enum class SyncStrategy {
  kNone,
  kCreate,
  kEdit,
  kBulkOverwrite,
  // Fetch and bind only.
  kCollect,
};

absl::string_view SyncStrategyName(SyncStrategy strategy);

// Diffs `local` against the fetched `remote` array by kind and name.
ScopePlan StageScope(const std::vector<LocalCommand>& local, const nlohmann::json& remote, bool global_scope);

// A single new or single updated command with nothing to remove is sent on
// its own; anything else is a bulk overwrite.
SyncStrategy ChooseStrategy(const ScopePlan& plan, bool delete_not_existing_commands);

// Payload of a bulk overwrite: new, updated and unchanged commands, plus the
// removal candidates when deletion is off.
nlohmann::json BulkPayload(const ScopePlan& plan, bool delete_not_existing_commands);

struct ScopeReport {
  Snowflake scope = kGlobalScope;
  SyncStrategy strategy = SyncStrategy::kNone;
  size_t new_commands = 0;
  size_t updates = 0;
  size_t unchanged = 0;
  size_t removal_candidates = 0;
  // Remote commands after the pass.
  size_t registered = 0;
  // Missing access or timeout; nothing in this scope was touched.
  bool skipped = false;
  absl::Status status;
};

struct SyncReport {
  std::vector<ScopeReport> scopes;

  const ScopeReport* Find(Snowflake scope) const;
  // Create, edit and bulk overwrite calls issued.
  size_t write_calls() const;
  size_t skipped() const;
};

/**
 * @brief Converges the service's command sets with the Registry.
 *
 * Desired state is snapshotted from the Registry on the calling thread, the
 * network work of every scope runs on a ScopeTaskRunner, and the results are
 * bound back onto the Registry on the calling thread. Guild scopes never
 * block each other: a guild we lack access to, or one that exceeds
 * `guild_timeout`, is skipped, and any other error is returned after every
 * scope has been processed.
 */
class Synchronizer {
 public:
  static absl::StatusOr<std::unique_ptr<Synchronizer>> Create(Registry* registry, CommandTransport* transport,
                                                              SyncOptions options);

  // The startup pass: Synchronize() or Collect() depending on `sync_commands`.
  absl::Status Run(std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // fetch -> diff -> write -> re-fetch -> bind, for every scope.
  absl::Status Synchronize(std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // fetch -> bind, for every scope. Remote commands without a local
  // definition are indexed as disabled so invocations of them are reported.
  absl::Status Collect(std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // Reloads a unit in the Registry, then calls OnUnitReloaded(). When the
  // reload fails the restored commands are only re-bound; nothing is synced.
  absl::Status ReloadUnit(const std::string& name);

  // Re-binds commands from the last fetched remote state, or runs a full
  // synchronization when `sync_commands_on_reload` is set.
  absl::Status OnUnitReloaded();

  const SyncReport& last_report() const { return last_report_; }
  const SyncOptions& options() const { return options_; }

 private:
  struct ScopeWork;

  Synchronizer(Registry* registry, CommandTransport* transport, SyncOptions options);

  std::shared_ptr<ScopeWork> Snapshot(Snowflake scope) const;
  void RecordResult(const ScopeTaskRunner::Result& result, const ScopeWork& work, SyncReport* report,
                    absl::Status* first_error);

  std::vector<Snowflake> GuildScopesToVisit() const;
  absl::Status RunPass(bool write, std::shared_ptr<CancellationRequest> cancellation);
  absl::Status ProcessScope(bool write, ScopeWork& work,
                            const std::shared_ptr<CancellationRequest>& cancellation) const;
  void BindScope(Snowflake scope, const nlohmann::json& remote);
  // BindScope() for every scope fetched so far.
  void RebindCached();

  Registry* registry_;
  CommandTransport* transport_;
  SyncOptions options_;
  std::unique_ptr<ScopeTaskRunner> runner_;
  // Last fetched command list per scope.
  std::map<Snowflake, nlohmann::json> last_remote_;
  SyncReport last_report_;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_SYNCHRONIZER_H_
