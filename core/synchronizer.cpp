#include "core/synchronizer.h"

#include <algorithm>
#include <set>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "core/status_macros.h"
#include "core/wire_compare.h"

namespace appcmd {

namespace {

using CommandKey = std::pair<int, std::string>;

CommandKey RemoteKey(const nlohmann::json& entry) {
  int type = 1;
  if (entry.contains("type") && entry["type"].is_number_integer()) type = entry["type"].get<int>();
  std::string name;
  if (entry.contains("name") && entry["name"].is_string()) name = entry["name"].get<std::string>();
  return {type, name};
}

std::string ScopeLabel(Snowflake scope) {
  if (scope == kGlobalScope) return "global scope";
  return absl::StrCat("guild ", scope);
}

bool IsSkippable(Snowflake scope, const absl::Status& status) {
  if (scope == kGlobalScope) return false;
  return absl::IsPermissionDenied(status) || absl::IsDeadlineExceeded(status);
}

}  // namespace

absl::string_view SyncStrategyName(SyncStrategy strategy) {
  switch (strategy) {
    case SyncStrategy::kNone:
      return "none";
    case SyncStrategy::kCreate:
      return "create";
    case SyncStrategy::kEdit:
      return "edit";
    case SyncStrategy::kBulkOverwrite:
      return "bulk_overwrite";
    case SyncStrategy::kCollect:
      return "collect";
  }
  return "unknown";
}

ScopePlan StageScope(const std::vector<LocalCommand>& local, const nlohmann::json& remote, bool global_scope) {
  ScopePlan plan;
  std::map<CommandKey, const LocalCommand*> by_key;
  for (const auto& command : local) by_key[{static_cast<int>(command.kind), command.name}] = &command;

  std::set<CommandKey> matched;
  if (remote.is_array()) {
    for (const auto& entry : remote) {
      if (!entry.is_object()) continue;
      CommandKey key = RemoteKey(entry);
      auto it = by_key.find(key);
      if (it == by_key.end()) {
        plan.removal_candidates.push_back(entry);
        continue;
      }
      if (!matched.insert(key).second) continue;
      if (CommandWireEquals(it->second->wire, entry, global_scope)) {
        plan.carry_over.push_back(entry);
      } else {
        nlohmann::json wire = it->second->wire;
        wire["id"] = entry.contains("id") ? entry["id"] : nlohmann::json();
        plan.updates.push_back(std::move(wire));
      }
    }
  }
  for (const auto& command : local) {
    if (matched.count({static_cast<int>(command.kind), command.name}) == 0) plan.new_commands.push_back(command.wire);
  }
  return plan;
}

SyncStrategy ChooseStrategy(const ScopePlan& plan, bool delete_not_existing_commands) {
  size_t changes = plan.new_commands.size() + plan.updates.size();
  bool removals = !plan.removal_candidates.empty();
  // Without deletion, leftover remote commands alone are no reason to write.
  if (changes == 0 && (!removals || !delete_not_existing_commands)) return SyncStrategy::kNone;
  if (changes == 1 && !removals) return plan.new_commands.empty() ? SyncStrategy::kEdit : SyncStrategy::kCreate;
  return SyncStrategy::kBulkOverwrite;
}

nlohmann::json BulkPayload(const ScopePlan& plan, bool delete_not_existing_commands) {
  nlohmann::json payload = nlohmann::json::array();
  for (const auto& command : plan.new_commands) payload.push_back(command);
  for (const auto& command : plan.updates) payload.push_back(command);
  for (const auto& command : plan.carry_over) payload.push_back(command);
  if (!delete_not_existing_commands) {
    for (const auto& command : plan.removal_candidates) payload.push_back(command);
  }
  return payload;
}

const ScopeReport* SyncReport::Find(Snowflake scope) const {
  for (const auto& report : scopes) {
    if (report.scope == scope) return &report;
  }
  return nullptr;
}

size_t SyncReport::write_calls() const {
  size_t calls = 0;
  for (const auto& report : scopes) {
    if (!report.status.ok()) continue;
    if (report.strategy == SyncStrategy::kCreate || report.strategy == SyncStrategy::kEdit ||
        report.strategy == SyncStrategy::kBulkOverwrite) {
      ++calls;
    }
  }
  return calls;
}

size_t SyncReport::skipped() const {
  return std::count_if(scopes.begin(), scopes.end(), [](const ScopeReport& report) { return report.skipped; });
}

// Per-scope input and output of one pass. Workers only touch their own
// ScopeWork; the Registry is read and bound on the calling thread.
struct Synchronizer::ScopeWork {
  Snowflake scope = kGlobalScope;
  std::vector<LocalCommand> local;
  // Remote state after the pass.
  nlohmann::json remote;
  ScopeReport report;
};

absl::StatusOr<std::unique_ptr<Synchronizer>> Synchronizer::Create(Registry* registry, CommandTransport* transport,
                                                                   SyncOptions options) {
  if (registry == nullptr) return absl::InvalidArgumentError("Registry must not be null");
  if (transport == nullptr) return absl::InvalidArgumentError("CommandTransport must not be null");
  if (options.guild_timeout <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("guild_timeout must be positive");
  }
  if (options.max_parallel_guilds < 1) return absl::InvalidArgumentError("max_parallel_guilds must be at least 1");
  return std::unique_ptr<Synchronizer>(new Synchronizer(registry, transport, std::move(options)));
}

Synchronizer::Synchronizer(Registry* registry, CommandTransport* transport, SyncOptions options)
    : registry_(registry), transport_(transport), options_(std::move(options)) {
  runner_ = std::make_unique<ScopeTaskRunner>(options_.concurrent_guilds ? options_.max_parallel_guilds : 1);
}

absl::Status Synchronizer::Run(std::shared_ptr<CancellationRequest> cancellation) {
  if (options_.sync_commands) return Synchronize(std::move(cancellation));
  return Collect(std::move(cancellation));
}

absl::Status Synchronizer::Synchronize(std::shared_ptr<CancellationRequest> cancellation) {
  return RunPass(true, std::move(cancellation));
}

absl::Status Synchronizer::Collect(std::shared_ptr<CancellationRequest> cancellation) {
  return RunPass(false, std::move(cancellation));
}

std::vector<Snowflake> Synchronizer::GuildScopesToVisit() const {
  std::set<Snowflake> guilds = registry_->GuildScopes();
  for (Snowflake guild : options_.known_guild_ids) guilds.insert(guild);
  for (const auto& [scope, remote] : last_remote_) guilds.insert(scope);
  guilds.erase(kGlobalScope);
  return {guilds.begin(), guilds.end()};
}

std::shared_ptr<Synchronizer::ScopeWork> Synchronizer::Snapshot(Snowflake scope) const {
  auto work = std::make_shared<ScopeWork>();
  work->scope = scope;
  work->report.scope = scope;
  for (const auto& command : registry_->Commands(scope)) {
    work->local.push_back({command->kind(), command->name(), command->ToWire(scope)});
  }
  return work;
}

absl::Status Synchronizer::RunPass(bool write, std::shared_ptr<CancellationRequest> cancellation) {
  LOG(INFO) << (write ? "Checking for changes..." : "Collecting registered commands...");
  SyncReport report;
  absl::Status first_error;

  auto make_task = [this, write](const std::shared_ptr<ScopeWork>& work) {
    return ScopeTaskRunner::Task{work->scope,
                                 [this, write, work](const std::shared_ptr<CancellationRequest>& task_cancellation) {
                                   return ProcessScope(write, *work, task_cancellation);
                                 }};
  };

  // The global set goes first and has no time limit.
  std::shared_ptr<ScopeWork> global = Snapshot(kGlobalScope);
  std::vector<ScopeTaskRunner::Task> tasks;
  tasks.push_back(make_task(global));
  std::vector<ScopeTaskRunner::Result> results = runner_->Run(std::move(tasks), absl::InfiniteDuration(), cancellation);
  RecordResult(results.front(), *global, &report, &first_error);

  std::vector<std::shared_ptr<ScopeWork>> guilds;
  tasks.clear();
  for (Snowflake guild : GuildScopesToVisit()) {
    guilds.push_back(Snapshot(guild));
    tasks.push_back(make_task(guilds.back()));
  }
  results = runner_->Run(std::move(tasks), options_.guild_timeout, cancellation);
  for (size_t i = 0; i < results.size(); ++i) RecordResult(results[i], *guilds[i], &report, &first_error);

  last_report_ = std::move(report);
  LOG(INFO) << (write ? "Synced " : "Collected ") << last_report_.scopes.size() << " scope(s): "
            << last_report_.write_calls() << " write call(s), " << last_report_.skipped() << " skipped";
  return first_error;
}

void Synchronizer::RecordResult(const ScopeTaskRunner::Result& result, const ScopeWork& work, SyncReport* report,
                                absl::Status* first_error) {
  if (result.status.ok()) {
    BindScope(work.scope, work.remote);
    report->scopes.push_back(work.report);
    return;
  }

  // A scope that failed or timed out may still be running; only its status
  // is safe to read.
  ScopeReport failed;
  failed.scope = work.scope;
  failed.status = result.status;
  if (IsSkippable(work.scope, result.status)) {
    failed.skipped = true;
    LOG(WARNING) << "Missing access to " << ScopeLabel(work.scope) << ", skipping: " << result.status.message();
  } else {
    LOG(ERROR) << "Failed to synchronize " << ScopeLabel(work.scope) << ": " << result.status;
    if (first_error->ok()) *first_error = result.status;
  }
  report->scopes.push_back(std::move(failed));
}

absl::Status Synchronizer::ProcessScope(bool write, ScopeWork& work,
                                        const std::shared_ptr<CancellationRequest>& cancellation) const {
  const std::string label = ScopeLabel(work.scope);
  ASSIGN_OR_RETURN(nlohmann::json remote, transport_->FetchCommands(work.scope, cancellation));
  if (!remote.is_array()) return absl::DataLossError(absl::StrCat("Commands of ", label, " are not an array"));

  ScopeReport& report = work.report;
  if (!write) {
    report.strategy = SyncStrategy::kCollect;
    report.registered = remote.size();
    VLOG(1) << "Collected " << remote.size() << " command(s) from " << label;
    work.remote = std::move(remote);
    return absl::OkStatus();
  }

  ScopePlan plan = StageScope(work.local, remote, work.scope == kGlobalScope);
  report.new_commands = plan.new_commands.size();
  report.updates = plan.updates.size();
  report.unchanged = plan.carry_over.size();
  report.removal_candidates = plan.removal_candidates.size();
  report.strategy = ChooseStrategy(plan, options_.delete_not_existing_commands);

  switch (report.strategy) {
    case SyncStrategy::kNone:
    case SyncStrategy::kCollect:
      LOG(INFO) << "No changes found in " << label;
      report.registered = remote.size();
      work.remote = std::move(remote);
      return absl::OkStatus();
    case SyncStrategy::kCreate: {
      const nlohmann::json& command = plan.new_commands.front();
      LOG(INFO) << "Creating command '" << command.value("name", "") << "' in " << label;
      RETURN_IF_ERROR_WITH_CONTEXT(transport_->CreateCommand(work.scope, command, cancellation).status(),
                                   absl::StrCat("Creating a command in ", label));
      break;
    }
    case SyncStrategy::kEdit: {
      nlohmann::json command = plan.updates.front();
      Snowflake id = SnowflakeOrZero(command, "id");
      command.erase("id");
      LOG(INFO) << "Editing command '" << command.value("name", "") << "' (" << id << ") in " << label;
      RETURN_IF_ERROR_WITH_CONTEXT(transport_->EditCommand(work.scope, id, command, cancellation).status(),
                                   absl::StrCat("Editing command ", id, " in ", label));
      break;
    }
    case SyncStrategy::kBulkOverwrite: {
      nlohmann::json payload = BulkPayload(plan, options_.delete_not_existing_commands);
      if (!plan.removal_candidates.empty()) {
        if (options_.delete_not_existing_commands) {
          LOG(INFO) << "Removing " << plan.removal_candidates.size() << " command(s) from " << label;
        } else {
          LOG(INFO) << "Keeping " << plan.removal_candidates.size() << " command(s) without local definition in "
                    << label;
        }
      }
      LOG(INFO) << "Overwriting " << payload.size() << " command(s) in " << label << " ("
                << plan.new_commands.size() << " new, " << plan.updates.size() << " updated, "
                << plan.carry_over.size() << " unchanged)";
      RETURN_IF_ERROR_WITH_CONTEXT(transport_->BulkOverwriteCommands(work.scope, payload, cancellation).status(),
                                   absl::StrCat("Overwriting the commands of ", label));
      break;
    }
  }

  // The write responses are not trusted for binding; the listing is.
  ASSIGN_OR_RETURN(work.remote, transport_->FetchCommands(work.scope, cancellation));
  if (!work.remote.is_array()) return absl::DataLossError(absl::StrCat("Commands of ", label, " are not an array"));
  report.registered = work.remote.size();
  return absl::OkStatus();
}

void Synchronizer::BindScope(Snowflake scope, const nlohmann::json& remote) {
  std::set<CommandKey> present;
  if (remote.is_array()) {
    for (const auto& entry : remote) {
      if (!entry.is_object()) continue;
      CommandKey key = RemoteKey(entry);
      present.insert(key);
      absl::StatusOr<CommandKind> kind = CommandKindFromInt(key.first);
      if (!kind.ok()) {
        VLOG(1) << "Ignoring command '" << key.second << "' of unknown type " << key.first;
        continue;
      }
      if (Registry::CommandPtr local = registry_->Find(scope, *kind, key.second)) {
        registry_->Bind(local, scope, entry);
        continue;
      }
      // Commands unloaded earlier keep their entry in the id index.
      Registry::CommandPtr known = registry_->FindById(SnowflakeOrZero(entry, "id"));
      if (known != nullptr && known->name() == key.second) {
        known->Bind(scope, entry);
        continue;
      }
      absl::StatusOr<std::shared_ptr<ApplicationCommand>> remote_only = ApplicationCommand::RemoteOnly(entry, scope);
      if (!remote_only.ok()) {
        LOG(WARNING) << "Cannot index command '" << key.second << "' of " << ScopeLabel(scope) << ": "
                     << remote_only.status();
        continue;
      }
      registry_->IndexRemoteOnly(*remote_only);
    }
  }
  for (const auto& command : registry_->Commands(scope)) {
    if (present.count({static_cast<int>(command->kind()), command->name()}) == 0) command->Unbind(scope);
  }
  last_remote_[scope] = remote;
}

absl::Status Synchronizer::ReloadUnit(const std::string& name) {
  absl::Status status = registry_->ReloadUnit(name);
  if (status.ok()) return OnUnitReloaded();
  if (registry_->HasUnit(name)) {
    // The previous commands are back; bind them again without syncing.
    LOG(WARNING) << "Reload of unit '" << name << "' failed, keeping the registered commands: " << status;
    RebindCached();
  }
  return status;
}

void Synchronizer::RebindCached() {
  // BindScope() writes last_remote_.
  std::map<Snowflake, nlohmann::json> cached = last_remote_;
  for (const auto& [scope, remote] : cached) BindScope(scope, remote);
}

absl::Status Synchronizer::OnUnitReloaded() {
  if (options_.sync_commands_on_reload) return Synchronize();

  size_t removed = 0;
  for (const auto& [scope, remote] : last_remote_) {
    if (!remote.is_array()) continue;
    for (const auto& entry : remote) {
      if (!entry.is_object()) continue;
      CommandKey key = RemoteKey(entry);
      absl::StatusOr<CommandKind> kind = CommandKindFromInt(key.first);
      if (!kind.ok() || registry_->Find(scope, *kind, key.second) != nullptr) continue;
      ++removed;
      LOG(WARNING) << "Command '" << key.second << "' was removed from code but is still registered in "
                   << ScopeLabel(scope);
    }
  }
  RebindCached();

  size_t unregistered = 0;
  std::set<Snowflake> scopes = registry_->GuildScopes();
  scopes.insert(kGlobalScope);
  for (Snowflake scope : scopes) {
    for (const auto& command : registry_->Commands(scope)) {
      if (command->id(scope) != 0) continue;
      ++unregistered;
      LOG(WARNING) << "Command '" << command->name() << "' is not registered in " << ScopeLabel(scope);
    }
  }

  if (removed > 0) {
    LOG(WARNING) << removed << " command(s) were removed from code but are still registered. "
                 << "Enable sync_commands_on_reload to remove them.";
  }
  if (unregistered > 0) {
    LOG(WARNING) << unregistered << " command(s) are not registered yet. "
                 << "Enable sync_commands_on_reload to register them.";
  }
  return absl::OkStatus();
}

}  // namespace appcmd
