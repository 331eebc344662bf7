#ifndef APPCMD_CORE_FAKE_TRANSPORT_H_
#define APPCMD_CORE_FAKE_TRANSPORT_H_

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "core/command_transport.h"
#include "core/snowflake.h"

#include <nlohmann/json.hpp>

namespace appcmd {

// In-memory command service for tests. Records every call and keeps one
// command list per scope, assigning ids the way the service does.
class FakeTransport : public CommandTransport {
 public:
  struct Call {
    std::string method;
    Snowflake scope = kGlobalScope;
    Snowflake command_id = 0;
    nlohmann::json body;
  };

  static constexpr Snowflake kApplicationId = 4242;

  // Replaces the stored list of `scope`. Entries without an id get one.
  void SetRemote(Snowflake scope, nlohmann::json commands) {
    absl::MutexLock lock(&mu_);
    nlohmann::json stored = nlohmann::json::array();
    for (auto& command : commands) stored.push_back(Stamp(scope, std::move(command), 0));
    remote_[scope] = std::move(stored);
  }

  nlohmann::json Remote(Snowflake scope) const {
    absl::MutexLock lock(&mu_);
    auto it = remote_.find(scope);
    return it == remote_.end() ? nlohmann::json::array() : it->second;
  }

  // Every call for `scope` fails with `status`.
  void FailScope(Snowflake scope, absl::Status status) {
    absl::MutexLock lock(&mu_);
    failures_[scope] = std::move(status);
  }

  // Create, edit and bulk overwrite calls for `scope` fail with `status`.
  void FailWrites(Snowflake scope, absl::Status status) {
    absl::MutexLock lock(&mu_);
    write_failures_[scope] = std::move(status);
  }

  // Calls for `scope` take `delay` unless cancelled first.
  void SetDelay(Snowflake scope, absl::Duration delay) {
    absl::MutexLock lock(&mu_);
    delays_[scope] = delay;
  }

  std::vector<Call> calls() const {
    absl::MutexLock lock(&mu_);
    return calls_;
  }

  std::vector<Call> CallsTo(const std::string& method) const {
    std::vector<Call> out;
    for (auto& call : calls()) {
      if (call.method == method) out.push_back(std::move(call));
    }
    return out;
  }

  size_t write_count() const {
    size_t writes = 0;
    for (const auto& call : calls()) {
      if (call.method != "fetch") ++writes;
    }
    return writes;
  }

  void ClearCalls() {
    absl::MutexLock lock(&mu_);
    calls_.clear();
  }

  absl::StatusOr<nlohmann::json> FetchCommands(Snowflake scope,
                                               std::shared_ptr<CancellationRequest> cancellation) override {
    if (auto status = Begin({"fetch", scope, 0, nullptr}, cancellation, false); !status.ok()) return status;
    return Remote(scope);
  }

  absl::StatusOr<nlohmann::json> CreateCommand(Snowflake scope, const nlohmann::json& command,
                                               std::shared_ptr<CancellationRequest> cancellation) override {
    if (auto status = Begin({"create", scope, 0, command}, cancellation, true); !status.ok()) return status;
    absl::MutexLock lock(&mu_);
    nlohmann::json& list = List(scope);
    nlohmann::json created = Stamp(scope, command, 0);
    for (auto& existing : list) {
      if (SameCommand(existing, command)) {
        created["id"] = existing["id"];
        existing = created;
        return created;
      }
    }
    list.push_back(created);
    return created;
  }

  absl::StatusOr<nlohmann::json> EditCommand(Snowflake scope, Snowflake command_id, const nlohmann::json& command,
                                             std::shared_ptr<CancellationRequest> cancellation) override {
    if (auto status = Begin({"edit", scope, command_id, command}, cancellation, true); !status.ok()) return status;
    absl::MutexLock lock(&mu_);
    for (auto& existing : List(scope)) {
      if (existing.value("id", "") != FormatSnowflake(command_id)) continue;
      existing = Stamp(scope, command, command_id);
      return existing;
    }
    return absl::NotFoundError(absl::StrCat("Unknown application command ", command_id));
  }

  absl::StatusOr<nlohmann::json> BulkOverwriteCommands(Snowflake scope, const nlohmann::json& commands,
                                                       std::shared_ptr<CancellationRequest> cancellation) override {
    if (auto status = Begin({"bulk", scope, 0, commands}, cancellation, true); !status.ok()) return status;
    absl::MutexLock lock(&mu_);
    nlohmann::json& list = List(scope);
    nlohmann::json replaced = nlohmann::json::array();
    for (const auto& command : commands) {
      Snowflake id = 0;
      for (const auto& existing : list) {
        if (SameCommand(existing, command)) id = SnowflakeOrZero(existing, "id");
      }
      replaced.push_back(Stamp(scope, command, id));
    }
    list = replaced;
    return replaced;
  }

 private:
  static bool SameCommand(const nlohmann::json& a, const nlohmann::json& b) {
    return a.value("type", 1) == b.value("type", 1) && a.value("name", "") == b.value("name", "");
  }

  nlohmann::json& List(Snowflake scope) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    auto it = remote_.find(scope);
    if (it == remote_.end()) it = remote_.emplace(scope, nlohmann::json::array()).first;
    return it->second;
  }

  // Adds the server-side fields. `id` 0 keeps the command's own id or
  // allocates a new one.
  nlohmann::json Stamp(Snowflake scope, nlohmann::json command, Snowflake id) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    if (id == 0) id = SnowflakeOrZero(command, "id");
    if (id == 0) id = (next_id_++) << 22;
    command["id"] = FormatSnowflake(id);
    command["application_id"] = FormatSnowflake(kApplicationId);
    command["version"] = FormatSnowflake(next_id_++);
    if (scope != kGlobalScope) command["guild_id"] = FormatSnowflake(scope);
    return command;
  }

  absl::Status Begin(Call call, const std::shared_ptr<CancellationRequest>& cancellation, bool write) {
    absl::Duration delay = absl::ZeroDuration();
    {
      absl::MutexLock lock(&mu_);
      Snowflake scope = call.scope;
      calls_.push_back(std::move(call));
      if (auto it = failures_.find(scope); it != failures_.end()) return it->second;
      if (write) {
        if (auto it = write_failures_.find(scope); it != write_failures_.end()) return it->second;
      }
      if (auto it = delays_.find(scope); it != delays_.end()) delay = it->second;
    }
    absl::Time until = absl::Now() + delay;
    while (absl::Now() < until) {
      if (cancellation && cancellation->IsCancelled()) return cancellation->status();
      absl::SleepFor(absl::Milliseconds(5));
    }
    return absl::OkStatus();
  }

  mutable absl::Mutex mu_;
  std::map<Snowflake, nlohmann::json> remote_ ABSL_GUARDED_BY(mu_);
  std::map<Snowflake, absl::Status> failures_ ABSL_GUARDED_BY(mu_);
  std::map<Snowflake, absl::Status> write_failures_ ABSL_GUARDED_BY(mu_);
  std::map<Snowflake, absl::Duration> delays_ ABSL_GUARDED_BY(mu_);
  std::vector<Call> calls_ ABSL_GUARDED_BY(mu_);
  Snowflake next_id_ ABSL_GUARDED_BY(mu_) = 1000;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_FAKE_TRANSPORT_H_
