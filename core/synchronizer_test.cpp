#include "core/synchronizer.h"

#include <set>
#include <string>
#include <vector>

#include "absl/time/clock.h"
#include "gtest/gtest.h"

#include "core/fake_transport.h"
#include "core/status_macros.h"

namespace appcmd {
namespace {

constexpr Snowflake kGuildA = 111;
constexpr Snowflake kGuildB = 222;
constexpr Snowflake kGuildC = 333;

CommandHandler Noop() {
  return [](Interaction&, const Arguments&) { return absl::OkStatus(); };
}

void AddCommand(Registry& registry, const std::string& name, const std::string& description = "Test command",
                std::vector<Snowflake> guild_ids = {}) {
  SlashCommandSpec spec;
  spec.name = name;
  spec.description = description;
  spec.guild_ids = std::move(guild_ids);
  ASSERT_TRUE(registry.RegisterSlashCommand(std::move(spec), Noop()).ok());
}

nlohmann::json WireOf(const Registry& registry, const std::string& name, Snowflake scope = kGlobalScope) {
  return registry.Find(scope, CommandKind::kChatInput, name)->ToWire(scope);
}

std::set<std::string> NamesIn(const nlohmann::json& commands) {
  std::set<std::string> names;
  for (const auto& command : commands) names.insert(command.value("name", ""));
  return names;
}

std::unique_ptr<Synchronizer> MakeSynchronizer(Registry* registry, FakeTransport* transport,
                                               SyncOptions options = {}) {
  auto synchronizer_or = Synchronizer::Create(registry, transport, std::move(options));
  EXPECT_TRUE(synchronizer_or.ok()) << synchronizer_or.status();
  return std::move(*synchronizer_or);
}

TEST(ChooseStrategyTest, NothingToDo) {
  ScopePlan plan;
  plan.carry_over.push_back({{"name", "a"}});
  EXPECT_EQ(ChooseStrategy(plan, true), SyncStrategy::kNone);
}

TEST(ChooseStrategyTest, SingleChanges) {
  ScopePlan create;
  create.new_commands.push_back({{"name", "a"}});
  EXPECT_EQ(ChooseStrategy(create, true), SyncStrategy::kCreate);

  ScopePlan edit;
  edit.updates.push_back({{"name", "a"}, {"id", "1"}});
  edit.carry_over.push_back({{"name", "b"}});
  EXPECT_EQ(ChooseStrategy(edit, true), SyncStrategy::kEdit);
}

TEST(ChooseStrategyTest, RemovalsForceBulk) {
  ScopePlan plan;
  plan.new_commands.push_back({{"name", "a"}});
  plan.removal_candidates.push_back({{"name", "c"}});
  EXPECT_EQ(ChooseStrategy(plan, true), SyncStrategy::kBulkOverwrite);
  EXPECT_EQ(ChooseStrategy(plan, false), SyncStrategy::kBulkOverwrite);

  ScopePlan removals_only;
  removals_only.removal_candidates.push_back({{"name", "c"}});
  EXPECT_EQ(ChooseStrategy(removals_only, true), SyncStrategy::kBulkOverwrite);
  EXPECT_EQ(ChooseStrategy(removals_only, false), SyncStrategy::kNone);
}

TEST(ChooseStrategyTest, SeveralChangesUseBulk) {
  ScopePlan plan;
  plan.new_commands.push_back({{"name", "a"}});
  plan.updates.push_back({{"name", "b"}, {"id", "1"}});
  EXPECT_EQ(ChooseStrategy(plan, true), SyncStrategy::kBulkOverwrite);
}

TEST(StageScopeTest, StagesUpdateNewAndRemoval) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b");
  nlohmann::json changed_a = WireOf(registry, "a");
  changed_a["description"] = "Outdated";
  changed_a["id"] = "100";
  nlohmann::json remote = nlohmann::json::array(
      {changed_a, {{"id", "200"}, {"type", 1}, {"name", "c"}, {"description", "Gone"}}});

  std::vector<LocalCommand> local = {
      {CommandKind::kChatInput, "a", WireOf(registry, "a")},
      {CommandKind::kChatInput, "b", WireOf(registry, "b")},
  };
  ScopePlan plan = StageScope(local, remote, true);
  ASSERT_EQ(plan.updates.size(), 1);
  EXPECT_EQ(plan.updates[0]["name"], "a");
  EXPECT_EQ(plan.updates[0]["id"], "100");
  EXPECT_EQ(plan.updates[0]["description"], "Test command");
  ASSERT_EQ(plan.new_commands.size(), 1);
  EXPECT_EQ(plan.new_commands[0]["name"], "b");
  ASSERT_EQ(plan.removal_candidates.size(), 1);
  EXPECT_EQ(plan.removal_candidates[0]["name"], "c");
  EXPECT_TRUE(plan.carry_over.empty());
}

TEST(StageScopeTest, SameNameDifferentKindIsNotAMatch) {
  std::vector<LocalCommand> local = {{CommandKind::kUser, "a", {{"type", 2}, {"name", "a"}, {"description", ""}}}};
  nlohmann::json remote = nlohmann::json::array({{{"id", "1"}, {"type", 1}, {"name", "a"}, {"description", "x"}}});
  ScopePlan plan = StageScope(local, remote, true);
  EXPECT_EQ(plan.new_commands.size(), 1);
  EXPECT_EQ(plan.removal_candidates.size(), 1);
}

TEST(BulkPayloadTest, RemovalCandidatesOnlyWithoutDeletion) {
  ScopePlan plan;
  plan.new_commands.push_back({{"name", "b"}});
  plan.updates.push_back({{"name", "a"}});
  plan.carry_over.push_back({{"name", "d"}});
  plan.removal_candidates.push_back({{"name", "c"}});
  EXPECT_EQ(NamesIn(BulkPayload(plan, true)), (std::set<std::string>{"a", "b", "d"}));
  EXPECT_EQ(NamesIn(BulkPayload(plan, false)), (std::set<std::string>{"a", "b", "c", "d"}));
}

TEST(SynchronizerTest, CreateRejectsNullArguments) {
  Registry registry;
  FakeTransport transport;
  EXPECT_EQ(Synchronizer::Create(nullptr, &transport, {}).status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(Synchronizer::Create(&registry, nullptr, {}).status().code(), absl::StatusCode::kInvalidArgument);
  SyncOptions options;
  options.guild_timeout = absl::ZeroDuration();
  EXPECT_EQ(Synchronizer::Create(&registry, &transport, options).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(SynchronizerTest, FirstSyncRegistersEverythingAndBindsIds) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b");
  FakeTransport transport;
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Synchronize().ok());

  auto bulk = transport.CallsTo("bulk");
  ASSERT_EQ(bulk.size(), 1);
  EXPECT_EQ(NamesIn(bulk[0].body), (std::set<std::string>{"a", "b"}));

  for (const char* name : {"a", "b"}) {
    auto command = registry.Find(kGlobalScope, CommandKind::kChatInput, name);
    Snowflake id = command->id(kGlobalScope);
    ASSERT_NE(id, 0) << name;
    EXPECT_EQ(registry.FindById(id), command);
    const RemoteBinding* binding = command->binding(kGlobalScope);
    EXPECT_EQ(binding->application_id, FakeTransport::kApplicationId);
    EXPECT_EQ(binding->created_at, SnowflakeTime(id));
  }
}

TEST(SynchronizerTest, SingleNewCommandIsCreated) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b");
  FakeTransport transport;
  transport.SetRemote(kGlobalScope, nlohmann::json::array({WireOf(registry, "a")}));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Synchronize().ok());

  EXPECT_EQ(transport.write_count(), 1);
  auto created = transport.CallsTo("create");
  ASSERT_EQ(created.size(), 1);
  EXPECT_EQ(created[0].body["name"], "b");
  EXPECT_TRUE(transport.CallsTo("bulk").empty());
  EXPECT_EQ(synchronizer->last_report().Find(kGlobalScope)->strategy, SyncStrategy::kCreate);
}

TEST(SynchronizerTest, SingleChangedCommandIsEdited) {
  Registry registry;
  AddCommand(registry, "a", "New text");
  FakeTransport transport;
  nlohmann::json stale = WireOf(registry, "a");
  stale["description"] = "Old text";
  transport.SetRemote(kGlobalScope, nlohmann::json::array({stale}));
  Snowflake remote_id = SnowflakeOrZero(transport.Remote(kGlobalScope)[0], "id");
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Synchronize().ok());

  auto edits = transport.CallsTo("edit");
  ASSERT_EQ(edits.size(), 1);
  EXPECT_EQ(edits[0].command_id, remote_id);
  EXPECT_EQ(edits[0].body["description"], "New text");
  EXPECT_FALSE(edits[0].body.contains("id"));
  EXPECT_EQ(transport.write_count(), 1);
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "a")->id(kGlobalScope), remote_id);
}

TEST(SynchronizerTest, UpdateNewAndRemovalGoInOneBulkOverwrite) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b");
  FakeTransport transport;
  nlohmann::json changed_a = WireOf(registry, "a");
  changed_a["description"] = "Different";
  transport.SetRemote(kGlobalScope,
                      nlohmann::json::array({changed_a, {{"type", 1}, {"name", "c"}, {"description", "Stale"}}}));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Synchronize().ok());

  EXPECT_EQ(transport.write_count(), 1);
  auto bulk = transport.CallsTo("bulk");
  ASSERT_EQ(bulk.size(), 1);
  EXPECT_EQ(NamesIn(bulk[0].body), (std::set<std::string>{"a", "b"}));
  EXPECT_EQ(NamesIn(transport.Remote(kGlobalScope)), (std::set<std::string>{"a", "b"}));

  const ScopeReport* report = synchronizer->last_report().Find(kGlobalScope);
  ASSERT_NE(report, nullptr);
  EXPECT_EQ(report->updates, 1);
  EXPECT_EQ(report->new_commands, 1);
  EXPECT_EQ(report->removal_candidates, 1);
  EXPECT_EQ(report->registered, 2);
}

TEST(SynchronizerTest, DisabledDeletionSendsRemovalCandidatesBack) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b");
  FakeTransport transport;
  transport.SetRemote(kGlobalScope, nlohmann::json::array({{{"type", 1}, {"name", "c"}, {"description", "Kept"}}}));
  SyncOptions options;
  options.delete_not_existing_commands = false;
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);

  ASSERT_TRUE(synchronizer->Synchronize().ok());

  auto bulk = transport.CallsTo("bulk");
  ASSERT_EQ(bulk.size(), 1);
  EXPECT_EQ(NamesIn(bulk[0].body), (std::set<std::string>{"a", "b", "c"}));
}

TEST(SynchronizerTest, RemovalsAloneAreLeftAloneWithoutDeletion) {
  Registry registry;
  AddCommand(registry, "a");
  FakeTransport transport;
  transport.SetRemote(kGlobalScope,
                      nlohmann::json::array({WireOf(registry, "a"), {{"type", 1}, {"name", "c"}, {"description", "x"}}}));
  SyncOptions options;
  options.delete_not_existing_commands = false;
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);

  ASSERT_TRUE(synchronizer->Synchronize().ok());
  EXPECT_EQ(transport.write_count(), 0);
}

TEST(SynchronizerTest, SecondPassWritesNothing) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b", "Guild only", {kGuildA});
  FakeTransport transport;
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Synchronize().ok());
  EXPECT_GT(transport.write_count(), 0);
  transport.ClearCalls();

  ASSERT_TRUE(synchronizer->Synchronize().ok());
  EXPECT_EQ(transport.write_count(), 0);
  EXPECT_EQ(synchronizer->last_report().write_calls(), 0);
}

TEST(SynchronizerTest, ServiceDefaultsCountAsUnchanged) {
  Registry registry;
  Option::Params text;
  text.type = OptionType::kString;
  text.name = "text";
  text.description = "Some text";
  text.required = false;
  SlashCommandSpec spec;
  spec.name = "echo";
  spec.description = "Echo";
  spec.options.push_back(*Option::Create(text));
  ASSERT_TRUE(registry.RegisterSlashCommand(std::move(spec), Noop()).ok());

  // What the service sends back: no `required: false`, no localization maps,
  // no nsfw flag.
  nlohmann::json remote = {
      {"type", 1},
      {"name", "echo"},
      {"description", "Echo"},
      {"default_member_permissions", nullptr},
      {"dm_permission", true},
      {"options", {{{"type", 3}, {"name", "text"}, {"description", "Some text"}}}},
  };
  FakeTransport transport;
  transport.SetRemote(kGlobalScope, nlohmann::json::array({remote}));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Synchronize().ok());
  EXPECT_EQ(transport.write_count(), 0);
  EXPECT_NE(registry.Find(kGlobalScope, CommandKind::kChatInput, "echo")->id(kGlobalScope), 0);
}

TEST(SynchronizerTest, GuildWithoutAccessIsSkipped) {
  Registry registry;
  AddCommand(registry, "a", "Guild command", {kGuildA, kGuildB});
  FakeTransport transport;
  transport.FailScope(kGuildA, absl::PermissionDeniedError("Missing Access"));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  EXPECT_TRUE(synchronizer->Synchronize().ok());

  const SyncReport& report = synchronizer->last_report();
  EXPECT_EQ(report.skipped(), 1);
  EXPECT_TRUE(report.Find(kGuildA)->skipped);
  EXPECT_FALSE(report.Find(kGuildB)->skipped);
  EXPECT_EQ(NamesIn(transport.Remote(kGuildB)), (std::set<std::string>{"a"}));
  auto command = registry.Find(kGuildB, CommandKind::kChatInput, "a");
  EXPECT_NE(command->id(kGuildB), 0);
  EXPECT_EQ(command->id(kGuildA), 0);
}

TEST(SynchronizerTest, GuildTimeoutIsSkipped) {
  Registry registry;
  AddCommand(registry, "a", "Guild command", {kGuildA, kGuildB});
  FakeTransport transport;
  transport.SetDelay(kGuildA, absl::Seconds(5));
  SyncOptions options;
  options.guild_timeout = absl::Milliseconds(100);
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);

  absl::Time start = absl::Now();
  EXPECT_TRUE(synchronizer->Synchronize().ok());
  EXPECT_LT(absl::Now() - start, absl::Seconds(3));

  const ScopeReport* slow = synchronizer->last_report().Find(kGuildA);
  ASSERT_NE(slow, nullptr);
  EXPECT_TRUE(slow->skipped);
  EXPECT_EQ(slow->status.code(), absl::StatusCode::kDeadlineExceeded);
  EXPECT_EQ(NamesIn(transport.Remote(kGuildB)), (std::set<std::string>{"a"}));
}

TEST(SynchronizerTest, TransportErrorIsReturnedAfterOtherScopes) {
  Registry registry;
  AddCommand(registry, "a", "Guild command", {kGuildA, kGuildB});
  FakeTransport transport;
  transport.FailWrites(kGuildA, absl::UnavailableError("Service down"));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  absl::Status status = synchronizer->Synchronize();
  EXPECT_EQ(status.code(), absl::StatusCode::kUnavailable);
  EXPECT_FALSE(synchronizer->last_report().Find(kGuildA)->skipped);
  EXPECT_EQ(NamesIn(transport.Remote(kGuildB)), (std::set<std::string>{"a"}));
}

TEST(SynchronizerTest, GlobalAccessErrorIsNotSkipped) {
  Registry registry;
  AddCommand(registry, "a");
  FakeTransport transport;
  transport.FailScope(kGlobalScope, absl::PermissionDeniedError("Missing Access"));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  EXPECT_EQ(synchronizer->Synchronize().code(), absl::StatusCode::kPermissionDenied);
  EXPECT_EQ(synchronizer->last_report().skipped(), 0);
}

TEST(SynchronizerTest, ConcurrentGuildsRunInParallel) {
  Registry registry;
  AddCommand(registry, "a", "Guild command", {kGuildA, kGuildB, kGuildC});
  FakeTransport transport;
  for (Snowflake guild : {kGuildA, kGuildB, kGuildC}) transport.SetDelay(guild, absl::Milliseconds(150));
  SyncOptions options;
  options.sync_commands = true;
  options.concurrent_guilds = true;
  options.max_parallel_guilds = 3;
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);

  absl::Time start = absl::Now();
  ASSERT_TRUE(synchronizer->Run().ok());
  // Fetch, create and re-fetch take 450ms per guild; three guilds one after
  // another would need 1350ms.
  EXPECT_LT(absl::Now() - start, absl::Milliseconds(1100));
  for (Snowflake guild : {kGuildA, kGuildB, kGuildC}) {
    EXPECT_EQ(NamesIn(transport.Remote(guild)), (std::set<std::string>{"a"})) << guild;
  }
}

TEST(SynchronizerTest, KnownGuildsAreCleanedUp) {
  Registry registry;
  AddCommand(registry, "a");
  FakeTransport transport;
  transport.SetRemote(kGuildC, nlohmann::json::array({{{"type", 1}, {"name", "old"}, {"description", "Old"}}}));
  SyncOptions options;
  options.known_guild_ids = {kGuildC};
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);

  ASSERT_TRUE(synchronizer->Synchronize().ok());

  // The global scope only needs a create.
  auto bulk = transport.CallsTo("bulk");
  ASSERT_EQ(bulk.size(), 1);
  EXPECT_EQ(bulk[0].scope, kGuildC);
  EXPECT_TRUE(bulk[0].body.empty());
  EXPECT_TRUE(transport.Remote(kGuildC).empty());
}

TEST(SynchronizerTest, CollectBindsWithoutWriting) {
  Registry registry;
  AddCommand(registry, "a");
  AddCommand(registry, "b");
  FakeTransport transport;
  transport.SetRemote(kGlobalScope, nlohmann::json::array({WireOf(registry, "a"), {{"type", 1},
                                                                                   {"name", "legacy"},
                                                                                   {"description", "Old"}}}));
  auto synchronizer = MakeSynchronizer(&registry, &transport);

  ASSERT_TRUE(synchronizer->Run().ok());

  EXPECT_EQ(transport.write_count(), 0);
  EXPECT_EQ(synchronizer->last_report().Find(kGlobalScope)->strategy, SyncStrategy::kCollect);
  EXPECT_NE(registry.Find(kGlobalScope, CommandKind::kChatInput, "a")->id(kGlobalScope), 0);
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "b")->id(kGlobalScope), 0);

  Snowflake legacy_id = SnowflakeOrZero(transport.Remote(kGlobalScope)[1], "id");
  auto legacy = registry.FindById(legacy_id);
  ASSERT_NE(legacy, nullptr);
  EXPECT_EQ(legacy->name(), "legacy");
  EXPECT_TRUE(legacy->disabled());
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "legacy"), nullptr);
}

TEST(SynchronizerTest, ReloadWithoutSyncDisablesVanishedCommands) {
  Registry registry;
  bool with_extra = true;
  CommandUnit unit;
  unit.name = "tools";
  unit.setup = [&with_extra](Registry& r) -> absl::Status {
    SlashCommandSpec keep;
    keep.name = "keep";
    keep.description = "Stays";
    RETURN_IF_ERROR(r.RegisterSlashCommand(std::move(keep), Noop()).status());
    SlashCommandSpec extra;
    extra.name = with_extra ? "extra" : "fresh";
    extra.description = "Changes";
    return r.RegisterSlashCommand(std::move(extra), Noop()).status();
  };
  ASSERT_TRUE(registry.LoadUnit(unit).ok());
  FakeTransport transport;
  auto synchronizer = MakeSynchronizer(&registry, &transport);
  ASSERT_TRUE(synchronizer->Synchronize().ok());
  auto extra = registry.Find(kGlobalScope, CommandKind::kChatInput, "extra");
  Snowflake extra_id = extra->id(kGlobalScope);
  ASSERT_NE(extra_id, 0);
  transport.ClearCalls();

  with_extra = false;
  ASSERT_TRUE(synchronizer->ReloadUnit("tools").ok());

  EXPECT_EQ(transport.write_count(), 0);
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "extra"), nullptr);
  EXPECT_TRUE(extra->disabled());
  EXPECT_EQ(extra->id(kGlobalScope), extra_id);
  EXPECT_EQ(registry.FindById(extra_id), extra);

  auto keep = registry.Find(kGlobalScope, CommandKind::kChatInput, "keep");
  EXPECT_FALSE(keep->disabled());
  EXPECT_NE(keep->id(kGlobalScope), 0);
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "fresh")->id(kGlobalScope), 0);
}

TEST(SynchronizerTest, ReloadWithSyncRegistersChanges) {
  Registry registry;
  std::string name = "first";
  CommandUnit unit;
  unit.name = "tools";
  unit.setup = [&name](Registry& r) {
    SlashCommandSpec spec;
    spec.name = name;
    spec.description = "Reloadable";
    return r.RegisterSlashCommand(std::move(spec), Noop()).status();
  };
  ASSERT_TRUE(registry.LoadUnit(unit).ok());
  FakeTransport transport;
  SyncOptions options;
  options.sync_commands_on_reload = true;
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);
  ASSERT_TRUE(synchronizer->Synchronize().ok());

  name = "second";
  ASSERT_TRUE(synchronizer->ReloadUnit("tools").ok());

  EXPECT_EQ(NamesIn(transport.Remote(kGlobalScope)), (std::set<std::string>{"second"}));
  EXPECT_NE(registry.Find(kGlobalScope, CommandKind::kChatInput, "second")->id(kGlobalScope), 0);
}

TEST(SynchronizerTest, FailedReloadKeepsBoundCommands) {
  Registry registry;
  bool broken = false;
  CommandUnit unit;
  unit.name = "tools";
  unit.setup = [&broken](Registry& r) -> absl::Status {
    SlashCommandSpec spec;
    spec.name = broken ? "renamed" : "stable";
    spec.description = "Reloadable";
    RETURN_IF_ERROR(r.RegisterSlashCommand(std::move(spec), Noop()).status());
    if (broken) return absl::InternalError("setup failed");
    return absl::OkStatus();
  };
  ASSERT_TRUE(registry.LoadUnit(unit).ok());
  FakeTransport transport;
  SyncOptions options;
  options.sync_commands_on_reload = true;
  auto synchronizer = MakeSynchronizer(&registry, &transport, options);
  ASSERT_TRUE(synchronizer->Synchronize().ok());
  auto stable = registry.Find(kGlobalScope, CommandKind::kChatInput, "stable");
  Snowflake stable_id = stable->id(kGlobalScope);
  ASSERT_NE(stable_id, 0);
  transport.ClearCalls();

  broken = true;
  EXPECT_EQ(synchronizer->ReloadUnit("tools").code(), absl::StatusCode::kInternal);

  EXPECT_TRUE(transport.calls().empty());
  EXPECT_TRUE(registry.HasUnit("tools"));
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "stable"), stable);
  EXPECT_FALSE(stable->disabled());
  EXPECT_EQ(stable->id(kGlobalScope), stable_id);
  EXPECT_EQ(registry.Find(kGlobalScope, CommandKind::kChatInput, "renamed"), nullptr);
}

TEST(SynchronizerTest, ReloadOfUnknownUnitFails) {
  Registry registry;
  FakeTransport transport;
  auto synchronizer = MakeSynchronizer(&registry, &transport);
  EXPECT_EQ(synchronizer->ReloadUnit("missing").code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace appcmd
