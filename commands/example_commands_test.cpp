#include "commands/example_commands.h"

#include <string>

#include "gtest/gtest.h"

#include "core/dispatcher.h"
#include "core/error_sink.h"

namespace appcmd {
namespace {

constexpr Snowflake kGuild = 500;

class CountingSink : public ErrorSink {
 public:
  void OnCommandError(const CommandRef&, const Interaction&, const absl::Status&) override { ++count; }
  int count = 0;
};

class ExampleCommandsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    settings_ = std::make_shared<SettingsStore>();
    ASSERT_TRUE(registry_.LoadUnit(ExampleCommandsUnit({}, settings_)).ok());
    auto dispatcher = Dispatcher::Create(&registry_, &sink_);
    ASSERT_TRUE(dispatcher.ok());
    dispatcher_ = std::move(*dispatcher);
  }

  // Dispatches a chat input command in kGuild by a member with
  // `permissions`. Returns the first reply, or "" when there is none.
  std::string Run(const std::string& name, nlohmann::json options, const std::string& permissions = "32",
                  Dispatcher::Result expected = Dispatcher::Result::HANDLED) {
    nlohmann::json payload = {
        {"type", 2},
        {"guild_id", FormatSnowflake(kGuild)},
        {"member", {{"user", {{"id", "5"}, {"username", "alice"}}}, {"permissions", permissions}}},
        {"data", {{"name", name}, {"type", 1}, {"options", std::move(options)}}},
    };
    auto interaction = Interaction::FromJson(payload);
    EXPECT_TRUE(interaction.ok()) << interaction.status();
    Dispatcher::Outcome outcome = dispatcher_->Dispatch(*interaction);
    EXPECT_EQ(outcome.result, expected) << outcome.status;
    if (interaction->responses().empty()) return "";
    return interaction->responses()[0]["data"]["content"].get<std::string>();
  }

  static nlohmann::json Settings(const std::string& sub_command, nlohmann::json options) {
    return nlohmann::json::array(
        {{{"type", 2},
          {"name", "settings"},
          {"options", nlohmann::json::array({{{"type", 1}, {"name", sub_command}, {"options", std::move(options)}}})}}});
  }

  static nlohmann::json Arg(const std::string& name, nlohmann::json value, int type = 3) {
    return {{"type", type}, {"name", name}, {"value", std::move(value)}};
  }

  Registry registry_;
  CountingSink sink_;
  std::shared_ptr<SettingsStore> settings_;
  std::unique_ptr<Dispatcher> dispatcher_;
};

TEST_F(ExampleCommandsTest, RegistersTheWholeSet) {
  EXPECT_NE(registry_.Find(kGlobalScope, CommandKind::kChatInput, "ping"), nullptr);
  EXPECT_NE(registry_.Find(kGlobalScope, CommandKind::kChatInput, "config"), nullptr);
  EXPECT_NE(registry_.Find(kGlobalScope, CommandKind::kChatInput, "color"), nullptr);
  EXPECT_NE(registry_.Find(kGlobalScope, CommandKind::kUser, "Show Avatar"), nullptr);
  EXPECT_NE(registry_.Find(kGlobalScope, CommandKind::kMessage, "Quote"), nullptr);
  EXPECT_EQ(registry_.size(), 5);
  EXPECT_TRUE(registry_.HasUnit("examples"));
}

TEST_F(ExampleCommandsTest, GuildRegistration) {
  Registry registry;
  ASSERT_TRUE(RegisterExampleCommands(registry, {1, 2}, settings_).ok());
  EXPECT_EQ(registry.GuildScopes(), (std::set<Snowflake>{1, 2}));
  EXPECT_TRUE(registry.Commands(kGlobalScope).empty());

  EXPECT_FALSE(RegisterExampleCommands(registry, {}, nullptr).ok());
}

TEST_F(ExampleCommandsTest, ConfigWireForm) {
  nlohmann::json wire = registry_.Find(kGlobalScope, CommandKind::kChatInput, "config")->ToWire(kGlobalScope);
  EXPECT_EQ(wire["default_member_permissions"], "32");
  EXPECT_EQ(wire["dm_permission"], false);
  ASSERT_EQ(wire["options"].size(), 2);
  EXPECT_EQ(wire["options"][0]["name"], "settings");
  EXPECT_EQ(wire["options"][0]["options"].size(), 2);
}

TEST_F(ExampleCommandsTest, Ping) { EXPECT_EQ(Run("ping", nlohmann::json::array()), "Pong!"); }

TEST_F(ExampleCommandsTest, SettingsRoundTrip) {
  EXPECT_EQ(Run("config", Settings("get", {Arg("key", "prefix")})), "prefix is not set");
  EXPECT_EQ(Run("config", Settings("set", {Arg("key", "prefix"), Arg("value", "!")})), "Set prefix to !");
  EXPECT_EQ(Run("config", Settings("get", {Arg("key", "prefix")})), "prefix = !");
  EXPECT_EQ(settings_->Get(kGuild, "prefix"), "!");

  nlohmann::json reset = nlohmann::json::array({{{"type", 1}, {"name", "reset"}, {"options", nlohmann::json::array()}}});
  EXPECT_EQ(Run("config", reset), "Cleared 1 setting(s)");
  EXPECT_FALSE(settings_->Get(kGuild, "prefix").has_value());
}

TEST_F(ExampleCommandsTest, SetNeedsManageGuild) {
  std::string reply = Run("config", Settings("set", {Arg("key", "prefix"), Arg("value", "!")}), "0",
                          Dispatcher::Result::CHECK_FAILED);
  EXPECT_EQ(reply.rfind("Could not change the setting", 0), 0);
  EXPECT_FALSE(settings_->Get(kGuild, "prefix").has_value());
  // The node's error handler claimed the failure.
  EXPECT_EQ(sink_.count, 0);
}

TEST_F(ExampleCommandsTest, SetRejectsLongValues) {
  std::string reply = Run("config", Settings("set", {Arg("key", "prefix"), Arg("value", std::string(101, 'x'))}),
                          "32", Dispatcher::Result::HANDLER_ERROR);
  EXPECT_NE(reply.find("limited to 100"), std::string::npos);
}

TEST_F(ExampleCommandsTest, Color) {
  EXPECT_EQ(Run("color", {Arg("name", "Blurple")}), "blurple: #5865f2");
  EXPECT_EQ(Run("color", {Arg("name", "red"), Arg("format", "rgb")}), "red: rgb(255, 0, 0)");
  EXPECT_EQ(Run("color", {Arg("name", "plaid")}, "32", Dispatcher::Result::HANDLER_ERROR), "");
  EXPECT_EQ(sink_.count, 1);
}

TEST_F(ExampleCommandsTest, ColorAutocomplete) {
  auto interaction = Interaction::FromJson(
      {{"type", 4},
       {"data", {{"name", "color"}, {"options", {{{"type", 3}, {"name", "name"}, {"value", "BL"}, {"focused", true}}}}}}});
  ASSERT_TRUE(interaction.ok());
  Dispatcher::Outcome outcome = dispatcher_->Dispatch(*interaction);
  ASSERT_EQ(outcome.result, Dispatcher::Result::AUTOCOMPLETED);
  ASSERT_EQ(outcome.choices.size(), 3);
  EXPECT_EQ(outcome.choices[0].name(), "black");
  EXPECT_EQ(outcome.choices[1].name(), "blue");
  EXPECT_EQ(outcome.choices[2].name(), "blurple");
}

TEST_F(ExampleCommandsTest, ShowAvatar) {
  auto interaction = Interaction::FromJson(nlohmann::json::parse(R"({
    "type": 2,
    "data": {"name": "Show Avatar", "type": 2, "target_id": "7",
             "resolved": {"users": {"7": {"id": "7", "username": "bob", "avatar": "abc"}}}}
  })"));
  ASSERT_TRUE(interaction.ok());
  ASSERT_EQ(dispatcher_->Dispatch(*interaction).result, Dispatcher::Result::HANDLED);
  EXPECT_EQ(interaction->responses()[0]["data"]["content"], "https://cdn.discordapp.com/avatars/7/abc.png");
}

TEST_F(ExampleCommandsTest, Quote) {
  auto interaction = Interaction::FromJson(nlohmann::json::parse(R"({
    "type": 2,
    "data": {"name": "Quote", "type": 3, "target_id": "9",
             "resolved": {"messages": {"9": {"id": "9", "content": "hello",
                                             "author": {"id": "7", "username": "bob"}}}}}
  })"));
  ASSERT_TRUE(interaction.ok());
  ASSERT_EQ(dispatcher_->Dispatch(*interaction).result, Dispatcher::Result::HANDLED);
  EXPECT_EQ(interaction->responses()[0]["data"]["content"], "> hello\n- bob");
}

TEST(SettingsStoreTest, PerGuild) {
  SettingsStore store;
  store.Set(1, "language", "fr");
  store.Set(2, "language", "de");
  EXPECT_EQ(store.Get(1, "language"), "fr");
  EXPECT_EQ(store.Get(2, "language"), "de");
  EXPECT_EQ(store.Reset(1), 1);
  EXPECT_EQ(store.Reset(1), 0);
  EXPECT_EQ(store.Get(2, "language"), "de");
}

}  // namespace
}  // namespace appcmd
