#include "core/interaction.h"

#include "gtest/gtest.h"

namespace appcmd {
namespace {

TEST(InteractionTest, ParsesGuildCommand) {
  nlohmann::json payload = nlohmann::json::parse(R"({
    "id": "1001",
    "application_id": "4242",
    "type": 2,
    "token": "tok",
    "guild_id": "500",
    "channel_id": "600",
    "locale": "fr",
    "member": {"user": {"id": "5", "username": "alice", "global_name": "Alice"}, "nick": "Al",
               "roles": ["7", "8"], "permissions": "2147483647"},
    "data": {
      "id": "9000",
      "name": "config",
      "type": 1,
      "guild_id": "500",
      "options": [{"type": 2, "name": "settings", "options": [
        {"type": 1, "name": "get", "options": [{"type": 3, "name": "key", "value": "prefix"}]}]}]
    }
  })");
  auto interaction = Interaction::FromJson(payload);
  ASSERT_TRUE(interaction.ok()) << interaction.status();

  EXPECT_EQ(interaction->id(), 1001u);
  EXPECT_EQ(interaction->application_id(), 4242u);
  EXPECT_EQ(interaction->type(), InteractionType::kApplicationCommand);
  EXPECT_EQ(interaction->token(), "tok");
  EXPECT_EQ(interaction->guild_id(), 500u);
  EXPECT_EQ(interaction->channel_id(), 600u);
  EXPECT_EQ(interaction->locale(), "fr");
  ASSERT_TRUE(interaction->member().has_value());
  EXPECT_EQ(interaction->member()->display_name(), "Al");
  EXPECT_EQ(interaction->member()->roles, (std::vector<Snowflake>{7, 8}));
  EXPECT_EQ(interaction->user().display_name(), "Alice");

  const CommandData& data = interaction->data();
  EXPECT_EQ(data.id, 9000u);
  EXPECT_EQ(data.name, "config");
  EXPECT_EQ(data.guild_id, 500u);
  ASSERT_EQ(data.options.size(), 1);
  const InteractionOption& group = data.options[0];
  EXPECT_EQ(group.type, 2);
  ASSERT_EQ(group.options.size(), 1);
  ASSERT_EQ(group.options[0].options.size(), 1);
  EXPECT_EQ(group.options[0].options[0].value, "prefix");
}

TEST(InteractionTest, DirectMessageUsesUser) {
  auto interaction = Interaction::FromJson(
      {{"type", 2}, {"user", {{"id", "5"}, {"username", "bob"}}}, {"data", {{"name", "ping"}}}});
  ASSERT_TRUE(interaction.ok());
  EXPECT_FALSE(interaction->member().has_value());
  EXPECT_EQ(interaction->user().username, "bob");
  EXPECT_EQ(interaction->user().mention(), "<@5>");
  EXPECT_EQ(interaction->guild_id(), kGlobalScope);
}

TEST(InteractionTest, AutocompleteFocus) {
  auto interaction = Interaction::FromJson(
      {{"type", 4},
       {"data", {{"name", "color"}, {"options", {{{"type", 3}, {"name", "name"}, {"value", "bl"}, {"focused", true}}}}}}});
  ASSERT_TRUE(interaction.ok());
  EXPECT_TRUE(interaction->is_autocomplete());
  EXPECT_TRUE(interaction->data().options[0].focused);
  EXPECT_TRUE(interaction->focused_option().empty());
}

TEST(InteractionTest, RejectsMalformedPayloads) {
  EXPECT_FALSE(Interaction::FromJson(nlohmann::json::array()).ok());
  EXPECT_FALSE(Interaction::FromJson(nlohmann::json{{"id", "1"}}).ok());
  EXPECT_FALSE(Interaction::FromJson(nlohmann::json{{"type", 9}}).ok());
  EXPECT_FALSE(Interaction::FromJson(nlohmann::json{{"type", 2}}).ok());
  EXPECT_FALSE(Interaction::FromJson({{"type", 2}, {"data", {{"type", 1}}}}).ok());
  // Components carry no command data.
  EXPECT_TRUE(Interaction::FromJson(nlohmann::json{{"type", 3}}).ok());
}

TEST(InteractionTest, ReplyAndDefer) {
  Interaction interaction;
  interaction.Reply("hello");
  interaction.Reply("secret", true);
  interaction.Defer(true);

  ASSERT_EQ(interaction.responses().size(), 3);
  EXPECT_EQ(interaction.responses()[0], nlohmann::json({{"type", 4}, {"data", {{"content", "hello"}}}}));
  EXPECT_EQ(interaction.responses()[1]["data"]["flags"], 64);
  EXPECT_EQ(interaction.responses()[2]["type"], 5);
  EXPECT_EQ(interaction.responses()[2]["data"]["flags"], 64);
}

TEST(EntitiesTest, ResolvedBundleJoinsMembersWithUsers) {
  nlohmann::json resolved = nlohmann::json::parse(R"({
    "users": {"5": {"id": "5", "username": "alice", "avatar": "abc", "bot": false}},
    "members": {"5": {"nick": "", "roles": ["7"], "joined_at": "2021-01-01T00:00:00Z", "permissions": "8"},
                "not-an-id": {"nick": "x"}},
    "roles": {"7": {"id": "7", "name": "admins", "color": 255, "position": 3, "managed": true}},
    "channels": {"8": {"id": "8", "type": 2, "name": "voice", "parent_id": "1"}},
    "attachments": {"9": {"id": "9", "filename": "a.txt", "content_type": "text/plain", "size": 12, "url": "u"}},
    "messages": {"10": {"id": "10", "channel_id": "8", "content": "hi", "author": {"id": "5", "username": "alice"}}}
  })");
  ResolvedData data = resolved.get<ResolvedData>();

  ASSERT_NE(data.FindMember(5), nullptr);
  EXPECT_EQ(data.FindMember(5)->user.username, "alice");
  EXPECT_EQ(data.FindMember(5)->display_name(), "alice");
  EXPECT_EQ(data.members.size(), 1);
  EXPECT_EQ(data.FindUser(5)->avatar, "abc");
  EXPECT_EQ(data.FindUser(5)->discriminator, "0");
  EXPECT_EQ(data.FindRole(7)->mention(), "<@&7>");
  EXPECT_TRUE(data.FindRole(7)->managed);
  EXPECT_EQ(data.FindChannel(8)->type, 2);
  EXPECT_EQ(data.FindChannel(8)->parent_id, 1u);
  EXPECT_EQ(data.FindAttachment(9)->size, 12);
  EXPECT_EQ(data.FindMessage(10)->author.id, 5u);
  EXPECT_EQ(data.FindUser(11), nullptr);
}

TEST(EntitiesTest, MalformedFieldsFallBack) {
  Role role = nlohmann::json({{"id", "x"}, {"name", 5}, {"color", "red"}}).get<Role>();
  EXPECT_EQ(role.id, 0u);
  EXPECT_EQ(role.name, "");
  EXPECT_EQ(role.color, 0);
}

}  // namespace
}  // namespace appcmd
