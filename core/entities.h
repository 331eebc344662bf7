#ifndef APPCMD_CORE_ENTITIES_H_
#define APPCMD_CORE_ENTITIES_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/snowflake.h"

#include <nlohmann/json.hpp>

namespace appcmd {

// The subset of the platform's entity model that argument resolution hands to
// handlers. Unknown fields are ignored; malformed ones fall back to defaults.

struct User {
  Snowflake id = 0;
  std::string username;
  std::string global_name;
  std::string discriminator;
  std::string avatar;
  bool bot = false;

  std::string display_name() const { return global_name.empty() ? username : global_name; }
  std::string mention() const { return "<@" + FormatSnowflake(id) + ">"; }
};

struct Member {
  User user;
  std::string nick;
  std::vector<Snowflake> roles;
  std::string joined_at;
  // Resolved members carry the invoker's computed channel permissions.
  std::string permissions;

  std::string display_name() const { return nick.empty() ? user.display_name() : nick; }
};

struct Role {
  Snowflake id = 0;
  std::string name;
  int color = 0;
  int position = 0;
  std::string permissions;
  bool managed = false;

  std::string mention() const { return "<@&" + FormatSnowflake(id) + ">"; }
};

struct Channel {
  Snowflake id = 0;
  int type = 0;
  std::string name;
  Snowflake parent_id = 0;
  std::string permissions;

  std::string mention() const { return "<#" + FormatSnowflake(id) + ">"; }
};

struct Attachment {
  Snowflake id = 0;
  std::string filename;
  std::string content_type;
  int64_t size = 0;
  std::string url;
};

struct Message {
  Snowflake id = 0;
  Snowflake channel_id = 0;
  std::string content;
  User author;
  std::string timestamp;
};

// Fully hydrated objects for every id referenced by the option values of an
// invocation, keyed by id.
struct ResolvedData {
  std::map<Snowflake, User> users;
  std::map<Snowflake, Member> members;
  std::map<Snowflake, Role> roles;
  std::map<Snowflake, Channel> channels;
  std::map<Snowflake, Attachment> attachments;
  std::map<Snowflake, Message> messages;

  const User* FindUser(Snowflake id) const;
  const Member* FindMember(Snowflake id) const;
  const Role* FindRole(Snowflake id) const;
  const Channel* FindChannel(Snowflake id) const;
  const Attachment* FindAttachment(Snowflake id) const;
  const Message* FindMessage(Snowflake id) const;
};

void from_json(const nlohmann::json& j, User& u);
void from_json(const nlohmann::json& j, Member& m);
void from_json(const nlohmann::json& j, Role& r);
void from_json(const nlohmann::json& j, Channel& c);
void from_json(const nlohmann::json& j, Attachment& a);
void from_json(const nlohmann::json& j, Message& m);
// Members in the bundle arrive without their user; it is joined from `users`.
void from_json(const nlohmann::json& j, ResolvedData& r);

}  // namespace appcmd

#endif  // APPCMD_CORE_ENTITIES_H_
