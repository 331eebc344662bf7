#include "core/entities.h"

namespace appcmd {

namespace {

std::string StringOr(const nlohmann::json& j, const char* key, std::string fallback = "") {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

template <typename T>
T NumberOr(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return fallback;
  return it->get<T>();
}

bool BoolOr(const nlohmann::json& j, const char* key, bool fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) return fallback;
  return it->get<bool>();
}

template <typename T>
const T* FindIn(const std::map<Snowflake, T>& map, Snowflake id) {
  auto it = map.find(id);
  return it == map.end() ? nullptr : &it->second;
}

// Parses an id-keyed object of entities.
template <typename T>
void ParseBundle(const nlohmann::json& j, const char* key, std::map<Snowflake, T>& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_object()) return;
  for (const auto& [id_text, value] : it->items()) {
    auto id = ParseSnowflake(nlohmann::json(id_text));
    if (!id.ok() || !value.is_object()) continue;
    T entity;
    from_json(value, entity);
    out[*id] = std::move(entity);
  }
}

}  // namespace

const User* ResolvedData::FindUser(Snowflake id) const { return FindIn(users, id); }
const Member* ResolvedData::FindMember(Snowflake id) const { return FindIn(members, id); }
const Role* ResolvedData::FindRole(Snowflake id) const { return FindIn(roles, id); }
const Channel* ResolvedData::FindChannel(Snowflake id) const { return FindIn(channels, id); }
const Attachment* ResolvedData::FindAttachment(Snowflake id) const { return FindIn(attachments, id); }
const Message* ResolvedData::FindMessage(Snowflake id) const { return FindIn(messages, id); }

void from_json(const nlohmann::json& j, User& u) {
  u.id = SnowflakeOrZero(j, "id");
  u.username = StringOr(j, "username");
  u.global_name = StringOr(j, "global_name");
  u.discriminator = StringOr(j, "discriminator", "0");
  u.avatar = StringOr(j, "avatar");
  u.bot = BoolOr(j, "bot", false);
}

void from_json(const nlohmann::json& j, Member& m) {
  if (j.contains("user") && j["user"].is_object()) from_json(j["user"], m.user);
  m.nick = StringOr(j, "nick");
  m.joined_at = StringOr(j, "joined_at");
  m.permissions = StringOr(j, "permissions");
  m.roles.clear();
  if (j.contains("roles") && j["roles"].is_array()) {
    for (const auto& role : j["roles"]) {
      auto id = ParseSnowflake(role);
      if (id.ok()) m.roles.push_back(*id);
    }
  }
}

void from_json(const nlohmann::json& j, Role& r) {
  r.id = SnowflakeOrZero(j, "id");
  r.name = StringOr(j, "name");
  r.color = NumberOr<int>(j, "color", 0);
  r.position = NumberOr<int>(j, "position", 0);
  r.permissions = StringOr(j, "permissions");
  r.managed = BoolOr(j, "managed", false);
}

void from_json(const nlohmann::json& j, Channel& c) {
  c.id = SnowflakeOrZero(j, "id");
  c.type = NumberOr<int>(j, "type", 0);
  c.name = StringOr(j, "name");
  c.parent_id = SnowflakeOrZero(j, "parent_id");
  c.permissions = StringOr(j, "permissions");
}

void from_json(const nlohmann::json& j, Attachment& a) {
  a.id = SnowflakeOrZero(j, "id");
  a.filename = StringOr(j, "filename");
  a.content_type = StringOr(j, "content_type");
  a.size = NumberOr<int64_t>(j, "size", 0);
  a.url = StringOr(j, "url");
}

void from_json(const nlohmann::json& j, Message& m) {
  m.id = SnowflakeOrZero(j, "id");
  m.channel_id = SnowflakeOrZero(j, "channel_id");
  m.content = StringOr(j, "content");
  m.timestamp = StringOr(j, "timestamp");
  if (j.contains("author") && j["author"].is_object()) from_json(j["author"], m.author);
}

void from_json(const nlohmann::json& j, ResolvedData& r) {
  ParseBundle(j, "users", r.users);
  ParseBundle(j, "members", r.members);
  ParseBundle(j, "roles", r.roles);
  ParseBundle(j, "channels", r.channels);
  ParseBundle(j, "attachments", r.attachments);
  ParseBundle(j, "messages", r.messages);
  for (auto& [id, member] : r.members) {
    if (member.user.id != 0) continue;
    if (const User* user = r.FindUser(id)) member.user = *user;
  }
}

}  // namespace appcmd
