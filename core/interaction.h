#ifndef APPCMD_CORE_INTERACTION_H_
#define APPCMD_CORE_INTERACTION_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include "core/entities.h"
#include "core/snowflake.h"

#include <nlohmann/json.hpp>

namespace appcmd {

enum class InteractionType : int {
  kPing = 1,
  kApplicationCommand = 2,
  kComponent = 3,
  kAutocomplete = 4,
  kModalSubmit = 5,
};

// One layer of the supplied option tree. Sub-command and sub-command-group
// layers carry `options`; leaf layers carry `value`.
struct InteractionOption {
  std::string name;
  int type = 0;
  nlohmann::json value;
  bool focused = false;
  std::vector<InteractionOption> options;
};

struct CommandData {
  Snowflake id = 0;
  std::string name;
  // 1 chat input, 2 user, 3 message.
  int type = 1;
  Snowflake guild_id = 0;
  // User or message a context command was used on.
  Snowflake target_id = 0;
  std::vector<InteractionOption> options;
  ResolvedData resolved;
};

/**
 * @brief An inbound invocation event as delivered by the gateway or the
 * interactions endpoint.
 *
 * Handlers answer through Reply()/Defer(); the queued responses are read back
 * by whoever owns the connection to the service.
 */
class Interaction {
 public:
  Interaction() = default;

  // Fails with InvalidArgument when the payload is not an object, lacks a
  // type, or is a command invocation without `data.name`.
  static absl::StatusOr<Interaction> FromJson(const nlohmann::json& payload);

  Snowflake id() const { return id_; }
  Snowflake application_id() const { return application_id_; }
  InteractionType type() const { return type_; }
  const std::string& token() const { return token_; }
  Snowflake guild_id() const { return guild_id_; }
  Snowflake channel_id() const { return channel_id_; }
  const std::string& locale() const { return locale_; }
  const std::string& guild_locale() const { return guild_locale_; }
  const CommandData& data() const { return data_; }
  const nlohmann::json& raw() const { return raw_; }

  // Present in guilds.
  const std::optional<Member>& member() const { return member_; }
  // The invoking user, taken from the member in guilds.
  const User& user() const { return user_; }

  bool is_autocomplete() const { return type_ == InteractionType::kAutocomplete; }

  // Name of the option being typed in an autocomplete invocation, empty otherwise.
  const std::string& focused_option() const { return focused_option_; }
  void set_focused_option(std::string name) { focused_option_ = std::move(name); }

  void Reply(const std::string& content, bool ephemeral = false);
  void Defer(bool ephemeral = false);
  const std::vector<nlohmann::json>& responses() const { return responses_; }

 private:
  Snowflake id_ = 0;
  Snowflake application_id_ = 0;
  InteractionType type_ = InteractionType::kPing;
  std::string token_;
  Snowflake guild_id_ = 0;
  Snowflake channel_id_ = 0;
  std::string locale_;
  std::string guild_locale_;
  CommandData data_;
  std::optional<Member> member_;
  User user_;
  std::string focused_option_;
  std::vector<nlohmann::json> responses_;
  nlohmann::json raw_;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_INTERACTION_H_
