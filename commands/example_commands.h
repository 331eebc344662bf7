#ifndef APPCMD_COMMANDS_EXAMPLE_COMMANDS_H_
#define APPCMD_COMMANDS_EXAMPLE_COMMANDS_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

#include "core/registry.h"
#include "core/snowflake.h"

namespace appcmd {

// MANAGE_GUILD permission bit.
constexpr uint64_t kManageGuildPermission = uint64_t{1} << 5;

// Per-guild key/value settings edited through /config.
class SettingsStore {
 public:
  static const std::vector<std::string>& Keys();

  std::optional<std::string> Get(Snowflake guild, const std::string& key) const;
  void Set(Snowflake guild, const std::string& key, std::string value);
  // Returns the number of settings cleared.
  size_t Reset(Snowflake guild);

 private:
  mutable absl::Mutex mu_;
  std::map<Snowflake, std::map<std::string, std::string>> values_ ABSL_GUARDED_BY(mu_);
};

// Color names offered by /color, with their hex value.
const std::map<std::string, std::string>& ColorTable();

/**
 * @brief The command set of the appcmd executable:
 *
 *   /ping
 *   /config settings get <key>
 *   /config settings set <key> <value>
 *   /config reset
 *   /color <name> [format]           (autocomplete on name)
 *   "Show Avatar"                    (user command)
 *   "Quote"                          (message command)
 *
 * Everything is registered in `guild_ids`, or globally when empty.
 */
absl::Status RegisterExampleCommands(Registry& registry, const std::vector<Snowflake>& guild_ids,
                                     std::shared_ptr<SettingsStore> settings);

// The same set wrapped as a reloadable unit named "examples".
CommandUnit ExampleCommandsUnit(std::vector<Snowflake> guild_ids, std::shared_ptr<SettingsStore> settings);

}  // namespace appcmd

#endif  // APPCMD_COMMANDS_EXAMPLE_COMMANDS_H_
