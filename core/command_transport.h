#ifndef APPCMD_CORE_COMMAND_TRANSPORT_H_
#define APPCMD_CORE_COMMAND_TRANSPORT_H_

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "core/cancellation.h"
#include "core/snowflake.h"

#include <nlohmann/json.hpp>

namespace appcmd {

/**
 * @brief The service's command endpoints.
 *
 * `scope` is a guild id, or kGlobalScope for the global set. Implementations
 * report a missing access grant for a guild as PermissionDenied; any other
 * failure is a transport error. Calls may run concurrently for different
 * scopes and must give up with Cancelled once `cancellation` fires.
 */
class CommandTransport {
 public:
  virtual ~CommandTransport() = default;

  // Array of command objects registered in `scope`, localizations included.
  virtual absl::StatusOr<nlohmann::json> FetchCommands(Snowflake scope,
                                                       std::shared_ptr<CancellationRequest> cancellation) = 0;
  // Returns the created command.
  virtual absl::StatusOr<nlohmann::json> CreateCommand(Snowflake scope, const nlohmann::json& command,
                                                       std::shared_ptr<CancellationRequest> cancellation) = 0;
  // Returns the edited command.
  virtual absl::StatusOr<nlohmann::json> EditCommand(Snowflake scope, Snowflake command_id,
                                                     const nlohmann::json& command,
                                                     std::shared_ptr<CancellationRequest> cancellation) = 0;
  // Replaces the whole set; commands left out are deleted. Returns the new set.
  virtual absl::StatusOr<nlohmann::json> BulkOverwriteCommands(
      Snowflake scope, const nlohmann::json& commands, std::shared_ptr<CancellationRequest> cancellation) = 0;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_COMMAND_TRANSPORT_H_
