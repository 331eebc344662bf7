#ifndef APPCMD_CORE_REST_COMMAND_TRANSPORT_H_
#define APPCMD_CORE_REST_COMMAND_TRANSPORT_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include "core/command_transport.h"
#include "core/http_client.h"

namespace appcmd {

// CommandTransport over the REST API.
class RestCommandTransport : public CommandTransport {
 public:
  struct Config {
    std::string base_url;
    std::string token;
    Snowflake application_id = 0;
  };

  // `http_client` must outlive the transport.
  static absl::StatusOr<std::unique_ptr<RestCommandTransport>> Create(HttpClient* http_client, Config config);

  absl::StatusOr<nlohmann::json> FetchCommands(Snowflake scope,
                                               std::shared_ptr<CancellationRequest> cancellation) override;
  absl::StatusOr<nlohmann::json> CreateCommand(Snowflake scope, const nlohmann::json& command,
                                               std::shared_ptr<CancellationRequest> cancellation) override;
  absl::StatusOr<nlohmann::json> EditCommand(Snowflake scope, Snowflake command_id, const nlohmann::json& command,
                                             std::shared_ptr<CancellationRequest> cancellation) override;
  absl::StatusOr<nlohmann::json> BulkOverwriteCommands(Snowflake scope, const nlohmann::json& commands,
                                                       std::shared_ptr<CancellationRequest> cancellation) override;

  // ".../applications/{app}/commands" or ".../applications/{app}/guilds/{guild}/commands".
  std::string CommandsUrl(Snowflake scope) const;

 private:
  RestCommandTransport(HttpClient* http_client, Config config)
      : http_client_(http_client), config_(std::move(config)) {}

  std::vector<std::string> Headers() const;

  HttpClient* http_client_;
  Config config_;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_REST_COMMAND_TRANSPORT_H_
