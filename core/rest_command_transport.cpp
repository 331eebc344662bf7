#include "core/rest_command_transport.h"

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"

#include "core/constants.h"
#include "core/status_macros.h"

namespace appcmd {

namespace {

absl::StatusOr<nlohmann::json> ParseBody(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    return absl::DataLossError(absl::StrCat("Malformed JSON in response: ", body.substr(0, 200)));
  }
  return j;
}

}  // namespace

absl::StatusOr<std::unique_ptr<RestCommandTransport>> RestCommandTransport::Create(HttpClient* http_client,
                                                                                   Config config) {
  if (http_client == nullptr) return absl::InvalidArgumentError("http_client must not be null");
  if (config.token.empty()) return absl::InvalidArgumentError("A bot token is required");
  if (config.application_id == 0) return absl::InvalidArgumentError("An application id is required");
  if (config.base_url.empty()) config.base_url = kDefaultApiBaseUrl;
  config.base_url = std::string(absl::StripSuffix(config.base_url, "/"));
  return std::unique_ptr<RestCommandTransport>(new RestCommandTransport(http_client, std::move(config)));
}

std::string RestCommandTransport::CommandsUrl(Snowflake scope) const {
  if (scope == kGlobalScope) {
    return absl::StrCat(config_.base_url, "/applications/", config_.application_id, "/commands");
  }
  return absl::StrCat(config_.base_url, "/applications/", config_.application_id, "/guilds/", scope, "/commands");
}

std::vector<std::string> RestCommandTransport::Headers() const {
  return {
      absl::StrCat("Authorization: Bot ", config_.token),
      "Content-Type: application/json",
      absl::StrCat("User-Agent: ", kUserAgent),
  };
}

absl::StatusOr<nlohmann::json> RestCommandTransport::FetchCommands(Snowflake scope,
                                                                   std::shared_ptr<CancellationRequest> cancellation) {
  ASSIGN_OR_RETURN(std::string body,
                   http_client_->Get(absl::StrCat(CommandsUrl(scope), "?with_localizations=true"), Headers(),
                                     std::move(cancellation)));
  ASSIGN_OR_RETURN(nlohmann::json commands, ParseBody(body));
  if (!commands.is_array()) {
    return absl::DataLossError(absl::StrCat("Expected a command list for scope ", scope));
  }
  return commands;
}

absl::StatusOr<nlohmann::json> RestCommandTransport::CreateCommand(Snowflake scope, const nlohmann::json& command,
                                                                   std::shared_ptr<CancellationRequest> cancellation) {
  ASSIGN_OR_RETURN(std::string body,
                   http_client_->Post(CommandsUrl(scope), command.dump(), Headers(), std::move(cancellation)));
  return ParseBody(body);
}

absl::StatusOr<nlohmann::json> RestCommandTransport::EditCommand(Snowflake scope, Snowflake command_id,
                                                                 const nlohmann::json& command,
                                                                 std::shared_ptr<CancellationRequest> cancellation) {
  ASSIGN_OR_RETURN(std::string body, http_client_->Patch(absl::StrCat(CommandsUrl(scope), "/", command_id),
                                                         command.dump(), Headers(), std::move(cancellation)));
  return ParseBody(body);
}

absl::StatusOr<nlohmann::json> RestCommandTransport::BulkOverwriteCommands(
    Snowflake scope, const nlohmann::json& commands, std::shared_ptr<CancellationRequest> cancellation) {
  ASSIGN_OR_RETURN(std::string body,
                   http_client_->Put(CommandsUrl(scope), commands.dump(), Headers(), std::move(cancellation)));
  return ParseBody(body);
}

}  // namespace appcmd
