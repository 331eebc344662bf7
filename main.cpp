#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"

#include "commands/example_commands.h"
#include "core/constants.h"
#include "core/dispatcher.h"
#include "core/error_sink.h"
#include "core/http_client.h"
#include "core/interaction.h"
#include "core/registry.h"
#include "core/rest_command_transport.h"
#include "core/synchronizer.h"

#include <nlohmann/json.hpp>

ABSL_FLAG(std::string, token, "", "Bot token (overrides DISCORD_TOKEN env var)");
ABSL_FLAG(std::string, application_id, "", "Application id (overrides DISCORD_APPLICATION_ID env var)");
ABSL_FLAG(std::string, api_base_url, appcmd::kDefaultApiBaseUrl, "Base URL of the REST API");
ABSL_FLAG(bool, sync_commands, false, "Write local commands to the service instead of only collecting them");
ABSL_FLAG(bool, delete_not_existing_commands, true,
          "Delete registered commands that have no local definition during sync");
ABSL_FLAG(bool, concurrent_guilds, false, "Synchronize guild scopes in parallel");
ABSL_FLAG(int, max_parallel_guilds, 4, "Maximum number of guilds synchronized at once with --concurrent_guilds");
ABSL_FLAG(absl::Duration, guild_timeout, absl::Seconds(30), "Time budget of each guild scope");
ABSL_FLAG(std::vector<std::string>, guild_ids, {}, "Register the commands in these guilds instead of globally");
ABSL_FLAG(std::string, dispatch, "", "Path to an interaction payload JSON to dispatch once after syncing");
ABSL_FLAG(std::string, log, "", "Log file path");

namespace {

class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string& path) : stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
      std::cerr << "Failed to open log file: " << path << std::endl;
    }
  }
  ~FileLogSink() override = default;

  void Send(const absl::LogEntry& entry) override {
    if (stream_.is_open()) {
      std::lock_guard<std::mutex> lock(mu_);
      stream_ << entry.text_message_with_prefix() << "\n";
    }
  }

 private:
  // Guild scopes log from the synchronizer's worker threads.
  std::mutex mu_;
  std::ofstream stream_;
};

// Keeps a FileLogSink registered for the lifetime of the guard.
class ScopedFileLogSink {
 public:
  explicit ScopedFileLogSink(const std::string& path) : sink_(std::make_unique<FileLogSink>(path)) {
    absl::AddLogSink(sink_.get());
  }
  ~ScopedFileLogSink() { absl::RemoveLogSink(sink_.get()); }

  ScopedFileLogSink(const ScopedFileLogSink&) = delete;
  ScopedFileLogSink& operator=(const ScopedFileLogSink&) = delete;

 private:
  std::unique_ptr<FileLogSink> sink_;
};

std::string FlagOrEnv(const std::string& flag_value, const char* env_name) {
  if (!flag_value.empty()) return flag_value;
  const char* env = std::getenv(env_name);
  return env == nullptr ? "" : env;
}

const char* ResultName(appcmd::Dispatcher::Result result) {
  switch (result) {
    case appcmd::Dispatcher::Result::HANDLED:
      return "handled";
    case appcmd::Dispatcher::Result::AUTOCOMPLETED:
      return "autocompleted";
    case appcmd::Dispatcher::Result::CHECK_FAILED:
      return "check failed";
    case appcmd::Dispatcher::Result::HANDLER_ERROR:
      return "handler error";
    case appcmd::Dispatcher::Result::UNKNOWN_COMMAND:
      return "unknown command";
    case appcmd::Dispatcher::Result::NOT_A_COMMAND:
      return "not a command";
  }
  return "unknown";
}

void PrintSummary(const appcmd::Registry& registry, const appcmd::SyncReport& report) {
  std::cout << "Registered " << registry.size() << " command(s) locally" << std::endl;
  for (const auto& scope : report.scopes) {
    std::string label = scope.scope == appcmd::kGlobalScope ? "global" : absl::StrCat("guild ", scope.scope);
    if (scope.skipped) {
      std::cout << "  " << label << ": skipped (" << scope.status.message() << ")" << std::endl;
    } else if (!scope.status.ok()) {
      std::cout << "  " << label << ": failed (" << scope.status << ")" << std::endl;
    } else {
      std::cout << "  " << label << ": " << appcmd::SyncStrategyName(scope.strategy) << ", " << scope.registered
                << " registered (" << scope.new_commands << " new, " << scope.updates << " updated, "
                << scope.unchanged << " unchanged, " << scope.removal_candidates << " without local definition)"
                << std::endl;
    }
  }
}

int DispatchFile(const std::string& path, const appcmd::Registry& registry) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "Failed to open payload file: " << path << std::endl;
    return 1;
  }
  nlohmann::json payload = nlohmann::json::parse(file, nullptr, false);
  if (payload.is_discarded()) {
    std::cerr << "Payload file is not valid JSON: " << path << std::endl;
    return 1;
  }
  auto interaction_or = appcmd::Interaction::FromJson(payload);
  if (!interaction_or.ok()) {
    std::cerr << "Invalid interaction: " << interaction_or.status() << std::endl;
    return 1;
  }

  appcmd::LoggingErrorSink sink;
  auto dispatcher_or = appcmd::Dispatcher::Create(&registry, &sink);
  if (!dispatcher_or.ok()) {
    std::cerr << dispatcher_or.status() << std::endl;
    return 1;
  }
  appcmd::Dispatcher::Outcome outcome = (*dispatcher_or)->Dispatch(*interaction_or);
  std::cout << "/" << outcome.qualified_name << ": " << ResultName(outcome.result);
  if (!outcome.status.ok()) std::cout << " (" << outcome.status << ")";
  std::cout << std::endl;
  for (const auto& response : interaction_or->responses()) std::cout << response.dump(2) << std::endl;
  if (outcome.result == appcmd::Dispatcher::Result::AUTOCOMPLETED) {
    std::cout << outcome.AutocompleteResponse().dump(2) << std::endl;
  }
  return outcome.result == appcmd::Dispatcher::Result::HANDLED ||
                 outcome.result == appcmd::Dispatcher::Result::AUTOCOMPLETED
             ? 0
             : 2;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Registers the example application commands, synchronizes them with the service and optionally "
      "dispatches one interaction payload.\n"
      "Usage: appcmd --token=... --application_id=... [--sync_commands] [--dispatch=payload.json]");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string log_path = absl::GetFlag(FLAGS_log);
  std::unique_ptr<ScopedFileLogSink> log_sink;
  if (!log_path.empty()) log_sink = std::make_unique<ScopedFileLogSink>(log_path);

  std::vector<appcmd::Snowflake> guild_ids;
  for (const auto& text : absl::GetFlag(FLAGS_guild_ids)) {
    appcmd::Snowflake id = 0;
    if (!absl::SimpleAtoi(text, &id) || id == appcmd::kGlobalScope) {
      std::cerr << "Invalid guild id: " << text << std::endl;
      return 1;
    }
    guild_ids.push_back(id);
  }

  appcmd::Registry registry;
  auto settings = std::make_shared<appcmd::SettingsStore>();
  absl::Status status = registry.LoadUnit(appcmd::ExampleCommandsUnit(guild_ids, settings));
  if (!status.ok()) {
    std::cerr << "Failed to register commands: " << status << std::endl;
    return 1;
  }

  std::string token = FlagOrEnv(absl::GetFlag(FLAGS_token), "DISCORD_TOKEN");
  std::string application_id = FlagOrEnv(absl::GetFlag(FLAGS_application_id), "DISCORD_APPLICATION_ID");
  std::string dispatch_path = absl::GetFlag(FLAGS_dispatch);

  int exit_code = 0;
  if (token.empty() || application_id.empty()) {
    if (dispatch_path.empty()) {
      std::cerr << "No credentials. Set --token and --application_id, or DISCORD_TOKEN and "
                   "DISCORD_APPLICATION_ID."
                << std::endl;
      exit_code = 1;
    } else {
      LOG(WARNING) << "No credentials, dispatching without synchronization";
    }
  } else {
    appcmd::RestCommandTransport::Config config;
    config.base_url = absl::GetFlag(FLAGS_api_base_url);
    config.token = token;
    if (!absl::SimpleAtoi(application_id, &config.application_id)) {
      std::cerr << "Invalid application id: " << application_id << std::endl;
      return 1;
    }

    appcmd::SyncOptions options;
    options.sync_commands = absl::GetFlag(FLAGS_sync_commands);
    options.delete_not_existing_commands = absl::GetFlag(FLAGS_delete_not_existing_commands);
    options.concurrent_guilds = absl::GetFlag(FLAGS_concurrent_guilds);
    options.max_parallel_guilds = absl::GetFlag(FLAGS_max_parallel_guilds);
    options.guild_timeout = absl::GetFlag(FLAGS_guild_timeout);
    options.known_guild_ids = guild_ids;

    appcmd::HttpClient http_client;
    auto transport_or = appcmd::RestCommandTransport::Create(&http_client, std::move(config));
    if (!transport_or.ok()) {
      std::cerr << transport_or.status() << std::endl;
      return 1;
    }
    auto synchronizer_or = appcmd::Synchronizer::Create(&registry, transport_or->get(), std::move(options));
    if (!synchronizer_or.ok()) {
      std::cerr << synchronizer_or.status() << std::endl;
      return 1;
    }
    status = (*synchronizer_or)->Run();
    PrintSummary(registry, (*synchronizer_or)->last_report());
    if (!status.ok()) {
      std::cerr << "Synchronization failed: " << status << std::endl;
      exit_code = 1;
    }
  }

  if (!dispatch_path.empty()) {
    int dispatch_code = DispatchFile(dispatch_path, registry);
    if (exit_code == 0) exit_code = dispatch_code;
  }

  return exit_code;
}
