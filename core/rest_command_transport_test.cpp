#include "core/rest_command_transport.h"

#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "gtest/gtest.h"

namespace appcmd {
namespace {

// Answers every request with a canned body and records what was sent.
class RecordingHttpClient : public HttpClient {
 public:
  struct Request {
    std::string method;
    std::string url;
    std::string body;
    std::vector<std::string> headers;
  };

  absl::StatusOr<std::string> Get(const std::string& url, const std::vector<std::string>& headers,
                                  std::shared_ptr<CancellationRequest>) override {
    return Record("GET", url, "", headers);
  }
  absl::StatusOr<std::string> Post(const std::string& url, const std::string& body,
                                   const std::vector<std::string>& headers,
                                   std::shared_ptr<CancellationRequest>) override {
    return Record("POST", url, body, headers);
  }
  absl::StatusOr<std::string> Put(const std::string& url, const std::string& body,
                                  const std::vector<std::string>& headers,
                                  std::shared_ptr<CancellationRequest>) override {
    return Record("PUT", url, body, headers);
  }
  absl::StatusOr<std::string> Patch(const std::string& url, const std::string& body,
                                    const std::vector<std::string>& headers,
                                    std::shared_ptr<CancellationRequest>) override {
    return Record("PATCH", url, body, headers);
  }

  absl::StatusOr<std::string> response = std::string("[]");
  std::vector<Request> requests;

 private:
  absl::StatusOr<std::string> Record(const std::string& method, const std::string& url, const std::string& body,
                                     const std::vector<std::string>& headers) {
    requests.push_back({method, url, body, headers});
    return response;
  }
};

class RestCommandTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    RestCommandTransport::Config config;
    config.base_url = "https://api.example/v10/";
    config.token = "secret";
    config.application_id = 4242;
    auto transport = RestCommandTransport::Create(&http_, std::move(config));
    ASSERT_TRUE(transport.ok()) << transport.status();
    transport_ = std::move(*transport);
  }

  RecordingHttpClient http_;
  std::unique_ptr<RestCommandTransport> transport_;
};

TEST_F(RestCommandTransportTest, CreateValidatesConfig) {
  RestCommandTransport::Config config;
  config.token = "secret";
  config.application_id = 1;
  EXPECT_FALSE(RestCommandTransport::Create(nullptr, config).ok());

  RestCommandTransport::Config no_token = config;
  no_token.token = "";
  EXPECT_FALSE(RestCommandTransport::Create(&http_, no_token).ok());

  RestCommandTransport::Config no_app = config;
  no_app.application_id = 0;
  EXPECT_FALSE(RestCommandTransport::Create(&http_, no_app).ok());

  auto defaulted = RestCommandTransport::Create(&http_, config);
  ASSERT_TRUE(defaulted.ok());
  EXPECT_EQ((*defaulted)->CommandsUrl(kGlobalScope), "https://discord.com/api/v10/applications/1/commands");
}

TEST_F(RestCommandTransportTest, CommandsUrl) {
  EXPECT_EQ(transport_->CommandsUrl(kGlobalScope), "https://api.example/v10/applications/4242/commands");
  EXPECT_EQ(transport_->CommandsUrl(77), "https://api.example/v10/applications/4242/guilds/77/commands");
}

TEST_F(RestCommandTransportTest, FetchAsksForLocalizations) {
  http_.response = std::string(R"([{"id": "1", "name": "ping"}])");
  auto commands = transport_->FetchCommands(77, nullptr);
  ASSERT_TRUE(commands.ok()) << commands.status();
  EXPECT_EQ(commands->size(), 1);

  ASSERT_EQ(http_.requests.size(), 1);
  const auto& request = http_.requests[0];
  EXPECT_EQ(request.method, "GET");
  EXPECT_EQ(request.url, "https://api.example/v10/applications/4242/guilds/77/commands?with_localizations=true");
  bool has_auth = false;
  for (const auto& header : request.headers) {
    if (header == "Authorization: Bot secret") has_auth = true;
  }
  EXPECT_TRUE(has_auth);
}

TEST_F(RestCommandTransportTest, FetchRejectsNonArray) {
  http_.response = std::string(R"({"message": "odd"})");
  EXPECT_EQ(transport_->FetchCommands(kGlobalScope, nullptr).status().code(), absl::StatusCode::kDataLoss);
  http_.response = std::string("<html>");
  EXPECT_EQ(transport_->FetchCommands(kGlobalScope, nullptr).status().code(), absl::StatusCode::kDataLoss);
}

TEST_F(RestCommandTransportTest, WritesUseTheRightVerbs) {
  nlohmann::json command = {{"name", "ping"}, {"description", "Ping"}};
  http_.response = std::string(R"({"id": "9", "name": "ping"})");

  ASSERT_TRUE(transport_->CreateCommand(kGlobalScope, command, nullptr).ok());
  auto edited = transport_->EditCommand(77, 9, command, nullptr);
  ASSERT_TRUE(edited.ok());
  EXPECT_EQ((*edited)["id"], "9");
  http_.response = std::string("[]");
  ASSERT_TRUE(transport_->BulkOverwriteCommands(77, nlohmann::json::array({command}), nullptr).ok());

  ASSERT_EQ(http_.requests.size(), 3);
  EXPECT_EQ(http_.requests[0].method, "POST");
  EXPECT_EQ(nlohmann::json::parse(http_.requests[0].body), command);
  EXPECT_EQ(http_.requests[1].method, "PATCH");
  EXPECT_TRUE(absl::EndsWith(http_.requests[1].url, "/guilds/77/commands/9"));
  EXPECT_EQ(http_.requests[2].method, "PUT");
  EXPECT_TRUE(nlohmann::json::parse(http_.requests[2].body).is_array());
}

TEST_F(RestCommandTransportTest, HttpErrorsPassThrough) {
  http_.response = absl::PermissionDeniedError("HTTP 403: Missing Access");
  EXPECT_EQ(transport_->FetchCommands(77, nullptr).status().code(), absl::StatusCode::kPermissionDenied);
  EXPECT_EQ(transport_->CreateCommand(77, {}, nullptr).status().code(), absl::StatusCode::kPermissionDenied);
}

}  // namespace
}  // namespace appcmd
