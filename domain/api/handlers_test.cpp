#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "handlers.hpp"

#include <host/mocks.hpp>
#include <runtime/fake_transport.hpp>

namespace dbdock::api {
namespace {

using runtime::fakes::FakeTransport;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

TEST(GatewayErrorStatus, MapsEachKind) {
  using runtime::GatewayError;
  EXPECT_EQ(to_http_error(GatewayError::transport("refused")).status, 503);
  EXPECT_EQ(to_http_error(GatewayError::timeout("idle")).status, 504);
  EXPECT_EQ(to_http_error(GatewayError::decode("bad")).status, 502);
  EXPECT_EQ(to_http_error(GatewayError::dialect("bad path")).status, 400);
  EXPECT_EQ(to_http_error(GatewayError::runtime(500, "boom")).status, 502);

  auto missing = to_http_error(GatewayError::runtime(404, "No such container"));
  EXPECT_EQ(missing.status, 404);
  EXPECT_EQ(missing.details["kind"].asString(), "runtime");
  EXPECT_EQ(missing.details["runtime_status"].asInt(), 404);
}

TEST(FilesystemErrorStatus, MapsEachKind) {
  using host::FilesystemError;
  using Kind = host::FilesystemErrorKind;
  EXPECT_EQ(to_http_error(FilesystemError(Kind::InvalidName, "x")).status, 400);
  EXPECT_EQ(to_http_error(FilesystemError(Kind::InvalidMode, "x")).status, 400);
  EXPECT_EQ(to_http_error(FilesystemError(Kind::NotFound, "x")).status, 404);
  EXPECT_EQ(to_http_error(FilesystemError(Kind::AlreadyExists, "x")).status,
            409);
  EXPECT_EQ(to_http_error(FilesystemError(Kind::Io, "x")).status, 500);
}

TEST(IdentityErrorStatus, CliUnavailableIsServiceUnavailable) {
  using host::IdentityError;
  using Kind = host::IdentityErrorKind;
  EXPECT_EQ(to_http_error(IdentityError(Kind::CliUnavailable, "x")).status, 503);
  EXPECT_EQ(to_http_error(IdentityError(Kind::CommandFailed, "x")).status, 500);
}

TEST(OrchestrationErrorStatus, StartFailureCarriesRetryContext) {
  deploy::OrchestrationError error(deploy::FailedStep::Start, "start failed",
                                   "c0ffee", 500);
  auto out = to_http_error(error);
  EXPECT_EQ(out.status, 502);
  EXPECT_EQ(out.details["stage"].asString(), "start");
  EXPECT_EQ(out.details["container_id"].asString(), "c0ffee");
  EXPECT_EQ(out.details["retryable_action"].asString(), "start");

  auto response = utils::create_error_response(out);
  EXPECT_EQ(response["status"].asString(), "error");
  EXPECT_EQ(response["code"].asInt(), 502);
  EXPECT_EQ(response["container_id"].asString(), "c0ffee");
}

TEST(OrchestrationErrorStatus, CreateFailureHasNoContainer) {
  auto out = to_http_error(
      deploy::OrchestrationError(deploy::FailedStep::Create, "conflict", {}, 409));
  EXPECT_EQ(out.status, 502);
  EXPECT_FALSE(out.details.isMember("container_id"));
  EXPECT_FALSE(out.details.isMember("retryable_action"));
  EXPECT_EQ(out.details["runtime_status"].asInt(), 409);
}

TEST(ValidationErrorStatus, ListsFields) {
  deploy::ValidationError error;
  error.add("name", "Database name is required");
  error.add("port", "Port must be between 1024 and 65535");

  auto out = to_http_error(error);
  EXPECT_EQ(out.status, 400);
  ASSERT_EQ(out.details["fields"].size(), 2u);
  EXPECT_EQ(out.details["fields"][1]["field"].asString(), "port");
}

TEST(CorsOrigin, WildcardAndAllowList) {
  config::CorsConfig cors;
  EXPECT_EQ(resolve_cors_origin(cors, "http://a.test"), "*");

  cors.origins = {"http://a.test"};
  EXPECT_EQ(resolve_cors_origin(cors, "http://a.test"), "http://a.test");
  EXPECT_FALSE(resolve_cors_origin(cors, "http://b.test").has_value());

  cors.enabled = false;
  EXPECT_FALSE(resolve_cors_origin(cors, "http://a.test").has_value());
}

TEST(PassthroughPath, BridgesOnlyThePodmanSubtree) {
  EXPECT_EQ(passthrough_path("/api/podman"), "/");
  EXPECT_EQ(passthrough_path("/api/podman/"), "/");
  EXPECT_EQ(passthrough_path("/api/podman/containers/json"),
            "/containers/json");
  EXPECT_FALSE(passthrough_path("/api/podmanX").has_value());
  EXPECT_FALSE(passthrough_path("/api/podmanX/containers/json").has_value());
  EXPECT_FALSE(passthrough_path("/api/other").has_value());
  EXPECT_FALSE(passthrough_path("/api/pod").has_value());
}

class ApiHandlersTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto gateway = std::make_shared<runtime::RuntimeGateway>(
        runtime::RuntimeEndpoint::from_path("/var/run/docker.sock"),
        transport_);
    auto orchestrator = std::make_shared<deploy::Orchestrator>(
        gateway, filesystem_, probe_, deploy::TemplateCatalog{});
    handlers_ = std::make_unique<ApiHandlers>(gateway, orchestrator,
                                              filesystem_, probe_);
    ON_CALL(*probe_, probe(_))
        .WillByDefault(Return(host::IdentityResult::Ok(
            host::ImageIdentity{999, 999, "mysql"})));
  }

  static Json::Value deploy_body() {
    Json::Value body;
    body["type"] = "mariadb";
    body["name"] = "test-db";
    body["version"] = "11.4";
    body["root_password"] = "secret";
    body["port"] = 15000;
    return body;
  }

  std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
  std::shared_ptr<::testing::NiceMock<host::MockFilesystem>> filesystem_ =
      std::make_shared<::testing::NiceMock<host::MockFilesystem>>();
  std::shared_ptr<::testing::NiceMock<host::MockIdentityProbe>> probe_ =
      std::make_shared<::testing::NiceMock<host::MockIdentityProbe>>();
  std::unique_ptr<ApiHandlers> handlers_;
};

TEST_F(ApiHandlersTest, HealthyRuntime) {
  transport_->reply("GET", "/info", 200, R"({"ServerVersion":"24.0.7"})");

  auto health = handlers_->health();
  ASSERT_TRUE(health);
  const auto &body = health.value();
  EXPECT_EQ(body["status"].asString(), "healthy");
  EXPECT_EQ(body["docker"]["version"].asString(), "24.0.7");
  EXPECT_EQ(body["docker"]["apiVersion"].asString(), "1.41");
  EXPECT_EQ(body["docker"]["socketPath"].asString(), "/var/run/docker.sock");
}

TEST_F(ApiHandlersTest, UnreachableRuntimeIsUnhealthy) {
  transport_->fail("GET", "/info",
                   runtime::GatewayError::transport("connection refused"));

  auto health = handlers_->health();
  ASSERT_FALSE(health);
  EXPECT_EQ(health.error().status, 503);
  EXPECT_EQ(health.error().details["status"].asString(), "unhealthy");

  auto response = utils::create_error_response(health.error());
  EXPECT_EQ(response["status"].asString(), "unhealthy");
}

TEST_F(ApiHandlersTest, ManagedOnlyFiltersList) {
  transport_->reply("GET", "/containers/json", 200, R"([
    {"Id":"a","Names":["/db-mariadb-one"],"State":"running",
     "Labels":{"db-manager.managed":"true"}},
    {"Id":"b","Names":["/nginx"],"State":"running","Labels":{}}
  ])");

  auto all = handlers_->list_containers(true, false);
  ASSERT_TRUE(all);
  EXPECT_EQ(all.value()["data"]["count"].asInt(), 2);

  auto managed = handlers_->list_containers(true, true);
  ASSERT_TRUE(managed);
  EXPECT_EQ(managed.value()["data"]["count"].asInt(), 1);
  EXPECT_EQ(managed.value()["data"]["containers"][0]["name"].asString(),
            "db-mariadb-one");
}

TEST_F(ApiHandlersTest, MissingContainerIsNotFound) {
  transport_->reply("POST", "/containers/ghost/stop", 404,
                    R"({"message":"No such container: ghost"})");

  auto stopped =
      handlers_->container_action(runtime::Operation::StopContainer, "ghost");
  ASSERT_FALSE(stopped);
  EXPECT_EQ(stopped.error().status, 404);
}

TEST_F(ApiHandlersTest, LogsJoinLines) {
  transport_->reply("GET", "/containers/abc/logs", 200, "first\nsecond\n",
                    "text/plain");

  auto logs = handlers_->container_logs("abc", 2);
  ASSERT_TRUE(logs);
  EXPECT_EQ(logs.value()["data"]["logs"].asString(), "first\nsecond");
  EXPECT_EQ(logs.value()["data"]["lines"].size(), 2u);
  EXPECT_THAT(transport_->requests().front().target, HasSubstr("tail=2"));
}

TEST_F(ApiHandlersTest, DeployReportsMissingField) {
  auto body = deploy_body();
  body.removeMember("version");

  auto deployed = handlers_->deploy(body);
  ASSERT_FALSE(deployed);
  EXPECT_EQ(deployed.error().status, 400);
  EXPECT_EQ(deployed.error().message, "Missing required field: version");
  EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(ApiHandlersTest, DeployRejectsUnknownEngine) {
  auto body = deploy_body();
  body["type"] = "mongodb";

  auto deployed = handlers_->deploy(body);
  ASSERT_FALSE(deployed);
  EXPECT_EQ(deployed.error().message, "Unsupported database type: mongodb");
}

TEST_F(ApiHandlersTest, DeployRejectsInvalidPortWithFields) {
  auto body = deploy_body();
  body["port"] = "80";

  auto deployed = handlers_->deploy(body);
  ASSERT_FALSE(deployed);
  EXPECT_EQ(deployed.error().status, 400);
  EXPECT_EQ(deployed.error().details["fields"][0]["field"].asString(), "port");
}

TEST_F(ApiHandlersTest, DeploySucceeds) {
  transport_->reply("POST", "/images/create", 200, R"({"status":"done"})");
  transport_->reply("POST", "/containers/create", 201, R"({"Id":"c0ffee"})");
  transport_->reply("POST", "/containers/c0ffee/start", 204, "");

  auto deployed = handlers_->deploy(deploy_body());
  ASSERT_TRUE(deployed) << deployed.error().message;
  const auto &data = deployed.value()["data"];
  EXPECT_EQ(data["container_id"].asString(), "c0ffee");
  EXPECT_EQ(data["container_name"].asString(), "db-mariadb-test-db");
  EXPECT_EQ(data["identity"]["uid"].asUInt(), 999u);
  EXPECT_EQ(data["identity_source"].asString(), "discovered");
  EXPECT_EQ(data["stage"].asString(), "done");
}

TEST_F(ApiHandlersTest, StatOfMissingPathIsNotFound) {
  host::PathInfo info;
  info.path = "/nowhere";
  EXPECT_CALL(*filesystem_, stat("/nowhere"))
      .WillOnce(Return(host::FsResult<host::PathInfo>::Ok(info)));

  auto stat = handlers_->stat_path("/nowhere");
  ASSERT_FALSE(stat);
  EXPECT_EQ(stat.error().status, 404);
  EXPECT_EQ(stat.error().message, "Path not found");
}

TEST_F(ApiHandlersTest, ListingDefaultsToRoot) {
  host::DirectoryListing listing;
  listing.current_path = "/";
  listing.directories = {{"srv", "/srv"}};
  EXPECT_CALL(*filesystem_, list_directories("/"))
      .WillOnce(Return(host::FsResult<host::DirectoryListing>::Ok(listing)));

  auto listed = handlers_->list_directories("");
  ASSERT_TRUE(listed);
  const auto &data = listed.value()["data"];
  EXPECT_TRUE(data["parent_path"].isNull());
  EXPECT_EQ(data["directories"][0]["path"].asString(), "/srv");
}

TEST_F(ApiHandlersTest, MakeDirectoryRequiresPathAndName) {
  Json::Value body;
  body["path"] = "/srv";
  body["name"] = "";
  EXPECT_CALL(*filesystem_, make_directory(_, _, _)).Times(0);

  auto made = handlers_->make_directory(body);
  ASSERT_FALSE(made);
  EXPECT_EQ(made.error().message, "Path and name are required");
}

TEST_F(ApiHandlersTest, MakeDirectoryDescribesOperations) {
  Json::Value body;
  body["path"] = "/srv";
  body["name"] = "pgdata";
  body["mode"] = 750;

  host::CreatedDirectory created;
  created.path = "/srv/pgdata";
  created.operations = {"permissions set to 750"};
  EXPECT_CALL(*filesystem_,
              make_directory("/srv", "pgdata",
                             ::testing::Field(&host::MakeDirectoryOptions::mode,
                                              ::testing::Optional(
                                                  std::string("750")))))
      .WillOnce(Return(host::FsResult<host::CreatedDirectory>::Ok(created)));

  auto made = handlers_->make_directory(body);
  ASSERT_TRUE(made);
  EXPECT_EQ(made.value()["data"]["message"].asString(),
            "Directory 'pgdata' created successfully with permissions set to "
            "750");
}

TEST_F(ApiHandlersTest, UserInfoReportsProbeFailure) {
  Json::Value body;
  body["image"] = "mariadb:11";
  EXPECT_CALL(*probe_, probe("mariadb:11"))
      .WillOnce(Return(host::IdentityResult::Error(host::IdentityError(
          host::IdentityErrorKind::CliUnavailable, "no cli"))));

  auto info = handlers_->user_info(body);
  ASSERT_FALSE(info);
  EXPECT_EQ(info.error().status, 503);

  Json::Value empty;
  empty["image"] = "";
  auto missing = handlers_->user_info(empty);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().message, "Image name is required");
}

TEST_F(ApiHandlersTest, ForwardRelaysJsonAndLogs) {
  transport_->reply("GET", "/v1.41/version", 200, R"({"ApiVersion":"1.41"})");
  auto version = handlers_->forward("GET", "/version", "", "");
  ASSERT_TRUE(version);
  EXPECT_EQ(version.value().status, 200);
  EXPECT_EQ(version.value().content_type, "application/json");
  EXPECT_THAT(version.value().body, HasSubstr("\"ApiVersion\""));

  std::string framed("\x01\x00\x00\x00\x00\x00\x00\x06ready\n", 14);
  transport_->reply("GET", "/containers/abc/logs", 200, framed,
                    "application/vnd.docker.raw-stream");
  auto logs = handlers_->forward("GET", "/containers/abc/logs", "tail=5", "");
  ASSERT_TRUE(logs);
  EXPECT_EQ(logs.value().content_type, "text/plain");
  EXPECT_EQ(logs.value().body, "ready");

  auto rejected = handlers_->forward("GET", "/../etc/passwd", "", "");
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().status, 400);
}

} // namespace
} // namespace dbdock::api
