#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "gateway.hpp"

namespace dbdock::runtime {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using fakes::FakeTransport;

std::string log_frame(char stream, std::string_view payload) {
  std::string out(8, '\0');
  out[0] = stream;
  auto length = static_cast<uint32_t>(payload.size());
  out[4] = static_cast<char>((length >> 24) & 0xFF);
  out[5] = static_cast<char>((length >> 16) & 0xFF);
  out[6] = static_cast<char>((length >> 8) & 0xFF);
  out[7] = static_cast<char>(length & 0xFF);
  out.append(payload);
  return out;
}

class GatewayTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();

  RuntimeGateway docker() const {
    return {RuntimeEndpoint::from_path("/var/run/docker.sock"), transport_};
  }
  RuntimeGateway podman() const {
    return {RuntimeEndpoint::from_path("/run/podman/podman.sock"), transport_};
  }
};

TEST_F(GatewayTest, InfoReturnsParsedBody) {
  transport_->reply("GET", "/v1.41/info", 200,
                    R"({"ServerVersion":"24.0.7","Containers":3})");

  auto info = docker().info();
  ASSERT_TRUE(info);
  EXPECT_EQ(info.value()["ServerVersion"], "24.0.7");
  EXPECT_EQ(transport_->requests().front().target, "/v1.41/info");
}

TEST_F(GatewayTest, ListNormalizesRecords) {
  transport_->reply("GET", "/containers/json", 200,
                    R"([{"Id":"a1","Names":["/one"],"State":"running"},
                        {"Id":"b2","Names":["/two"],"State":"exited"}])");

  auto list = podman().list_containers(true);
  ASSERT_TRUE(list);
  ASSERT_EQ(list.value().size(), 2u);
  EXPECT_EQ(list.value()[0].name, "one");
  EXPECT_EQ(list.value()[1].state, ContainerState::Stopped);
  EXPECT_THAT(transport_->requests().front().target,
              HasSubstr("/v4.0.0/libpod/containers/json?all=true"));
}

TEST_F(GatewayTest, NotFoundBecomesRuntimeError) {
  transport_->reply("GET", "/containers/ghost/json", 404,
                    R"({"message":"No such container: ghost"})");

  auto record = docker().inspect_container("ghost");
  ASSERT_FALSE(record);
  EXPECT_TRUE(record.error().is(GatewayErrorKind::Runtime));
  EXPECT_EQ(record.error().status_code(), 404);
  EXPECT_THAT(record.error().message(), HasSubstr("No such container: ghost"));
}

TEST_F(GatewayTest, CreateThenStart) {
  transport_->reply("POST", "/containers/create", 201,
                    R"({"Id":"c0ffee","Warnings":[]})");
  transport_->reply("POST", "/containers/c0ffee/start", 204, "");

  ContainerSpec spec;
  spec.name = "db-postgresql-orders";
  spec.image = "docker.io/library/postgres:16";

  auto created = docker().create_container(spec);
  ASSERT_TRUE(created);
  EXPECT_EQ(created.value().id, "c0ffee");

  auto started = docker().start_container(created.value().id);
  EXPECT_TRUE(started);

  const auto &create_request = transport_->requests().front();
  EXPECT_EQ(create_request.target,
            "/v1.41/containers/create?name=db-postgresql-orders");
  EXPECT_THAT(create_request.body, HasSubstr("postgres:16"));
}

TEST_F(GatewayTest, CreateWithoutIdIsDecodeError) {
  transport_->reply("POST", "/containers/create", 201, R"({"Warnings":[]})");
  ContainerSpec spec;
  spec.name = "x";
  spec.image = "busybox";

  auto created = docker().create_container(spec);
  ASSERT_FALSE(created);
  EXPECT_TRUE(created.error().is(GatewayErrorKind::Decode));
}

TEST_F(GatewayTest, PullSucceedsOnCleanProgressStream) {
  transport_->reply("POST", "/images/pull", 200,
                    "{\"stream\":\"Trying to pull docker.io/library/postgres:16...\"}\n"
                    "{\"images\":[\"5f1e\"],\"id\":\"5f1e\"}\n");
  EXPECT_TRUE(podman().pull_image("postgres:16"));
}

TEST_F(GatewayTest, PullErrorInsideStreamFailsThePull) {
  transport_->reply("POST", "/images/pull", 200,
                    "{\"stream\":\"Trying to pull quay.io/nope:1...\"}\n"
                    "{\"error\":\"initializing source: manifest unknown\"}\n");

  auto pulled = podman().pull_image("quay.io/nope:1");
  ASSERT_FALSE(pulled);
  EXPECT_TRUE(pulled.error().is(GatewayErrorKind::Runtime));
  EXPECT_THAT(pulled.error().message(), HasSubstr("manifest unknown"));
}

TEST_F(GatewayTest, DockerPullErrorDetailFailsThePull) {
  transport_->reply("POST", "/images/create", 200,
                    R"({"errorDetail":{"message":"pull access denied"},"error":"pull access denied"})");

  auto pulled = docker().pull_image("private/db:1");
  ASSERT_FALSE(pulled);
  EXPECT_THAT(pulled.error().message(), HasSubstr("pull access denied"));
}

TEST_F(GatewayTest, NotModifiedStartCountsAsSuccess) {
  transport_->reply("POST", "/containers/abc/start", 304, "", "text/plain");
  EXPECT_TRUE(docker().start_container("abc"));

  transport_->reply("POST", "/containers/abc/restart", 304, "", "text/plain");
  EXPECT_FALSE(docker().restart_container("abc"));
}

TEST_F(GatewayTest, LogsAreDemultiplexed) {
  transport_->reply("GET", "/containers/abc/logs", 200,
                    log_frame(1, "ready\n") + log_frame(2, "slow query\n"),
                    "application/vnd.docker.raw-stream");

  auto logs = docker().container_logs("abc", 10);
  ASSERT_TRUE(logs);
  EXPECT_THAT(logs.value(), ElementsAre("ready", "slow query"));
}

TEST_F(GatewayTest, MalformedJsonFallsBackToText) {
  transport_->reply("GET", "/v1.41/info", 200, "{not json");

  auto result = docker().invoke(Operation::RuntimeInfo, {});
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value().json(), nullptr);
  EXPECT_EQ(result.value().text(), "{not json");

  auto info = docker().info();
  ASSERT_FALSE(info);
  EXPECT_TRUE(info.error().is(GatewayErrorKind::Decode));
}

TEST_F(GatewayTest, TransportFailurePropagates) {
  transport_->fail("GET", "/info",
                   GatewayError::transport("connection refused"));

  auto info = podman().info();
  ASSERT_FALSE(info);
  EXPECT_TRUE(info.error().is(GatewayErrorKind::Transport));
}

TEST_F(GatewayTest, StatsNormalizeLibpodReport) {
  transport_->reply("GET", "/containers/abc/stats", 200,
                    R"({"Error":null,"Stats":[{"CPU":1.5,"PIDs":4}]})");

  auto stats = podman().container_stats("abc");
  ASSERT_TRUE(stats);
  EXPECT_DOUBLE_EQ(stats.value().cpu_percent, 1.5);
  EXPECT_EQ(stats.value().pids, 4u);
  EXPECT_THAT(transport_->requests().front().target,
              HasSubstr("stream=false"));
}

TEST_F(GatewayTest, ForwardKeepsNonSuccessStatus) {
  transport_->reply("DELETE", "/v4.0.0/libpod/containers/abc", 409,
                    R"({"cause":"container is running"})");

  auto result = podman().forward("DELETE", "/containers/abc", "", "");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value().status_code, 409);
  ASSERT_NE(result.value().json(), nullptr);
  EXPECT_EQ((*result.value().json())["cause"], "container is running");
}

} // namespace
} // namespace dbdock::runtime
