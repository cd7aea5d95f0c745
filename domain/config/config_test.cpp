#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "config.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace dbdock::config {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;

EnvLookup env_from(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const char *name)
             -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

TEST(ParseConfig, NullDocumentGivesDefaults) {
  auto config = parse_config(nlohmann::json());
  ASSERT_TRUE(config);
  EXPECT_EQ(config.value().server.host, "127.0.0.1");
  EXPECT_EQ(config.value().server.port, 3000);
  EXPECT_TRUE(config.value().socket.auto_detect);
  EXPECT_EQ(config.value().storage.default_mode, "755");
  EXPECT_EQ(config.value().logging.log_level, "info");
}

TEST(ParseConfig, ReadsEverySection) {
  auto config = parse_config_text(R"({
    "server": {"host": "0.0.0.0", "port": 8080, "threads": 4,
               "cors": {"enabled": true, "origins": ["http://localhost:5173"]}},
    "containerSocket": {"autoDetect": false, "path": "/tmp/podman.sock"},
    "storage": {"defaultPermissions": {"mode": "750"},
                "defaultBasePath": "/srv/databases"},
    "logging": {"enabled": true, "logFile": "/var/log/dbdock.log",
                "logLevel": "debug", "consoleOutput": false},
    "templates": {"mariadb": {"image": "mariadb"}, "postgresql": "postgres"}
  })");
  ASSERT_TRUE(config) << config.error();

  const auto &value = config.value();
  EXPECT_EQ(value.server.host, "0.0.0.0");
  EXPECT_EQ(value.server.port, 8080);
  EXPECT_EQ(value.server.threads, 4u);
  EXPECT_THAT(value.server.cors.origins, ElementsAre("http://localhost:5173"));
  EXPECT_FALSE(value.socket.auto_detect);
  EXPECT_EQ(value.socket.path, "/tmp/podman.sock");
  EXPECT_EQ(value.storage.default_mode, "750");
  EXPECT_EQ(value.storage.default_base_path, "/srv/databases");
  EXPECT_EQ(value.logging.log_file, "/var/log/dbdock.log");
  EXPECT_FALSE(value.logging.console_output);
  EXPECT_THAT(value.template_repositories,
              ElementsAre(Pair("mariadb", "mariadb"),
                          Pair("postgresql", "postgres")));
}

TEST(ParseConfig, RejectsBadDocuments) {
  EXPECT_FALSE(parse_config_text("{not json"));
  EXPECT_FALSE(parse_config_text("[1, 2]"));

  auto wrong_type = parse_config_text(R"({"server": {"port": "eighty"}})");
  ASSERT_FALSE(wrong_type);
  EXPECT_THAT(wrong_type.error(), HasSubstr("invalid configuration value"));

  auto out_of_range = parse_config_text(R"({"server": {"port": 70000}})");
  ASSERT_FALSE(out_of_range);
  EXPECT_THAT(out_of_range.error(), HasSubstr("out of range"));
}

TEST(LoadConfig, MissingFileGivesDefaults) {
  auto config = load_config("/nonexistent/dbdock/config.server.json");
  ASSERT_TRUE(config);
  EXPECT_EQ(config.value().server.port, 3000);
}

TEST(LoadConfig, MalformedFileNamesThePath) {
  std::random_device rd;
  auto path = std::filesystem::temp_directory_path() /
              ("dbdock-config-" + std::to_string(rd()) + ".json");
  std::ofstream(path) << "{\"server\": ";

  auto config = load_config(path.string());
  std::filesystem::remove(path);

  ASSERT_FALSE(config);
  EXPECT_THAT(config.error(), HasSubstr(path.string()));
}

TEST(EnvOverrides, DockerSocketWinsOverPodman) {
  ServerConfig config;
  apply_env_overrides(config, env_from({{"DOCKER_SOCKET", "/d.sock"},
                                        {"PODMAN_SOCKET", "/p.sock"},
                                        {"HOST", "0.0.0.0"},
                                        {"PORT", "4000"}}));
  EXPECT_EQ(config.socket.path, "/d.sock");
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 4000);
}

TEST(EnvOverrides, InvalidPortIsIgnored) {
  ServerConfig config;
  apply_env_overrides(config, env_from({{"PODMAN_SOCKET", "/p.sock"},
                                        {"PORT", "40a0"}}));
  EXPECT_EQ(config.socket.path, "/p.sock");
  EXPECT_EQ(config.server.port, 3000);

  apply_env_overrides(config, env_from({{"PORT", "0"}}));
  EXPECT_EQ(config.server.port, 3000);
}

TEST(SocketCandidates, ExplicitPathIsTheOnlyCandidate) {
  ServerConfig config;
  config.socket.path = "/custom.sock";
  config.socket.candidates = {"/a.sock"};
  EXPECT_THAT(socket_candidates(config), ElementsAre("/custom.sock"));
}

TEST(SocketCandidates, ConfiguredListThenBuiltIns) {
  ServerConfig config;
  config.socket.candidates = {"/a.sock", "/b.sock"};
  EXPECT_THAT(socket_candidates(config), ElementsAre("/a.sock", "/b.sock"));

  config.socket.candidates.clear();
  auto builtins = socket_candidates(config);
  ASSERT_FALSE(builtins.empty());
  EXPECT_EQ(builtins.front(), "/var/run/docker.sock");

  config.socket.auto_detect = false;
  EXPECT_TRUE(socket_candidates(config).empty());
}

} // namespace
} // namespace dbdock::config
