#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "container_record.hpp"

namespace dbdock::runtime {
namespace {

using json = nlohmann::json;
using ::testing::ElementsAre;

TEST(NormalizeContainer, DockerListEntry) {
  auto record = normalize_container(json::parse(R"({
    "Id": "4f1c",
    "Names": ["/db-mariadb-test-db"],
    "Image": "quay.io/mariadb-foundation/mariadb-devel:11.4",
    "State": "running",
    "Status": "Up 5 minutes",
    "Created": 1718000000,
    "Ports": [{"PrivatePort": 3306, "PublicPort": 15000, "Type": "tcp",
               "IP": "0.0.0.0"}],
    "Labels": {"db-manager.managed": "true",
               "db-manager.database-type": "mariadb"},
    "Mounts": [{"Type": "bind", "Source": "/srv/data",
                "Destination": "/var/lib/mysql", "RW": true}],
    "NetworkSettings": {"Networks": {"bridge": {}}}
  })"));

  EXPECT_EQ(record.id, "4f1c");
  EXPECT_EQ(record.name, "db-mariadb-test-db");
  EXPECT_EQ(record.state, ContainerState::Running);
  EXPECT_EQ(record.status, "Up 5 minutes");
  EXPECT_EQ(record.created, 1718000000);
  ASSERT_EQ(record.ports.size(), 1u);
  EXPECT_EQ(record.ports[0].container_port, 3306);
  EXPECT_EQ(record.ports[0].host_port, 15000);
  EXPECT_EQ(record.ports[0].host_ip, "0.0.0.0");
  ASSERT_EQ(record.mounts.size(), 1u);
  EXPECT_EQ(record.mounts[0].source, "/srv/data");
  EXPECT_THAT(record.networks, ElementsAre("bridge"));
  EXPECT_TRUE(is_managed(record));
  EXPECT_TRUE(is_database(record));
}

TEST(NormalizeContainer, PodmanListEntry) {
  auto record = normalize_container(json::parse(R"({
    "Id": "9a0b",
    "Names": ["db-postgresql-orders"],
    "Image": "docker.io/library/postgres:16",
    "State": "exited",
    "Created": "2024-06-10T10:00:00Z",
    "Ports": [{"host_ip": "", "container_port": 5432, "host_port": 15432,
               "protocol": "tcp"}],
    "Labels": {"db-manager.managed": "true"},
    "Mounts": ["/var/lib/postgresql/data"],
    "Networks": ["podman"]
  })"));

  EXPECT_EQ(record.name, "db-postgresql-orders");
  EXPECT_EQ(record.state, ContainerState::Stopped);
  EXPECT_EQ(record.created, 0);
  EXPECT_EQ(record.created_text, "2024-06-10T10:00:00Z");
  ASSERT_EQ(record.ports.size(), 1u);
  EXPECT_EQ(record.ports[0].container_port, 5432);
  EXPECT_EQ(record.ports[0].host_port, 15432);
  ASSERT_EQ(record.mounts.size(), 1u);
  EXPECT_EQ(record.mounts[0].destination, "/var/lib/postgresql/data");
  EXPECT_THAT(record.networks, ElementsAre("podman"));
  EXPECT_TRUE(is_managed(record));
  EXPECT_FALSE(is_database(record));
}

TEST(NormalizeContainer, DockerInspectShape) {
  auto record = normalize_container(json::parse(R"({
    "Id": "4f1c",
    "Name": "/db-mariadb-test-db",
    "Image": "sha256:deadbeef",
    "State": {"Status": "paused", "Running": false},
    "Config": {"Image": "mariadb:11", "Labels": {"db-manager.managed": "true"}},
    "NetworkSettings": {
      "Ports": {"3306/tcp": [{"HostIp": "0.0.0.0", "HostPort": "15000"}],
                "33060/tcp": null},
      "Networks": {"bridge": {}}
    }
  })"));

  EXPECT_EQ(record.name, "db-mariadb-test-db");
  EXPECT_EQ(record.image, "mariadb:11");
  EXPECT_EQ(record.state, ContainerState::Paused);
  EXPECT_TRUE(is_managed(record));
  ASSERT_EQ(record.ports.size(), 2u);
  EXPECT_EQ(record.ports[0].container_port, 3306);
  EXPECT_EQ(record.ports[0].host_port, 15000);
  EXPECT_EQ(record.ports[1].container_port, 33060);
  EXPECT_EQ(record.ports[1].host_port, 0);
}

TEST(NormalizeContainer, MissingFieldsStayDefault) {
  auto record = normalize_container(json::object());
  EXPECT_TRUE(record.id.empty());
  EXPECT_EQ(record.state, ContainerState::Unknown);
  EXPECT_FALSE(is_managed(record));

  EXPECT_TRUE(normalize_container(json("not an object")).id.empty());
  EXPECT_TRUE(normalize_container_list(json::object()).empty());
}

TEST(ParseContainerState, MapsRuntimeVocabulary) {
  EXPECT_EQ(parse_container_state("running"), ContainerState::Running);
  EXPECT_EQ(parse_container_state("Exited"), ContainerState::Stopped);
  EXPECT_EQ(parse_container_state("created"), ContainerState::Stopped);
  EXPECT_EQ(parse_container_state("dead"), ContainerState::Stopped);
  EXPECT_EQ(parse_container_state("paused"), ContainerState::Paused);
  EXPECT_EQ(parse_container_state("restarting"), ContainerState::Restarting);
  EXPECT_EQ(parse_container_state("removing"), ContainerState::Unknown);
}

TEST(IsManaged, RequiresExactMarker) {
  ContainerRecord record;
  record.labels["db-manager.managed"] = "yes";
  EXPECT_FALSE(is_managed(record));
  record.labels["db-manager.managed"] = "true";
  EXPECT_TRUE(is_managed(record));
}

TEST(NormalizeStats, DockerDeltaFormula) {
  auto stats = normalize_stats(json::parse(R"({
    "cpu_stats": {"cpu_usage": {"total_usage": 300}, "system_cpu_usage": 2000,
                  "online_cpus": 2},
    "precpu_stats": {"cpu_usage": {"total_usage": 100},
                     "system_cpu_usage": 1000},
    "memory_stats": {"usage": 600, "limit": 1000, "stats": {"cache": 100}},
    "networks": {"eth0": {"rx_bytes": 10, "tx_bytes": 20},
                 "eth1": {"rx_bytes": 1, "tx_bytes": 2}},
    "blkio_stats": {"io_service_bytes_recursive": [
      {"op": "Read", "value": 7}, {"op": "Write", "value": 9},
      {"op": "read", "value": 3}]},
    "pids_stats": {"current": 12}
  })"));

  EXPECT_DOUBLE_EQ(stats.cpu_percent, 40.0);
  EXPECT_EQ(stats.memory_usage, 500u);
  EXPECT_EQ(stats.memory_limit, 1000u);
  EXPECT_DOUBLE_EQ(stats.memory_percent, 50.0);
  EXPECT_EQ(stats.network_rx, 11u);
  EXPECT_EQ(stats.network_tx, 22u);
  EXPECT_EQ(stats.block_read, 10u);
  EXPECT_EQ(stats.block_write, 9u);
  EXPECT_EQ(stats.pids, 12u);
}

TEST(NormalizeStats, LibpodReportShape) {
  auto stats = normalize_stats(json::parse(R"({
    "Error": null,
    "Stats": [{"CPU": 12.5, "MemUsage": 2048, "MemLimit": 4096,
               "MemPerc": 50.0, "NetInput": 5, "NetOutput": 6,
               "BlockInput": 7, "BlockOutput": 8, "PIDs": 3}]
  })"));

  EXPECT_DOUBLE_EQ(stats.cpu_percent, 12.5);
  EXPECT_EQ(stats.memory_usage, 2048u);
  EXPECT_EQ(stats.memory_limit, 4096u);
  EXPECT_EQ(stats.network_tx, 6u);
  EXPECT_EQ(stats.block_write, 8u);
  EXPECT_EQ(stats.pids, 3u);
}

TEST(NormalizeStats, EmptyInputIsZero) {
  auto stats = normalize_stats(json::object());
  EXPECT_EQ(stats.memory_usage, 0u);
  EXPECT_DOUBLE_EQ(stats.cpu_percent, 0.0);
}

TEST(ToJson, ExposesStateAsTextAndManagedFlag) {
  ContainerRecord record;
  record.id = "abc";
  record.state = ContainerState::Running;
  record.labels["db-manager.managed"] = "true";

  auto out = to_json(record);
  EXPECT_EQ(out["state"], "running");
  EXPECT_EQ(out["managed"], true);
  EXPECT_EQ(out["created"], 0);
}

} // namespace
} // namespace dbdock::runtime
