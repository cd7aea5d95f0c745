#ifndef DBDOCK_RUNTIME_CONTAINER_RECORD_HPP
#define DBDOCK_RUNTIME_CONTAINER_RECORD_HPP

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace dbdock::runtime {

namespace labels {
inline constexpr std::string_view kNamespace = "db-manager";
inline constexpr std::string_view kManaged = "db-manager.managed";
inline constexpr std::string_view kDatabaseType = "db-manager.database-type";
inline constexpr std::string_view kDatabaseName = "db-manager.database-name";
inline constexpr std::string_view kDatabasePort = "db-manager.database-port";
inline constexpr std::string_view kManagedMarker = "true";
} // namespace labels

enum class ContainerState { Running, Stopped, Paused, Restarting, Unknown };

std::string_view to_string(ContainerState state);
ContainerState parse_container_state(std::string_view raw);

struct PortBinding {
  int container_port = 0;
  int host_port = 0;
  std::string protocol = "tcp";
  std::string host_ip;
};

struct MountSummary {
  std::string type;
  std::string source;
  std::string destination;
  bool read_write = true;
};

struct ContainerRecord {
  std::string id;
  std::string name;
  std::string image;
  ContainerState state = ContainerState::Unknown;
  std::string status;
  std::vector<PortBinding> ports;
  // Unix seconds when the runtime reports a number, otherwise 0 and the
  // runtime's own text lands in created_text.
  int64_t created = 0;
  std::string created_text;
  std::map<std::string, std::string> labels;
  std::vector<MountSummary> mounts;
  std::vector<std::string> networks;

  std::string label(std::string_view key) const;
};

// Merges Docker and Podman list/inspect shapes. Never fails: whatever is
// missing stays at its default.
ContainerRecord normalize_container(const nlohmann::json &raw);

std::vector<ContainerRecord> normalize_container_list(const nlohmann::json &raw);

bool is_managed(const ContainerRecord &record);
bool is_database(const ContainerRecord &record);

struct StatsSnapshot {
  double cpu_percent = 0.0;
  uint64_t memory_usage = 0;
  uint64_t memory_limit = 0;
  double memory_percent = 0.0;
  uint64_t network_rx = 0;
  uint64_t network_tx = 0;
  uint64_t block_read = 0;
  uint64_t block_write = 0;
  uint64_t pids = 0;
};

// Accepts the Docker-compatible one-shot shape (cpu_stats/precpu_stats/...)
// and the libpod report shape ({"Stats":[{...}]}).
StatsSnapshot normalize_stats(const nlohmann::json &raw);

nlohmann::json to_json(const ContainerRecord &record);
nlohmann::json to_json(const StatsSnapshot &stats);

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_CONTAINER_RECORD_HPP
