#include "container_record.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cstdlib>
#include <initializer_list>

namespace dbdock::runtime {

namespace {

using json = nlohmann::json;

const json &null_json() {
  static const json value;
  return value;
}

const json &child(const json &obj, const char *key) {
  if (!obj.is_object()) {
    return null_json();
  }
  auto it = obj.find(key);
  return it == obj.end() ? null_json() : *it;
}

// First present, non-null key.
const json &either(const json &obj, std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    const json &value = child(obj, key);
    if (!value.is_null()) {
      return value;
    }
  }
  return null_json();
}

const json &at_path(const json &obj, std::initializer_list<const char *> path) {
  const json *current = &obj;
  for (const char *key : path) {
    current = &child(*current, key);
    if (current->is_null()) {
      break;
    }
  }
  return *current;
}

std::string text(const json &value) {
  return value.is_string() ? value.get<std::string>() : std::string{};
}

uint64_t u64(const json &value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer()) {
    auto v = value.get<int64_t>();
    return v > 0 ? static_cast<uint64_t>(v) : 0;
  }
  if (value.is_number_float()) {
    auto v = value.get<double>();
    return v > 0 ? static_cast<uint64_t>(v) : 0;
  }
  return 0;
}

double f64(const json &value) {
  return value.is_number() ? value.get<double>() : 0.0;
}

int port_number(const json &value) {
  if (value.is_number()) {
    return value.get<int>();
  }
  if (value.is_string()) {
    return std::atoi(value.get<std::string>().c_str());
  }
  return 0;
}

std::string strip_slash(std::string name) {
  if (!name.empty() && name.front() == '/') {
    name.erase(0, 1);
  }
  return name;
}

std::string record_name(const json &raw) {
  const json &names = either(raw, {"Names", "names"});
  if (names.is_array() && !names.empty() && names.front().is_string()) {
    return strip_slash(names.front().get<std::string>());
  }
  return strip_slash(text(either(raw, {"Name", "name"})));
}

std::string record_image(const json &raw) {
  std::string configured = text(at_path(raw, {"Config", "Image"}));
  if (!configured.empty()) {
    return configured;
  }
  std::string named = text(child(raw, "ImageName"));
  if (!named.empty()) {
    return named;
  }
  return text(either(raw, {"Image", "image"}));
}

ContainerState record_state(const json &raw) {
  const json &state = either(raw, {"State", "state"});
  if (state.is_string()) {
    return parse_container_state(state.get<std::string>());
  }
  if (state.is_object()) {
    return parse_container_state(text(either(state, {"Status", "status"})));
  }
  return ContainerState::Unknown;
}

std::map<std::string, std::string> record_labels(const json &raw) {
  const json *source = &either(raw, {"Labels", "labels"});
  if (!source->is_object()) {
    source = &at_path(raw, {"Config", "Labels"});
  }
  std::map<std::string, std::string> out;
  if (!source->is_object()) {
    return out;
  }
  for (const auto &[key, value] : source->items()) {
    if (value.is_string()) {
      out.emplace(key, value.get<std::string>());
    }
  }
  return out;
}

PortBinding port_from_entry(const json &entry) {
  PortBinding port;
  port.container_port =
      port_number(either(entry, {"PrivatePort", "container_port"}));
  port.host_port = port_number(either(entry, {"PublicPort", "host_port"}));
  std::string protocol = text(either(entry, {"Type", "protocol"}));
  if (!protocol.empty()) {
    port.protocol = protocol;
  }
  port.host_ip = text(either(entry, {"IP", "host_ip"}));
  return port;
}

// Inspect form: {"3306/tcp": [{"HostIp": "", "HostPort": "15000"}] | null}
void ports_from_map(const json &map, std::vector<PortBinding> &out) {
  for (const auto &[key, bindings] : map.items()) {
    PortBinding base;
    auto slash = key.find('/');
    base.container_port = std::atoi(key.substr(0, slash).c_str());
    if (slash != std::string::npos) {
      base.protocol = key.substr(slash + 1);
    }
    if (!bindings.is_array() || bindings.empty()) {
      out.push_back(base);
      continue;
    }
    for (const auto &binding : bindings) {
      PortBinding port = base;
      port.host_port = port_number(child(binding, "HostPort"));
      port.host_ip = text(child(binding, "HostIp"));
      out.push_back(port);
    }
  }
}

std::vector<PortBinding> record_ports(const json &raw) {
  std::vector<PortBinding> out;
  const json &ports = either(raw, {"Ports", "ports"});
  if (ports.is_array()) {
    for (const auto &entry : ports) {
      if (entry.is_object()) {
        out.push_back(port_from_entry(entry));
      }
    }
    return out;
  }
  const json &mapped = at_path(raw, {"NetworkSettings", "Ports"});
  if (mapped.is_object()) {
    ports_from_map(mapped, out);
  }
  return out;
}

std::vector<MountSummary> record_mounts(const json &raw) {
  std::vector<MountSummary> out;
  const json &mounts = either(raw, {"Mounts", "mounts"});
  if (!mounts.is_array()) {
    return out;
  }
  for (const auto &entry : mounts) {
    MountSummary mount;
    if (entry.is_string()) {
      // libpod list reports destinations only
      mount.destination = entry.get<std::string>();
    } else if (entry.is_object()) {
      mount.type = text(either(entry, {"Type", "type"}));
      mount.source = text(either(entry, {"Source", "source"}));
      mount.destination = text(either(entry, {"Destination", "destination"}));
      const json &rw = either(entry, {"RW", "rw"});
      mount.read_write = rw.is_boolean() ? rw.get<bool>() : true;
    } else {
      continue;
    }
    out.push_back(std::move(mount));
  }
  return out;
}

std::vector<std::string> record_networks(const json &raw) {
  std::vector<std::string> out;
  const json *networks = &at_path(raw, {"NetworkSettings", "Networks"});
  if (networks->is_null()) {
    networks = &either(raw, {"Networks", "networks"});
  }
  if (networks->is_object()) {
    for (const auto &[key, value] : networks->items()) {
      out.push_back(key);
    }
  } else if (networks->is_array()) {
    for (const auto &value : *networks) {
      if (value.is_string()) {
        out.push_back(value.get<std::string>());
      }
    }
  }
  return out;
}

uint64_t blkio_total(const json &entries, std::string_view op) {
  uint64_t total = 0;
  if (!entries.is_array()) {
    return total;
  }
  for (const auto &entry : entries) {
    if (boost::algorithm::iequals(text(child(entry, "op")), op)) {
      total += u64(child(entry, "value"));
    }
  }
  return total;
}

StatsSnapshot docker_stats(const json &raw) {
  StatsSnapshot stats;

  const json &cpu = child(raw, "cpu_stats");
  const json &precpu = child(raw, "precpu_stats");
  double cpu_delta =
      f64(at_path(cpu, {"cpu_usage", "total_usage"})) -
      f64(at_path(precpu, {"cpu_usage", "total_usage"}));
  double system_delta = f64(child(cpu, "system_cpu_usage")) -
                        f64(child(precpu, "system_cpu_usage"));
  double online = f64(child(cpu, "online_cpus"));
  if (online <= 0) {
    const json &percpu = at_path(cpu, {"cpu_usage", "percpu_usage"});
    online = percpu.is_array() && !percpu.empty()
                 ? static_cast<double>(percpu.size())
                 : 1.0;
  }
  if (cpu_delta > 0 && system_delta > 0) {
    stats.cpu_percent = cpu_delta / system_delta * online * 100.0;
  }

  const json &memory = child(raw, "memory_stats");
  uint64_t usage = u64(child(memory, "usage"));
  const json &memory_detail = child(memory, "stats");
  uint64_t cache = u64(child(memory_detail, "cache"));
  if (cache == 0) {
    cache = u64(child(memory_detail, "inactive_file"));
  }
  stats.memory_usage = usage > cache ? usage - cache : usage;
  stats.memory_limit = u64(child(memory, "limit"));
  if (stats.memory_limit > 0) {
    stats.memory_percent = static_cast<double>(stats.memory_usage) /
                           static_cast<double>(stats.memory_limit) * 100.0;
  }

  const json &networks = child(raw, "networks");
  if (networks.is_object()) {
    for (const auto &[name, counters] : networks.items()) {
      stats.network_rx += u64(child(counters, "rx_bytes"));
      stats.network_tx += u64(child(counters, "tx_bytes"));
    }
  }

  const json &io = at_path(raw, {"blkio_stats", "io_service_bytes_recursive"});
  stats.block_read = blkio_total(io, "read");
  stats.block_write = blkio_total(io, "write");

  stats.pids = u64(at_path(raw, {"pids_stats", "current"}));
  return stats;
}

StatsSnapshot libpod_report_stats(const json &entry) {
  StatsSnapshot stats;
  stats.cpu_percent = f64(child(entry, "CPU"));
  stats.memory_usage = u64(child(entry, "MemUsage"));
  stats.memory_limit = u64(child(entry, "MemLimit"));
  stats.memory_percent = f64(child(entry, "MemPerc"));
  stats.network_rx = u64(child(entry, "NetInput"));
  stats.network_tx = u64(child(entry, "NetOutput"));
  stats.block_read = u64(child(entry, "BlockInput"));
  stats.block_write = u64(child(entry, "BlockOutput"));
  stats.pids = u64(child(entry, "PIDs"));
  return stats;
}

} // namespace

std::string_view to_string(ContainerState state) {
  switch (state) {
  case ContainerState::Running:
    return "running";
  case ContainerState::Stopped:
    return "stopped";
  case ContainerState::Paused:
    return "paused";
  case ContainerState::Restarting:
    return "restarting";
  case ContainerState::Unknown:
    return "unknown";
  }
  return "unknown";
}

ContainerState parse_container_state(std::string_view raw) {
  std::string state = boost::algorithm::to_lower_copy(std::string(raw));
  boost::algorithm::trim(state);
  if (state == "running") {
    return ContainerState::Running;
  }
  if (state == "exited" || state == "stopped" || state == "created" ||
      state == "dead" || state == "configured") {
    return ContainerState::Stopped;
  }
  if (state == "paused") {
    return ContainerState::Paused;
  }
  if (state == "restarting") {
    return ContainerState::Restarting;
  }
  return ContainerState::Unknown;
}

std::string ContainerRecord::label(std::string_view key) const {
  auto it = labels.find(std::string(key));
  return it == labels.end() ? std::string{} : it->second;
}

ContainerRecord normalize_container(const json &raw) {
  ContainerRecord record;
  if (!raw.is_object()) {
    return record;
  }

  record.id = text(either(raw, {"Id", "id"}));
  record.name = record_name(raw);
  record.image = record_image(raw);
  record.state = record_state(raw);
  record.status = text(either(raw, {"Status", "status"}));
  record.ports = record_ports(raw);

  const json &created = either(raw, {"Created", "created"});
  if (created.is_number()) {
    record.created = static_cast<int64_t>(u64(created));
  } else {
    record.created_text = text(created);
  }

  record.labels = record_labels(raw);
  record.mounts = record_mounts(raw);
  record.networks = record_networks(raw);
  return record;
}

std::vector<ContainerRecord> normalize_container_list(const json &raw) {
  std::vector<ContainerRecord> out;
  if (!raw.is_array()) {
    return out;
  }
  out.reserve(raw.size());
  for (const auto &entry : raw) {
    out.push_back(normalize_container(entry));
  }
  return out;
}

bool is_managed(const ContainerRecord &record) {
  return record.label(labels::kManaged) == labels::kManagedMarker;
}

bool is_database(const ContainerRecord &record) {
  return is_managed(record) && record.labels.count(std::string(
                                   labels::kDatabaseType)) > 0;
}

StatsSnapshot normalize_stats(const json &raw) {
  const json &reports = child(raw, "Stats");
  if (reports.is_array()) {
    return reports.empty() ? StatsSnapshot{}
                           : libpod_report_stats(reports.front());
  }
  return docker_stats(raw);
}

json to_json(const ContainerRecord &record) {
  json ports = json::array();
  for (const auto &port : record.ports) {
    ports.push_back({{"container_port", port.container_port},
                     {"host_port", port.host_port},
                     {"protocol", port.protocol},
                     {"host_ip", port.host_ip}});
  }

  json mounts = json::array();
  for (const auto &mount : record.mounts) {
    mounts.push_back({{"type", mount.type},
                      {"source", mount.source},
                      {"destination", mount.destination},
                      {"rw", mount.read_write}});
  }

  json out = {{"id", record.id},
              {"name", record.name},
              {"image", record.image},
              {"state", std::string(to_string(record.state))},
              {"status", record.status},
              {"ports", ports},
              {"labels", record.labels},
              {"mounts", mounts},
              {"networks", record.networks},
              {"managed", is_managed(record)}};
  if (record.created_text.empty()) {
    out["created"] = record.created;
  } else {
    out["created"] = record.created_text;
  }
  return out;
}

json to_json(const StatsSnapshot &stats) {
  return {{"cpu_percent", stats.cpu_percent},
          {"memory_usage", stats.memory_usage},
          {"memory_limit", stats.memory_limit},
          {"memory_percent", stats.memory_percent},
          {"network_rx", stats.network_rx},
          {"network_tx", stats.network_tx},
          {"block_read", stats.block_read},
          {"block_write", stats.block_write},
          {"pids", stats.pids}};
}

} // namespace dbdock::runtime
