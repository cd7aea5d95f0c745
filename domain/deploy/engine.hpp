#ifndef DBDOCK_DEPLOY_ENGINE_HPP
#define DBDOCK_DEPLOY_ENGINE_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dbdock::deploy {

enum class Engine { MariaDb, PostgreSql };

constexpr std::string_view to_string(Engine engine) {
  return engine == Engine::MariaDb ? "mariadb" : "postgresql";
}

std::optional<Engine> parse_engine(std::string_view value);

struct EngineTemplate {
  Engine engine;
  std::string display_name;
  std::string image_repository;
  std::string default_version = "latest";
  int container_port = 0;
  std::string data_dir;
  std::string root_password_env;
  std::string database_env;
  std::string user_env;
  std::optional<std::string> user_password_env;
};

const EngineTemplate &builtin_template(Engine engine);

// Built-in templates plus per-engine overrides from configuration.
class TemplateCatalog {
public:
  TemplateCatalog();

  void override_repository(Engine engine, std::string repository);
  const EngineTemplate &get(Engine engine) const;

private:
  std::map<Engine, EngineTemplate> templates_;
};

} // namespace dbdock::deploy

#endif // DBDOCK_DEPLOY_ENGINE_HPP
