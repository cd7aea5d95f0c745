#include "engine.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <spdlog/spdlog.h>

namespace dbdock::deploy {

std::optional<Engine> parse_engine(std::string_view value) {
  auto lowered = boost::algorithm::to_lower_copy(std::string(value));
  if (lowered == "mariadb" || lowered == "mysql") {
    return Engine::MariaDb;
  }
  if (lowered == "postgresql" || lowered == "postgres") {
    return Engine::PostgreSql;
  }
  return std::nullopt;
}

const EngineTemplate &builtin_template(Engine engine) {
  static const EngineTemplate mariadb{
      .engine = Engine::MariaDb,
      .display_name = "MariaDB",
      .image_repository = "quay.io/mariadb-foundation/mariadb-devel",
      .default_version = "latest",
      .container_port = 3306,
      .data_dir = "/var/lib/mysql",
      .root_password_env = "MYSQL_ROOT_PASSWORD",
      .database_env = "MYSQL_DATABASE",
      .user_env = "MYSQL_USER",
      .user_password_env = "MYSQL_PASSWORD",
  };
  static const EngineTemplate postgresql{
      .engine = Engine::PostgreSql,
      .display_name = "PostgreSQL",
      .image_repository = "postgres",
      .default_version = "latest",
      .container_port = 5432,
      .data_dir = "/var/lib/postgresql/data",
      .root_password_env = "POSTGRES_PASSWORD",
      .database_env = "POSTGRES_DB",
      .user_env = "POSTGRES_USER",
      .user_password_env = std::nullopt,
  };
  return engine == Engine::MariaDb ? mariadb : postgresql;
}

TemplateCatalog::TemplateCatalog() {
  for (auto engine : {Engine::MariaDb, Engine::PostgreSql}) {
    templates_.emplace(engine, builtin_template(engine));
  }
}

void TemplateCatalog::override_repository(Engine engine,
                                          std::string repository) {
  if (repository.empty()) {
    return;
  }
  spdlog::info("Using image repository {} for {}", repository,
               to_string(engine));
  templates_.at(engine).image_repository = std::move(repository);
}

const EngineTemplate &TemplateCatalog::get(Engine engine) const {
  return templates_.at(engine);
}

} // namespace dbdock::deploy
