#ifndef DBDOCK_API_BODIES_HPP
#define DBDOCK_API_BODIES_HPP

#include <boost/hana.hpp>
#include <map>
#include <optional>
#include <string>

namespace dbdock::api::validate {

namespace hana = boost::hana;

struct DeployBody {
  std::string type;
  std::string name;
  std::string version;
  std::string root_password;
  std::optional<std::string> database;
  std::optional<std::string> username;
  std::optional<std::string> password;
  int port = 0;
  std::optional<bool> persistent_storage;
  std::optional<std::string> storage_path;
  std::optional<std::map<std::string, std::string>> environment;
};

struct MkdirBody {
  std::string path;
  std::string name;
  std::optional<std::string> mode;
  std::optional<std::string> owner;
  std::optional<std::string> group;
};

struct UserInfoBody {
  std::string image;
};

} // namespace dbdock::api::validate

BOOST_HANA_ADAPT_STRUCT(dbdock::api::validate::DeployBody, type, name, version,
                        root_password, database, username, password, port,
                        persistent_storage, storage_path, environment);
BOOST_HANA_ADAPT_STRUCT(dbdock::api::validate::MkdirBody, path, name, mode,
                        owner, group);
BOOST_HANA_ADAPT_STRUCT(dbdock::api::validate::UserInfoBody, image);

#endif // DBDOCK_API_BODIES_HPP
