#ifndef DBDOCK_HOST_FILESYSTEM_HPP
#define DBDOCK_HOST_FILESYSTEM_HPP

#include "errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dbdock::host {

struct DirectoryEntry {
  std::string name;
  std::string path;
};

struct DirectoryListing {
  std::string current_path;
  std::optional<std::string> parent_path; // empty at "/"
  std::vector<DirectoryEntry> directories;
};

struct PathInfo {
  bool exists = false;
  bool is_directory = false;
  bool is_file = false;
  std::string path;
  uintmax_t size = 0;
  uint32_t mode = 0;
  int64_t modified = 0; // unix seconds
};

struct MakeDirectoryOptions {
  std::optional<std::string> mode;  // octal text, e.g. "755"
  std::optional<std::string> owner; // numeric uid or user name
  std::optional<std::string> group; // numeric gid or group name
};

struct CreatedDirectory {
  std::string path;
  std::vector<std::string> operations;
  // Mode/ownership steps that failed after the directory was created.
  std::vector<std::string> warnings;
};

class IFilesystem {
public:
  virtual ~IFilesystem() = default;

  virtual FsResult<DirectoryListing>
  list_directories(const std::string &path) = 0;

  // A missing path is not an error: exists comes back false.
  virtual FsResult<PathInfo> stat(const std::string &path) = 0;

  virtual FsResult<CreatedDirectory>
  make_directory(const std::string &parent, const std::string &name,
                 const MakeDirectoryOptions &options) = 0;
};

class LocalFilesystem final : public IFilesystem {
public:
  FsResult<DirectoryListing> list_directories(const std::string &path) override;
  FsResult<PathInfo> stat(const std::string &path) override;
  FsResult<CreatedDirectory>
  make_directory(const std::string &parent, const std::string &name,
                 const MakeDirectoryOptions &options) override;
};

// Absolute, lexically normalized, no trailing slash. Anything that does not
// end up under "/" is InvalidPath.
FsResult<std::string> resolve_path(const std::string &path);

bool is_valid_directory_name(const std::string &name);
bool is_valid_mode(const std::string &mode);

} // namespace dbdock::host

#endif // DBDOCK_HOST_FILESYSTEM_HPP
