#include "filesystem.hpp"
#include "numeric_id.hpp"

#include <algorithm>
#include <boost/regex.hpp>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fmt/format.h>
#include <grp.h>
#include <pwd.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dbdock::host {

namespace fs = std::filesystem;

namespace {

FilesystemError fs_error(FilesystemErrorKind kind, std::string message) {
  return FilesystemError(kind, std::move(message));
}

bool all_digits(const std::string &value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

std::optional<uid_t> resolve_owner(const std::string &owner) {
  if (all_digits(owner)) {
    return parse_numeric_id(owner);
  }
  if (const struct passwd *pw = ::getpwnam(owner.c_str())) {
    return pw->pw_uid;
  }
  return std::nullopt;
}

std::optional<gid_t> resolve_group(const std::string &name) {
  if (all_digits(name)) {
    return parse_numeric_id(name);
  }
  if (const struct group *gr = ::getgrnam(name.c_str())) {
    return gr->gr_gid;
  }
  return std::nullopt;
}

std::string ownership_label(const MakeDirectoryOptions &options) {
  if (options.owner && options.group) {
    return fmt::format("{}:{}", *options.owner, *options.group);
  }
  if (options.owner) {
    return *options.owner;
  }
  return fmt::format(":{}", *options.group);
}

// Mode and ownership are applied after creation; failures are reported,
// the directory stays.
void apply_attributes(const std::string &path,
                      const MakeDirectoryOptions &options,
                      CreatedDirectory &created) {
  if (options.mode) {
    auto mode = static_cast<mode_t>(std::stoul(*options.mode, nullptr, 8));
    if (::chmod(path.c_str(), mode) == 0) {
      created.operations.push_back(
          fmt::format("permissions set to {}", *options.mode));
      spdlog::info("Set permissions {} on {}", *options.mode, path);
    } else {
      created.warnings.push_back(fmt::format(
          "Failed to set permissions/ownership: chmod {}: {}", *options.mode,
          std::strerror(errno)));
    }
  }

  if (!options.owner && !options.group) {
    return;
  }

  uid_t uid = static_cast<uid_t>(-1);
  gid_t gid = static_cast<gid_t>(-1);
  if (options.owner) {
    auto resolved = resolve_owner(*options.owner);
    if (!resolved) {
      created.warnings.push_back(fmt::format(
          "Failed to set permissions/ownership: unknown user '{}'",
          *options.owner));
      return;
    }
    uid = *resolved;
  }
  if (options.group) {
    auto resolved = resolve_group(*options.group);
    if (!resolved) {
      created.warnings.push_back(fmt::format(
          "Failed to set permissions/ownership: unknown group '{}'",
          *options.group));
      return;
    }
    gid = *resolved;
  }

  auto label = ownership_label(options);
  if (::chown(path.c_str(), uid, gid) == 0) {
    created.operations.push_back(fmt::format("ownership set to {}", label));
    spdlog::info("Set ownership {} on {}", label, path);
  } else {
    created.warnings.push_back(
        fmt::format("Failed to set permissions/ownership: chown {}: {}", label,
                    std::strerror(errno)));
  }
}

} // namespace

FsResult<std::string> resolve_path(const std::string &path) {
  using Out = FsResult<std::string>;
  std::error_code ec;
  auto absolute = fs::absolute(path.empty() ? fs::path("/") : fs::path(path),
                               ec);
  if (ec) {
    return Out::Error(fs_error(FilesystemErrorKind::InvalidPath,
                               fmt::format("{}: {}", path, ec.message())));
  }

  auto normal = absolute.lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  if (normal.empty() || normal.front() != '/') {
    return Out::Error(fs_error(FilesystemErrorKind::InvalidPath,
                               fmt::format("Invalid path: {}", path)));
  }
  return Out::Ok(std::move(normal));
}

bool is_valid_directory_name(const std::string &name) {
  static const boost::regex pattern("^[a-zA-Z0-9._-]+$");
  return name != "." && name != ".." && boost::regex_match(name, pattern);
}

bool is_valid_mode(const std::string &mode) {
  static const boost::regex pattern("^[0-7]{3,4}$");
  return boost::regex_match(mode, pattern);
}

FsResult<DirectoryListing>
LocalFilesystem::list_directories(const std::string &path) {
  using Out = FsResult<DirectoryListing>;

  auto resolved = resolve_path(path);
  if (!resolved) {
    return Out::Error(resolved.error());
  }
  const auto &safe_path = resolved.value();

  std::error_code ec;
  auto status = fs::status(safe_path, ec);
  if (ec || !fs::exists(status)) {
    return Out::Error(
        fs_error(FilesystemErrorKind::NotFound, "Path not found"));
  }
  if (!fs::is_directory(status)) {
    return Out::Error(
        fs_error(FilesystemErrorKind::NotADirectory, "Path is not a directory"));
  }

  DirectoryListing listing;
  listing.current_path = safe_path;
  if (safe_path != "/") {
    listing.parent_path = fs::path(safe_path).parent_path().string();
  }

  fs::directory_iterator it(safe_path,
                            fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return Out::Error(fs_error(FilesystemErrorKind::Io,
                               fmt::format("{}: {}", safe_path, ec.message())));
  }
  for (const auto &entry : it) {
    std::error_code entry_ec;
    if (!entry.is_directory(entry_ec) || entry_ec) {
      continue;
    }
    listing.directories.push_back(
        {entry.path().filename().string(), entry.path().string()});
  }

  std::sort(listing.directories.begin(), listing.directories.end(),
            [](const DirectoryEntry &a, const DirectoryEntry &b) {
              return a.name < b.name;
            });
  return Out::Ok(std::move(listing));
}

FsResult<PathInfo> LocalFilesystem::stat(const std::string &path) {
  using Out = FsResult<PathInfo>;

  auto resolved = resolve_path(path);
  if (!resolved) {
    return Out::Error(resolved.error());
  }

  PathInfo info;
  info.path = resolved.value();

  struct ::stat st {};
  if (::stat(info.path.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return Out::Ok(std::move(info));
    }
    return Out::Error(fs_error(
        FilesystemErrorKind::Io,
        fmt::format("stat {}: {}", info.path, std::strerror(errno))));
  }

  info.exists = true;
  info.is_directory = S_ISDIR(st.st_mode);
  info.is_file = S_ISREG(st.st_mode);
  info.size = static_cast<uintmax_t>(st.st_size);
  info.mode = static_cast<uint32_t>(st.st_mode);
  info.modified = static_cast<int64_t>(st.st_mtime);
  return Out::Ok(std::move(info));
}

FsResult<CreatedDirectory>
LocalFilesystem::make_directory(const std::string &parent,
                                const std::string &name,
                                const MakeDirectoryOptions &options) {
  using Out = FsResult<CreatedDirectory>;

  if (parent.empty() || name.empty()) {
    return Out::Error(fs_error(FilesystemErrorKind::InvalidPath,
                               "Path and name are required"));
  }

  auto resolved = resolve_path(parent);
  if (!resolved) {
    return Out::Error(resolved.error());
  }
  const auto &safe_parent = resolved.value();

  if (!is_valid_directory_name(name)) {
    return Out::Error(fs_error(
        FilesystemErrorKind::InvalidName,
        "Invalid directory name. Only letters, numbers, dots, underscores, "
        "and hyphens are allowed."));
  }
  if (options.mode && !is_valid_mode(*options.mode)) {
    return Out::Error(
        fs_error(FilesystemErrorKind::InvalidMode,
                 "Invalid mode. Must be octal notation (e.g., 755, 644, 0755)"));
  }

  std::error_code ec;
  auto parent_status = fs::status(safe_parent, ec);
  if (ec || !fs::exists(parent_status)) {
    return Out::Error(
        fs_error(FilesystemErrorKind::NotFound, "Parent path not found"));
  }
  if (!fs::is_directory(parent_status)) {
    return Out::Error(fs_error(FilesystemErrorKind::NotADirectory,
                               "Parent path is not a directory"));
  }

  auto target = (fs::path(safe_parent) / name).string();
  if (::mkdir(target.c_str(), 0777) != 0) {
    if (errno == EEXIST) {
      return Out::Error(fs_error(FilesystemErrorKind::AlreadyExists,
                                 "Directory already exists"));
    }
    return Out::Error(fs_error(
        FilesystemErrorKind::Io,
        fmt::format("mkdir {}: {}", target, std::strerror(errno))));
  }
  spdlog::info("Created directory: {}", target);

  CreatedDirectory created;
  created.path = target;
  apply_attributes(target, options, created);
  for (const auto &warning : created.warnings) {
    spdlog::warn("{}", warning);
  }
  return Out::Ok(std::move(created));
}

} // namespace dbdock::host
