#ifndef DBDOCK_HOST_ERRORS_HPP
#define DBDOCK_HOST_ERRORS_HPP

#include <infrastructure/result.hpp>
#include <utils/error.hpp>

#include <string_view>

namespace dbdock::host {

enum class FilesystemErrorKind {
  InvalidPath,
  NotFound,
  NotADirectory,
  AlreadyExists,
  InvalidName,
  InvalidMode,
  Io
};

constexpr std::string_view to_string(FilesystemErrorKind kind) {
  switch (kind) {
  case FilesystemErrorKind::InvalidPath:
    return "invalid path";
  case FilesystemErrorKind::NotFound:
    return "not found";
  case FilesystemErrorKind::NotADirectory:
    return "not a directory";
  case FilesystemErrorKind::AlreadyExists:
    return "already exists";
  case FilesystemErrorKind::InvalidName:
    return "invalid name";
  case FilesystemErrorKind::InvalidMode:
    return "invalid mode";
  case FilesystemErrorKind::Io:
    return "io";
  }
  return "unknown";
}

class FilesystemError : public core::utils::Error<FilesystemErrorKind> {
public:
  using Error::Error;
};

template <typename T> using FsResult = core::Result<T, FilesystemError>;

enum class IdentityErrorKind {
  CliUnavailable,  // neither runtime CLI is on PATH
  CommandFailed,   // spawn failure, non-zero exit or timeout
  UnparsableOutput // ran fine, but no uid=/gid= in the output
};

constexpr std::string_view to_string(IdentityErrorKind kind) {
  switch (kind) {
  case IdentityErrorKind::CliUnavailable:
    return "cli unavailable";
  case IdentityErrorKind::CommandFailed:
    return "command failed";
  case IdentityErrorKind::UnparsableOutput:
    return "unparsable output";
  }
  return "unknown";
}

class IdentityError : public core::utils::Error<IdentityErrorKind> {
public:
  using Error::Error;
};

} // namespace dbdock::host

#endif // DBDOCK_HOST_ERRORS_HPP
