#ifndef DBDOCK_HOST_MOCKS_HPP
#define DBDOCK_HOST_MOCKS_HPP

#include "filesystem.hpp"
#include "identity_probe.hpp"

#include <gmock/gmock.h>

namespace dbdock::host {

class MockFilesystem : public IFilesystem {
public:
  MOCK_METHOD(FsResult<DirectoryListing>, list_directories,
              (const std::string &), (override));
  MOCK_METHOD(FsResult<PathInfo>, stat, (const std::string &), (override));
  MOCK_METHOD(FsResult<CreatedDirectory>, make_directory,
              (const std::string &, const std::string &,
               const MakeDirectoryOptions &),
              (override));
};

class MockIdentityProbe : public IIdentityProbe {
public:
  MOCK_METHOD(IdentityResult, probe, (const std::string &), (override));
};

} // namespace dbdock::host

#endif // DBDOCK_HOST_MOCKS_HPP
