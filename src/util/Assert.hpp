#pragma once

#include "roxfs/FileSystemError.hpp"
#include "util/Log.hpp"

namespace roxfs
{

[[noreturn]]
inline void ThrowFilesystemError(ErrorCode code, const char * description)
{
  throw FileSystemError(code, description);
}

[[noreturn]]
inline void ThrowCorruptMetadata(const char * description)
{
  ROXFS_LOG(warning) << description;
  throw FileSystemError(ErrorCode::CorruptMetadata, description);
}

}

#define ROXFS_STRINGIFY_IMPL(s) #s
#define ROXFS_STRINGIFY(s) ROXFS_STRINGIFY_IMPL(s)

#define ROXFS_FORMAT_ASSERT(expression) \
  (void)((!!(expression)) || (ThrowCorruptMetadata( \
    "Corrupt metadata at " __FILE__ " (" ROXFS_STRINGIFY(__LINE__) ")"), false))

#define ROXFS_ASSERT(expression) \
  (void)((!!(expression)) || (ThrowFilesystemError(ErrorCode::InternalExpectationFail, \
    "Internal expectation fail at " __FILE__ " (" ROXFS_STRINGIFY(__LINE__) ")"), false))
