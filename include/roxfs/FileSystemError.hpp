#ifndef _ROXFS_API_FILE_SYSTEM_ERROR_H
#define _ROXFS_API_FILE_SYSTEM_ERROR_H

#include "roxfs/Defs.hpp"

namespace roxfs
{

enum class ErrorCode
{
  InvalidStorageFormat,  // Superblock rejected, the image can't be mounted
  CorruptMetadata,       // Metadata block failed magic, checksum or consistency check
  NotFound,
  AttributeNotFound,
  NotADirectory,
  IsADirectory,
  InvalidOperation,      // Operation doesn't apply to this file type
  NameTooLong,
  IoError,
  InternalExpectationFail
};

class ROXFS_API_DECL FileSystemError
{
public:
  FileSystemError(ErrorCode code, const char * msg);
  FileSystemError(FileSystemError const &);
  FileSystemError(FileSystemError &&);
  ~FileSystemError();

  FileSystemError & operator=(FileSystemError const &);
  FileSystemError & operator=(FileSystemError &&);

  ErrorCode code() const;
  const char * message() const;

private:
  class Impl;
  Impl * m_impl;
};

// Positive errno value to hand back to a file-operation transport
ROXFS_API_DECL int ErrorCodeToErrno(ErrorCode code);

}

#endif
