#ifndef _ROXFS_API_FILE_DESCRIPTOR_H
#define _ROXFS_API_FILE_DESCRIPTOR_H

#include <cstdint>
#include <stddef.h>
#include "roxfs/Defs.hpp"

namespace roxfs
{

// Handle of an opened regular file. Closing it is the "release" operation.
// Keeps the file system alive while open.
class ROXFS_API_DECL FileDescriptor
{
public:
  FileDescriptor();
  FileDescriptor(FileDescriptor &&);
  FileDescriptor(FileDescriptor const &);
  ~FileDescriptor();

  FileDescriptor & operator=(FileDescriptor const &);
  FileDescriptor & operator=(FileDescriptor &&);

  bool isOpen() const;
  void close();

  uint64_t inode() const;
  uint64_t size() const;

  void seek(uint64_t position);
  uint64_t position() const;
  void read(size_t & inOutSize, void * buffer);
  size_t pread(uint64_t position, size_t size, void * buffer) const;

private:
  friend class FileDescriptorFactory;
  class Impl;
  Impl * m_impl;
};

}

#endif
