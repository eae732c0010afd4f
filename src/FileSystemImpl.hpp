#pragma once

#include <memory>
#include "roxfs/FileSystem.hpp"
#include "roxfs/IStorage.hpp"
#include "Directory.hpp"
#include "Inode.hpp"
#include "Volume.hpp"

namespace roxfs
{

// Shared by the FileSystem object and every open descriptor or directory iterator
class FileSystemImpl:
  public std::enable_shared_from_this<FileSystemImpl>
{
public:
  FileSystemImpl(std::unique_ptr<IStorage> && storage, MountOptions const & options);

  std::unique_ptr<IStorage> const m_storage;
  Volume const m_volume;

  InodePtr getInode(uint64_t ino) const;
  InodePtr getDirectoryInode(uint64_t ino) const;

  FileAttributes attributes(Inode const & inode) const;

  // Type from the directory entry, or from the inode on images without types in entries
  FileType entryType(Directory::Entry const & entry) const;
};

struct FileSystem::Impl
{
  std::shared_ptr<FileSystemImpl> ptr;
};

}
