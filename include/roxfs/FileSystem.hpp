#ifndef _ROXFS_API_FILE_SYSTEM_H
#define _ROXFS_API_FILE_SYSTEM_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "roxfs/Common.hpp"
#include "roxfs/Defs.hpp"
#include "roxfs/DirectoryIterator.hpp"
#include "roxfs/FileDescriptor.hpp"

namespace roxfs
{

class IStorage;

struct Timestamp
{
  int64_t seconds;
  uint32_t nanoseconds;
};

struct FileAttributes
{
  uint64_t inode;
  FileType type;
  uint16_t permissions; // Mode bits without file type: rwx, setuid, setgid, sticky
  uint32_t links;
  uint32_t uid;
  uint32_t gid;
  uint64_t size;
  uint64_t blocks;      // Allocated space in 512-byte units
  uint32_t blockSize;
  uint32_t rdevMajor;
  uint32_t rdevMinor;
  uint32_t generation;
  Timestamp atime;
  Timestamp mtime;
  Timestamp ctime;
  Timestamp crtime;     // Zero on images without v3 inodes
};

struct FileSystemStatistics
{
  uint32_t blockSize;
  uint64_t totalBlocks;
  uint64_t freeBlocks;
  uint64_t totalInodes;
  uint64_t freeInodes;
  uint32_t maxNameLength;
  std::string label;
};

// Read-only view of an XFS image. All operations take inode numbers as
// handed out by rootInode(), lookup() and readdir(). Methods are safe to call
// from several threads at once.
class ROXFS_API_DECL FileSystem
{
public:
  explicit FileSystem(std::unique_ptr<IStorage> && storage, MountOptions const & options = MountOptions());
  ~FileSystem();

  FileSystem(FileSystem const &) = delete;
  void operator =(FileSystem const &) = delete;

  uint64_t rootInode() const;

  FileAttributes lookup(uint64_t parentInode, const char * name) const;
  FileAttributes getattr(uint64_t inode) const;

  // Starts with "." and "..", then entries in name hash order.
  // 'offset' is the DirectoryEntry::nextOffset() of the last consumed entry.
  DirectoryIterator readdir(uint64_t inode, uint64_t offset = 0) const;

  // Returns number of bytes copied; 0 at or past end of file
  size_t read(uint64_t inode, uint64_t offset, size_t size, void * buffer) const;
  std::string readlink(uint64_t inode) const;

  // Names carry namespace prefix: "user.", "trusted.", "security."
  std::vector<std::string> listxattr(uint64_t inode, bool privileged = false) const;
  std::vector<char> getxattr(uint64_t inode, const char * name, bool privileged = false) const;

  FileDescriptor open(uint64_t inode) const;

  FileSystemStatistics statfs() const;

private:
  struct Impl;
  Impl * m_impl;
};

}

#endif
