#pragma once

#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "roxfs/Common.hpp"
#include "roxfs/FileSystem.hpp"
#include "BlockCache.hpp"
#include "Geometry.hpp"

namespace roxfs
{

enum class ForkFormat
{
  Device = 0,
  Local = 1,
  Extents = 2,
  Btree = 3
};

enum class Fork
{
  Data,
  Attribute
};

// Decoded inode core with copies of both fork literal areas. Immutable once read.
struct Inode
{
  uint64_t number;
  uint16_t mode;
  uint8_t version;
  uint32_t links;
  uint32_t uid;
  uint32_t gid;
  uint32_t projectId;
  uint64_t size;
  uint64_t blockCount; // Filesystem blocks including metadata
  Timestamp atime;
  Timestamp mtime;
  Timestamp ctime;
  Timestamp crtime;
  uint32_t generation;
  uint16_t flags;
  uint64_t flags2;
  uint32_t rdev;

  ForkFormat dataFormat;
  uint64_t dataExtents;
  std::vector<char> dataFork;

  bool hasAttributeFork;
  ForkFormat attributeFormat;
  uint32_t attributeExtents;
  std::vector<char> attributeFork;

  FileType type() const;
  uint16_t permissions() const { return mode & 07777; }

  ForkFormat format(Fork fork) const { return fork == Fork::Data ? dataFormat : attributeFormat; }
  uint64_t extentCount(Fork fork) const { return fork == Fork::Data ? dataExtents : attributeExtents; }
  std::vector<char> const & forkData(Fork fork) const { return fork == Fork::Data ? dataFork : attributeFork; }

  uint32_t rdevMajor() const { return rdev >> 18; }
  uint32_t rdevMinor() const { return rdev & 0x3ffff; }
};

typedef std::shared_ptr<const Inode> InodePtr;

class InodeReader
{
public:
  InodeReader(Geometry const & geometry, BlockCache const & cache, MountOptions const & options);

  // Throws NotFound for numbers outside of the volume or unallocated inodes
  InodePtr getInode(uint64_t ino) const;

private:
  Geometry const & m_geometry;
  BlockCache const & m_cache;
  bool const m_verifyChecksums;
  size_t const m_capacity;

  typedef std::list<InodePtr> LruList;
  mutable std::mutex m_mutex;
  mutable LruList m_lru;
  mutable std::map<uint64_t, LruList::iterator> m_index;

  InodePtr decode(uint64_t ino) const;
  Timestamp decodeTimestamp(uint64_t raw, bool bigTime) const;
};

}
