#ifndef _ROXFS_API_COMMON_H
#define _ROXFS_API_COMMON_H

#include <stddef.h>
#include <cstdint>

namespace roxfs
{

enum class FileType
{
  Unknown = 0,
  Regular = 1,
  Directory = 2,
  CharacterDevice = 3,
  BlockDevice = 4,
  Fifo = 5,
  Socket = 6,
  Symlink = 7
};

const size_t MaxFileName = 255; // Bytes, same limit for directory entries and attribute names

struct MountOptions
{
  MountOptions()
    : cacheBlocks(4096)
    , inodeCacheSize(1024)
    , verifyChecksums(true)
  {}

  size_t cacheBlocks;    // Filesystem blocks kept by the block cache
  size_t inodeCacheSize; // Decoded inodes kept in memory
  bool verifyChecksums;  // Check CRC32c of v5 metadata blocks
};

}

#endif
