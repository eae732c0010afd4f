#pragma once

#include <cstdint>
#include <string>
#include <boost/optional.hpp>
#include "roxfs/IStorage.hpp"

namespace roxfs
{

// Shapes of the volume recovered from the primary superblock.
// All address arithmetic uses the shifts stored there.
class Geometry
{
public:
  static Geometry load(IStorage const & storage, bool verifyChecksums);

  struct InodeLocation
  {
    uint64_t linearBlock;
    uint32_t offset; // Byte offset of the inode record inside the block
  };

  bool hasCrc() const { return m_version == 5; }
  bool hasFileType() const { return m_hasFileType; }
  bool hasAsciiCi() const { return m_hasAsciiCi; }
  bool hasBigTime() const { return m_hasBigTime; }
  bool hasLargeExtentCounts() const { return m_hasLargeExtentCounts; }

  uint32_t blockSize() const { return m_blockSize; }
  unsigned blockLog() const { return m_blockLog; }
  uint32_t sectorSize() const { return m_sectorSize; }
  uint32_t inodeSize() const { return m_inodeSize; }
  unsigned inodeLog() const { return m_inodeLog; }
  unsigned inodesPerBlockLog() const { return m_inodesPerBlockLog; }
  uint32_t agBlocks() const { return m_agBlocks; }
  unsigned agBlocksLog() const { return m_agBlocksLog; }
  uint32_t agCount() const { return m_agCount; }
  unsigned dirBlockLog() const { return m_dirBlockLog; }
  uint32_t dirBlockSize() const { return m_blockSize << m_dirBlockLog; }
  unsigned dirBlockFsbCount() const { return 1u << m_dirBlockLog; }

  uint64_t rootInode() const { return m_rootInode; }
  uint64_t dataBlocks() const { return m_dataBlocks; }
  uint64_t freeDataBlocks() const { return m_freeDataBlocks; }
  uint64_t inodeCount() const { return m_inodeCount; }
  uint64_t freeInodes() const { return m_freeInodes; }
  std::string const & label() const { return m_label; }

  // Inode number = agno << (agblklog + inopblog) | agbno << inopblog | index
  uint32_t inodeToAg(uint64_t ino) const;
  uint64_t inodeToAgInode(uint64_t ino) const;
  uint64_t agInodeToInode(uint32_t agno, uint64_t agino) const;
  uint64_t agBlockToAgInode(uint32_t agbno, unsigned index) const;

  // Filesystem block = agno << agblklog | agbno
  uint32_t fsblockToAg(uint64_t fsblock) const;
  uint32_t fsblockToAgBlock(uint64_t fsblock) const;
  uint64_t agBlockToFsblock(uint32_t agno, uint32_t agbno) const;
  bool isValidFsblock(uint64_t fsblock) const;
  // Throws CorruptMetadata for addresses outside of the volume
  uint64_t fsblockToLinear(uint64_t fsblock) const;

  // None if the number points outside of allocation groups
  boost::optional<InodeLocation> locateInode(uint64_t ino) const;

  // Directory data, leaf and free index regions start at fixed byte offsets of the data fork
  uint64_t dirLeafFileBlock() const;
  uint64_t dirFreeFileBlock() const;

private:
  Geometry();

  unsigned m_version;
  bool m_hasFileType;
  bool m_hasAsciiCi;
  bool m_hasBigTime;
  bool m_hasLargeExtentCounts;
  uint32_t m_blockSize;
  unsigned m_blockLog;
  uint32_t m_sectorSize;
  uint32_t m_inodeSize;
  unsigned m_inodeLog;
  unsigned m_inodesPerBlockLog;
  uint32_t m_agBlocks;
  unsigned m_agBlocksLog;
  uint32_t m_agCount;
  unsigned m_dirBlockLog;
  uint64_t m_rootInode;
  uint64_t m_dataBlocks;
  uint64_t m_freeDataBlocks;
  uint64_t m_inodeCount;
  uint64_t m_freeInodes;
  std::string m_label;
};

}
