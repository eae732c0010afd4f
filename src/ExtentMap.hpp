#pragma once

#include <cstdint>
#include <vector>
#include <boost/optional.hpp>
#include "Inode.hpp"
#include "Volume.hpp"

namespace roxfs
{

struct Extent
{
  uint64_t fileOffset; // In filesystem blocks
  uint64_t startBlock; // Filesystem block
  uint64_t blockCount;
  bool unwritten;

  uint64_t fileEnd() const { return fileOffset + blockCount; }
};

// Logical to physical block mapping of an inode fork in extents or btree format
class ExtentMap
{
public:
  ExtentMap(Volume const & volume, Inode const & inode, Fork fork);

  // Ordered by file offset, non-overlapping
  std::vector<Extent> extents() const;

  // None for holes
  boost::optional<Extent> lookup(uint64_t fileBlock) const;

  // Filesystem block holding 'fileBlock', none for holes and unwritten extents
  boost::optional<uint64_t> mapBlock(uint64_t fileBlock) const;

  // Metadata blocks [fileBlock, fileBlock + count) concatenated. Holes there are corruption.
  std::vector<char> readBlocks(uint64_t fileBlock, unsigned count) const;

private:
  Volume const & m_volume;
  Inode const & m_inode;
  Fork const m_fork;
  ForkFormat const m_format;

  struct Node
  {
    unsigned level;
    unsigned recordCount;
    std::vector<char> data;
    size_t keysOffset;
    size_t pointersOffset; // Only for non-leaf nodes
    size_t recordsOffset;  // Only for leaves
  };

  Node rootNode() const;
  Node readNode(uint64_t fsblock, unsigned expectedLevel) const;
  uint64_t key(Node const & node, unsigned index) const;
  uint64_t pointer(Node const & node, unsigned index) const;
  Extent record(Node const & node, unsigned index) const;

  void collect(Node const & node, uint64_t lowKey, std::vector<Extent> & result) const;
};

Extent DecodeExtent(uint64_t high, uint64_t low);

}
