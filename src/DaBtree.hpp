#pragma once

#include <cstdint>
#include <vector>
#include "ExtentMap.hpp"
#include "Volume.hpp"

namespace roxfs
{

// Hash-keyed btree over fork blocks shared by node/btree directories and attribute forks.
// Blocks are addressed by their first file block ("dablk") in the fork.
class DaBtree
{
public:
  DaBtree(Volume const & volume, ExtentMap const & blocks, uint64_t owner, unsigned blockFsbCount);

  std::vector<char> readBlock(uint64_t dablk) const;

  // Common header of leaf and node blocks: magic, checksum and owner
  uint16_t magic(std::vector<char> const & block) const;
  void verifyHeader(std::vector<char> const & block, uint16_t expectedMagic) const;
  uint32_t forward(std::vector<char> const & block) const;

  bool isNode(std::vector<char> const & block) const;

  // Walks down from the node at 'rootBlock' to the leftmost leaf that may contain 'hash'
  uint64_t findLeaf(uint64_t rootBlock, uint32_t hash) const;
  uint64_t firstLeaf(uint64_t rootBlock) const;

private:
  Volume const & m_volume;
  ExtentMap const & m_blocks;
  uint64_t const m_owner;
  unsigned const m_blockFsbCount;

  struct NodeEntry
  {
    uint32_t hash;
    uint32_t before;
  };

  unsigned readNode(std::vector<char> const & block, std::vector<NodeEntry> & entries) const;
  uint64_t descend(uint64_t rootBlock, bool leftmost, uint32_t hash) const;
};

}
