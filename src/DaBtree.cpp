#include "DaBtree.hpp"
#include "format/DaBtree.hpp"
#include "util/Assert.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

DaBtree::DaBtree(Volume const & volume, ExtentMap const & blocks, uint64_t owner, unsigned blockFsbCount)
  : m_volume(volume)
  , m_blocks(blocks)
  , m_owner(owner)
  , m_blockFsbCount(blockFsbCount)
{}

std::vector<char> DaBtree::readBlock(uint64_t dablk) const
{
  return m_blocks.readBlocks(dablk, m_blockFsbCount);
}

uint16_t DaBtree::magic(std::vector<char> const & block) const
{
  return util::readT<format::DaBlockInfo>(block, 0).magic.value();
}

void DaBtree::verifyHeader(std::vector<char> const & block, uint16_t expectedMagic) const
{
  ROXFS_FORMAT_ASSERT(magic(block) == expectedMagic);
  if (m_volume.geometry().hasCrc())
  {
    m_volume.verifyCrc(block, format::Da3BlockCrcOffset);
    ROXFS_FORMAT_ASSERT(util::readT<format::Da3BlockInfo>(block, 0).owner.value() == m_owner);
  }
}

uint32_t DaBtree::forward(std::vector<char> const & block) const
{
  return util::readT<format::DaBlockInfo>(block, 0).forward.value();
}

bool DaBtree::isNode(std::vector<char> const & block) const
{
  return magic(block) == (m_volume.geometry().hasCrc()
    ? format::DaNodeHeader::MagicValueV5 : format::DaNodeHeader::MagicValue);
}

unsigned DaBtree::readNode(std::vector<char> const & block, std::vector<NodeEntry> & entries) const
{
  bool const crc = m_volume.geometry().hasCrc();
  verifyHeader(block, crc ? format::DaNodeHeader::MagicValueV5 : format::DaNodeHeader::MagicValue);

  unsigned count, level;
  size_t headerSize;
  if (crc)
  {
    format::Da3NodeHeader header;
    util::readT(block, 0, header);
    count = header.count.value();
    level = header.level.value();
    headerSize = sizeof(header);
  }
  else
  {
    format::DaNodeHeader header;
    util::readT(block, 0, header);
    count = header.count.value();
    level = header.level.value();
    headerSize = sizeof(header);
  }
  ROXFS_FORMAT_ASSERT(count > 0 && count <= (block.size() - headerSize) / sizeof(format::DaNodeEntry));
  ROXFS_FORMAT_ASSERT(level > 0 && level <= format::MaxDaLevels);

  entries.resize(count);
  for (unsigned i = 0; i < count; ++i)
  {
    format::DaNodeEntry entry;
    util::readT(block, headerSize + i * sizeof(entry), entry);
    entries[i].hash = entry.hashValue.value();
    entries[i].before = entry.before.value();
    ROXFS_FORMAT_ASSERT(i == 0 || entries[i].hash >= entries[i - 1].hash);
  }
  return level;
}

uint64_t DaBtree::descend(uint64_t rootBlock, bool leftmost, uint32_t hash) const
{
  std::vector<NodeEntry> entries;
  uint64_t blockNumber = rootBlock;
  unsigned expectedLevel = 0;
  for (;;)
  {
    std::vector<char> const block = readBlock(blockNumber);
    // A tree of a single leaf has no node above it, the caller checks the leaf magic
    if (expectedLevel == 0 && !isNode(block))
      return rootBlock;
    unsigned const level = readNode(block, entries);
    ROXFS_FORMAT_ASSERT(expectedLevel == 0 || level == expectedLevel);

    // First child whose highest hash is not below the wanted one
    size_t index = 0;
    if (!leftmost)
    {
      while (index + 1 < entries.size() && entries[index].hash < hash)
        ++index;
    }
    blockNumber = entries[index].before;
    if (level == 1)
      return blockNumber;
    expectedLevel = level - 1;
  }
}

uint64_t DaBtree::findLeaf(uint64_t rootBlock, uint32_t hash) const
{
  return descend(rootBlock, false, hash);
}

uint64_t DaBtree::firstLeaf(uint64_t rootBlock) const
{
  return descend(rootBlock, true, 0);
}

}
