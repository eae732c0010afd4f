#include "ExtentMap.hpp"
#include <algorithm>
#include "format/Bmap.hpp"
#include "util/Assert.hpp"
#include "util/BitRange.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

Extent DecodeExtent(uint64_t high, uint64_t low)
{
  typedef format::BmbtRecord R;
  Extent extent;
  extent.unwritten = util::GetBitField128(high, low, R::UnwrittenBit, 1) != 0;
  extent.fileOffset = util::GetBitField128(high, low, R::FileOffsetFirstBit, R::FileOffsetBits);
  extent.startBlock = util::GetBitField128(high, low, R::StartBlockFirstBit, R::StartBlockBits);
  extent.blockCount = util::GetBitField128(high, low, R::BlockCountFirstBit, R::BlockCountBits);
  return extent;
}

namespace
{

Extent ReadExtent(std::vector<char> const & data, size_t offset)
{
  format::BmbtRecord record;
  util::readT(data, offset, record);
  Extent extent = DecodeExtent(record.high.value(), record.low.value());
  ROXFS_FORMAT_ASSERT(extent.blockCount != 0);
  return extent;
}

// Extents must go in order and not overlap 'previousEnd'
void CheckNextExtent(uint64_t & previousEnd, Extent const & extent)
{
  ROXFS_FORMAT_ASSERT(extent.fileOffset >= previousEnd);
  previousEnd = extent.fileEnd();
}

template<class Records>
boost::optional<Extent> FindCovering(Records const & records, unsigned count, uint64_t fileBlock)
{
  // Last record with fileOffset <= fileBlock
  unsigned low = 0, high = count;
  while (low < high)
  {
    unsigned const middle = low + (high - low) / 2;
    if (records(middle).fileOffset <= fileBlock)
      low = middle + 1;
    else
      high = middle;
  }
  if (low == 0)
    return boost::none;
  Extent const extent = records(low - 1);
  if (fileBlock >= extent.fileEnd())
    return boost::none;
  return extent;
}

}

ExtentMap::ExtentMap(Volume const & volume, Inode const & inode, Fork fork)
  : m_volume(volume)
  , m_inode(inode)
  , m_fork(fork)
  , m_format(inode.format(fork))
{
  ROXFS_ASSERT(m_format == ForkFormat::Extents || m_format == ForkFormat::Btree);
}

std::vector<Extent> ExtentMap::extents() const
{
  std::vector<Extent> result;
  std::vector<char> const & forkData = m_inode.forkData(m_fork);
  if (m_format == ForkFormat::Extents)
  {
    uint64_t const count = m_inode.extentCount(m_fork);
    result.reserve(count);
    for (uint64_t i = 0; i < count; ++i)
      result.push_back(ReadExtent(forkData, i * sizeof(format::BmbtRecord)));
  }
  else
  {
    Node const root = rootNode();
    collect(root, 0, result);
  }

  uint64_t end = 0;
  for (Extent const & extent: result)
    CheckNextExtent(end, extent);
  return result;
}

boost::optional<Extent> ExtentMap::lookup(uint64_t fileBlock) const
{
  std::vector<char> const & forkData = m_inode.forkData(m_fork);
  if (m_format == ForkFormat::Extents)
  {
    unsigned const count = static_cast<unsigned>(m_inode.extentCount(m_fork));
    return FindCovering([&](unsigned i) { return ReadExtent(forkData, i * sizeof(format::BmbtRecord)); },
      count, fileBlock);
  }

  Node node = rootNode();
  uint64_t lowKey = 0;
  uint64_t highKey = ~UINT64_C(0);
  while (node.level > 0)
  {
    // Last key <= fileBlock
    unsigned low = 0, high = node.recordCount;
    while (low < high)
    {
      unsigned const middle = low + (high - low) / 2;
      if (key(node, middle) <= fileBlock)
        low = middle + 1;
      else
        high = middle;
    }
    if (low == 0)
      return boost::none;
    unsigned const index = low - 1;
    uint64_t const childLowKey = key(node, index);
    ROXFS_FORMAT_ASSERT(childLowKey >= lowKey);
    if (index + 1 < node.recordCount)
    {
      highKey = key(node, index + 1);
      ROXFS_FORMAT_ASSERT(highKey > childLowKey);
    }
    lowKey = childLowKey;
    node = readNode(pointer(node, index), node.level - 1);
  }

  boost::optional<Extent> const extent =
    FindCovering([&](unsigned i) { return record(node, i); }, node.recordCount, fileBlock);
  if (extent)
    ROXFS_FORMAT_ASSERT(extent->fileOffset >= lowKey && extent->fileOffset < highKey);
  return extent;
}

boost::optional<uint64_t> ExtentMap::mapBlock(uint64_t fileBlock) const
{
  boost::optional<Extent> const extent = lookup(fileBlock);
  if (!extent || extent->unwritten)
    return boost::none;
  return extent->startBlock + (fileBlock - extent->fileOffset);
}

std::vector<char> ExtentMap::readBlocks(uint64_t fileBlock, unsigned count) const
{
  std::vector<char> result;
  result.reserve(size_t(count) * m_volume.geometry().blockSize());
  for (unsigned done = 0; done < count;)
  {
    boost::optional<Extent> const extent = lookup(fileBlock + done);
    ROXFS_FORMAT_ASSERT(extent && !extent->unwritten);
    uint64_t const skip = fileBlock + done - extent->fileOffset;
    unsigned const chunk = static_cast<unsigned>(std::min<uint64_t>(count - done, extent->blockCount - skip));
    std::vector<char> const blocks = m_volume.readBlocks(extent->startBlock + skip, chunk);
    result.insert(result.end(), blocks.begin(), blocks.end());
    done += chunk;
  }
  return result;
}

ExtentMap::Node ExtentMap::rootNode() const
{
  std::vector<char> const & forkData = m_inode.forkData(m_fork);
  format::BmdrHeader header;
  util::readT(forkData, 0, header);

  Node node;
  node.level = header.level.value();
  node.recordCount = header.recordCount.value();
  node.data = forkData;
  size_t const maxRecords = (forkData.size() - sizeof(header)) / (sizeof(format::BmbtKey) + sizeof(format::BmbtPointer));
  ROXFS_FORMAT_ASSERT(node.level > 0 && node.level <= format::MaxBmbtLevels);
  ROXFS_FORMAT_ASSERT(node.recordCount > 0 && node.recordCount <= maxRecords);
  node.keysOffset = sizeof(header);
  node.pointersOffset = sizeof(header) + maxRecords * sizeof(format::BmbtKey);
  node.recordsOffset = 0;
  return node;
}

ExtentMap::Node ExtentMap::readNode(uint64_t fsblock, unsigned expectedLevel) const
{
  Geometry const & geometry = m_volume.geometry();
  ROXFS_FORMAT_ASSERT(geometry.isValidFsblock(fsblock));

  Node node;
  node.data = *m_volume.cache().read(geometry.fsblockToLinear(fsblock));

  size_t headerSize;
  if (geometry.hasCrc())
  {
    format::BtreeLongBlockHeaderV5 header;
    util::readT(node.data, 0, header);
    ROXFS_FORMAT_ASSERT(header.magic.value() == format::BtreeLongBlockHeader::MagicValueV5);
    m_volume.verifyCrc(node.data, format::BtreeLongBlockCrcOffset);
    ROXFS_FORMAT_ASSERT(header.owner.value() == m_inode.number);
    node.level = header.level.value();
    node.recordCount = header.recordCount.value();
    headerSize = sizeof(header);
  }
  else
  {
    format::BtreeLongBlockHeader header;
    util::readT(node.data, 0, header);
    ROXFS_FORMAT_ASSERT(header.magic.value() == format::BtreeLongBlockHeader::MagicValue);
    node.level = header.level.value();
    node.recordCount = header.recordCount.value();
    headerSize = sizeof(header);
  }

  // Leaf records and key/pointer pairs are both 16 bytes
  size_t const maxRecords = (node.data.size() - headerSize) / sizeof(format::BmbtRecord);
  ROXFS_FORMAT_ASSERT(node.level == expectedLevel);
  ROXFS_FORMAT_ASSERT(node.recordCount > 0 && node.recordCount <= maxRecords);
  node.keysOffset = headerSize;
  node.recordsOffset = headerSize;
  node.pointersOffset = headerSize + maxRecords * sizeof(format::BmbtKey);
  return node;
}

uint64_t ExtentMap::key(Node const & node, unsigned index) const
{
  return util::readT<format::BmbtKey>(node.data, node.keysOffset + index * sizeof(format::BmbtKey)).value();
}

uint64_t ExtentMap::pointer(Node const & node, unsigned index) const
{
  return util::readT<format::BmbtPointer>(node.data, node.pointersOffset + index * sizeof(format::BmbtPointer)).value();
}

Extent ExtentMap::record(Node const & node, unsigned index) const
{
  return ReadExtent(node.data, node.recordsOffset + index * sizeof(format::BmbtRecord));
}

// In-order walk. Every child must start at or after its key in the parent.
void ExtentMap::collect(Node const & node, uint64_t lowKey, std::vector<Extent> & result) const
{
  if (node.level == 0)
  {
    for (unsigned i = 0; i < node.recordCount; ++i)
    {
      Extent const extent = record(node, i);
      ROXFS_FORMAT_ASSERT(extent.fileOffset >= lowKey);
      result.push_back(extent);
    }
    return;
  }

  uint64_t previousKey = 0;
  for (unsigned i = 0; i < node.recordCount; ++i)
  {
    uint64_t const childKey = key(node, i);
    ROXFS_FORMAT_ASSERT(childKey >= lowKey);
    ROXFS_FORMAT_ASSERT(i == 0 || childKey > previousKey);
    previousKey = childKey;
    collect(readNode(pointer(node, i), node.level - 1), childKey, result);
  }
}

}
