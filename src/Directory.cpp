#include "Directory.hpp"
#include <algorithm>
#include "format/Directory.hpp"
#include "util/Assert.hpp"
#include "util/DaHash.hpp"
#include "util/Log.hpp"
#include "util/RoundUp.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

namespace
{

bool IsDotName(std::string const & name)
{
  return name == "." || name == "..";
}

FileType DecodeFileType(uint8_t fileType)
{
  // Whiteouts of overlay file systems are character devices in their inodes
  if (fileType == format::Dir3FileTypeWhiteout)
    return FileType::Unknown;
  ROXFS_FORMAT_ASSERT(fileType <= static_cast<uint8_t>(FileType::Symlink));
  return static_cast<FileType>(fileType);
}

uint32_t HashEntryName(Geometry const & geometry, std::string const & name)
{
  return geometry.hasAsciiCi() ? util::HashNameAsciiCi(name) : util::HashName(name);
}

uint64_t ReadShortformInode(char const * data, size_t size, size_t offset, bool wide)
{
  if (wide)
  {
    format::big_uint64_buf_t value;
    util::readT(data, size, offset, value);
    return value.value();
  }
  format::big_uint32_buf_t value;
  util::readT(data, size, offset, value);
  return value.value();
}

}

class Directory::LookupVisitor: public boost::static_visitor<boost::optional<Directory::Entry>>
{
public:
  LookupVisitor(Directory const & directory, std::string const & name)
    : m_directory(directory)
    , m_name(name)
  {}

  result_type operator()(ShortformLayout const & layout) const
  {
    return m_directory.lookupShortform(layout, m_name);
  }

  result_type operator()(BlockLayout const &) const
  {
    return m_directory.lookupIndexed(Index::Block, m_name);
  }

  result_type operator()(LeafLayout const &) const
  {
    return m_directory.lookupIndexed(Index::Leaf, m_name);
  }

  result_type operator()(NodeLayout const &) const
  {
    return m_directory.lookupIndexed(Index::Node, m_name);
  }

  result_type operator()(BtreeLayout const & layout) const
  {
    return m_directory.lookupIndexed(layout.index, m_name);
  }

private:
  Directory const & m_directory;
  std::string const & m_name;
};

class Directory::BatchVisitor: public boost::static_visitor<Directory::Batch>
{
public:
  explicit BatchVisitor(Directory const & directory)
    : m_directory(directory)
  {}

  result_type operator()(ShortformLayout const & layout) const
  {
    Batch batch;
    batch.entries = layout.entries;
    return batch;
  }

  result_type operator()(BlockLayout const &) const
  {
    return m_directory.firstIndexedBatch(Index::Block);
  }

  result_type operator()(LeafLayout const &) const
  {
    return m_directory.firstIndexedBatch(Index::Leaf);
  }

  result_type operator()(NodeLayout const &) const
  {
    return m_directory.firstIndexedBatch(Index::Node);
  }

  result_type operator()(BtreeLayout const & layout) const
  {
    return m_directory.firstIndexedBatch(layout.index);
  }

private:
  Directory const & m_directory;
};

Directory::Directory(Volume const & volume, InodePtr const & inode)
  : m_volume(volume)
  , m_geometry(volume.geometry())
  , m_inode(inode)
{
  ROXFS_ASSERT(m_inode->type() == FileType::Directory);

  switch (m_inode->dataFormat)
  {
  case ForkFormat::Local:
    m_layout = decodeShortform(m_geometry, *m_inode);
    break;
  case ForkFormat::Extents:
  case ForkFormat::Btree:
  {
    m_blocks.reset(new ExtentMap(m_volume, *m_inode, Fork::Data));
    m_tree.reset(new DaBtree(m_volume, *m_blocks, m_inode->number, m_geometry.dirBlockFsbCount()));
    Index const index = detectIndex();
    if (m_inode->dataFormat == ForkFormat::Btree)
      m_layout = BtreeLayout{ index };
    else if (index == Index::Block)
      m_layout = BlockLayout();
    else if (index == Index::Leaf)
      m_layout = LeafLayout();
    else
      m_layout = NodeLayout();
    break;
  }
  default:
    ThrowCorruptMetadata("Unexpected directory fork format");
  }

  ROXFS_LOG(debug) << "Directory " << m_inode->number << " layout " << static_cast<int>(layoutType());
}

Directory::LayoutType Directory::layoutType() const
{
  return static_cast<LayoutType>(m_layout.which());
}

Directory::ShortformLayout Directory::decodeShortform(Geometry const & geometry, Inode const & inode)
{
  char const * const data = inode.dataFork.data();
  size_t const size = static_cast<size_t>(inode.size);
  ROXFS_FORMAT_ASSERT(size <= inode.dataFork.size());

  format::Dir2SfHeader header;
  util::readT(data, size, 0, header);
  bool const wide = header.count8 != 0;
  size_t const inodeSize = wide ? 8 : 4;

  ShortformLayout layout;
  size_t position = sizeof(header);
  layout.parent = ReadShortformInode(data, size, position, wide);
  position += inodeSize;

  layout.entries.reserve(header.count);
  for (unsigned i = 0; i < header.count; ++i)
  {
    format::Dir2SfEntryHeader entryHeader;
    util::readT(data, size, position, entryHeader);
    position += sizeof(entryHeader);
    ROXFS_FORMAT_ASSERT(entryHeader.nameLength > 0 && position + entryHeader.nameLength <= size);

    Entry entry;
    entry.name.assign(data + position, entryHeader.nameLength);
    position += entryHeader.nameLength;
    entry.type = FileType::Unknown;
    if (geometry.hasFileType())
    {
      uint8_t fileType;
      util::readT(data, size, position, fileType);
      entry.type = DecodeFileType(fileType);
      ++position;
    }
    entry.inode = ReadShortformInode(data, size, position, wide);
    position += inodeSize;
    entry.hash = HashEntryName(geometry, entry.name);
    layout.entries.push_back(entry);
  }

  std::stable_sort(layout.entries.begin(), layout.entries.end(),
    [](Entry const & a, Entry const & b) { return a.hash < b.hash; });
  return layout;
}

// Block directories have nothing mapped at the leaf offset, others keep a leaf or a node there
Directory::Index Directory::detectIndex() const
{
  uint64_t const leafBlock = m_geometry.dirLeafFileBlock();
  if (!m_blocks->lookup(leafBlock))
  {
    ROXFS_FORMAT_ASSERT(m_inode->size == m_geometry.dirBlockSize());
    return Index::Block;
  }

  std::vector<char> const block = m_tree->readBlock(leafBlock);
  uint16_t const magic = m_tree->magic(block);
  if (magic == (m_geometry.hasCrc() ? format::Dir3LeafHeader::Leaf1MagicValue : format::Dir2LeafHeader::Leaf1MagicValue))
    return Index::Leaf;
  // A node directory shrunk to one leaf keeps that leaf at the leaf offset
  if (m_tree->isNode(block)
    || magic == (m_geometry.hasCrc() ? format::Dir3LeafHeader::LeafNMagicValue : format::Dir2LeafHeader::LeafNMagicValue))
    return Index::Node;
  ThrowCorruptMetadata("Unknown directory index block");
}

size_t Directory::dataHeaderSize() const
{
  return m_geometry.hasCrc() ? sizeof(format::Dir3DataHeader) : sizeof(format::Dir2DataHeader);
}

uint32_t Directory::blockMagic() const
{
  return m_geometry.hasCrc() ? format::Dir3BlockHeader::BlockMagicValue : format::Dir2DataHeader::BlockMagicValue;
}

uint32_t Directory::dataMagic() const
{
  return m_geometry.hasCrc() ? format::Dir3BlockHeader::DataMagicValue : format::Dir2DataHeader::DataMagicValue;
}

std::vector<char> Directory::readDataBlock(uint64_t dablk, uint32_t magic) const
{
  ROXFS_FORMAT_ASSERT(dablk < m_geometry.dirLeafFileBlock());
  std::vector<char> block = m_blocks->readBlocks(dablk, m_geometry.dirBlockFsbCount());
  ROXFS_FORMAT_ASSERT(util::readT<format::big_uint32_buf_t>(block, 0).value() == magic);
  if (m_geometry.hasCrc())
  {
    m_volume.verifyCrc(block, format::Dir3DataCrcOffset);
    ROXFS_FORMAT_ASSERT(util::readT<format::Dir3BlockHeader>(block, 0).owner.value() == m_inode->number);
  }
  return block;
}

// Hash index of a single block directory sits right before the block tail
std::vector<Directory::LeafEntry> Directory::blockLeafEntries(std::vector<char> const & block) const
{
  format::Dir2BlockTail tail;
  util::readT(block, block.size() - sizeof(tail), tail);
  uint64_t const count = tail.count.value();
  ROXFS_FORMAT_ASSERT(dataHeaderSize() + sizeof(tail) + count * sizeof(format::Dir2LeafEntry) <= block.size());

  size_t const first = block.size() - sizeof(tail) - static_cast<size_t>(count) * sizeof(format::Dir2LeafEntry);
  std::vector<LeafEntry> result(static_cast<size_t>(count));
  for (size_t i = 0; i < result.size(); ++i)
  {
    format::Dir2LeafEntry entry;
    util::readT(block, first + i * sizeof(entry), entry);
    result[i].hash = entry.hashValue.value();
    result[i].address = entry.address.value();
    ROXFS_FORMAT_ASSERT(i == 0 || result[i].hash >= result[i - 1].hash);
  }
  return result;
}

std::vector<Directory::LeafEntry> Directory::leafEntries(std::vector<char> const & block, bool singleLeaf) const
{
  bool const crc = m_geometry.hasCrc();
  uint16_t magic;
  if (singleLeaf)
    magic = crc ? format::Dir3LeafHeader::Leaf1MagicValue : format::Dir2LeafHeader::Leaf1MagicValue;
  else
    magic = crc ? format::Dir3LeafHeader::LeafNMagicValue : format::Dir2LeafHeader::LeafNMagicValue;
  m_tree->verifyHeader(block, magic);

  uint64_t count;
  size_t headerSize;
  if (crc)
  {
    format::Dir3LeafHeader header;
    util::readT(block, 0, header);
    count = header.count.value();
    headerSize = sizeof(header);
  }
  else
  {
    format::Dir2LeafHeader header;
    util::readT(block, 0, header);
    count = header.count.value();
    headerSize = sizeof(header);
  }

  // Single leaf keeps best free values of data blocks at its end
  uint64_t end = block.size();
  if (singleLeaf)
  {
    format::Dir2LeafTail tail;
    util::readT(block, block.size() - sizeof(tail), tail);
    uint64_t const tailSize = sizeof(tail) + uint64_t(tail.bestCount.value()) * sizeof(uint16_t);
    ROXFS_FORMAT_ASSERT(tailSize <= end);
    end -= tailSize;
  }
  ROXFS_FORMAT_ASSERT(headerSize + count * sizeof(format::Dir2LeafEntry) <= end);

  std::vector<LeafEntry> result(static_cast<size_t>(count));
  for (size_t i = 0; i < result.size(); ++i)
  {
    format::Dir2LeafEntry entry;
    util::readT(block, headerSize + i * sizeof(entry), entry);
    result[i].hash = entry.hashValue.value();
    result[i].address = entry.address.value();
    ROXFS_FORMAT_ASSERT(i == 0 || result[i].hash >= result[i - 1].hash);
  }
  return result;
}

Directory::Entry Directory::readEntry(LeafEntry const & leaf, DataBlocks & blocks) const
{
  uint64_t const byteOffset = uint64_t(leaf.address) << format::Dir2DataAlignLog;
  ROXFS_FORMAT_ASSERT(byteOffset < format::Dir2LeafOffset);
  uint32_t const dirBlockSize = m_geometry.dirBlockSize();
  uint64_t const dablk = (byteOffset / dirBlockSize) << m_geometry.dirBlockLog();
  size_t const offset = static_cast<size_t>(byteOffset % dirBlockSize);

  auto it = blocks.find(dablk);
  if (it == blocks.end())
    it = blocks.insert(std::make_pair(dablk, readDataBlock(dablk, dataMagic()))).first;
  std::vector<char> const & block = it->second;

  ROXFS_FORMAT_ASSERT(offset >= dataHeaderSize());
  ROXFS_FORMAT_ASSERT(
    util::readT<format::big_uint16_buf_t>(block, offset).value() != format::Dir2DataUnused::FreeTagValue);

  format::Dir2DataEntryHeader header;
  util::readT(block, offset, header);
  size_t position = offset + sizeof(header);
  ROXFS_FORMAT_ASSERT(header.nameLength > 0 && position + header.nameLength <= block.size());

  Entry entry;
  entry.name.assign(block.data() + position, header.nameLength);
  position += header.nameLength;
  entry.type = FileType::Unknown;
  if (m_geometry.hasFileType())
  {
    entry.type = DecodeFileType(util::readT<uint8_t>(block, position));
    ++position;
  }

  // Entry ends with a tag holding its own offset
  size_t const entrySize = util::RoundUp(position + sizeof(uint16_t) - offset, size_t(1) << format::Dir2DataAlignLog);
  ROXFS_FORMAT_ASSERT(
    util::readT<format::big_uint16_buf_t>(block, offset + entrySize - sizeof(uint16_t)).value() == offset);

  entry.inode = header.inode.value();
  entry.hash = leaf.hash;
  ROXFS_FORMAT_ASSERT(HashEntryName(m_geometry, entry.name) == leaf.hash);
  return entry;
}

Directory::Batch Directory::resolveEntries(std::vector<LeafEntry> const & leaves, DataBlocks & blocks) const
{
  Batch batch;
  batch.entries.reserve(leaves.size());
  for (LeafEntry const & leaf: leaves)
    if (leaf.address != format::Dir2NullDataAddress)
      batch.entries.push_back(readEntry(leaf, blocks));
  return batch;
}

// An exact match wins, the first case-insensitive one is kept in 'caseMatch'
boost::optional<Directory::Entry> Directory::searchEntries(std::vector<LeafEntry> const & leaves, uint32_t hash,
  std::string const & name, DataBlocks & blocks, bool & mayContinue, boost::optional<Entry> & caseMatch) const
{
  auto it = std::lower_bound(leaves.begin(), leaves.end(), hash,
    [](LeafEntry const & leaf, uint32_t value) { return leaf.hash < value; });
  for (; it != leaves.end() && it->hash == hash; ++it)
  {
    if (it->address == format::Dir2NullDataAddress)
      continue;
    Entry entry = readEntry(*it, blocks);
    if (entry.name == name)
      return entry;
    if (!caseMatch && m_geometry.hasAsciiCi() && util::EqualAsciiCi(entry.name, name))
      caseMatch = entry;
  }
  // Entries with the same hash may continue in the next leaf
  mayContinue = it == leaves.end();
  return boost::none;
}

boost::optional<Directory::Entry> Directory::lookupShortform(ShortformLayout const & layout, std::string const & name) const
{
  Entry entry;
  entry.name = name;
  entry.hash = HashEntryName(m_geometry, name);
  entry.type = FileType::Directory;
  if (name == ".")
  {
    entry.inode = m_inode->number;
    return entry;
  }
  if (name == "..")
  {
    entry.inode = layout.parent;
    return entry;
  }

  for (Entry const & candidate: layout.entries)
    if (candidate.name == name)
      return candidate;
  if (m_geometry.hasAsciiCi())
  {
    for (Entry const & candidate: layout.entries)
      if (util::EqualAsciiCi(candidate.name, name))
        return candidate;
  }
  return boost::none;
}

boost::optional<Directory::Entry> Directory::lookupIndexed(Index index, std::string const & name) const
{
  uint32_t const hash = HashEntryName(m_geometry, name);
  DataBlocks blocks;
  bool mayContinue = false;
  boost::optional<Entry> caseMatch;
  switch (index)
  {
  case Index::Block:
  {
    std::vector<char> block = readDataBlock(0, blockMagic());
    std::vector<LeafEntry> const leaves = blockLeafEntries(block);
    blocks[0] = std::move(block);
    boost::optional<Entry> const entry = searchEntries(leaves, hash, name, blocks, mayContinue, caseMatch);
    return entry ? entry : caseMatch;
  }
  case Index::Leaf:
  {
    std::vector<char> const leaf = m_tree->readBlock(m_geometry.dirLeafFileBlock());
    boost::optional<Entry> const entry = searchEntries(leafEntries(leaf, true), hash, name, blocks, mayContinue,
      caseMatch);
    return entry ? entry : caseMatch;
  }
  case Index::Node:
  {
    std::set<uint64_t> visited;
    uint64_t leafBlock = m_tree->findLeaf(m_geometry.dirLeafFileBlock(), hash);
    for (;;)
    {
      ROXFS_FORMAT_ASSERT(visited.insert(leafBlock).second);
      std::vector<char> const leaf = m_tree->readBlock(leafBlock);
      boost::optional<Entry> const entry = searchEntries(leafEntries(leaf, false), hash, name, blocks, mayContinue,
        caseMatch);
      uint32_t const next = m_tree->forward(leaf);
      if (entry || !mayContinue || next == 0)
        return entry ? entry : caseMatch;
      leafBlock = next;
    }
  }
  }
  return boost::none;
}

Directory::Batch Directory::firstIndexedBatch(Index index) const
{
  DataBlocks blocks;
  switch (index)
  {
  case Index::Block:
  {
    std::vector<char> block = readDataBlock(0, blockMagic());
    std::vector<LeafEntry> const leaves = blockLeafEntries(block);
    blocks[0] = std::move(block);
    return resolveEntries(leaves, blocks);
  }
  case Index::Leaf:
  {
    std::vector<char> const leaf = m_tree->readBlock(m_geometry.dirLeafFileBlock());
    return resolveEntries(leafEntries(leaf, true), blocks);
  }
  case Index::Node:
    return nextBatch(m_tree->firstLeaf(m_geometry.dirLeafFileBlock()));
  }
  return Batch();
}

Directory::Batch Directory::firstBatch() const
{
  return boost::apply_visitor(BatchVisitor(*this), m_layout);
}

Directory::Batch Directory::nextBatch(uint64_t leafBlock) const
{
  std::vector<char> const leaf = m_tree->readBlock(leafBlock);
  DataBlocks blocks;
  Batch batch = resolveEntries(leafEntries(leaf, false), blocks);
  uint32_t const next = m_tree->forward(leaf);
  if (next != 0)
    batch.nextLeaf = next;
  return batch;
}

boost::optional<Directory::Entry> Directory::lookup(std::string const & name) const
{
  return boost::apply_visitor(LookupVisitor(*this, name), m_layout);
}

uint64_t Directory::parentInode() const
{
  boost::optional<Entry> const parent = lookup("..");
  ROXFS_FORMAT_ASSERT(parent.is_initialized());
  return parent->inode;
}

Directory::Iterator::Iterator(Directory const & directory)
  : m_directory(directory)
  , m_position(0)
{
  Batch batch = m_directory.firstBatch();
  m_entries = std::move(batch.entries);
  m_nextLeaf = batch.nextLeaf;
  skipDotEntries();
}

void Directory::Iterator::skipDotEntries()
{
  for (;;)
  {
    while (m_position < m_entries.size() && IsDotName(m_entries[m_position].name))
      ++m_position;
    if (m_position < m_entries.size() || !m_nextLeaf)
      return;

    uint64_t const leafBlock = *m_nextLeaf;
    ROXFS_FORMAT_ASSERT(m_visitedLeaves.insert(leafBlock).second);
    Batch batch = m_directory.nextBatch(leafBlock);
    m_entries = std::move(batch.entries);
    m_nextLeaf = batch.nextLeaf;
    m_position = 0;
  }
}

void Directory::Iterator::moveNext()
{
  ROXFS_ASSERT(!eof());
  ++m_position;
  skipDotEntries();
}

bool Directory::Iterator::eof() const
{
  return m_position >= m_entries.size();
}

Directory::Entry const & Directory::Iterator::current() const
{
  ROXFS_ASSERT(!eof());
  return m_entries[m_position];
}

}
