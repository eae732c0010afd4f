#include "Attributes.hpp"
#include <algorithm>
#include "format/Attribute.hpp"
#include "format/RemoteBlock.hpp"
#include "util/Assert.hpp"
#include "util/DaHash.hpp"
#include "util/Log.hpp"
#include "util/RoundUp.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

namespace
{

// None for entries that aren't extended attributes visible through this interface
boost::optional<AttributeNamespace> DecodeNamespace(uint8_t flags)
{
  if ((flags & (format::AttributeIncomplete | format::AttributeParent)) != 0)
    return boost::none;
  bool const trusted = (flags & format::AttributeRoot) != 0;
  bool const secure = (flags & format::AttributeSecure) != 0;
  ROXFS_FORMAT_ASSERT(!(trusted && secure));
  if (trusted)
    return AttributeNamespace::Trusted;
  if (secure)
    return AttributeNamespace::Secure;
  return AttributeNamespace::User;
}

}

class Attributes::GetVisitor: public boost::static_visitor<boost::optional<std::vector<char>>>
{
public:
  GetVisitor(Attributes const & attributes, AttributeNamespace ns, std::string const & name)
    : m_attributes(attributes)
    , m_ns(ns)
    , m_name(name)
  {}

  result_type operator()(NoAttributesLayout const &) const
  {
    return boost::none;
  }

  result_type operator()(LocalLayout const & layout) const
  {
    return m_attributes.getFromLocal(layout, m_ns, m_name);
  }

  result_type operator()(ExtentsLayout const &) const
  {
    return m_attributes.getFromLeaves(m_ns, m_name);
  }

  result_type operator()(BtreeLayout const &) const
  {
    return m_attributes.getFromLeaves(m_ns, m_name);
  }

private:
  Attributes const & m_attributes;
  AttributeNamespace const m_ns;
  std::string const & m_name;
};

class Attributes::BatchVisitor: public boost::static_visitor<Attributes::Batch>
{
public:
  explicit BatchVisitor(Attributes const & attributes)
    : m_attributes(attributes)
  {}

  result_type operator()(NoAttributesLayout const &) const
  {
    return Batch();
  }

  result_type operator()(LocalLayout const & layout) const
  {
    Batch batch;
    for (LocalEntry const & entry: layout.entries)
      batch.names.push_back(entry.name);
    return batch;
  }

  result_type operator()(ExtentsLayout const &) const
  {
    return firstLeafBatch();
  }

  result_type operator()(BtreeLayout const &) const
  {
    return firstLeafBatch();
  }

private:
  Attributes const & m_attributes;

  // Block 0 is either the only leaf or the root node
  Batch firstLeafBatch() const
  {
    std::vector<char> const root = m_attributes.m_tree->readBlock(0);
    if (m_attributes.m_tree->isNode(root))
      return m_attributes.leafBatch(m_attributes.m_tree->firstLeaf(0));
    return m_attributes.leafBatch(0);
  }
};

Attributes::Attributes(Volume const & volume, InodePtr const & inode)
  : m_volume(volume)
  , m_geometry(volume.geometry())
  , m_inode(inode)
{
  if (!m_inode->hasAttributeFork)
    return;

  switch (m_inode->attributeFormat)
  {
  case ForkFormat::Local:
    m_layout = decodeLocal(*m_inode);
    break;
  case ForkFormat::Extents:
    if (m_inode->attributeExtents == 0)
      break;
    // fall through
  case ForkFormat::Btree:
    m_blocks.reset(new ExtentMap(m_volume, *m_inode, Fork::Attribute));
    m_tree.reset(new DaBtree(m_volume, *m_blocks, m_inode->number, 1));
    if (m_inode->attributeFormat == ForkFormat::Btree)
      m_layout = BtreeLayout();
    else
      m_layout = ExtentsLayout();
    break;
  default:
    ThrowCorruptMetadata("Unexpected attribute fork format");
  }
}

Attributes::LayoutType Attributes::layoutType() const
{
  return static_cast<LayoutType>(m_layout.which());
}

Attributes::LocalLayout Attributes::decodeLocal(Inode const & inode)
{
  std::vector<char> const & fork = inode.attributeFork;
  format::AttrShortformHeader header;
  util::readT(fork, 0, header);
  size_t const totalSize = header.totalSize.value();
  ROXFS_FORMAT_ASSERT(totalSize >= sizeof(header) && totalSize <= fork.size());

  LocalLayout layout;
  size_t position = sizeof(header);
  for (unsigned i = 0; i < header.count; ++i)
  {
    format::AttrShortformEntry entryHeader;
    util::readT(fork.data(), totalSize, position, entryHeader);
    position += sizeof(entryHeader);
    ROXFS_FORMAT_ASSERT(entryHeader.nameLength > 0);
    ROXFS_FORMAT_ASSERT(position + entryHeader.nameLength + entryHeader.valueLength <= totalSize);

    boost::optional<AttributeNamespace> const ns = DecodeNamespace(entryHeader.flags);
    if (ns)
    {
      LocalEntry entry;
      entry.name.ns = *ns;
      entry.name.name.assign(fork.data() + position, entryHeader.nameLength);
      char const * const value = fork.data() + position + entryHeader.nameLength;
      entry.value.assign(value, value + entryHeader.valueLength);
      layout.entries.push_back(entry);
    }
    position += entryHeader.nameLength + entryHeader.valueLength;
  }
  return layout;
}

Attributes::Leaf Attributes::readLeaf(uint64_t dablk) const
{
  Leaf leaf;
  leaf.block = m_tree->readBlock(dablk);
  std::vector<char> const & block = leaf.block;

  size_t headerSize;
  unsigned count;
  if (m_geometry.hasCrc())
  {
    m_tree->verifyHeader(block, format::Attr3LeafHeader::MagicValue);
    format::Attr3LeafHeader header;
    util::readT(block, 0, header);
    count = header.count.value();
    headerSize = sizeof(header);
  }
  else
  {
    m_tree->verifyHeader(block, format::AttrLeafHeader::MagicValue);
    format::AttrLeafHeader header;
    util::readT(block, 0, header);
    count = header.count.value();
    headerSize = sizeof(header);
  }
  leaf.forward = m_tree->forward(block);

  size_t const entriesEnd = headerSize + size_t(count) * sizeof(format::AttrLeafEntry);
  ROXFS_FORMAT_ASSERT(entriesEnd <= block.size());
  leaf.entries.resize(count);
  for (unsigned i = 0; i < count; ++i)
  {
    format::AttrLeafEntry entry;
    util::readT(block, headerSize + i * sizeof(entry), entry);
    leaf.entries[i].hash = entry.hashValue.value();
    leaf.entries[i].flags = entry.flags;
    leaf.entries[i].nameOffset = entry.nameIndex.value();
    ROXFS_FORMAT_ASSERT(leaf.entries[i].nameOffset >= entriesEnd && leaf.entries[i].nameOffset < block.size());
    ROXFS_FORMAT_ASSERT(i == 0 || leaf.entries[i].hash >= leaf.entries[i - 1].hash);
  }
  return leaf;
}

std::string Attributes::leafEntryName(Leaf const & leaf, LeafEntry const & entry) const
{
  std::vector<char> const & block = leaf.block;
  size_t nameOffset;
  size_t nameLength;
  if ((entry.flags & format::AttributeLocal) != 0)
  {
    format::AttrLeafNameLocal local;
    util::readT(block, entry.nameOffset, local);
    nameOffset = entry.nameOffset + sizeof(local);
    nameLength = local.nameLength;
  }
  else
  {
    format::AttrLeafNameRemote remote;
    util::readT(block, entry.nameOffset, remote);
    nameOffset = entry.nameOffset + sizeof(remote);
    nameLength = remote.nameLength;
  }
  ROXFS_FORMAT_ASSERT(nameLength > 0 && nameOffset + nameLength <= block.size());
  return std::string(block.data() + nameOffset, nameLength);
}

std::vector<char> Attributes::leafEntryValue(Leaf const & leaf, LeafEntry const & entry) const
{
  std::vector<char> const & block = leaf.block;
  if ((entry.flags & format::AttributeLocal) != 0)
  {
    format::AttrLeafNameLocal local;
    util::readT(block, entry.nameOffset, local);
    size_t const valueOffset = entry.nameOffset + sizeof(local) + local.nameLength;
    size_t const valueLength = local.valueLength.value();
    ROXFS_FORMAT_ASSERT(valueOffset + valueLength <= block.size());
    return std::vector<char>(block.begin() + valueOffset, block.begin() + valueOffset + valueLength);
  }

  format::AttrLeafNameRemote remote;
  util::readT(block, entry.nameOffset, remote);
  return readRemoteValue(remote.valueBlock.value(), remote.valueLength.value());
}

// Remote values occupy consecutive attribute fork blocks, each with its own header on v5
std::vector<char> Attributes::readRemoteValue(uint32_t valueBlock, uint32_t valueLength) const
{
  bool const crc = m_geometry.hasCrc();
  size_t const headerSize = crc ? sizeof(format::RemoteBlockHeader) : 0;
  size_t const payloadSize = m_geometry.blockSize() - headerSize;
  uint64_t const blockCount = util::CeilDiv(uint64_t(valueLength), payloadSize);

  std::vector<char> value;
  value.reserve(valueLength);
  for (uint64_t i = 0; i < blockCount; ++i)
  {
    std::vector<char> const block = m_blocks->readBlocks(valueBlock + i, 1);
    size_t const chunk = std::min<size_t>(payloadSize, valueLength - value.size());
    if (crc)
    {
      format::RemoteBlockHeader header;
      util::readT(block, 0, header);
      ROXFS_FORMAT_ASSERT(header.magic.value() == format::RemoteBlockHeader::AttributeMagicValue);
      m_volume.verifyCrc(block, format::RemoteBlockCrcOffset);
      ROXFS_FORMAT_ASSERT(header.owner.value() == m_inode->number);
      ROXFS_FORMAT_ASSERT(header.offset.value() == value.size() && header.bytes.value() == chunk);
    }
    value.insert(value.end(), block.begin() + headerSize, block.begin() + headerSize + chunk);
  }
  return value;
}

boost::optional<std::vector<char>> Attributes::getFromLocal(LocalLayout const & layout,
  AttributeNamespace ns, std::string const & name) const
{
  for (LocalEntry const & entry: layout.entries)
    if (entry.name.ns == ns && entry.name.name == name)
      return entry.value;
  return boost::none;
}

boost::optional<std::vector<char>> Attributes::getFromLeaves(AttributeNamespace ns, std::string const & name) const
{
  uint32_t const hash = util::HashName(name);
  std::vector<char> const root = m_tree->readBlock(0);
  uint64_t leafBlock = m_tree->isNode(root) ? m_tree->findLeaf(0, hash) : 0;

  std::set<uint64_t> visited;
  for (;;)
  {
    ROXFS_FORMAT_ASSERT(visited.insert(leafBlock).second);
    Leaf const leaf = readLeaf(leafBlock);
    auto it = std::lower_bound(leaf.entries.begin(), leaf.entries.end(), hash,
      [](LeafEntry const & entry, uint32_t value) { return entry.hash < value; });
    for (; it != leaf.entries.end() && it->hash == hash; ++it)
    {
      boost::optional<AttributeNamespace> const entryNs = DecodeNamespace(it->flags);
      if (entryNs && *entryNs == ns && leafEntryName(leaf, *it) == name)
        return leafEntryValue(leaf, *it);
    }
    // Same hash may continue in the next leaf
    if (it != leaf.entries.end() || leaf.forward == 0)
      return boost::none;
    leafBlock = leaf.forward;
  }
}

boost::optional<std::vector<char>> Attributes::get(AttributeNamespace ns, std::string const & name) const
{
  return boost::apply_visitor(GetVisitor(*this, ns, name), m_layout);
}

Attributes::Batch Attributes::firstBatch() const
{
  return boost::apply_visitor(BatchVisitor(*this), m_layout);
}

Attributes::Batch Attributes::leafBatch(uint64_t dablk) const
{
  Leaf const leaf = readLeaf(dablk);
  Batch batch;
  for (LeafEntry const & entry: leaf.entries)
  {
    boost::optional<AttributeNamespace> const ns = DecodeNamespace(entry.flags);
    if (!ns)
      continue;
    Name name;
    name.ns = *ns;
    name.name = leafEntryName(leaf, entry);
    batch.names.push_back(name);
  }
  if (leaf.forward != 0)
    batch.nextLeaf = leaf.forward;
  return batch;
}

Attributes::Iterator::Iterator(Attributes const & attributes)
  : m_attributes(attributes)
  , m_position(0)
{
  Batch batch = m_attributes.firstBatch();
  m_names = std::move(batch.names);
  m_nextLeaf = batch.nextLeaf;
  loadNextLeaves();
}

void Attributes::Iterator::loadNextLeaves()
{
  while (m_position >= m_names.size() && m_nextLeaf)
  {
    uint64_t const leafBlock = *m_nextLeaf;
    ROXFS_FORMAT_ASSERT(m_visitedLeaves.insert(leafBlock).second);
    Batch batch = m_attributes.leafBatch(leafBlock);
    m_names = std::move(batch.names);
    m_nextLeaf = batch.nextLeaf;
    m_position = 0;
  }
}

void Attributes::Iterator::moveNext()
{
  ROXFS_ASSERT(!eof());
  ++m_position;
  loadNextLeaves();
}

bool Attributes::Iterator::eof() const
{
  return m_position >= m_names.size();
}

Attributes::Name const & Attributes::Iterator::current() const
{
  ROXFS_ASSERT(!eof());
  return m_names[m_position];
}

}
