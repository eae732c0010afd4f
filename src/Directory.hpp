#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include "roxfs/Common.hpp"
#include "DaBtree.hpp"
#include "ExtentMap.hpp"
#include "Inode.hpp"
#include "Volume.hpp"

namespace roxfs
{

class Directory
{
public:
  struct Entry
  {
    std::string name;
    uint64_t inode;
    FileType type; // Unknown on images without file type in entries
    uint32_t hash;
  };

  enum class LayoutType
  {
    Shortform,
    Block,
    Leaf,
    Node,
    Btree
  };

  Directory(Volume const & volume, InodePtr const & inode);

  Directory(Directory const &) = delete;
  void operator=(Directory const &) = delete;

  LayoutType layoutType() const;
  uint64_t inode() const { return m_inode->number; }

  // "." and ".." are resolved too
  boost::optional<Entry> lookup(std::string const & name) const;
  uint64_t parentInode() const;

  // Entries in hash order without "." and "..".
  class Iterator
  {
  public:
    explicit Iterator(Directory const &);

    void moveNext();
    bool eof() const;

    Entry const & current() const;

  private:
    Directory const & m_directory;
    std::vector<Entry> m_entries;
    boost::optional<uint64_t> m_nextLeaf;
    size_t m_position;
    std::set<uint64_t> m_visitedLeaves;

    void skipDotEntries();
  };

private:
  struct LeafEntry
  {
    uint32_t hash;
    uint32_t address;
  };

  // Hash index kinds of multi-block directories
  enum class Index
  {
    Block,
    Leaf,
    Node
  };

  struct ShortformLayout
  {
    uint64_t parent;
    std::vector<Entry> entries; // Sorted by hash
  };
  struct BlockLayout {};
  struct LeafLayout {};
  struct NodeLayout {};
  struct BtreeLayout
  {
    Index index;
  };

  typedef boost::variant<ShortformLayout, BlockLayout, LeafLayout, NodeLayout, BtreeLayout> Layout;

  struct Batch
  {
    std::vector<Entry> entries;
    boost::optional<uint64_t> nextLeaf;
  };

  typedef std::map<uint64_t, std::vector<char>> DataBlocks;

  class LookupVisitor;
  class BatchVisitor;

  Volume const & m_volume;
  Geometry const & m_geometry;
  InodePtr const m_inode;
  std::unique_ptr<ExtentMap> m_blocks;
  std::unique_ptr<DaBtree> m_tree;
  Layout m_layout;

  static ShortformLayout decodeShortform(Geometry const &, Inode const &);
  Index detectIndex() const;

  Batch firstBatch() const;
  Batch nextBatch(uint64_t leafBlock) const;

  boost::optional<Entry> lookupShortform(ShortformLayout const &, std::string const & name) const;
  boost::optional<Entry> lookupIndexed(Index, std::string const & name) const;
  Batch firstIndexedBatch(Index) const;

  std::vector<char> readDataBlock(uint64_t dablk, uint32_t magic) const;
  std::vector<LeafEntry> blockLeafEntries(std::vector<char> const & block) const;
  std::vector<LeafEntry> leafEntries(std::vector<char> const & block, bool singleLeaf) const;
  Entry readEntry(LeafEntry const & leaf, DataBlocks & blocks) const;
  Batch resolveEntries(std::vector<LeafEntry> const & leaves, DataBlocks & blocks) const;
  boost::optional<Entry> searchEntries(std::vector<LeafEntry> const & leaves, uint32_t hash,
    std::string const & name, DataBlocks & blocks, bool & mayContinue, boost::optional<Entry> & caseMatch) const;

  size_t dataHeaderSize() const;
  uint32_t blockMagic() const;
  uint32_t dataMagic() const;
};

}
