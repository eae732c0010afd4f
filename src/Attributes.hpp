#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include "DaBtree.hpp"
#include "ExtentMap.hpp"
#include "Inode.hpp"
#include "Volume.hpp"

namespace roxfs
{

enum class AttributeNamespace
{
  User,
  Trusted,
  Secure
};

// Extended attributes kept in the attribute fork of an inode
class Attributes
{
public:
  struct Name
  {
    AttributeNamespace ns;
    std::string name;
  };

  enum class LayoutType
  {
    None,
    Local,
    Extents,
    Btree
  };

  Attributes(Volume const & volume, InodePtr const & inode);

  Attributes(Attributes const &) = delete;
  void operator=(Attributes const &) = delete;

  LayoutType layoutType() const;

  boost::optional<std::vector<char>> get(AttributeNamespace ns, std::string const & name) const;

  // Names in on-disk order, parent pointers and incomplete entries are skipped
  class Iterator
  {
  public:
    explicit Iterator(Attributes const &);

    void moveNext();
    bool eof() const;

    Name const & current() const;

  private:
    Attributes const & m_attributes;
    std::vector<Name> m_names;
    boost::optional<uint64_t> m_nextLeaf;
    size_t m_position;
    std::set<uint64_t> m_visitedLeaves;

    void loadNextLeaves();
  };

private:
  struct LocalEntry
  {
    Name name;
    std::vector<char> value;
  };

  struct NoAttributesLayout {};
  struct LocalLayout
  {
    std::vector<LocalEntry> entries;
  };
  struct ExtentsLayout {};
  struct BtreeLayout {};

  typedef boost::variant<NoAttributesLayout, LocalLayout, ExtentsLayout, BtreeLayout> Layout;

  struct LeafEntry
  {
    uint32_t hash;
    uint8_t flags;
    size_t nameOffset;
  };

  struct Leaf
  {
    std::vector<char> block;
    std::vector<LeafEntry> entries;
    uint32_t forward;
  };

  struct Batch
  {
    std::vector<Name> names;
    boost::optional<uint64_t> nextLeaf;
  };

  class GetVisitor;
  class BatchVisitor;

  Volume const & m_volume;
  Geometry const & m_geometry;
  InodePtr const m_inode;
  std::unique_ptr<ExtentMap> m_blocks;
  std::unique_ptr<DaBtree> m_tree;
  Layout m_layout;

  static LocalLayout decodeLocal(Inode const &);

  Leaf readLeaf(uint64_t dablk) const;
  std::string leafEntryName(Leaf const & leaf, LeafEntry const & entry) const;
  std::vector<char> leafEntryValue(Leaf const & leaf, LeafEntry const & entry) const;
  std::vector<char> readRemoteValue(uint32_t valueBlock, uint32_t valueLength) const;

  boost::optional<std::vector<char>> getFromLocal(LocalLayout const &, AttributeNamespace, std::string const &) const;
  boost::optional<std::vector<char>> getFromLeaves(AttributeNamespace, std::string const &) const;

  Batch firstBatch() const;
  Batch leafBatch(uint64_t dablk) const;
};

}
