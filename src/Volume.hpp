#pragma once

#include <vector>
#include "roxfs/Common.hpp"
#include "roxfs/IStorage.hpp"
#include "BlockCache.hpp"
#include "Geometry.hpp"
#include "Inode.hpp"

namespace roxfs
{

// Per-mount context handed to every decoder: immutable geometry and options plus the shared caches
class Volume
{
public:
  Volume(IStorage const & storage, MountOptions const & options);

  Volume(Volume const &) = delete;
  void operator=(Volume const &) = delete;

  Geometry const & geometry() const { return m_geometry; }
  BlockCache const & cache() const { return m_cache; }
  InodeReader const & inodes() const { return m_inodes; }
  MountOptions const & options() const { return m_options; }

  // 'count' consecutive filesystem blocks starting at 'fsblock' as one buffer
  std::vector<char> readBlocks(uint64_t fsblock, unsigned count) const;

  // No-op on v4 images or when verification is off
  void verifyCrc(std::vector<char> const & block, size_t crcOffset) const;

private:
  MountOptions const m_options;
  Geometry const m_geometry;
  BlockCache const m_cache;
  InodeReader const m_inodes;
};

}
