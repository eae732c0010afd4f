#include "Volume.hpp"
#include "util/Assert.hpp"
#include "util/Crc32c.hpp"

namespace roxfs
{

Volume::Volume(IStorage const & storage, MountOptions const & options)
  : m_options(options)
  , m_geometry(Geometry::load(storage, options.verifyChecksums))
  , m_cache(storage, m_geometry.blockSize(), options.cacheBlocks)
  , m_inodes(m_geometry, m_cache, m_options)
{}

std::vector<char> Volume::readBlocks(uint64_t fsblock, unsigned count) const
{
  std::vector<char> result;
  result.reserve(size_t(count) * m_geometry.blockSize());
  for (unsigned i = 0; i < count; ++i)
  {
    BlockCache::BlockPtr const block = m_cache.read(m_geometry.fsblockToLinear(fsblock + i));
    result.insert(result.end(), block->begin(), block->end());
  }
  return result;
}

void Volume::verifyCrc(std::vector<char> const & block, size_t crcOffset) const
{
  if (m_geometry.hasCrc() && m_options.verifyChecksums)
    ROXFS_FORMAT_ASSERT(util::VerifyCrc32c(block.data(), block.size(), crcOffset));
}

}
