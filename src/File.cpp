#include "File.hpp"
#include <algorithm>
#include <cstring>
#include "util/Assert.hpp"

namespace roxfs
{

File::File(Volume const & volume, InodePtr const & inode)
  : m_volume(volume)
  , m_inode(inode)
  , m_position(0)
{
  ROXFS_ASSERT(m_inode->type() == FileType::Regular);
  if (m_inode->dataFormat != ForkFormat::Local)
    m_extents.reset(new ExtentMap(m_volume, *m_inode, Fork::Data));
}

void File::read(size_t & inOutSize, void * buffer)
{
  inOutSize = pread(m_position, inOutSize, buffer);
  m_position += inOutSize;
}

size_t File::pread(uint64_t position, size_t size, void * buffer) const
{
  uint64_t const fileSize = m_inode->size;
  if (position >= fileSize)
    return 0;
  size_t const availableSize = size_t(std::min(uint64_t(size), fileSize - position));
  char * out = static_cast<char *>(buffer);

  if (!m_extents)
  {
    std::vector<char> const & data = m_inode->dataFork;
    ROXFS_FORMAT_ASSERT(position + availableSize <= data.size());
    std::memcpy(out, data.data() + position, availableSize);
    return availableSize;
  }

  Geometry const & geometry = m_volume.geometry();
  uint32_t const blockSize = geometry.blockSize();
  boost::optional<Extent> extent;
  for (size_t done = 0; done < availableSize;)
  {
    uint64_t const current = position + done;
    uint64_t const fileBlock = current >> geometry.blockLog();
    size_t const inBlock = size_t(current & (blockSize - 1));
    size_t const chunk = std::min<size_t>(availableSize - done, blockSize - inBlock);

    if (!extent || fileBlock < extent->fileOffset || fileBlock >= extent->fileEnd())
      extent = m_extents->lookup(fileBlock);

    if (!extent || extent->unwritten)
    {
      std::memset(out + done, 0, chunk);
    }
    else
    {
      uint64_t const fsblock = extent->startBlock + (fileBlock - extent->fileOffset);
      BlockCache::BlockPtr const block = m_volume.cache().read(geometry.fsblockToLinear(fsblock));
      std::memcpy(out + done, block->data() + inBlock, chunk);
    }
    done += chunk;
  }
  return availableSize;
}

}
