#include "Symlink.hpp"
#include <algorithm>
#include "ExtentMap.hpp"
#include "format/RemoteBlock.hpp"
#include "util/Assert.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

std::string ReadSymlinkTarget(Volume const & volume, InodePtr const & inode)
{
  ROXFS_ASSERT(inode->type() == FileType::Symlink);
  size_t const size = static_cast<size_t>(inode->size);
  ROXFS_FORMAT_ASSERT(inode->size > 0 && inode->size <= MaxSymlinkTarget);

  if (inode->dataFormat == ForkFormat::Local)
    return std::string(inode->dataFork.data(), size);

  // One header per mapped extent on CRC enabled file systems
  Geometry const & geometry = volume.geometry();
  ExtentMap const extents(volume, *inode, Fork::Data);
  std::string target;
  for (Extent const & extent: extents.extents())
  {
    if (target.size() == size)
      break;
    ROXFS_FORMAT_ASSERT(!extent.unwritten);
    std::vector<char> const buffer = volume.readBlocks(extent.startBlock, static_cast<unsigned>(extent.blockCount));
    size_t headerSize = 0;
    size_t chunk = std::min(size - target.size(), buffer.size());
    if (geometry.hasCrc())
    {
      format::RemoteBlockHeader header;
      util::readT(buffer, 0, header);
      headerSize = sizeof(header);
      chunk = std::min(size - target.size(), buffer.size() - headerSize);
      ROXFS_FORMAT_ASSERT(header.magic.value() == format::RemoteBlockHeader::SymlinkMagicValue);
      volume.verifyCrc(buffer, format::RemoteBlockCrcOffset);
      ROXFS_FORMAT_ASSERT(header.owner.value() == inode->number);
      ROXFS_FORMAT_ASSERT(header.offset.value() == target.size() && header.bytes.value() == chunk);
    }
    target.append(buffer.data() + headerSize, chunk);
  }
  ROXFS_FORMAT_ASSERT(target.size() == size);
  return target;
}

}
