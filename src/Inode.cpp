#include "Inode.hpp"
#include <sys/stat.h>
#include "format/Inode.hpp"
#include "util/Assert.hpp"
#include "util/Crc32c.hpp"
#include "util/Log.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

FileType Inode::type() const
{
  switch (mode & S_IFMT)
  {
  case S_IFREG:
    return FileType::Regular;
  case S_IFDIR:
    return FileType::Directory;
  case S_IFCHR:
    return FileType::CharacterDevice;
  case S_IFBLK:
    return FileType::BlockDevice;
  case S_IFIFO:
    return FileType::Fifo;
  case S_IFSOCK:
    return FileType::Socket;
  case S_IFLNK:
    return FileType::Symlink;
  default:
    return FileType::Unknown;
  }
}

InodeReader::InodeReader(Geometry const & geometry, BlockCache const & cache, MountOptions const & options)
  : m_geometry(geometry)
  , m_cache(cache)
  , m_verifyChecksums(options.verifyChecksums)
  , m_capacity(options.inodeCacheSize == 0 ? 1 : options.inodeCacheSize)
{}

InodePtr InodeReader::getInode(uint64_t ino) const
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(ino);
    if (it != m_index.end())
    {
      m_lru.splice(m_lru.begin(), m_lru, it->second);
      return *it->second;
    }
  }

  InodePtr inode = decode(ino);

  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_index.find(ino) == m_index.end())
  {
    m_lru.push_front(inode);
    m_index[ino] = m_lru.begin();
    while (m_lru.size() > m_capacity)
    {
      m_index.erase(m_lru.back()->number);
      m_lru.pop_back();
    }
  }
  return inode;
}

Timestamp InodeReader::decodeTimestamp(uint64_t raw, bool bigTime) const
{
  Timestamp result;
  if (bigTime)
  {
    result.seconds = static_cast<int64_t>(raw / 1000000000) - format::BigTimeEpochOffset;
    result.nanoseconds = static_cast<uint32_t>(raw % 1000000000);
  }
  else
  {
    result.seconds = static_cast<int32_t>(static_cast<uint32_t>(raw >> 32));
    result.nanoseconds = static_cast<uint32_t>(raw);
  }
  return result;
}

namespace
{

bool IsForkFormatValid(uint8_t format)
{
  return format <= format::ForkFormatBtree;
}

// Device nodes keep the device number in the data fork, everything else maps data
bool IsDataForkFormatAllowed(FileType type, ForkFormat format)
{
  switch (type)
  {
  case FileType::CharacterDevice:
  case FileType::BlockDevice:
  case FileType::Fifo:
  case FileType::Socket:
    return format == ForkFormat::Device;
  case FileType::Regular:
  case FileType::Directory:
  case FileType::Symlink:
    return format == ForkFormat::Local || format == ForkFormat::Extents || format == ForkFormat::Btree;
  default:
    return false;
  }
}

}

InodePtr InodeReader::decode(uint64_t ino) const
{
  boost::optional<Geometry::InodeLocation> const location = m_geometry.locateInode(ino);
  if (!location)
    ThrowFilesystemError(ErrorCode::NotFound, "Inode number is outside of the volume");

  BlockCache::BlockPtr const block = m_cache.read(location->linearBlock);
  char const * const record = block->data() + location->offset;
  size_t const inodeSize = m_geometry.inodeSize();

  format::InodeCore core;
  util::readT(record, inodeSize, 0, core);
  ROXFS_FORMAT_ASSERT(core.magic.value() == format::InodeCore::MagicValue);

  std::shared_ptr<Inode> inode = std::make_shared<Inode>();
  inode->number = ino;
  inode->version = core.version;
  ROXFS_FORMAT_ASSERT(inode->version >= 1 && inode->version <= 3);
  ROXFS_FORMAT_ASSERT((inode->version == 3) == m_geometry.hasCrc());

  size_t coreSize = sizeof(format::InodeCore);
  inode->flags2 = 0;
  inode->crtime = Timestamp();
  if (inode->version == 3)
  {
    format::InodeCoreV3 coreV3;
    util::readT(record, inodeSize, 0, coreV3);
    if (m_verifyChecksums)
      ROXFS_FORMAT_ASSERT(util::VerifyCrc32c(record, inodeSize, format::InodeCrcOffset));
    ROXFS_FORMAT_ASSERT(coreV3.inodeNumber.value() == ino);
    inode->flags2 = coreV3.flags2.value();
    inode->crtime = decodeTimestamp(coreV3.crtime.value(), (inode->flags2 & format::InodeCore::Flags2BigTime) != 0);
    coreSize = sizeof(format::InodeCoreV3);
  }

  inode->mode = core.mode.value();
  if (inode->mode == 0)
    ThrowFilesystemError(ErrorCode::NotFound, "Inode is not allocated");

  bool const bigTime = (inode->flags2 & format::InodeCore::Flags2BigTime) != 0;
  inode->links = inode->version == 1 ? core.oldLinkCount.value() : core.linkCount.value();
  inode->uid = core.uid.value();
  inode->gid = core.gid.value();
  inode->projectId = (uint32_t(core.projectIdHi.value()) << 16) | core.projectIdLo.value();
  inode->size = core.size.value();
  inode->blockCount = core.blockCount.value();
  inode->atime = decodeTimestamp(core.atime.value(), bigTime);
  inode->mtime = decodeTimestamp(core.mtime.value(), bigTime);
  inode->ctime = decodeTimestamp(core.ctime.value(), bigTime);
  inode->generation = core.generation.value();
  inode->flags = core.flags.value();

  if ((inode->flags2 & format::InodeCore::Flags2LargeExtentCounts) != 0)
  {
    ROXFS_FORMAT_ASSERT(m_geometry.hasLargeExtentCounts());
    format::big_uint64_buf_t largeCount;
    util::readT(record, coreSize, format::LargeDataExtentsOffset, largeCount);
    inode->dataExtents = largeCount.value();
    inode->attributeExtents = core.dataExtents.value();
  }
  else
  {
    inode->dataExtents = core.dataExtents.value();
    inode->attributeExtents = core.attrExtents.value();
  }

  ROXFS_FORMAT_ASSERT(IsForkFormatValid(core.format));
  inode->dataFormat = static_cast<ForkFormat>(core.format);
  ROXFS_FORMAT_ASSERT(IsDataForkFormatAllowed(inode->type(), inode->dataFormat));

  // Literal area follows the core, attribute fork starts at forkOffset * 8 if present
  size_t const literalSize = inodeSize - coreSize;
  size_t dataForkSize = literalSize;
  inode->hasAttributeFork = core.forkOffset != 0;
  if (inode->hasAttributeFork)
  {
    dataForkSize = size_t(core.forkOffset) * 8;
    ROXFS_FORMAT_ASSERT(dataForkSize < literalSize);
    ROXFS_FORMAT_ASSERT(IsForkFormatValid(core.attrFormat) && core.attrFormat != format::ForkFormatDevice);
    inode->attributeFormat = static_cast<ForkFormat>(core.attrFormat);
    inode->attributeFork.assign(record + coreSize + dataForkSize, record + inodeSize);
  }
  else
  {
    inode->attributeFormat = ForkFormat::Extents;
    inode->attributeExtents = 0;
  }
  inode->dataFork.assign(record + coreSize, record + coreSize + dataForkSize);

  inode->rdev = 0;
  if (inode->dataFormat == ForkFormat::Device)
    inode->rdev = util::readT<format::big_uint32_buf_t>(inode->dataFork, 0).value();
  else if (inode->dataFormat == ForkFormat::Extents)
    ROXFS_FORMAT_ASSERT(inode->dataExtents <= dataForkSize / 16);
  else if (inode->dataFormat == ForkFormat::Local)
    ROXFS_FORMAT_ASSERT(inode->size <= dataForkSize);

  if (inode->hasAttributeFork && inode->attributeFormat == ForkFormat::Extents)
    ROXFS_FORMAT_ASSERT(inode->attributeExtents <= inode->attributeFork.size() / 16);

  ROXFS_LOG(trace) << "Inode " << ino << " mode " << std::oct << inode->mode << std::dec
    << " data fork " << int(core.format) << " attribute fork " << int(core.attrFormat);
  return inode;
}

}
