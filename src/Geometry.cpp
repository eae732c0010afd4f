#include "Geometry.hpp"
#include <cstring>
#include <vector>
#include "format/Directory.hpp"
#include "format/Superblock.hpp"
#include "util/Assert.hpp"
#include "util/Crc32c.hpp"
#include "util/Log.hpp"
#include "util/StorageT.hpp"

namespace roxfs
{

namespace
{

[[noreturn]]
void ThrowInvalidFormat(const char * description)
{
  ROXFS_LOG(error) << "Mount failed: " << description;
  throw FileSystemError(ErrorCode::InvalidStorageFormat, description);
}

#define ROXFS_SUPERBLOCK_CHECK(expression, description) \
  (void)((!!(expression)) || (ThrowInvalidFormat(description), false))

}

Geometry::Geometry()
{}

Geometry Geometry::load(IStorage const & storage, bool verifyChecksums)
{
  static const uint32_t MinSectorSize = 512;
  static const uint32_t MaxSectorSize = 32768;

  ROXFS_SUPERBLOCK_CHECK(storage.size() >= MinSectorSize, "Image is too small");
  std::vector<char> sector(MinSectorSize);
  storage.read(0, sector.size(), sector.data());

  format::Superblock sb;
  util::readT(sector, 0, sb);
  ROXFS_SUPERBLOCK_CHECK(sb.magic.value() == format::Superblock::MagicValue, "Bad superblock magic");

  Geometry g;
  g.m_version = sb.versionNumber.value() & format::Superblock::VersionMask;
  ROXFS_SUPERBLOCK_CHECK(g.m_version == format::Superblock::Version4 || g.m_version == format::Superblock::Version5,
    "Unsupported superblock version");
  g.m_hasAsciiCi = (sb.versionNumber.value() & format::Superblock::VersionAsciiCi) != 0;

  g.m_sectorSize = sb.sectorSize.value();
  ROXFS_SUPERBLOCK_CHECK(g.m_sectorSize >= MinSectorSize && g.m_sectorSize <= MaxSectorSize
    && (g.m_sectorSize & (g.m_sectorSize - 1)) == 0
    && g.m_sectorSize == (1u << sb.sectorLog), "Bad sector size");

  if (g.hasCrc())
  {
    ROXFS_SUPERBLOCK_CHECK(storage.size() >= g.m_sectorSize, "Image is too small");
    sector.resize(g.m_sectorSize);
    storage.read(0, sector.size(), sector.data());
    if (verifyChecksums)
      ROXFS_SUPERBLOCK_CHECK(util::VerifyCrc32c(sector.data(), sector.size(), format::SuperblockCrcOffset),
        "Superblock checksum mismatch");
    uint32_t const incompat = sb.featuresIncompat.value();
    ROXFS_SUPERBLOCK_CHECK((incompat & ~format::Superblock::IncompatKnown) == 0, "Unknown incompatible features");
    ROXFS_SUPERBLOCK_CHECK((incompat & format::Superblock::IncompatNeedsRepair) == 0, "File system needs repair");
    g.m_hasFileType = (incompat & format::Superblock::IncompatFileType) != 0;
    g.m_hasBigTime = (incompat & format::Superblock::IncompatBigTime) != 0;
    g.m_hasLargeExtentCounts = (incompat & format::Superblock::IncompatLargeExtentCounts) != 0;
  }
  else
  {
    g.m_hasFileType = (sb.features2.value() & format::Superblock::Features2FileType) != 0;
    g.m_hasBigTime = false;
    g.m_hasLargeExtentCounts = false;
  }

  g.m_blockSize = sb.blockSize.value();
  g.m_blockLog = sb.blockLog;
  ROXFS_SUPERBLOCK_CHECK(g.m_blockLog >= 9 && g.m_blockLog <= 16 && g.m_blockSize == (1u << g.m_blockLog)
    && g.m_blockSize >= g.m_sectorSize, "Bad block size");

  g.m_inodeSize = sb.inodeSize.value();
  g.m_inodeLog = sb.inodeLog;
  ROXFS_SUPERBLOCK_CHECK(g.m_inodeLog >= 8 && g.m_inodeLog <= 11 && g.m_inodeSize == (1u << g.m_inodeLog)
    && g.m_inodeSize <= g.m_blockSize, "Bad inode size");

  g.m_inodesPerBlockLog = sb.inodesPerBlockLog;
  ROXFS_SUPERBLOCK_CHECK(g.m_inodesPerBlockLog == g.m_blockLog - g.m_inodeLog
    && sb.inodesPerBlock.value() == (1u << g.m_inodesPerBlockLog), "Bad inodes per block");

  g.m_agBlocks = sb.agBlocks.value();
  g.m_agBlocksLog = sb.agBlocksLog;
  g.m_agCount = sb.agCount.value();
  ROXFS_SUPERBLOCK_CHECK(g.m_agCount != 0 && g.m_agBlocks != 0, "Empty allocation groups");
  ROXFS_SUPERBLOCK_CHECK(g.m_agBlocksLog < 32 && uint64_t(g.m_agBlocks) <= (UINT64_C(1) << g.m_agBlocksLog)
    && (g.m_agBlocksLog == 0 || uint64_t(g.m_agBlocks) > (UINT64_C(1) << (g.m_agBlocksLog - 1))),
    "Bad allocation group size");

  g.m_dirBlockLog = sb.dirBlockLog;
  ROXFS_SUPERBLOCK_CHECK(g.m_blockLog + g.m_dirBlockLog <= 16, "Bad directory block size");

  g.m_rootInode = sb.rootInode.value();
  g.m_dataBlocks = sb.dataBlocks.value();
  g.m_freeDataBlocks = sb.freeDataBlocks.value();
  g.m_inodeCount = sb.inodeCount.value();
  g.m_freeInodes = sb.freeInodes.value();
  g.m_label.assign(sb.label, strnlen(sb.label, sizeof(sb.label)));

  ROXFS_SUPERBLOCK_CHECK(g.locateInode(g.m_rootInode).is_initialized(), "Root inode is outside of the volume");

  ROXFS_LOG(info) << "Mounted '" << g.m_label << "' v" << g.m_version
    << ", block " << g.m_blockSize << ", inode " << g.m_inodeSize
    << ", " << g.m_agCount << " AGs of " << g.m_agBlocks << " blocks"
    << ", directory block " << g.dirBlockSize();
  return g;
}

uint32_t Geometry::inodeToAg(uint64_t ino) const
{
  return static_cast<uint32_t>(ino >> (m_agBlocksLog + m_inodesPerBlockLog));
}

uint64_t Geometry::inodeToAgInode(uint64_t ino) const
{
  return ino & ((UINT64_C(1) << (m_agBlocksLog + m_inodesPerBlockLog)) - 1);
}

uint64_t Geometry::agInodeToInode(uint32_t agno, uint64_t agino) const
{
  return (uint64_t(agno) << (m_agBlocksLog + m_inodesPerBlockLog)) | agino;
}

uint64_t Geometry::agBlockToAgInode(uint32_t agbno, unsigned index) const
{
  return (uint64_t(agbno) << m_inodesPerBlockLog) | index;
}

uint32_t Geometry::fsblockToAg(uint64_t fsblock) const
{
  return static_cast<uint32_t>(fsblock >> m_agBlocksLog);
}

uint32_t Geometry::fsblockToAgBlock(uint64_t fsblock) const
{
  return static_cast<uint32_t>(fsblock & ((UINT64_C(1) << m_agBlocksLog) - 1));
}

uint64_t Geometry::agBlockToFsblock(uint32_t agno, uint32_t agbno) const
{
  return (uint64_t(agno) << m_agBlocksLog) | agbno;
}

bool Geometry::isValidFsblock(uint64_t fsblock) const
{
  return fsblockToAg(fsblock) < m_agCount && fsblockToAgBlock(fsblock) < m_agBlocks;
}

uint64_t Geometry::fsblockToLinear(uint64_t fsblock) const
{
  ROXFS_FORMAT_ASSERT(isValidFsblock(fsblock));
  return uint64_t(fsblockToAg(fsblock)) * m_agBlocks + fsblockToAgBlock(fsblock);
}

boost::optional<Geometry::InodeLocation> Geometry::locateInode(uint64_t ino) const
{
  uint32_t const agno = inodeToAg(ino);
  uint64_t const agino = inodeToAgInode(ino);
  uint64_t const agbno = agino >> m_inodesPerBlockLog;
  if (agno >= m_agCount || agbno >= m_agBlocks)
    return boost::none;

  InodeLocation location;
  location.linearBlock = uint64_t(agno) * m_agBlocks + agbno;
  location.offset = static_cast<uint32_t>(agino & ((1u << m_inodesPerBlockLog) - 1)) << m_inodeLog;
  return location;
}

uint64_t Geometry::dirLeafFileBlock() const
{
  return format::Dir2LeafOffset >> m_blockLog;
}

uint64_t Geometry::dirFreeFileBlock() const
{
  return format::Dir2FreeOffset >> m_blockLog;
}

}
