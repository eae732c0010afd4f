#include <gtest/gtest.h>
#include <cstring>
#include <functional>
#include "Geometry.hpp"
#include "ImageBuilder.hpp"
#include "StorageInMemory.hpp"
#include "format/Superblock.hpp"
#include "roxfs/FileSystemError.hpp"

namespace
{
  namespace format = roxfs::format;

  const size_t LabelOffset = 108;

  std::vector<char> DefaultImage()
  {
    ImageBuilder builder;
    builder.addFile(builder.rootInode(), "file", 10000);
    return builder.build();
  }

  void PatchSuperblock(std::vector<char> & image, std::function<void(format::Superblock &)> const & patch)
  {
    format::Superblock sb;
    std::memcpy(&sb, image.data(), sizeof(sb));
    patch(sb);
    std::memcpy(image.data(), &sb, sizeof(sb));
    RewriteChecksum(image, 0, 512, format::SuperblockCrcOffset);
  }

  roxfs::ErrorCode LoadError(std::vector<char> const & image, bool verifyChecksums = true)
  {
    StorageInMemory storage(image);
    try
    {
      roxfs::Geometry::load(storage, verifyChecksums);
    }
    catch (roxfs::FileSystemError const & e)
    {
      return e.code();
    }
    return roxfs::ErrorCode::InternalExpectationFail;
  }
}

TEST(Geometry, DefaultImage)
{
  ImageBuilder builder;
  uint64_t const root = builder.rootInode();
  StorageInMemory storage(builder.build());
  roxfs::Geometry const g = roxfs::Geometry::load(storage, true);

  EXPECT_TRUE(g.hasCrc());
  EXPECT_TRUE(g.hasFileType());
  EXPECT_FALSE(g.hasBigTime());
  EXPECT_FALSE(g.hasLargeExtentCounts());
  EXPECT_EQ(4096u, g.blockSize());
  EXPECT_EQ(12u, g.blockLog());
  EXPECT_EQ(512u, g.sectorSize());
  EXPECT_EQ(512u, g.inodeSize());
  EXPECT_EQ(9u, g.inodeLog());
  EXPECT_EQ(3u, g.inodesPerBlockLog());
  EXPECT_EQ(3000u, g.agBlocks());
  EXPECT_EQ(12u, g.agBlocksLog());
  EXPECT_EQ(2u, g.agCount());
  EXPECT_EQ(4096u, g.dirBlockSize());
  EXPECT_EQ(1u, g.dirBlockFsbCount());
  EXPECT_EQ(root, g.rootInode());
  EXPECT_EQ(6000u, g.dataBlocks());
  EXPECT_LT(g.freeDataBlocks(), g.dataBlocks());
  EXPECT_EQ(8u, g.inodeCount());
  EXPECT_EQ(7u, g.freeInodes());
  EXPECT_EQ("roxfs-test", g.label());
}

TEST(Geometry, Options)
{
  ImageOptions options;
  options.blockLog = 10;
  options.inodeLog = 8;
  options.dirBlockLog = 2;
  options.agBlocks = 5000;
  options.agCount = 3;
  options.bigTime = true;
  options.label = "twelve_chars";
  ImageBuilder builder(options);
  StorageInMemory storage(builder.build());
  roxfs::Geometry const g = roxfs::Geometry::load(storage, true);

  EXPECT_TRUE(g.hasBigTime());
  EXPECT_EQ(1024u, g.blockSize());
  EXPECT_EQ(256u, g.inodeSize());
  EXPECT_EQ(2u, g.inodesPerBlockLog());
  EXPECT_EQ(13u, g.agBlocksLog());
  EXPECT_EQ(3u, g.agCount());
  EXPECT_EQ(4096u, g.dirBlockSize());
  EXPECT_EQ(4u, g.dirBlockFsbCount());
  EXPECT_EQ("twelve_chars", g.label());
}

TEST(Geometry, AddressArithmetic)
{
  StorageInMemory storage(DefaultImage());
  roxfs::Geometry const g = roxfs::Geometry::load(storage, true);

  uint64_t const ino = g.agInodeToInode(1, g.agBlockToAgInode(10, 5));
  EXPECT_EQ((UINT64_C(1) << 15) | (10 << 3) | 5, ino);
  EXPECT_EQ(1u, g.inodeToAg(ino));
  EXPECT_EQ((10u << 3) | 5, g.inodeToAgInode(ino));

  auto location = g.locateInode(ino);
  ASSERT_TRUE(location.is_initialized());
  EXPECT_EQ(3010u, location->linearBlock);
  EXPECT_EQ(5u * 512, location->offset);

  uint64_t const fsblock = g.agBlockToFsblock(1, 10);
  EXPECT_EQ((UINT64_C(1) << 12) | 10, fsblock);
  EXPECT_EQ(1u, g.fsblockToAg(fsblock));
  EXPECT_EQ(10u, g.fsblockToAgBlock(fsblock));
  EXPECT_EQ(3010u, g.fsblockToLinear(fsblock));

  EXPECT_EQ(UINT64_C(1) << 23, g.dirLeafFileBlock());
  EXPECT_EQ(UINT64_C(1) << 24, g.dirFreeFileBlock());
}

TEST(Geometry, AddressesOutsideOfVolume)
{
  StorageInMemory storage(DefaultImage());
  roxfs::Geometry const g = roxfs::Geometry::load(storage, true);

  // Block number bits allow 4096 blocks per group but only 3000 exist
  EXPECT_FALSE(g.isValidFsblock(g.agBlockToFsblock(0, 3000)));
  EXPECT_FALSE(g.isValidFsblock(g.agBlockToFsblock(2, 0)));
  EXPECT_TRUE(g.isValidFsblock(g.agBlockToFsblock(1, 2999)));

  try
  {
    g.fsblockToLinear(g.agBlockToFsblock(0, 3500));
    FAIL();
  }
  catch (roxfs::FileSystemError const & e)
  {
    EXPECT_EQ(roxfs::ErrorCode::CorruptMetadata, e.code());
  }

  EXPECT_FALSE(g.locateInode(g.agInodeToInode(2, 64)).is_initialized());
  EXPECT_FALSE(g.locateInode(g.agInodeToInode(0, g.agBlockToAgInode(3000, 0))).is_initialized());
}

TEST(Geometry, BadMagic)
{
  std::vector<char> image = DefaultImage();
  PatchSuperblock(image, [](format::Superblock & sb) { sb.magic = 0x58465341; });
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
}

TEST(Geometry, ChecksumMismatch)
{
  std::vector<char> image = DefaultImage();
  image[LabelOffset] = 'R';
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));

  StorageInMemory storage(image);
  EXPECT_EQ("Roxfs-test", roxfs::Geometry::load(storage, false).label());
}

TEST(Geometry, UnknownIncompatibleFeature)
{
  std::vector<char> image = DefaultImage();
  PatchSuperblock(image, [](format::Superblock & sb) {
    sb.featuresIncompat = sb.featuresIncompat.value() | (1u << 20);
  });
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
}

TEST(Geometry, NeedsRepair)
{
  std::vector<char> image = DefaultImage();
  PatchSuperblock(image, [](format::Superblock & sb) {
    sb.featuresIncompat = sb.featuresIncompat.value() | format::Superblock::IncompatNeedsRepair;
  });
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
}

TEST(Geometry, TooSmall)
{
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(std::vector<char>()));
  std::vector<char> image = DefaultImage();
  image.resize(200);
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
}

TEST(Geometry, UnsupportedVersion)
{
  std::vector<char> image = DefaultImage();
  PatchSuperblock(image, [](format::Superblock & sb) { sb.versionNumber = 0xb4a3; });
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
}

TEST(Geometry, Version4)
{
  std::vector<char> image = DefaultImage();
  PatchSuperblock(image, [](format::Superblock & sb) { sb.versionNumber = 0xb4a4; });
  // No checksums on version 4
  image[LabelOffset] = 'R';

  StorageInMemory storage(image);
  roxfs::Geometry const g = roxfs::Geometry::load(storage, true);
  EXPECT_FALSE(g.hasCrc());
  EXPECT_TRUE(g.hasFileType());
  EXPECT_FALSE(g.hasBigTime());
  EXPECT_EQ("Roxfs-test", g.label());
}

TEST(Geometry, BuiltVersion4)
{
  for (ImageFormat format: { ImageFormat::V4, ImageFormat::V4NoFileType, ImageFormat::V4InodeV1 })
  {
    ImageBuilder builder((ImageOptions(format)));
    StorageInMemory storage(builder.build());
    roxfs::Geometry const g = roxfs::Geometry::load(storage, true);
    EXPECT_FALSE(g.hasCrc());
    EXPECT_EQ(format != ImageFormat::V4NoFileType, g.hasFileType());
    EXPECT_FALSE(g.hasAsciiCi());
    EXPECT_EQ(8u, g.inodeCount());
  }
}

TEST(Geometry, AsciiCi)
{
  for (ImageFormat format: { ImageFormat::V5, ImageFormat::V4 })
  {
    ImageOptions options(format);
    options.asciiCi = true;
    ImageBuilder builder(options);
    StorageInMemory storage(builder.build());
    roxfs::Geometry const g = roxfs::Geometry::load(storage, true);
    EXPECT_TRUE(g.hasAsciiCi());
    EXPECT_EQ(format == ImageFormat::V5, g.hasCrc());
  }
  std::vector<char> image = DefaultImage();
  StorageInMemory storage(image);
  EXPECT_FALSE(roxfs::Geometry::load(storage, true).hasAsciiCi());
}

TEST(Geometry, InconsistentSizes)
{
  std::vector<std::function<void(format::Superblock &)>> const patches = {
    [](format::Superblock & sb) { sb.blockSize = 8192; },
    [](format::Superblock & sb) { sb.blockLog = 8; sb.blockSize = 256; },
    [](format::Superblock & sb) { sb.inodeSize = 1024; },
    [](format::Superblock & sb) { sb.inodeLog = 13; sb.inodeSize = 8192; },
    [](format::Superblock & sb) { sb.inodesPerBlock = 4; },
    [](format::Superblock & sb) { sb.agCount = 0; },
    [](format::Superblock & sb) { sb.agBlocksLog = 20; },
    [](format::Superblock & sb) { sb.sectorSize = 1000; },
    [](format::Superblock & sb) { sb.dirBlockLog = 5; },
  };
  for (auto const & patch: patches)
  {
    std::vector<char> image = DefaultImage();
    PatchSuperblock(image, patch);
    EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
  }
}

TEST(Geometry, RootInodeOutsideOfVolume)
{
  std::vector<char> image = DefaultImage();
  PatchSuperblock(image, [](format::Superblock & sb) { sb.rootInode = UINT64_C(5) << 15; });
  EXPECT_EQ(roxfs::ErrorCode::InvalidStorageFormat, LoadError(image));
}
