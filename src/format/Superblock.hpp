#pragma once

#include <cstddef>
#include "Common.hpp"

namespace roxfs { namespace format
{

#pragma pack(push, 1)

struct Superblock
{
  static const uint32_t MagicValue = 0x58465342; // "XFSB"
  static const uint16_t VersionMask = 0x000f;
  static const uint16_t Version4 = 4;
  static const uint16_t Version5 = 5;
  static const uint16_t VersionAsciiCi = 0x4000; // Directory names hash and compare ASCII case-insensitively

  static const uint32_t Features2FileType = 0x00000200;

  static const uint32_t IncompatFileType = 1u << 0;
  static const uint32_t IncompatSparseInodes = 1u << 1;
  static const uint32_t IncompatMetaUuid = 1u << 2;
  static const uint32_t IncompatBigTime = 1u << 3;
  static const uint32_t IncompatNeedsRepair = 1u << 4;
  static const uint32_t IncompatLargeExtentCounts = 1u << 5;
  static const uint32_t IncompatKnown = IncompatFileType | IncompatSparseInodes | IncompatMetaUuid
    | IncompatBigTime | IncompatNeedsRepair | IncompatLargeExtentCounts;

  big_uint32_buf_t magic;
  big_uint32_buf_t blockSize;
  big_uint64_buf_t dataBlocks;
  big_uint64_buf_t realtimeBlocks;
  big_uint64_buf_t realtimeExtents;
  uint8_t uuid[UuidSize];
  big_uint64_buf_t logStart;
  big_uint64_buf_t rootInode;
  big_uint64_buf_t realtimeBitmapInode;
  big_uint64_buf_t realtimeSummaryInode;
  big_uint32_buf_t realtimeExtentSize;
  big_uint32_buf_t agBlocks;
  big_uint32_buf_t agCount;
  big_uint32_buf_t realtimeBitmapBlocks;
  big_uint32_buf_t logBlocks;
  big_uint16_buf_t versionNumber;
  big_uint16_buf_t sectorSize;
  big_uint16_buf_t inodeSize;
  big_uint16_buf_t inodesPerBlock;
  char label[12];
  uint8_t blockLog;
  uint8_t sectorLog;
  uint8_t inodeLog;
  uint8_t inodesPerBlockLog;
  uint8_t agBlocksLog;
  uint8_t realtimeExtentsLog;
  uint8_t inProgress;
  uint8_t inodeMaxPercent;
  big_uint64_buf_t inodeCount;
  big_uint64_buf_t freeInodes;
  big_uint64_buf_t freeDataBlocks;
  big_uint64_buf_t freeRealtimeExtents;
  big_uint64_buf_t userQuotaInode;
  big_uint64_buf_t groupQuotaInode;
  big_uint16_buf_t quotaFlags;
  uint8_t flags;
  uint8_t sharedVersion;
  big_uint32_buf_t inodeAlignment;
  big_uint32_buf_t stripeUnit;
  big_uint32_buf_t stripeWidth;
  uint8_t dirBlockLog;
  uint8_t logSectorLog;
  big_uint16_buf_t logSectorSize;
  big_uint32_buf_t logStripeUnit;
  big_uint32_buf_t features2;
  big_uint32_buf_t badFeatures2;
  big_uint32_buf_t featuresCompat;
  big_uint32_buf_t featuresRoCompat;
  big_uint32_buf_t featuresIncompat;
  big_uint32_buf_t featuresLogIncompat;
  little_uint32_buf_t crc;
  big_uint32_buf_t sparseInodeAlignment;
  big_uint64_buf_t projectQuotaInode;
  big_uint64_buf_t lsn;
  uint8_t metaUuid[UuidSize];
};

static const size_t SuperblockCrcOffset = 224;

static_assert(sizeof(Superblock) == 264, "");

#pragma pack(pop)

}}
