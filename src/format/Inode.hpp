#pragma once

#include <cstddef>
#include "Common.hpp"

namespace roxfs { namespace format
{

#pragma pack(push,1)

enum InodeForkFormat: uint8_t
{
  ForkFormatDevice = 0,
  ForkFormatLocal = 1,
  ForkFormatExtents = 2,
  ForkFormatBtree = 3
};

// Version 1 and 2 inode core
struct InodeCore
{
  static const uint16_t MagicValue = 0x494e; // "IN"

  static const uint64_t Flags2BigTime = 1u << 3;
  static const uint64_t Flags2LargeExtentCounts = 1u << 4;

  big_uint16_buf_t magic;
  big_uint16_buf_t mode;
  uint8_t version;
  uint8_t format;
  big_uint16_buf_t oldLinkCount;
  big_uint32_buf_t uid;
  big_uint32_buf_t gid;
  big_uint32_buf_t linkCount;
  big_uint16_buf_t projectIdLo;
  big_uint16_buf_t projectIdHi;
  // Holds 64-bit data fork extent count when Flags2LargeExtentCounts is set
  uint8_t pad[6];
  big_uint16_buf_t flushIter;
  // Legacy: signed 32-bit seconds, 32-bit nanoseconds. BigTime: nanoseconds since 1901-12-13
  big_uint64_buf_t atime;
  big_uint64_buf_t mtime;
  big_uint64_buf_t ctime;
  big_uint64_buf_t size;
  big_uint64_buf_t blockCount;
  big_uint32_buf_t extentSizeHint;
  big_uint32_buf_t dataExtents;
  big_uint16_buf_t attrExtents;
  uint8_t forkOffset; // Attribute fork offset in 8-byte units, 0 - no attribute fork
  uint8_t attrFormat;
  big_uint32_buf_t dmEventMask;
  big_uint16_buf_t dmState;
  big_uint16_buf_t flags;
  big_uint32_buf_t generation;
  big_uint32_buf_t nextUnlinked;
};

// Version 3 inode core of CRC enabled file systems
struct InodeCoreV3: InodeCore
{
  little_uint32_buf_t crc;
  big_uint64_buf_t changeCount;
  big_uint64_buf_t lsn;
  big_uint64_buf_t flags2;
  big_uint32_buf_t cowExtentSizeHint;
  uint8_t pad2[12];
  big_uint64_buf_t crtime;
  big_uint64_buf_t inodeNumber;
  uint8_t uuid[UuidSize];
};

static const size_t InodeCrcOffset = 100;
static const size_t LargeDataExtentsOffset = 24;
static const int64_t BigTimeEpochOffset = INT64_C(2147483648); // seconds between 1901-12-13 and 1970-01-01

static_assert(sizeof(InodeCore) == 100, "");
static_assert(sizeof(InodeCoreV3) == 176, "");

#pragma pack(pop)

}}
