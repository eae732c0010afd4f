#include <gtest/gtest.h>
#include <cstring>
#include <vector>
#include "util/Crc32c.hpp"

TEST(Crc32c, CheckValue)
{
  roxfs::util::crc32c_type crc;
  crc.process_bytes("123456789", 9);
  EXPECT_EQ(0xe3069283u, crc.checksum());
}

TEST(Crc32c, ChecksumFieldIsZeroed)
{
  char data[] = "1234abcd56789";
  EXPECT_EQ(0xec7eb9a7u, roxfs::util::ComputeCrc32c(data, 13, 4));
  std::memset(data + 4, 0, 4);
  EXPECT_EQ(0xec7eb9a7u, roxfs::util::ComputeCrc32c(data, 13, 4));
}

TEST(Crc32c, StoredLittleEndian)
{
  std::vector<char> block(512, 'x');
  uint32_t const crc = roxfs::util::ComputeCrc32c(block.data(), block.size(), 224);
  block[224] = static_cast<char>(crc & 0xff);
  block[225] = static_cast<char>((crc >> 8) & 0xff);
  block[226] = static_cast<char>((crc >> 16) & 0xff);
  block[227] = static_cast<char>(crc >> 24);
  EXPECT_EQ(crc, roxfs::util::StoredCrc32c(block.data(), 224));
  EXPECT_TRUE(roxfs::util::VerifyCrc32c(block.data(), block.size(), 224));

  block[10] ^= 1;
  EXPECT_FALSE(roxfs::util::VerifyCrc32c(block.data(), block.size(), 224));
}

TEST(Crc32c, FieldOutsideOfBuffer)
{
  std::vector<char> block(16, 0);
  EXPECT_FALSE(roxfs::util::VerifyCrc32c(block.data(), block.size(), 14));
}
