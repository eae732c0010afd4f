#include <gtest/gtest.h>
#include "util/DaHash.hpp"
#include "ImageBuilder.hpp"

TEST(DaHash, KnownValues)
{
  EXPECT_EQ(0x61u, roxfs::util::HashName("a"));
  EXPECT_EQ(0x30e2u, roxfs::util::HashName("ab"));
  EXPECT_EQ(0x187163u, roxfs::util::HashName("abc"));
  EXPECT_EQ(0xc38b1e4u, roxfs::util::HashName("abcd"));
  EXPECT_EQ(0x2eu, roxfs::util::HashName("."));
  EXPECT_EQ(0x172eu, roxfs::util::HashName(".."));
  EXPECT_EQ(0x21aa60cu, roxfs::util::HashName("lost+found"));
  EXPECT_EQ(0xccd0c6c5u, roxfs::util::HashName("file_0001.txt"));
  EXPECT_EQ(0x3c7173dcu, roxfs::util::HashName("user.mime_type"));
}

TEST(DaHash, EmptyName)
{
  EXPECT_EQ(0u, roxfs::util::HashName(""));
}

TEST(DaHash, BytesAreUnsigned)
{
  std::string const name("\xe9t\xe9", 3);
  EXPECT_EQ((0xe9u << 14) ^ (uint32_t('t') << 7) ^ 0xe9u, roxfs::util::HashName(name));
}

TEST(DaHash, CollidingNames)
{
  std::vector<std::string> const names = CollidingNames("collision", 8);
  ASSERT_EQ(8u, names.size());
  for (std::string const & name: names)
  {
    EXPECT_EQ(names.front().size(), name.size());
    EXPECT_EQ(roxfs::util::HashName(names.front()), roxfs::util::HashName(name)) << name;
  }
  for (size_t i = 1; i < names.size(); ++i)
    EXPECT_NE(names[i - 1], names[i]);
}

TEST(DaHash, AsciiCi)
{
  EXPECT_EQ(roxfs::util::HashName("lost+found"), roxfs::util::HashNameAsciiCi("Lost+Found"));
  EXPECT_EQ(roxfs::util::HashName("file_0001.txt"), roxfs::util::HashNameAsciiCi("FILE_0001.TXT"));
  EXPECT_EQ(0x61u, roxfs::util::HashNameAsciiCi("A"));
  // Latin-1 capitals fold, the multiplication sign does not
  EXPECT_EQ(roxfs::util::HashName(std::string("\xe9t\xe9", 3)), roxfs::util::HashNameAsciiCi(std::string("\xc9T\xc9", 3)));
  EXPECT_EQ(0xd7u, roxfs::util::HashNameAsciiCi(std::string("\xd7", 1)));

  EXPECT_TRUE(roxfs::util::EqualAsciiCi("ReadMe", "README"));
  EXPECT_FALSE(roxfs::util::EqualAsciiCi("ReadMe", "READM"));
  EXPECT_FALSE(roxfs::util::EqualAsciiCi("[", "{"));
}
