#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <tuple>
#include "Directory.hpp"
#include "ImageBuilder.hpp"
#include "StorageInMemory.hpp"
#include "Volume.hpp"
#include "roxfs/FileSystemError.hpp"
#include "util/DaHash.hpp"

namespace
{
  std::string EntryName(unsigned i)
  {
    return "entry" + std::to_string(i) + std::string(i % 13, 'x');
  }

  std::string CreateRandomString(std::minstd_rand & random_engine)
  {
    std::uniform_int_distribution<> length_dist(1, 40);
    std::uniform_int_distribution<> char_dist(1, 255);

    int len = length_dist(random_engine);
    std::string res;
    res.reserve(len);
    for(; len > 0; --len)
    {
      char c = static_cast<char>(char_dist(random_engine));
      res += c == '/' ? '_' : c;
    }
    return res;
  }

  struct TestImage
  {
    explicit TestImage(std::vector<char> const & image)
      : storage(image)
      , volume(storage, roxfs::MountOptions())
    {}

    StorageInMemory storage;
    roxfs::Volume volume;
  };

  // Checks lookup and iteration of 'directory' against 'expected' names
  void CheckDirectory(roxfs::Volume const & volume, uint64_t directoryInode, uint64_t parentInode,
    std::map<std::string, uint64_t> const & expected)
  {
    roxfs::Directory directory(volume, volume.inodes().getInode(directoryInode));
    EXPECT_EQ(parentInode, directory.parentInode());

    std::map<std::string, uint64_t> found;
    uint32_t previousHash = 0;
    for (roxfs::Directory::Iterator it(directory); !it.eof(); it.moveNext())
    {
      roxfs::Directory::Entry const & entry = it.current();
      EXPECT_LE(previousHash, entry.hash);
      EXPECT_EQ(volume.geometry().hasAsciiCi() ? roxfs::util::HashNameAsciiCi(entry.name)
        : roxfs::util::HashName(entry.name), entry.hash);
      previousHash = entry.hash;
      EXPECT_TRUE(found.insert(std::make_pair(entry.name, entry.inode)).second) << entry.name;
    }
    EXPECT_TRUE(expected == found);

    for (auto const & item: expected)
    {
      boost::optional<roxfs::Directory::Entry> entry = directory.lookup(item.first);
      ASSERT_TRUE(entry.is_initialized()) << item.first;
      EXPECT_EQ(item.second, entry->inode);
      EXPECT_EQ(item.first, entry->name);
    }

    auto dot = directory.lookup(".");
    ASSERT_TRUE(dot.is_initialized());
    EXPECT_EQ(directoryInode, dot->inode);
    if (volume.geometry().hasFileType() || directory.layoutType() == roxfs::Directory::LayoutType::Shortform)
      EXPECT_EQ(roxfs::FileType::Directory, dot->type);
    auto dotdot = directory.lookup("..");
    ASSERT_TRUE(dotdot.is_initialized());
    EXPECT_EQ(parentInode, dotdot->inode);

    EXPECT_FALSE(directory.lookup("missing").is_initialized());
    EXPECT_FALSE(directory.lookup(EntryName(1) + "y").is_initialized());
  }
}

// Entry count, layout, block log, directory block log, image format
typedef std::tuple<unsigned, DirectoryLayout, unsigned, unsigned, ImageFormat> DirectoryParam;

class DirectoryTest : public ::testing::TestWithParam<DirectoryParam> {
};

TEST_P(DirectoryTest, LookupAndIterate)
{
  unsigned const count = std::get<0>(GetParam());
  DirectoryLayout const layout = std::get<1>(GetParam());
  ImageOptions options(std::get<4>(GetParam()));
  options.blockLog = std::get<2>(GetParam());
  options.dirBlockLog = std::get<3>(GetParam());
  ImageBuilder builder(options);
  uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", layout);

  std::map<std::string, uint64_t> expected;
  for (unsigned i = 0; i < count; ++i)
  {
    InodeOptions inodeOptions;
    inodeOptions.ag = i % 2;
    std::string const name = EntryName(i);
    if (i % 50 == 7)
      expected[name] = builder.addDirectory(dir, name, DirectoryLayout::Shortform, inodeOptions);
    else
      expected[name] = builder.addFile(dir, name, 0, {}, inodeOptions);
  }
  TestImage image(builder.build());

  roxfs::Directory directory(image.volume, image.volume.inodes().getInode(dir));
  EXPECT_EQ(static_cast<roxfs::Directory::LayoutType>(layout), directory.layoutType());
  CheckDirectory(image.volume, dir, builder.rootInode(), expected);
}

TEST_P(DirectoryTest, EntryTypes)
{
  unsigned const count = std::get<0>(GetParam());
  if (count == 0)
    return;
  ImageOptions options(std::get<4>(GetParam()));
  options.blockLog = std::get<2>(GetParam());
  options.dirBlockLog = std::get<3>(GetParam());
  ImageBuilder builder(options);
  uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", std::get<1>(GetParam()));

  std::map<std::string, roxfs::FileType> expected;
  roxfs::FileType const types[] = { roxfs::FileType::Regular, roxfs::FileType::Directory,
    roxfs::FileType::Symlink, roxfs::FileType::CharacterDevice, roxfs::FileType::BlockDevice,
    roxfs::FileType::Fifo, roxfs::FileType::Socket };
  uint64_t const target = builder.addFile(builder.rootInode(), "target", 0);
  for (unsigned i = 0; i < count; ++i)
  {
    std::string const name = EntryName(i);
    roxfs::FileType const type = types[i % 7];
    switch (type)
    {
    case roxfs::FileType::Regular:
      builder.addLink(dir, name, target);
      break;
    case roxfs::FileType::Directory:
      builder.addDirectory(dir, name);
      break;
    case roxfs::FileType::Symlink:
      builder.addSymlink(dir, name, "target");
      break;
    default:
      builder.addSpecial(dir, name, type, 1, i);
    }
    expected[name] = type;
  }
  TestImage image(builder.build());

  // Without file types in entries the type is left to the inode
  bool const fileType = options.fileType;
  roxfs::Directory directory(image.volume, image.volume.inodes().getInode(dir));
  size_t visited = 0;
  for (roxfs::Directory::Iterator it(directory); !it.eof(); it.moveNext(), ++visited)
    EXPECT_EQ(fileType ? expected.at(it.current().name) : roxfs::FileType::Unknown, it.current().type)
      << it.current().name;
  EXPECT_EQ(count, visited);

  auto entry = directory.lookup(EntryName(0));
  ASSERT_TRUE(entry.is_initialized());
  EXPECT_EQ(target, entry->inode);
  EXPECT_EQ(fileType ? roxfs::FileType::Regular : roxfs::FileType::Unknown, entry->type);
}

INSTANTIATE_TEST_CASE_P(DirectoryTests,
  DirectoryTest,
  ::testing::Values(
    DirectoryParam(0, DirectoryLayout::Shortform, 12, 0, ImageFormat::V5),
    DirectoryParam(2, DirectoryLayout::Shortform, 12, 0, ImageFormat::V5),
    DirectoryParam(12, DirectoryLayout::Shortform, 12, 0, ImageFormat::V5),
    DirectoryParam(2, DirectoryLayout::Block, 12, 0, ImageFormat::V5),
    DirectoryParam(32, DirectoryLayout::Block, 12, 0, ImageFormat::V5),
    DirectoryParam(64, DirectoryLayout::Block, 12, 0, ImageFormat::V5),
    DirectoryParam(200, DirectoryLayout::Block, 12, 2, ImageFormat::V5),
    DirectoryParam(384, DirectoryLayout::Leaf, 12, 0, ImageFormat::V5),
    DirectoryParam(384, DirectoryLayout::Leaf, 12, 1, ImageFormat::V5),
    DirectoryParam(200, DirectoryLayout::Leaf, 9, 3, ImageFormat::V5),
    DirectoryParam(1024, DirectoryLayout::Node, 12, 0, ImageFormat::V5),
    DirectoryParam(1024, DirectoryLayout::Node, 12, 1, ImageFormat::V5),
    DirectoryParam(8192, DirectoryLayout::Node, 12, 0, ImageFormat::V5),
    DirectoryParam(2000, DirectoryLayout::Btree, 12, 0, ImageFormat::V5),
    DirectoryParam(2000, DirectoryLayout::Btree, 12, 2, ImageFormat::V5),
    DirectoryParam(1000, DirectoryLayout::Btree, 10, 1, ImageFormat::V5),
    DirectoryParam(8192, DirectoryLayout::Btree, 12, 0, ImageFormat::V5),
    DirectoryParam(12, DirectoryLayout::Shortform, 12, 0, ImageFormat::V4),
    DirectoryParam(12, DirectoryLayout::Shortform, 12, 0, ImageFormat::V4NoFileType),
    DirectoryParam(64, DirectoryLayout::Block, 12, 0, ImageFormat::V4),
    DirectoryParam(64, DirectoryLayout::Block, 12, 0, ImageFormat::V4NoFileType),
    DirectoryParam(384, DirectoryLayout::Leaf, 12, 0, ImageFormat::V4),
    DirectoryParam(200, DirectoryLayout::Leaf, 9, 3, ImageFormat::V4NoFileType),
    DirectoryParam(1024, DirectoryLayout::Node, 12, 0, ImageFormat::V4),
    DirectoryParam(1024, DirectoryLayout::Node, 12, 1, ImageFormat::V4InodeV1),
    DirectoryParam(2000, DirectoryLayout::Btree, 12, 0, ImageFormat::V4),
    DirectoryParam(1000, DirectoryLayout::Btree, 10, 1, ImageFormat::V4NoFileType)
  )
);

TEST(Directory, RandomNames)
{
  std::minstd_rand random_engine;
  for (DirectoryLayout layout: { DirectoryLayout::Block, DirectoryLayout::Leaf, DirectoryLayout::Node })
  {
    ImageBuilder builder;
    uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", layout);
    std::map<std::string, uint64_t> expected;
    while (expected.size() < 40)
    {
      std::string const name = CreateRandomString(random_engine);
      if (name == "." || name == ".." || expected.count(name) != 0)
        continue;
      expected[name] = builder.addFile(dir, name, 0);
    }
    TestImage image(builder.build());
    CheckDirectory(image.volume, dir, builder.rootInode(), expected);
  }
}

TEST(Directory, LongNames)
{
  ImageBuilder builder;
  uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", DirectoryLayout::Leaf);
  std::map<std::string, uint64_t> expected;
  for (unsigned i = 0; i < 40; ++i)
  {
    std::string name = std::to_string(i);
    name += std::string(roxfs::MaxFileName - name.size(), 'n');
    expected[name] = builder.addFile(dir, name, 0);
  }
  TestImage image(builder.build());
  CheckDirectory(image.volume, dir, builder.rootInode(), expected);
}

class DirectoryCollisionTest : public ::testing::TestWithParam<DirectoryLayout> {
};

TEST_P(DirectoryCollisionTest, SameHashNames)
{
  ImageBuilder builder;
  uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", GetParam());
  // Colliding names end up in different leaves
  builder.setDirectoryShape(dir, TreeShape(3, 0));

  std::map<std::string, uint64_t> expected;
  std::vector<std::string> const colliding = CollidingNames("collision", 8);
  for (std::string const & name: colliding)
    expected[name] = builder.addFile(dir, name, 0);
  if (GetParam() != DirectoryLayout::Shortform)
    for (unsigned i = 0; i < 40; ++i)
      expected[EntryName(i)] = builder.addFile(dir, EntryName(i), 0);
  TestImage image(builder.build());

  CheckDirectory(image.volume, dir, builder.rootInode(), expected);

  roxfs::Directory directory(image.volume, image.volume.inodes().getInode(dir));
  std::string almost = colliding.front();
  almost.back() ^= 1;
  EXPECT_NE(roxfs::util::HashName(colliding.front()), roxfs::util::HashName(almost));
  EXPECT_FALSE(directory.lookup(almost).is_initialized());
}

INSTANTIATE_TEST_CASE_P(DirectoryCollisionTests,
  DirectoryCollisionTest,
  ::testing::Values(
    DirectoryLayout::Shortform,
    DirectoryLayout::Block,
    DirectoryLayout::Leaf,
    DirectoryLayout::Node,
    DirectoryLayout::Btree
  )
);

TEST(Directory, DeepNodeTree)
{
  for (DirectoryLayout layout: { DirectoryLayout::Node, DirectoryLayout::Btree })
  {
    ImageBuilder builder;
    uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", layout);
    builder.setDirectoryShape(dir, TreeShape(4, 3));
    std::map<std::string, uint64_t> expected;
    for (unsigned i = 0; i < 300; ++i)
      expected[EntryName(i)] = builder.addFile(dir, EntryName(i), 0);
    TestImage image(builder.build());
    CheckDirectory(image.volume, dir, builder.rootInode(), expected);
  }
}

TEST(Directory, Nested)
{
  ImageBuilder builder;
  uint64_t const a = builder.addDirectory(builder.rootInode(), "a", DirectoryLayout::Block);
  uint64_t const b = builder.addDirectory(a, "b", DirectoryLayout::Leaf);
  uint64_t const c = builder.addDirectory(b, "c", DirectoryLayout::Shortform);
  std::map<std::string, uint64_t> expected;
  expected["file"] = builder.addFile(c, "file", 0);
  TestImage image(builder.build());

  CheckDirectory(image.volume, c, b, expected);
  std::map<std::string, uint64_t> expectedB;
  expectedB["c"] = c;
  CheckDirectory(image.volume, b, a, expectedB);

  roxfs::Directory root(image.volume, image.volume.inodes().getInode(builder.rootInode()));
  EXPECT_EQ(builder.rootInode(), root.parentInode());
  EXPECT_EQ(builder.rootInode(), root.lookup("..")->inode);
}

TEST(Directory, CorruptDataBlock)
{
  ImageBuilder builder;
  uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", DirectoryLayout::Block);
  for (unsigned i = 0; i < 10; ++i)
    builder.addFile(dir, EntryName(i), 0);
  std::vector<char> image = builder.build();
  image[builder.dataBlockOffset(dir, 0) + 1000] ^= 1;

  StorageInMemory storage(image);
  roxfs::Volume volume(storage, roxfs::MountOptions());
  try
  {
    roxfs::Directory directory(volume, volume.inodes().getInode(dir));
    directory.lookup(EntryName(3));
    FAIL();
  }
  catch (roxfs::FileSystemError const & e)
  {
    EXPECT_EQ(roxfs::ErrorCode::CorruptMetadata, e.code());
  }
}

TEST(Directory, NodeWithSingleLeaf)
{
  for (ImageFormat format: { ImageFormat::V5, ImageFormat::V4 })
  {
    for (DirectoryLayout layout: { DirectoryLayout::Node, DirectoryLayout::Btree })
    {
      ImageBuilder builder((ImageOptions(format)));
      uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", layout);
      builder.setDirectoryLeafAtRoot(dir);
      std::map<std::string, uint64_t> expected;
      for (unsigned i = 0; i < 60; ++i)
        expected[EntryName(i)] = builder.addFile(dir, EntryName(i), 0);
      TestImage image(builder.build());

      roxfs::Directory directory(image.volume, image.volume.inodes().getInode(dir));
      EXPECT_EQ(static_cast<roxfs::Directory::LayoutType>(layout), directory.layoutType());
      CheckDirectory(image.volume, dir, builder.rootInode(), expected);
    }
  }
}

// Leaf block copied over the node above it, as left behind when a node directory shrinks
TEST(Directory, NodeLeafMovedToLeafOffset)
{
  ImageBuilder builder;
  uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", DirectoryLayout::Node);
  std::map<std::string, uint64_t> expected;
  for (unsigned i = 0; i < 10; ++i)
    expected[EntryName(i)] = builder.addFile(dir, EntryName(i), 0);
  std::vector<char> image = builder.build();

  uint64_t const leafBase = (UINT64_C(1) << 35) >> 12;
  uint64_t const node = builder.dataBlockOffset(dir, leafBase);
  uint64_t const leaf = builder.dataBlockOffset(dir, leafBase + 1);
  std::copy(image.begin() + leaf, image.begin() + leaf + builder.blockSize(), image.begin() + node);

  TestImage test(image);
  roxfs::Directory directory(test.volume, test.volume.inodes().getInode(dir));
  EXPECT_EQ(roxfs::Directory::LayoutType::Node, directory.layoutType());
  CheckDirectory(test.volume, dir, builder.rootInode(), expected);
}

TEST(Directory, Whiteout)
{
  for (DirectoryLayout layout: { DirectoryLayout::Shortform, DirectoryLayout::Block, DirectoryLayout::Leaf,
    DirectoryLayout::Node })
  {
    ImageBuilder builder;
    uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", layout);
    uint64_t const file = builder.addFile(dir, "kept", 0);
    uint64_t const whiteout = builder.addWhiteout(dir, "gone");
    std::map<std::string, uint64_t> expected;
    expected["kept"] = file;
    expected["gone"] = whiteout;
    TestImage image(builder.build());
    CheckDirectory(image.volume, dir, builder.rootInode(), expected);

    roxfs::Directory directory(image.volume, image.volume.inodes().getInode(dir));
    auto entry = directory.lookup("gone");
    ASSERT_TRUE(entry.is_initialized());
    EXPECT_EQ(roxfs::FileType::Unknown, entry->type);
    EXPECT_EQ(roxfs::FileType::CharacterDevice, image.volume.inodes().getInode(entry->inode)->type());
    EXPECT_EQ(roxfs::FileType::Regular, directory.lookup("kept")->type);
  }
}

TEST(Directory, AsciiCi)
{
  for (ImageFormat format: { ImageFormat::V5, ImageFormat::V4 })
  {
    for (DirectoryLayout layout: { DirectoryLayout::Shortform, DirectoryLayout::Block, DirectoryLayout::Leaf,
      DirectoryLayout::Node, DirectoryLayout::Btree })
    {
      ImageOptions options(format);
      options.asciiCi = true;
      ImageBuilder builder(options);
      uint64_t const dir = builder.addDirectory(builder.rootInode(), "dir", layout);
      if (layout == DirectoryLayout::Node || layout == DirectoryLayout::Btree)
        builder.setDirectoryShape(dir, TreeShape(4, 0));

      std::map<std::string, uint64_t> expected;
      expected["README"] = builder.addFile(dir, "README", 0);
      expected["Makefile"] = builder.addFile(dir, "Makefile", 0);
      expected["Caf\xc9"] = builder.addFile(dir, "Caf\xc9", 0);
      expected["Foo"] = builder.addFile(dir, "Foo", 0);
      expected["FOO"] = builder.addFile(dir, "FOO", 0);
      if (layout != DirectoryLayout::Shortform)
        for (unsigned i = 0; i < 30; ++i)
          expected[EntryName(i)] = builder.addFile(dir, EntryName(i), 0);
      TestImage image(builder.build());
      CheckDirectory(image.volume, dir, builder.rootInode(), expected);

      roxfs::Directory directory(image.volume, image.volume.inodes().getInode(dir));
      auto entry = directory.lookup("readme");
      ASSERT_TRUE(entry.is_initialized());
      EXPECT_EQ("README", entry->name);
      EXPECT_EQ(expected["README"], entry->inode);
      EXPECT_EQ(expected["Makefile"], directory.lookup("MAKEFILE")->inode);
      EXPECT_EQ(expected["Caf\xc9"], directory.lookup("caf\xe9")->inode);
      EXPECT_EQ(expected[EntryName(0)], directory.lookup("ENTRY0")->inode);

      // Exact spelling wins over other cases
      EXPECT_EQ(expected["Foo"], directory.lookup("Foo")->inode);
      EXPECT_EQ(expected["FOO"], directory.lookup("FOO")->inode);
      entry = directory.lookup("foo");
      ASSERT_TRUE(entry.is_initialized());
      EXPECT_TRUE(entry->name == "Foo" || entry->name == "FOO");

      EXPECT_FALSE(directory.lookup("READMEE").is_initialized());
    }
  }
}
