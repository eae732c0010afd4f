#include "FileSystemImpl.hpp"
#include <cstring>
#include "roxfs/FileSystemError.hpp"
#include "Attributes.hpp"
#include "Directory.hpp"
#include "DirectoryIteratorImpl.hpp"
#include "File.hpp"
#include "FileDescriptorImpl.hpp"
#include "Symlink.hpp"
#include "util/Assert.hpp"

namespace roxfs
{

namespace
{
  struct NamespacePrefix
  {
    AttributeNamespace ns;
    const char * prefix;
  };

  const NamespacePrefix NamespacePrefixes[] =
  {
    { AttributeNamespace::User, "user." },
    { AttributeNamespace::Trusted, "trusted." },
    { AttributeNamespace::Secure, "security." }
  };

  const char * PrefixOf(AttributeNamespace ns)
  {
    for (NamespacePrefix const & item: NamespacePrefixes)
      if (item.ns == ns)
        return item.prefix;
    ThrowFilesystemError(ErrorCode::InternalExpectationFail, "Unknown attribute namespace");
  }

  bool IsVisible(AttributeNamespace ns, bool privileged)
  {
    return ns != AttributeNamespace::Trusted || privileged;
  }

  std::string CheckedName(const char * name)
  {
    if (name == nullptr)
      ThrowFilesystemError(ErrorCode::InvalidOperation, "Name is null");
    size_t const size = std::strlen(name);
    if (size > MaxFileName)
      ThrowFilesystemError(ErrorCode::NameTooLong, "Name exceeds size limit");
    return std::string(name, size);
  }
}

FileSystemImpl::FileSystemImpl(std::unique_ptr<IStorage> && storage, MountOptions const & options)
  : m_storage(std::move(storage))
  , m_volume(*m_storage, options)
{}

InodePtr FileSystemImpl::getInode(uint64_t ino) const
{
  return m_volume.inodes().getInode(ino);
}

InodePtr FileSystemImpl::getDirectoryInode(uint64_t ino) const
{
  InodePtr inode = getInode(ino);
  if (inode->type() != FileType::Directory)
    ThrowFilesystemError(ErrorCode::NotADirectory, "Not a directory");
  return inode;
}

FileAttributes FileSystemImpl::attributes(Inode const & inode) const
{
  Geometry const & geometry = m_volume.geometry();
  FileAttributes result;
  result.inode = inode.number;
  result.type = inode.type();
  result.permissions = inode.permissions();
  result.links = inode.links;
  result.uid = inode.uid;
  result.gid = inode.gid;
  result.size = inode.size;
  result.blocks = inode.blockCount << (geometry.blockLog() - 9);
  result.blockSize = geometry.blockSize();
  result.rdevMajor = 0;
  result.rdevMinor = 0;
  if (result.type == FileType::CharacterDevice || result.type == FileType::BlockDevice)
  {
    result.rdevMajor = inode.rdevMajor();
    result.rdevMinor = inode.rdevMinor();
  }
  result.generation = inode.generation;
  result.atime = inode.atime;
  result.mtime = inode.mtime;
  result.ctime = inode.ctime;
  result.crtime = inode.crtime;
  return result;
}

FileType FileSystemImpl::entryType(Directory::Entry const & entry) const
{
  if (entry.type != FileType::Unknown)
    return entry.type;
  return getInode(entry.inode)->type();
}

FileSystem::FileSystem(std::unique_ptr<IStorage> && storage, MountOptions const & options)
  : m_impl(nullptr)
{
  if (!storage)
    ThrowFilesystemError(ErrorCode::InvalidOperation, "Storage is null");
  std::unique_ptr<Impl> impl(new Impl);
  impl->ptr = std::make_shared<FileSystemImpl>(std::move(storage), options);
  m_impl = impl.release();
}

FileSystem::~FileSystem()
{
  delete m_impl;
}

uint64_t FileSystem::rootInode() const
{
  return m_impl->ptr->m_volume.geometry().rootInode();
}

FileAttributes FileSystem::lookup(uint64_t parentInode, const char * name) const
{
  std::string const fileName = CheckedName(name);
  InodePtr const parent = m_impl->ptr->getDirectoryInode(parentInode);
  if (fileName.empty())
    ThrowFilesystemError(ErrorCode::NotFound, "Empty name");

  Directory directory(m_impl->ptr->m_volume, parent);
  boost::optional<Directory::Entry> const entry = directory.lookup(fileName);
  if (!entry)
    ThrowFilesystemError(ErrorCode::NotFound, "No such file or directory");
  return getattr(entry->inode);
}

FileAttributes FileSystem::getattr(uint64_t inode) const
{
  return m_impl->ptr->attributes(*m_impl->ptr->getInode(inode));
}

DirectoryIterator FileSystem::readdir(uint64_t inode, uint64_t offset) const
{
  InodePtr const directory = m_impl->ptr->getDirectoryInode(inode);
  return DirectoryIteratorFactory::create(
    std::unique_ptr<DirectoryIteratorImpl>(new DirectoryIteratorImpl(m_impl->ptr, directory, offset)));
}

size_t FileSystem::read(uint64_t inode, uint64_t offset, size_t size, void * buffer) const
{
  InodePtr const file = m_impl->ptr->getInode(inode);
  switch (file->type())
  {
  case FileType::Regular:
    return File(m_impl->ptr->m_volume, file).pread(offset, size, buffer);
  case FileType::Directory:
    ThrowFilesystemError(ErrorCode::IsADirectory, "Can't read directory");
  default:
    ThrowFilesystemError(ErrorCode::InvalidOperation, "File has no readable data");
  }
}

std::string FileSystem::readlink(uint64_t inode) const
{
  InodePtr const link = m_impl->ptr->getInode(inode);
  if (link->type() != FileType::Symlink)
    ThrowFilesystemError(ErrorCode::InvalidOperation, "Not a symbolic link");
  return ReadSymlinkTarget(m_impl->ptr->m_volume, link);
}

std::vector<std::string> FileSystem::listxattr(uint64_t inode, bool privileged) const
{
  Attributes attributes(m_impl->ptr->m_volume, m_impl->ptr->getInode(inode));
  std::vector<std::string> names;
  for (Attributes::Iterator it(attributes); !it.eof(); it.moveNext())
  {
    Attributes::Name const & name = it.current();
    if (IsVisible(name.ns, privileged))
      names.push_back(PrefixOf(name.ns) + name.name);
  }
  return names;
}

std::vector<char> FileSystem::getxattr(uint64_t inode, const char * name, bool privileged) const
{
  std::string const fullName = CheckedName(name);
  InodePtr const file = m_impl->ptr->getInode(inode);

  for (NamespacePrefix const & item: NamespacePrefixes)
  {
    size_t const prefixSize = std::strlen(item.prefix);
    if (fullName.compare(0, prefixSize, item.prefix) != 0)
      continue;
    std::string const attributeName = fullName.substr(prefixSize);
    if (attributeName.empty() || !IsVisible(item.ns, privileged))
      break;

    Attributes attributes(m_impl->ptr->m_volume, file);
    boost::optional<std::vector<char>> value = attributes.get(item.ns, attributeName);
    if (!value)
      break;
    return *value;
  }
  ThrowFilesystemError(ErrorCode::AttributeNotFound, "No such attribute");
}

FileDescriptor FileSystem::open(uint64_t inode) const
{
  InodePtr const file = m_impl->ptr->getInode(inode);
  if (file->type() == FileType::Directory)
    ThrowFilesystemError(ErrorCode::IsADirectory, "Can't open directory as a file");
  if (file->type() != FileType::Regular)
    ThrowFilesystemError(ErrorCode::InvalidOperation, "Only regular files can be opened");

  std::unique_ptr<File> data(new File(m_impl->ptr->m_volume, file));
  return FileDescriptorFactory::create(std::make_shared<FileDescriptorImpl>(std::move(data), m_impl->ptr));
}

FileSystemStatistics FileSystem::statfs() const
{
  Geometry const & geometry = m_impl->ptr->m_volume.geometry();
  FileSystemStatistics result;
  result.blockSize = geometry.blockSize();
  result.totalBlocks = geometry.dataBlocks();
  result.freeBlocks = geometry.freeDataBlocks();
  result.totalInodes = geometry.inodeCount();
  result.freeInodes = geometry.freeInodes();
  result.maxNameLength = MaxFileName;
  result.label = geometry.label();
  return result;
}

}
