#include "DirectoryIteratorImpl.hpp"
#include "roxfs/FileSystemError.hpp"

namespace roxfs
{

namespace
{
  const uint64_t DotPosition = 0;
  const uint64_t DotDotPosition = 1;
  const uint64_t FirstEntryPosition = 2;
}

DirectoryEntry::DirectoryEntry()
{}

DirectoryEntry::~DirectoryEntry()
{}

FileType DirectoryEntry::type() const
{
  return m_impl->directory.currentType();
}

std::string DirectoryEntry::name() const
{
  return m_impl->directory.currentName();
}

uint64_t DirectoryEntry::inode() const
{
  return m_impl->directory.currentInode();
}

uint64_t DirectoryEntry::nextOffset() const
{
  return m_impl->directory.currentPosition() + 1;
}

DirectoryIteratorImpl::DirectoryEntry::DirectoryEntry(DirectoryIteratorImpl & directory)
{
  m_impl = new Impl(directory);
}

DirectoryIteratorImpl::DirectoryEntry::~DirectoryEntry()
{
  delete m_impl;
}

DirectoryIterator::DirectoryIterator()
  : m_impl(nullptr)
{}

DirectoryIterator::DirectoryIterator(DirectoryIterator && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

DirectoryIterator::DirectoryIterator(DirectoryIterator const & src)
  : m_impl(nullptr)
{
  *this = src;
}

DirectoryIterator::~DirectoryIterator()
{
  delete m_impl;
}

DirectoryIterator & DirectoryIterator::operator=(DirectoryIterator && src)
{
  delete m_impl;
  m_impl = src.m_impl;
  src.m_impl = nullptr;
  return *this;
}

DirectoryIterator & DirectoryIterator::operator=(DirectoryIterator const & src)
{
  if (this == &src)
    return *this;
  delete m_impl;
  if (src.m_impl)
    m_impl = new Impl(*src.m_impl);
  else
    m_impl = nullptr;
  return *this;
}

bool DirectoryIterator::operator!=(DirectoryIterator const & rhs) const
{
  // Simple comparison only for end() check
  return (!m_impl || m_impl->ptr->eof()) != (!rhs.m_impl || rhs.m_impl->ptr->eof());
}

DirectoryIterator & DirectoryIterator::operator++()
{
  if (!m_impl || m_impl->ptr->eof())
    throw FileSystemError(ErrorCode::InvalidOperation, "Incrementing end directory iterator");
  m_impl->ptr->moveNext();
  return *this;
}

const DirectoryEntry & DirectoryIterator::operator*() const
{
  if (!m_impl || m_impl->ptr->eof())
    throw FileSystemError(ErrorCode::InvalidOperation, "Dereferencing end directory iterator");
  return m_impl->ptr->m_entry;
}

const DirectoryEntry * DirectoryIterator::operator->() const
{
  if (!m_impl || m_impl->ptr->eof())
    throw FileSystemError(ErrorCode::InvalidOperation, "Dereferencing end directory iterator");
  return &m_impl->ptr->m_entry;
}

DirectoryIteratorImpl::DirectoryIteratorImpl(
  std::shared_ptr<FileSystemImpl> const & owner,
  InodePtr const & inode,
  uint64_t offset)
  : m_owner(owner)
  , m_directory(owner->m_volume, inode)
  , m_iterator(m_directory)
  , m_position(DotPosition)
  , m_entry(*this)
{
  while (m_position < offset && !eof())
    moveNext();
}

bool DirectoryIteratorImpl::eof() const
{
  return m_position >= FirstEntryPosition && m_iterator.eof();
}

void DirectoryIteratorImpl::moveNext()
{
  if (m_position >= FirstEntryPosition)
    m_iterator.moveNext();
  ++m_position;
}

FileType DirectoryIteratorImpl::currentType() const
{
  if (m_position < FirstEntryPosition)
    return FileType::Directory;
  return m_owner->entryType(m_iterator.current());
}

std::string DirectoryIteratorImpl::currentName() const
{
  switch (m_position)
  {
  case DotPosition:
    return ".";
  case DotDotPosition:
    return "..";
  default:
    return m_iterator.current().name;
  }
}

uint64_t DirectoryIteratorImpl::currentInode() const
{
  switch (m_position)
  {
  case DotPosition:
    return m_directory.inode();
  case DotDotPosition:
    return m_directory.parentInode();
  default:
    return m_iterator.current().inode;
  }
}

}
