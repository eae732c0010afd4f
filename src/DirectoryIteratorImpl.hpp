#pragma once

#include <memory>
#include "roxfs/DirectoryIterator.hpp"
#include "Directory.hpp"
#include "FileSystemImpl.hpp"

namespace roxfs
{

// Produces ".", ".." and then the directory entries. Position of an entry is its index in this sequence.
class DirectoryIteratorImpl
{
public:
  DirectoryIteratorImpl(
    std::shared_ptr<FileSystemImpl> const & owner,
    InodePtr const & inode,
    uint64_t offset);

  bool eof() const;
  void moveNext();

  FileType currentType() const;
  std::string currentName() const;
  uint64_t currentInode() const;
  uint64_t currentPosition() const { return m_position; }

private:
  std::shared_ptr<FileSystemImpl> const m_owner;
  Directory m_directory;
  Directory::Iterator m_iterator;
  uint64_t m_position;

public:
  class DirectoryEntry: public roxfs::DirectoryEntry
  {
  public:
    DirectoryEntry(DirectoryIteratorImpl &);
    ~DirectoryEntry();
  };

  DirectoryEntry m_entry;
};

class DirectoryIterator::Impl
{
public:
  std::shared_ptr<DirectoryIteratorImpl> ptr;
};

class DirectoryIteratorFactory
{
public:
  static DirectoryIterator create(std::unique_ptr<DirectoryIteratorImpl> && impl)
  {
    DirectoryIterator instance;
    instance.m_impl = new DirectoryIterator::Impl;
    instance.m_impl->ptr.reset(impl.release());
    return instance;
  }
};

class DirectoryEntry::Impl
{
public:
  Impl(DirectoryIteratorImpl & directory)
    : directory(directory)
  {}

  DirectoryIteratorImpl & directory;
};

}
