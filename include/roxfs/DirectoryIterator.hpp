#ifndef _ROXFS_API_DIRECTORY_ITERATOR_H
#define _ROXFS_API_DIRECTORY_ITERATOR_H

#include <cstdint>
#include <string>
#include "roxfs/Common.hpp"
#include "roxfs/Defs.hpp"

namespace roxfs
{

class ROXFS_API_DECL DirectoryEntry
{
public:
  FileType type() const;
  std::string name() const;
  uint64_t inode() const;
  uint64_t nextOffset() const; // Pass to FileSystem::readdir to continue after this entry

  DirectoryEntry(DirectoryEntry const &) = delete;
  void operator=(DirectoryEntry const &) = delete;

protected:
  DirectoryEntry();
  ~DirectoryEntry();
  class Impl;
  Impl * m_impl;
};

// Similar to C++ InputIterator concept. Only guarantee validity for single pass algorithms: once an
// iterator has been incremented, all copies of its previous value may be invalidated.
class ROXFS_API_DECL DirectoryIterator
{
public:
  DirectoryIterator(); // end iterator constructor
  DirectoryIterator(DirectoryIterator &&);
  DirectoryIterator(DirectoryIterator const &);
  ~DirectoryIterator();
  DirectoryIterator & operator=(DirectoryIterator &&);
  DirectoryIterator & operator=(DirectoryIterator const &);

  bool operator!=(DirectoryIterator const &) const;

  DirectoryIterator & operator++();

  const DirectoryEntry & operator*() const;
  const DirectoryEntry * operator->() const;

  class Impl;
private:
  friend class DirectoryIteratorFactory;
  Impl * m_impl;
};

inline DirectoryIterator begin(DirectoryIterator const & it)
{
  return it;
}

inline DirectoryIterator end(DirectoryIterator)
{
  return DirectoryIterator();
}

}

#endif
