#pragma once

#include <cstdint>
#include <memory>
#include <stddef.h>
#include "ExtentMap.hpp"
#include "Inode.hpp"
#include "Volume.hpp"

namespace roxfs
{

// Data of a regular file. Holes and unwritten extents read as zeros.
class File
{
public:
  File(Volume const & volume, InodePtr const & inode);

  uint64_t inode() const { return m_inode->number; }
  uint64_t size() const { return m_inode->size; }

  void seek(uint64_t position) { m_position = position; }
  uint64_t position() const { return m_position; }
  void read(size_t & inOutSize, void * buffer);

  // Doesn't move the position. Returns bytes copied, 0 at or past end of file.
  size_t pread(uint64_t position, size_t size, void * buffer) const;

private:
  Volume const & m_volume;
  InodePtr const m_inode;
  std::unique_ptr<ExtentMap> m_extents; // Empty for local format
  uint64_t m_position;
};

}
