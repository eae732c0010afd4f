#ifndef _ROXFS_API_ISTORAGE_H
#define _ROXFS_API_ISTORAGE_H

#include <cstdint>
#include "roxfs/Common.hpp"

namespace roxfs
{

// Read-only random access to the backing image.
// Implementations must allow read() to be called from several threads at once.
class IStorage
{
public:
  virtual uint64_t size() const = 0;
  virtual void read(uint64_t position, size_t size, void *) const = 0; // throw if can't read 'size' bytes

  virtual ~IStorage() {}
};

}

#endif
