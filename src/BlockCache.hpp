#pragma once

#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "roxfs/IStorage.hpp"

namespace roxfs
{

// Raw filesystem blocks addressed by linear block number.
// Concurrent requests of the same block share one device read.
class BlockCache
{
public:
  typedef std::shared_ptr<const std::vector<char>> BlockPtr;

  BlockCache(IStorage const & storage, uint32_t blockSize, size_t capacity);

  uint32_t blockSize() const { return m_blockSize; }

  BlockPtr read(uint64_t linearBlock) const;

  size_t size() const;

private:
  struct Slot
  {
    std::shared_future<BlockPtr> value;
    std::list<uint64_t>::iterator lruPosition;
    bool completed;
  };

  IStorage const & m_storage;
  uint32_t const m_blockSize;
  uint64_t const m_blockCount;
  size_t const m_capacity;

  mutable std::mutex m_mutex;
  mutable std::map<uint64_t, Slot> m_slots;
  mutable std::list<uint64_t> m_lru; // Completed blocks, most recently used at front

  BlockPtr load(uint64_t linearBlock) const;
  void evict() const;
};

}
