#include "BlockCache.hpp"
#include <exception>
#include "util/Assert.hpp"
#include "util/Log.hpp"

namespace roxfs
{

BlockCache::BlockCache(IStorage const & storage, uint32_t blockSize, size_t capacity)
  : m_storage(storage)
  , m_blockSize(blockSize)
  , m_blockCount(storage.size() / blockSize)
  , m_capacity(capacity == 0 ? 1 : capacity)
{}

BlockCache::BlockPtr BlockCache::read(uint64_t linearBlock) const
{
  if (linearBlock >= m_blockCount)
    ThrowFilesystemError(ErrorCode::IoError, "Block is beyond end of image");

  std::promise<BlockPtr> promise;
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_slots.find(linearBlock);
    if (it != m_slots.end())
    {
      if (it->second.completed)
        m_lru.splice(m_lru.begin(), m_lru, it->second.lruPosition);
      std::shared_future<BlockPtr> value = it->second.value;
      lock.unlock();
      return value.get();
    }
    Slot slot;
    slot.value = promise.get_future().share();
    slot.completed = false;
    m_slots.insert(std::make_pair(linearBlock, slot));
  }

  BlockPtr block;
  try
  {
    block = load(linearBlock);
  }
  catch (...)
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_slots.erase(linearBlock);
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    Slot & slot = m_slots[linearBlock];
    m_lru.push_front(linearBlock);
    slot.lruPosition = m_lru.begin();
    slot.completed = true;
    evict();
  }
  promise.set_value(block);
  return block;
}

BlockCache::BlockPtr BlockCache::load(uint64_t linearBlock) const
{
  ROXFS_LOG(debug) << "Cache miss, block " << linearBlock;
  std::shared_ptr<std::vector<char>> data = std::make_shared<std::vector<char>>(m_blockSize);
  m_storage.read(linearBlock * m_blockSize, m_blockSize, data->data());
  return data;
}

// Called with m_mutex locked. In-flight reads are never dropped.
void BlockCache::evict() const
{
  while (m_lru.size() > m_capacity)
  {
    m_slots.erase(m_lru.back());
    m_lru.pop_back();
  }
}

size_t BlockCache::size() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_lru.size();
}

}
