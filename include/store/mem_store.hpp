#ifndef SWARM_STORE_MEM_STORE_HPP
#define SWARM_STORE_MEM_STORE_HPP

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include "store/chunk_store.hpp"

namespace swarm {
namespace store {

// Volatile chunk store held in memory
class MemStore : public ChunkStore {
public:
  MemStore() = default;

  void put(const chunker::Chunk& chunk) override;
  std::optional<chunker::Chunk> get(const chunker::Key& key) override;

  bool has(const chunker::Key& key) const;
  std::size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::unordered_map<chunker::Key, chunker::Chunk> chunks_;
};

} // namespace store
} // namespace swarm

#endif // SWARM_STORE_MEM_STORE_HPP
