#ifndef SWARM_STORE_CHUNK_STORE_HPP
#define SWARM_STORE_CHUNK_STORE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include "chunker/chunk.hpp"
#include "chunker/key.hpp"

namespace swarm {
namespace store {

// Key/value persistence for chunks. Implementations must accept concurrent calls.
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  // Upserts by key. Storing an existing key again has no observable effect.
  // Throws std::invalid_argument for a retrieval request (chunk without data).
  virtual void put(const chunker::Chunk& chunk) = 0;

  // Returns the stored chunk, or std::nullopt if the key is unknown
  virtual std::optional<chunker::Chunk> get(const chunker::Key& key) = 0;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace swarm

#endif // SWARM_STORE_CHUNK_STORE_HPP
