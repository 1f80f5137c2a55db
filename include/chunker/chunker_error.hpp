#ifndef SWARM_CHUNKER_ERROR_HPP
#define SWARM_CHUNKER_ERROR_HPP

#include <stdexcept>
#include <string>
#include "chunker/key.hpp"

namespace swarm::chunker {

class ChunkerError : public std::runtime_error {
public:
  explicit ChunkerError(const std::string& message)
    : std::runtime_error(message) {}
};

// Hash capability cannot be used; raised when a chunker or hasher is built
class HashConfigError : public ChunkerError {
public:
  explicit HashConfigError(const std::string& message)
    : ChunkerError("Hash configuration error: " + message) {}
};

// Chunk buffer disagrees with the size or branch count it should encode
class MalformedChunkError : public ChunkerError {
public:
  explicit MalformedChunkError(const std::string& message)
    : ChunkerError("Malformed chunk: " + message) {}

protected:
  struct Raw {};
  MalformedChunkError(Raw, const std::string& message)
    : ChunkerError(message) {}
};

// Chunk content does not hash to the key it was fetched under
class ChunkIntegrityError : public MalformedChunkError {
public:
  explicit ChunkIntegrityError(const Key& key)
    : MalformedChunkError(Raw{}, "Integrity error: content does not match key " + key.to_hex())
    , key_(key) {}

  const Key& key() const { return key_; }

private:
  Key key_;
};

// A referenced key is absent from the store
class ChunkNotFoundError : public ChunkerError {
public:
  explicit ChunkNotFoundError(const Key& key)
    : ChunkerError("Chunk not found: " + key.to_hex())
    , key_(key) {}

  const Key& key() const { return key_; }

private:
  Key key_;
};

} // namespace swarm::chunker

#endif // SWARM_CHUNKER_ERROR_HPP
