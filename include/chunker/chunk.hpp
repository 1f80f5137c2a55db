#ifndef SWARM_CHUNKER_CHUNK_HPP
#define SWARM_CHUNKER_CHUNK_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>
#include "chunker/key.hpp"

namespace swarm::chunker {

// Every chunk buffer starts with the little-endian subtree size
constexpr std::size_t SIZE_PREFIX_LENGTH = 8;

// A keyed buffer. Leaf data is LE64(size) || payload, intermediate data is
// LE64(size) || child keys. A chunk without data is a retrieval request.
// size is the length of the input covered by the subtree, not data->size().
struct Chunk {
  Key key;
  std::optional<std::vector<uint8_t>> data;
  uint64_t size{0};

  Chunk() = default;
  Chunk(Key k, std::vector<uint8_t> d, uint64_t s)
    : key(std::move(k)), data(std::move(d)), size(s) {}

  // Creates a retrieval request for the given key
  static Chunk request(Key k);

  bool is_request() const { return !data.has_value(); }
};

// Writes LE64(size) into the first SIZE_PREFIX_LENGTH bytes of buffer
void encode_size_prefix(uint8_t* buffer, uint64_t size);
// Reads the LE64 size prefix, throws MalformedChunkError if the buffer is shorter than the prefix
uint64_t decode_size_prefix(const std::vector<uint8_t>& buffer);

} // namespace swarm::chunker

#endif // SWARM_CHUNKER_CHUNK_HPP
