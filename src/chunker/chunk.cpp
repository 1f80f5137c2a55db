#include "chunker/chunk.hpp"
#include "chunker/chunker_error.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>

namespace swarm::chunker {

Chunk Chunk::request(Key k) {
  Chunk chunk;
  chunk.key = std::move(k);
  return chunk;
}

void encode_size_prefix(uint8_t* buffer, uint64_t size) {
  uint64_t little_endian_size = boost::endian::native_to_little(size);
  std::memcpy(buffer, &little_endian_size, sizeof(little_endian_size));
}

uint64_t decode_size_prefix(const std::vector<uint8_t>& buffer) {
  if (buffer.size() < SIZE_PREFIX_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Chunk: Buffer of " << buffer.size() << " bytes is too short for a size prefix";
    throw MalformedChunkError("buffer of " + std::to_string(buffer.size()) + " bytes has no size prefix");
  }

  uint64_t little_endian_size;
  std::memcpy(&little_endian_size, buffer.data(), sizeof(little_endian_size));
  return boost::endian::little_to_native(little_endian_size);
}

} // namespace swarm::chunker
