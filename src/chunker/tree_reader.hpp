#ifndef SWARM_CHUNKER_TREE_READER_HPP
#define SWARM_CHUNKER_TREE_READER_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "chunker/tree_chunker.hpp"

namespace swarm::chunker {

// Root of a joined tree, shared by a reader and all of its slices
struct TreeState {
  TreeChunker chunker;
  store::ChunkStore& store;
  Key root_key;
  std::vector<uint8_t> root_data;
  uint64_t root_size;
  TreeShape root_shape;
};

// Lazy reader over a chunk tree. Each read fetches only the chunks whose
// span intersects the requested range and checks them against their keys.
class TreeReader : public SectionReader {
public:
  // Fetches and validates the root chunk
  // Throws ChunkNotFoundError, ChunkIntegrityError or MalformedChunkError
  static std::shared_ptr<const TreeState> open(const TreeChunker& chunker,
                                               store::ChunkStore& store,
                                               const Key& root);

  explicit TreeReader(std::shared_ptr<const TreeState> state);

  uint64_t size() const override { return length_; }
  void read_at(uint8_t* out, std::size_t length, uint64_t position) const override;
  std::unique_ptr<SectionReader> slice(uint64_t start, uint64_t end) const override;

private:
  TreeReader(std::shared_ptr<const TreeState> state, uint64_t offset, uint64_t length);

  // Copies [position, position + length) of the node's section into out
  void read_node(const std::vector<uint8_t>& data, TreeShape shape, uint64_t node_size,
                 uint64_t position, uint8_t* out, std::size_t length) const;

  // Fetches a chunk and verifies its digest and size prefix
  static std::vector<uint8_t> fetch(const TreeState& state, const Key& key, uint64_t expected_size);
  static std::vector<uint8_t> fetch_verified(const TreeChunker& chunker, store::ChunkStore& store,
                                             const Key& key);
  // Checks the buffer length against the node kind implied by shape
  static void check_layout(const TreeChunker& chunker, const Key& key, const std::vector<uint8_t>& data,
                           const TreeShape& shape, uint64_t node_size);

  std::shared_ptr<const TreeState> state_;
  uint64_t offset_;
  uint64_t length_;
};

} // namespace swarm::chunker

#endif // SWARM_CHUNKER_TREE_READER_HPP
