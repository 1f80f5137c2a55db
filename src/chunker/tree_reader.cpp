#include "chunker/tree_reader.hpp"
#include "chunker/chunker_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>

namespace swarm::chunker {

//==============================================
// OPENING
//==============================================

std::shared_ptr<const TreeState> TreeReader::open(const TreeChunker& chunker,
                                                  store::ChunkStore& store,
                                                  const Key& root) {
  std::vector<uint8_t> data = fetch_verified(chunker, store, root);
  const uint64_t size = decode_size_prefix(data);

  // Same shape arithmetic as split, so every child span is known up front
  TreeShape shape{};
  try {
    shape = chunker.compute_depth(size);
  } catch (const std::overflow_error&) {
    throw MalformedChunkError("root chunk " + root.to_hex() + " encodes an impossible size " + std::to_string(size));
  }
  TreeShape normalized = shape;
  chunker.normalize(normalized, size);
  check_layout(chunker, root, data, normalized, size);

  return std::make_shared<TreeState>(TreeState{chunker, store, root, std::move(data), size, shape});
}

TreeReader::TreeReader(std::shared_ptr<const TreeState> state)
  : state_(std::move(state))
  , offset_(0)
  , length_(state_->root_size) {}

TreeReader::TreeReader(std::shared_ptr<const TreeState> state, uint64_t offset, uint64_t length)
  : state_(std::move(state))
  , offset_(offset)
  , length_(length) {}


//==============================================
// SECTION READER INTERFACE
//==============================================

void TreeReader::read_at(uint8_t* out, std::size_t length, uint64_t position) const {
  check_range(position, length);
  if (length == 0) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Tree reader: Reading " << length << " bytes at " << offset_ + position
                           << " from tree " << state_->root_key;
  read_node(state_->root_data, state_->root_shape, state_->root_size, offset_ + position, out, length);
}

std::unique_ptr<SectionReader> TreeReader::slice(uint64_t start, uint64_t end) const {
  check_slice(start, end);
  return std::unique_ptr<SectionReader>(new TreeReader(state_, offset_ + start, end - start));
}


//==============================================
// TREE DESCENT
//==============================================

void TreeReader::read_node(const std::vector<uint8_t>& data, TreeShape shape, uint64_t node_size,
                           uint64_t position, uint8_t* out, std::size_t length) const {
  const TreeChunker& chunker = state_->chunker;
  chunker.normalize(shape, node_size);

  if (shape.depth == 0) {
    std::memcpy(out, data.data() + SIZE_PREFIX_LENGTH + position, length);
    return;
  }

  const uint64_t tree_size = shape.tree_size;
  const std::size_t hash_size = chunker.key_size();
  const TreeShape child_shape{shape.depth - 1, tree_size / chunker.branches()};
  const uint64_t end = position + length;

  // Only the branches intersecting [position, end) are visited
  const uint64_t first = position / tree_size;
  const uint64_t last = (end - 1) / tree_size;
  if (SIZE_PREFIX_LENGTH + (last + 1) * hash_size > data.size()) {
    BOOST_LOG_TRIVIAL(error) << "Tree reader: Node of " << data.size() << " bytes has no key for branch " << last;
    throw MalformedChunkError("node of " + std::to_string(data.size()) + " bytes has no key for branch "
      + std::to_string(last));
  }
  for (uint64_t i = first; i <= last; ++i) {
    const uint64_t child_start = i * tree_size;
    const uint64_t child_size = std::min(tree_size, node_size - child_start);
    const uint64_t from = std::max(position, child_start);
    const uint64_t to = std::min(end, child_start + child_size);

    Key child_key(data.data() + SIZE_PREFIX_LENGTH + i * hash_size, hash_size);
    std::vector<uint8_t> child_data = fetch(*state_, child_key, child_size);

    TreeShape normalized = child_shape;
    chunker.normalize(normalized, child_size);
    check_layout(chunker, child_key, child_data, normalized, child_size);

    read_node(child_data, child_shape, child_size, from - child_start,
              out + (from - position), static_cast<std::size_t>(to - from));
  }
}

std::vector<uint8_t> TreeReader::fetch(const TreeState& state, const Key& key, uint64_t expected_size) {
  std::vector<uint8_t> data = fetch_verified(state.chunker, state.store, key);

  const uint64_t size = decode_size_prefix(data);
  if (size != expected_size) {
    BOOST_LOG_TRIVIAL(error) << "Tree reader: Chunk " << key << " encodes " << size
                             << " bytes but its parent expects " << expected_size;
    throw MalformedChunkError("chunk " + key.to_hex() + " encodes " + std::to_string(size)
      + " bytes, parent expects " + std::to_string(expected_size));
  }
  return data;
}

std::vector<uint8_t> TreeReader::fetch_verified(const TreeChunker& chunker, store::ChunkStore& store,
                                                const Key& key) {
  std::optional<Chunk> chunk = store.get(key);
  if (!chunk) {
    BOOST_LOG_TRIVIAL(error) << "Tree reader: Chunk not found: " << key;
    throw ChunkNotFoundError(key);
  }

  if (chunk->is_request()) {
    BOOST_LOG_TRIVIAL(error) << "Tree reader: Store returned chunk " << key << " without data";
    throw MalformedChunkError("chunk " + key.to_hex() + " has no data");
  }

  if (chunker.hash_chunk(*chunk->data) != key) {
    BOOST_LOG_TRIVIAL(error) << "Tree reader: Content of chunk " << key << " does not match its key";
    throw ChunkIntegrityError(key);
  }

  BOOST_LOG_TRIVIAL(trace) << "Tree reader: Fetched chunk " << key << " (" << chunk->data->size() << " bytes)";
  return std::move(*chunk->data);
}

void TreeReader::check_layout(const TreeChunker& chunker, const Key& key, const std::vector<uint8_t>& data,
                              const TreeShape& shape, uint64_t node_size) {
  uint64_t expected_length = SIZE_PREFIX_LENGTH;
  if (shape.depth == 0) {
    expected_length += node_size;
  } else {
    const uint64_t branches = chunker.branch_count(shape.tree_size, node_size);
    if (branches == 0 || branches > chunker.branches()) {
      BOOST_LOG_TRIVIAL(error) << "Tree reader: Chunk " << key << " encodes " << node_size
                               << " bytes, which needs " << branches << " branches";
      throw MalformedChunkError("chunk " + key.to_hex() + " encodes " + std::to_string(node_size)
        + " bytes, which needs " + std::to_string(branches) + " branches");
    }
    expected_length += branches * chunker.key_size();
  }

  if (data.size() != expected_length) {
    BOOST_LOG_TRIVIAL(error) << "Tree reader: Chunk " << key << " has " << data.size()
                             << " bytes, expected " << expected_length
                             << (shape.depth == 0 ? " for a leaf" : " for an intermediate node");
    throw MalformedChunkError("chunk " + key.to_hex() + " has " + std::to_string(data.size())
      + " bytes, expected " + std::to_string(expected_length));
  }
}

} // namespace swarm::chunker
