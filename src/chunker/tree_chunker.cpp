#include "chunker/tree_chunker.hpp"
#include "chunker/chunker_error.hpp"
#include "chunker/tree_reader.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace swarm::chunker {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TreeChunker::TreeChunker()
  : TreeChunker(ChunkerConfig{}) {}

TreeChunker::TreeChunker(const ChunkerConfig& config)
  : TreeChunker(config.branches, make_hasher(config.hash_name)) {}

TreeChunker::TreeChunker(std::size_t branches, std::shared_ptr<const Hasher> hasher)
  : branches_(branches)
  , hasher_(std::move(hasher))
  , hash_size_(0)
  , chunk_size_(0) {
  if (!hasher_) {
    BOOST_LOG_TRIVIAL(error) << "Tree chunker: No hasher provided";
    throw HashConfigError("no hasher provided");
  }

  hash_size_ = hasher_->digest_length();
  if (hash_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Tree chunker: Hasher reports a zero digest length";
    throw HashConfigError("digest length is zero");
  }

  // A single branch would never grow the tree window
  if (branches_ < 2) {
    BOOST_LOG_TRIVIAL(error) << "Tree chunker: Invalid branch count: " << branches_;
    throw std::invalid_argument("Tree chunker: branches must be at least 2");
  }

  chunk_size_ = static_cast<uint64_t>(hash_size_) * branches_;
  BOOST_LOG_TRIVIAL(debug) << "Tree chunker: Initialized with " << branches_ << " branches, "
                           << hash_size_ << " byte keys, chunk size " << chunk_size_;
}


//==============================================
// TREE OPERATIONS
//==============================================

Key TreeChunker::split(const SectionReader& reader, const ChunkCollector& collector) const {
  if (!collector) {
    throw std::invalid_argument("Tree chunker: split needs a chunk collector");
  }

  const uint64_t size = reader.size();
  TreeShape shape = compute_depth(size);
  BOOST_LOG_TRIVIAL(info) << "Tree chunker: Splitting " << size << " bytes, depth " << shape.depth
                          << ", tree size " << shape.tree_size;

  Key root = split_node(shape, reader, collector);

  BOOST_LOG_TRIVIAL(info) << "Tree chunker: Split complete, root key " << root;
  return root;
}

std::unique_ptr<SectionReader> TreeChunker::join(store::ChunkStore& store, const Key& root) const {
  BOOST_LOG_TRIVIAL(info) << "Tree chunker: Joining tree with root key " << root;
  auto state = TreeReader::open(*this, store, root);
  BOOST_LOG_TRIVIAL(debug) << "Tree chunker: Root chunk covers " << state->root_size << " bytes";
  return std::make_unique<TreeReader>(std::move(state));
}


//==============================================
// TREE ARITHMETIC
//==============================================

TreeShape TreeChunker::compute_depth(uint64_t size) const {
  TreeShape shape{0, chunk_size_};

  // Lowest depth such that chunk_size * branches^depth >= size
  while (shape.tree_size < size) {
    if (shape.tree_size > std::numeric_limits<uint64_t>::max() / branches_) {
      BOOST_LOG_TRIVIAL(error) << "Tree chunker: Tree size overflow for input of " << size << " bytes";
      throw std::overflow_error("Tree chunker: input too large for tree arithmetic");
    }
    shape.tree_size *= branches_;
    ++shape.depth;
  }
  return shape;
}

void TreeChunker::normalize(TreeShape& shape, uint64_t section_size) const {
  while (shape.depth > 0 && section_size < shape.tree_size) {
    shape.tree_size /= branches_;
    --shape.depth;
  }
}

uint64_t TreeChunker::branch_count(uint64_t tree_size, uint64_t section_size) const {
  // Rounds up without forming section_size + tree_size, which can wrap
  return section_size / tree_size + (section_size % tree_size != 0 ? 1 : 0);
}

Key TreeChunker::hash_chunk(const std::vector<uint8_t>& buffer) const {
  std::vector<uint8_t> digest = hasher_->digest(buffer);
  if (digest.size() != hash_size_) {
    BOOST_LOG_TRIVIAL(error) << "Tree chunker: Hasher returned " << digest.size()
                             << " bytes, expected " << hash_size_;
    throw HashConfigError("hasher returned a digest of unexpected length");
  }
  return Key(std::move(digest));
}


//==============================================
// SPLITTING
//==============================================

Key TreeChunker::split_node(TreeShape shape, const SectionReader& reader,
                            const ChunkCollector& collector) const {
  normalize(shape, reader.size());

  if (shape.depth == 0) {
    return split_leaf(reader, collector);
  }
  return split_intermediate(shape, reader, collector);
}

Key TreeChunker::split_leaf(const SectionReader& reader, const ChunkCollector& collector) const {
  const uint64_t size = reader.size();

  std::vector<uint8_t> buffer;
  buffer.reserve(SIZE_PREFIX_LENGTH + size);
  buffer.resize(SIZE_PREFIX_LENGTH);
  encode_size_prefix(buffer.data(), size);
  reader.read(buffer, SIZE_PREFIX_LENGTH);

  Key key = hash_chunk(buffer);
  BOOST_LOG_TRIVIAL(trace) << "Tree chunker: Leaf chunk " << key << " with " << size << " bytes";
  collector(Chunk(key, std::move(buffer), size));
  return key;
}

Key TreeChunker::split_intermediate(TreeShape shape, const SectionReader& reader,
                                    const ChunkCollector& collector) const {
  const uint64_t size = reader.size();
  const uint64_t branch_cnt = branch_count(shape.tree_size, size);

  std::vector<uint8_t> buffer(SIZE_PREFIX_LENGTH + branch_cnt * hash_size_);
  encode_size_prefix(buffer.data(), size);

  const TreeShape child_shape{shape.depth - 1, shape.tree_size / branches_};
  uint64_t position = 0;
  for (uint64_t i = 0; i < branch_cnt; ++i) {
    // The last branch can cover a shorter section
    const uint64_t section_size = std::min(shape.tree_size, size - position);
    auto section = reader.slice(position, position + section_size);

    Key child = split_node(child_shape, *section, collector);
    std::memcpy(buffer.data() + SIZE_PREFIX_LENGTH + i * hash_size_, child.data(), hash_size_);

    position += shape.tree_size;
  }

  Key key = hash_chunk(buffer);
  BOOST_LOG_TRIVIAL(trace) << "Tree chunker: Intermediate chunk " << key << " with " << branch_cnt
                           << " branches covering " << size << " bytes";
  collector(Chunk(key, std::move(buffer), size));
  return key;
}

} // namespace swarm::chunker
