#ifndef SWARM_CHUNKER_TREE_CHUNKER_HPP
#define SWARM_CHUNKER_TREE_CHUNKER_HPP

#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include "chunker/chunk.hpp"
#include "chunker/hasher.hpp"
#include "chunker/key.hpp"
#include "chunker/section_reader.hpp"
#include "store/chunk_store.hpp"

namespace swarm::chunker {

// Receives every chunk produced by split, children before their parent
using ChunkCollector = std::function<void(Chunk)>;

struct ChunkerConfig {
  std::size_t branches = 128;
  std::string hash_name = EvpHasher::DEFAULT_DIGEST;
};

// Depth of a tree and the span its root window covers
struct TreeShape {
  unsigned depth;
  uint64_t tree_size;
};

/*
 * Splits a byte section into a hash tree of chunks and joins it back.
 *
 * Leaf chunk:          LE64(length) || payload
 * Intermediate chunk:  LE64(subtree size) || key_0 || ... || key_{n-1}
 *
 * Every chunk key is the digest of the full chunk buffer. The tree depth is
 * the smallest d with chunk_size * branches^d >= input size, and a node whose
 * section is smaller than its window drops levels before it is built.
 */
class TreeChunker {
public:
  static constexpr std::size_t DEFAULT_BRANCHES = 128;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // SHA-256 with 128 branches
  TreeChunker();
  // Throws HashConfigError for an unknown digest, std::invalid_argument for branches < 2
  explicit TreeChunker(const ChunkerConfig& config);
  // Throws HashConfigError for a null or zero-length hasher, std::invalid_argument for branches < 2
  TreeChunker(std::size_t branches, std::shared_ptr<const Hasher> hasher);


  // ---- TREE OPERATIONS ----
  // Splits the whole section, hands every chunk to collector in post-order
  // and returns the root key
  Key split(const SectionReader& reader, const ChunkCollector& collector) const;
  // Returns a lazy reader over the content addressed by root. Only the root
  // chunk is fetched here; reads fetch the chunks covering the requested range.
  // The store must outlive the returned reader.
  std::unique_ptr<SectionReader> join(store::ChunkStore& store, const Key& root) const;


  // ---- TREE ARITHMETIC ----
  // Smallest depth whose window covers size
  TreeShape compute_depth(uint64_t size) const;
  // Drops levels while the section is smaller than the window
  void normalize(TreeShape& shape, uint64_t section_size) const;
  // Number of children of a node with the given window and section size
  uint64_t branch_count(uint64_t tree_size, uint64_t section_size) const;


  // ---- GETTERS ----
  std::size_t key_size() const { return hash_size_; }
  std::size_t branches() const { return branches_; }
  uint64_t chunk_size() const { return chunk_size_; }
  const Hasher& hasher() const { return *hasher_; }

  // Digest of a chunk buffer as a key
  Key hash_chunk(const std::vector<uint8_t>& buffer) const;

private:
  // ---- PARAMETERS ----
  std::size_t branches_;
  std::shared_ptr<const Hasher> hasher_;
  std::size_t hash_size_;
  uint64_t chunk_size_;


  // ---- SPLITTING ----
  Key split_node(TreeShape shape, const SectionReader& reader, const ChunkCollector& collector) const;
  Key split_leaf(const SectionReader& reader, const ChunkCollector& collector) const;
  Key split_intermediate(TreeShape shape, const SectionReader& reader, const ChunkCollector& collector) const;
};

} // namespace swarm::chunker

#endif // SWARM_CHUNKER_TREE_CHUNKER_HPP
