#ifndef SWARM_DPA_HPP
#define SWARM_DPA_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <vector>
#include "chunker/tree_chunker.hpp"
#include "store/chunk_store.hpp"

namespace swarm {
namespace dpa {

// Distributed preimage archive: whole-content store and read on top of a
// TreeChunker and a ChunkStore
class DPA {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The store is borrowed and must outlive the DPA
  DPA(chunker::TreeChunker chunker, store::ChunkStore& store);


  // ---- STORE ----
  // Splits the content, puts every chunk into the store and returns the root key
  chunker::Key store(const std::vector<uint8_t>& data);
  chunker::Key store(const chunker::SectionReader& reader);
  // Reads the stream to its end first; throws std::runtime_error on a bad stream
  chunker::Key store(std::istream& input);


  // ---- READ ----
  // Reconstructs the full content
  // Throws ChunkNotFoundError or MalformedChunkError if the tree cannot be rebuilt
  std::vector<uint8_t> read(const chunker::Key& key);
  // Streams the content to output, returns the number of bytes written
  uint64_t read(const chunker::Key& key, std::ostream& output);
  // Lazy access for callers reading ranges
  std::unique_ptr<chunker::SectionReader> open(const chunker::Key& key);


  // ---- GETTERS ----
  const chunker::TreeChunker& chunker() const { return chunker_; }

private:
  // ---- PARAMETERS ----
  chunker::TreeChunker chunker_;
  store::ChunkStore& store_;
};

} // namespace dpa
} // namespace swarm

#endif // SWARM_DPA_HPP
