#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "store/chunk_store.hpp"

namespace swarm {
namespace store {

// Durable chunk store. Each chunk's encoded buffer is written to its own file.
class DiskStore : public ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DiskStore(const std::filesystem::path& base_path);


  // ---- CHUNK STORE INTERFACE ----
  // Writes the chunk file unless it already exists
  void put(const chunker::Chunk& chunk) override;
  // Reads the chunk file and decodes the subtree size from its prefix
  std::optional<chunker::Chunk> get(const chunker::Key& key) override;


  // ---- QUERY OPERATIONS ----
  bool has(const chunker::Key& key) const;
  // Removes all stored chunks
  void clear();

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored chunks
  std::filesystem::path base_path_;
  // Serializes writers so a chunk file is never observed half written
  mutable std::mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // {base_path}/{hex[0:2]}/{hex[2:4]}/{hex[4:6]}/{remaining_hex}
  std::filesystem::path path_for_key(const chunker::Key& key) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace swarm
