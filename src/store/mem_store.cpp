#include "store/mem_store.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace swarm {
namespace store {

void MemStore::put(const chunker::Chunk& chunk) {
  if (chunk.is_request()) {
    BOOST_LOG_TRIVIAL(error) << "Mem store: Refusing retrieval request for key: " << chunk.key;
    throw std::invalid_argument("Mem store: Cannot store a chunk without data");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Content addressed, so an existing entry already holds the same bytes
  auto [it, inserted] = chunks_.emplace(chunk.key, chunk);
  BOOST_LOG_TRIVIAL(trace) << "Mem store: " << (inserted ? "Stored" : "Already holding") << " chunk " << chunk.key;
}

std::optional<chunker::Chunk> MemStore::get(const chunker::Key& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(key);
  if (it == chunks_.end()) {
    BOOST_LOG_TRIVIAL(trace) << "Mem store: Miss for key: " << key;
    return std::nullopt;
  }
  return it->second;
}

bool MemStore::has(const chunker::Key& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(key) > 0;
}

std::size_t MemStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

void MemStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.clear();
  BOOST_LOG_TRIVIAL(debug) << "Mem store: Cleared";
}

} // namespace store
} // namespace swarm
