#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <boost/asio.hpp>
#include "store/chunk_store.hpp"

namespace swarm {
namespace store {

// Chunk store composed of a fast volatile tier and a durable tier.
//
// put() writes the volatile tier synchronously and queues the durable write on
// a background io_context, so callers never wait on durable latency.
// get() checks the volatile tier first and falls back to the durable tier.
// A durable hit is NOT copied back into the volatile tier.
//
// Both tiers are borrowed and must outlive the LocalStore. Since LocalStore is
// itself a ChunkStore, further tiers are added by nesting.
class LocalStore : public ChunkStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  LocalStore(ChunkStore& volatile_store, ChunkStore& durable_store);
  // Completes all queued durable writes before returning
  ~LocalStore() override;

  LocalStore(const LocalStore&) = delete;
  LocalStore& operator=(const LocalStore&) = delete;


  // ---- CHUNK STORE INTERFACE ----
  void put(const chunker::Chunk& chunk) override;
  std::optional<chunker::Chunk> get(const chunker::Key& key) override;


  // ---- DURABLE FORWARDING ----
  // Blocks until every durable write queued so far has completed
  void flush();
  // Durable writes queued but not yet completed
  std::size_t pending_writes() const;
  // Durable writes that threw
  std::size_t failed_writes() const { return failed_writes_.load(); }

private:
  // ---- PARAMETERS ----
  ChunkStore& volatile_store_;
  ChunkStore& durable_store_;

  // Durable write worker
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::unique_ptr<std::thread> io_thread_;

  // Queue accounting
  mutable std::mutex mutex_;
  std::condition_variable drained_;
  std::size_t pending_writes_{0};
  std::atomic<std::size_t> failed_writes_{0};


  // ---- DURABLE FORWARDING ----
  // Runs on the worker thread
  void write_durable(const chunker::Chunk& chunk);
  void shutdown();
};

} // namespace store
} // namespace swarm
