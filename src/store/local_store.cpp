#include "store/local_store.hpp"
#include <boost/log/trivial.hpp>

namespace swarm {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalStore::LocalStore(ChunkStore& volatile_store, ChunkStore& durable_store)
  : volatile_store_(volatile_store)
  , durable_store_(durable_store)
  , work_guard_(boost::asio::make_work_guard(io_context_)) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Starting durable write worker";

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Local store: IO context error: " << e.what();
    } catch (...) {
      BOOST_LOG_TRIVIAL(error) << "Local store: IO context stopped by a non-standard exception";
    }
  });
}

LocalStore::~LocalStore() {
  shutdown();
}

void LocalStore::shutdown() {
  BOOST_LOG_TRIVIAL(info) << "Local store: Shutting down with " << pending_writes() << " pending durable writes";

  // Without the guard run() returns once the queued writes are done
  work_guard_.reset();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  BOOST_LOG_TRIVIAL(info) << "Local store: Shutdown complete, " << failed_writes() << " failed durable writes";
}


//==============================================
// CHUNK STORE INTERFACE
//==============================================

void LocalStore::put(const chunker::Chunk& chunk) {
  volatile_store_.put(chunk);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++pending_writes_;
  }

  boost::asio::post(io_context_, [this, chunk]() {
    write_durable(chunk);
  });
  BOOST_LOG_TRIVIAL(trace) << "Local store: Queued durable write for " << chunk.key;
}

std::optional<chunker::Chunk> LocalStore::get(const chunker::Key& key) {
  if (auto chunk = volatile_store_.get(key)) {
    return chunk;
  }

  BOOST_LOG_TRIVIAL(debug) << "Local store: Volatile miss, falling back to durable store for " << key;
  return durable_store_.get(key);
}


//==============================================
// DURABLE FORWARDING
//==============================================

void LocalStore::write_durable(const chunker::Chunk& chunk) {
  try {
    durable_store_.put(chunk);
  } catch (const std::exception& e) {
    ++failed_writes_;
    BOOST_LOG_TRIVIAL(error) << "Local store: Durable write failed for " << chunk.key << ": " << e.what();
  } catch (...) {
    ++failed_writes_;
    BOOST_LOG_TRIVIAL(error) << "Local store: Durable write failed for " << chunk.key << " with a non-standard exception";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (--pending_writes_ == 0) {
    drained_.notify_all();
  }
}

void LocalStore::flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this]() { return pending_writes_ == 0; });
}

std::size_t LocalStore::pending_writes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_writes_;
}

} // namespace store
} // namespace swarm
