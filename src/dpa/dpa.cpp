#include "dpa/dpa.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace swarm {
namespace dpa {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DPA::DPA(chunker::TreeChunker chunker, store::ChunkStore& store)
  : chunker_(std::move(chunker))
  , store_(store) {
  BOOST_LOG_TRIVIAL(info) << "DPA: Initialized with chunk size " << chunker_.chunk_size();
}


//==============================================
// STORE
//==============================================

chunker::Key DPA::store(const std::vector<uint8_t>& data) {
  return store(chunker::BufferSectionReader(data));
}

chunker::Key DPA::store(const chunker::SectionReader& reader) {
  BOOST_LOG_TRIVIAL(info) << "DPA: Storing " << reader.size() << " bytes";

  std::size_t chunk_count = 0;
  chunker::Key root = chunker_.split(reader, [this, &chunk_count](chunker::Chunk chunk) {
    store_.put(chunk);
    ++chunk_count;
  });

  BOOST_LOG_TRIVIAL(info) << "DPA: Stored " << chunk_count << " chunks under root key " << root;
  return root;
}

chunker::Key DPA::store(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "DPA: Invalid input stream";
    throw std::runtime_error("DPA: Invalid input stream");
  }

  std::vector<uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "DPA: Failed reading input stream";
    throw std::runtime_error("DPA: Failed reading input stream");
  }
  return store(data);
}


//==============================================
// READ
//==============================================

std::vector<uint8_t> DPA::read(const chunker::Key& key) {
  auto reader = open(key);
  std::vector<uint8_t> data = reader->read_all();
  BOOST_LOG_TRIVIAL(info) << "DPA: Read " << data.size() << " bytes for key " << key;
  return data;
}

uint64_t DPA::read(const chunker::Key& key, std::ostream& output) {
  auto reader = open(key);

  // One piece spans the largest possible leaf, so no leaf is fetched twice
  const uint64_t piece_size = chunker_.chunk_size() * chunker_.branches();
  std::vector<uint8_t> buffer(static_cast<std::size_t>(std::min<uint64_t>(piece_size, reader->size())));

  uint64_t position = 0;
  while (position < reader->size()) {
    const std::size_t length = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), reader->size() - position));
    reader->read_at(buffer.data(), length, position);
    output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (!output.good()) {
      BOOST_LOG_TRIVIAL(error) << "DPA: Failed to write to output stream";
      throw std::runtime_error("DPA: Failed to write to output stream");
    }
    position += length;
  }

  BOOST_LOG_TRIVIAL(info) << "DPA: Streamed " << position << " bytes for key " << key;
  return position;
}

std::unique_ptr<chunker::SectionReader> DPA::open(const chunker::Key& key) {
  return chunker_.join(store_, key);
}

} // namespace dpa
} // namespace swarm
