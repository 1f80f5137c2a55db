#include "store/disk_store.hpp"
#include "chunker/chunker_error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace swarm {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DiskStore::DiskStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Disk store: Initializing with base path: " << base_path_.string();
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to create base directory: " << e.what();
    throw StoreError("Disk store: Failed to create base directory: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "Disk store: Directory created/verified at: " << base_path_.string();
}


//==============================================
// CHUNK STORE INTERFACE
//==============================================

void DiskStore::put(const chunker::Chunk& chunk) {
  if (chunk.is_request()) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Refusing retrieval request for key: " << chunk.key;
    throw std::invalid_argument("Disk store: Cannot store a chunk without data");
  }

  std::filesystem::path file_path = path_for_key(chunk.key);
  std::lock_guard<std::mutex> lock(mutex_);

  // Same key means same content, nothing to rewrite
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(trace) << "Disk store: Chunk already stored: " << chunk.key;
    return;
  }

  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to create directory for " << chunk.key << ": " << e.what();
    throw StoreError("Disk store: Failed to create directory: " + std::string(e.what()));
  }

  // Write next to the target then rename, so readers never see a partial file
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to create file: " << temp_path.string();
      throw StoreError("Disk store: Failed to create file: " + temp_path.string());
    }
    const auto& data = *chunk.data;
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to write file: " << temp_path.string();
      throw StoreError("Disk store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to move " << temp_path.string() << " into place: " << ec.message();
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Disk store: Failed to store chunk " + chunk.key.to_hex());
  }

  BOOST_LOG_TRIVIAL(debug) << "Disk store: Stored chunk " << chunk.key << " (" << chunk.data->size() << " bytes)";
}

std::optional<chunker::Chunk> DiskStore::get(const chunker::Key& key) {
  std::filesystem::path file_path = path_for_key(key);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    if (!std::filesystem::exists(file_path)) {
      BOOST_LOG_TRIVIAL(trace) << "Disk store: Miss for key: " << key;
      return std::nullopt;
    }
    BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to open file: " << file_path.string();
    throw StoreError("Disk store: Failed to open file: " + file_path.string());
  }

  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to read file: " << file_path.string();
    throw StoreError("Disk store: Failed to read file: " + file_path.string());
  }

  // Throws MalformedChunkError if the file is too short to hold a size prefix
  uint64_t size = chunker::decode_size_prefix(data);
  BOOST_LOG_TRIVIAL(trace) << "Disk store: Loaded chunk " << key << " (" << data.size() << " bytes)";
  return chunker::Chunk(key, std::move(data), size);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool DiskStore::has(const chunker::Key& key) const {
  return std::filesystem::exists(path_for_key(key));
}

void DiskStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Disk store: Clearing entire store at: " << base_path_.string();
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path DiskStore::path_for_key(const chunker::Key& key) const {
  const std::string hex = key.to_hex();
  std::filesystem::path path = base_path_;

  // Short keys are stored flat
  if (hex.size() <= 6) {
    return path / hex;
  }

  for (size_t i = 0; i < 6; i += 2) {
    path /= hex.substr(i, 2);
  }
  path /= hex.substr(6);
  return path;
}

void DiskStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace swarm
