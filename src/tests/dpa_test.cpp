#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <sstream>
#include "chunker/chunker_error.hpp"
#include "dpa/dpa.hpp"
#include "store/disk_store.hpp"
#include "store/local_store.hpp"
#include "store/mem_store.hpp"
#include "test_utils.hpp"

using namespace swarm::chunker;
using swarm::dpa::DPA;
using swarm::store::DiskStore;
using swarm::store::LocalStore;
using swarm::store::MemStore;

class DPATest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("dpa_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  static std::string as_string(const std::vector<uint8_t>& data) {
    return std::string(data.begin(), data.end());
  }
};

TEST_F(DPATest, StoreAndReadThroughLocalStore) {
  MemStore mem_store;
  DiskStore disk_store(test_dir);
  LocalStore local_store(mem_store, disk_store);
  DPA dpa(TreeChunker(), local_store);

  const auto data = make_pattern(TreeChunker::DEFAULT_BRANCHES * 4096 + 5000);
  Key root = dpa.store(data);
  EXPECT_EQ(root.size(), 32u);
  EXPECT_EQ(dpa.read(root), data);

  // Served from disk once the volatile tier is gone
  local_store.flush();
  mem_store.clear();
  EXPECT_EQ(dpa.read(root), data);
}

TEST_F(DPATest, StreamStoreAndRead) {
  MemStore store;
  DPA dpa(TreeChunker(4, std::make_shared<ToyHasher>()), store);

  const auto data = make_pattern(1000, 11);
  std::istringstream input(as_string(data));
  Key root = dpa.store(input);
  EXPECT_EQ(root, dpa.store(data));

  std::ostringstream output;
  EXPECT_EQ(dpa.read(root, output), 1000u);
  EXPECT_EQ(output.str(), as_string(data));
}

TEST_F(DPATest, EmptyContent) {
  MemStore store;
  DPA dpa(TreeChunker(), store);

  Key root = dpa.store(std::vector<uint8_t>());
  EXPECT_TRUE(dpa.read(root).empty());
  EXPECT_EQ(dpa.open(root)->size(), 0u);

  std::ostringstream output;
  EXPECT_EQ(dpa.read(root, output), 0u);
  EXPECT_TRUE(output.str().empty());
}

TEST_F(DPATest, BadInputStream) {
  MemStore store;
  DPA dpa(TreeChunker(), store);

  std::istringstream input("content");
  input.setstate(std::ios::failbit);
  EXPECT_THROW(dpa.store(input), std::runtime_error);
}

TEST_F(DPATest, UnknownKeyIsNotFound) {
  MemStore store;
  DPA dpa(TreeChunker(), store);
  EXPECT_THROW(dpa.read(Key(std::vector<uint8_t>(32, 0x42))), ChunkNotFoundError);
}

TEST_F(DPATest, RepeatedContentIsStoredOnce) {
  MemStore store;
  DPA dpa(TreeChunker(2, std::make_shared<ToyHasher>()), store);

  // Two identical 16 byte leaves
  const std::vector<uint8_t> half = make_pattern(16);
  std::vector<uint8_t> data = half;
  data.insert(data.end(), half.begin(), half.end());

  Key root = dpa.store(data);
  EXPECT_EQ(store.size(), 3u);

  EXPECT_EQ(dpa.store(data), root);
  EXPECT_EQ(store.size(), 3u);
  EXPECT_EQ(dpa.read(root), data);
}

TEST_F(DPATest, RangeAccess) {
  MemStore store;
  DPA dpa(TreeChunker(3, std::make_shared<ToyHasher>()), store);
  const auto data = make_pattern(400);
  Key root = dpa.store(data);

  auto reader = dpa.open(root);
  std::vector<uint8_t> out(50);
  reader->read_at(out.data(), out.size(), 123);
  EXPECT_EQ(out, std::vector<uint8_t>(data.begin() + 123, data.begin() + 173));
}
