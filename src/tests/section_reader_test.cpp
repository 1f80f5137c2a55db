#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "chunker/section_reader.hpp"
#include "test_utils.hpp"

using namespace swarm::chunker;

class SectionReaderTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("section_reader_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::filesystem::path write_file(const std::string& name, const std::vector<uint8_t>& data) {
    std::filesystem::path path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
  }
};

TEST_F(SectionReaderTest, BufferReadAndSlice) {
  const auto data = make_pattern(100);
  BufferSectionReader reader(data);
  ASSERT_EQ(reader.size(), 100u);
  EXPECT_EQ(reader.read_all(), data);

  std::vector<uint8_t> out(5);
  reader.read_at(out.data(), out.size(), 95);
  EXPECT_EQ(out, std::vector<uint8_t>(data.begin() + 95, data.end()));

  auto slice = reader.slice(10, 60);
  auto nested = slice->slice(5, 15);
  EXPECT_EQ(slice->size(), 50u);
  EXPECT_EQ(nested->read_all(), std::vector<uint8_t>(data.begin() + 15, data.begin() + 25));
}

TEST_F(SectionReaderTest, ReadIntoOffset) {
  BufferSectionReader reader(std::vector<uint8_t>{7, 8, 9});
  std::vector<uint8_t> buffer{1, 2};
  reader.read(buffer, 2);
  EXPECT_EQ(buffer, (std::vector<uint8_t>{1, 2, 7, 8, 9}));
}

TEST_F(SectionReaderTest, OutOfRangeAccess) {
  BufferSectionReader reader(make_pattern(10));
  std::vector<uint8_t> out(4);
  EXPECT_THROW(reader.read_at(out.data(), 4, 7), std::out_of_range);
  EXPECT_THROW(reader.slice(5, 11), std::out_of_range);
  EXPECT_THROW(reader.slice(6, 5), std::out_of_range);
  EXPECT_NO_THROW(reader.read_at(out.data(), 0, 10));
  EXPECT_EQ(reader.slice(10, 10)->size(), 0u);
}

TEST_F(SectionReaderTest, FileReadAndSlice) {
  const auto data = make_pattern(5000, 3);
  FileSectionReader reader(write_file("input.bin", data));
  ASSERT_EQ(reader.size(), 5000u);
  EXPECT_EQ(reader.read_all(), data);

  auto slice = reader.slice(1000, 4000);
  auto nested = slice->slice(100, 200);
  EXPECT_EQ(nested->read_all(), std::vector<uint8_t>(data.begin() + 1100, data.begin() + 1200));

  std::vector<uint8_t> out(1);
  EXPECT_THROW(slice->read_at(out.data(), 1, 3000), std::out_of_range);
}

TEST_F(SectionReaderTest, EmptyFile) {
  FileSectionReader reader(write_file("empty.bin", {}));
  EXPECT_EQ(reader.size(), 0u);
  EXPECT_TRUE(reader.read_all().empty());
}

TEST_F(SectionReaderTest, MissingFileIsReaderError) {
  EXPECT_THROW(FileSectionReader(test_dir / "does_not_exist"), SectionReaderError);
}
