#ifndef SWARM_CHUNKER_SECTION_READER_HPP
#define SWARM_CHUNKER_SECTION_READER_HPP

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace swarm::chunker {

// I/O failure inside a concrete reader
class SectionReaderError : public std::runtime_error {
public:
  explicit SectionReaderError(const std::string& message)
    : std::runtime_error(message) {}
};

// Read access to a byte range. Slices are views over the same source.
class SectionReader {
public:
  virtual ~SectionReader() = default;

  // Total number of bytes in this section
  virtual uint64_t size() const = 0;

  // Copies length bytes starting at position into out
  // Throws std::out_of_range if [position, position + length) leaves the section
  virtual void read_at(uint8_t* out, std::size_t length, uint64_t position) const = 0;

  // Returns a view of [start, end) sharing this reader's source
  // Throws std::out_of_range unless start <= end <= size()
  virtual std::unique_ptr<SectionReader> slice(uint64_t start, uint64_t end) const = 0;

  // Copies the whole section into buffer starting at offset, growing the buffer if needed
  void read(std::vector<uint8_t>& buffer, std::size_t offset) const;

  // Copies the whole section into a new buffer
  std::vector<uint8_t> read_all() const;

protected:
  void check_range(uint64_t position, uint64_t length) const;
  void check_slice(uint64_t start, uint64_t end) const;
};

// Section over bytes held in memory
class BufferSectionReader : public SectionReader {
public:
  explicit BufferSectionReader(std::vector<uint8_t> data);
  explicit BufferSectionReader(std::shared_ptr<const std::vector<uint8_t>> data);

  uint64_t size() const override { return length_; }
  void read_at(uint8_t* out, std::size_t length, uint64_t position) const override;
  std::unique_ptr<SectionReader> slice(uint64_t start, uint64_t end) const override;

private:
  BufferSectionReader(std::shared_ptr<const std::vector<uint8_t>> data, uint64_t offset, uint64_t length);

  std::shared_ptr<const std::vector<uint8_t>> data_;
  uint64_t offset_;
  uint64_t length_;
};

// Section over a file on disk. Slices share one open file handle.
class FileSectionReader : public SectionReader {
public:
  // Throws SectionReaderError if the file cannot be opened
  explicit FileSectionReader(const std::filesystem::path& path);

  uint64_t size() const override { return length_; }
  void read_at(uint8_t* out, std::size_t length, uint64_t position) const override;
  std::unique_ptr<SectionReader> slice(uint64_t start, uint64_t end) const override;

private:
  struct OpenFile {
    std::filesystem::path path;
    std::ifstream stream;
    std::mutex mutex;
  };

  FileSectionReader(std::shared_ptr<OpenFile> file, uint64_t offset, uint64_t length);

  std::shared_ptr<OpenFile> file_;
  uint64_t offset_;
  uint64_t length_;
};

} // namespace swarm::chunker

#endif // SWARM_CHUNKER_SECTION_READER_HPP
