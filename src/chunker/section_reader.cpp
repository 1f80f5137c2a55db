#include "chunker/section_reader.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace swarm::chunker {

//==============================================
// SECTION READER
//==============================================

void SectionReader::read(std::vector<uint8_t>& buffer, std::size_t offset) const {
  const uint64_t length = size();
  if (buffer.size() < offset + length) {
    buffer.resize(offset + length);
  }
  if (length > 0) {
    read_at(buffer.data() + offset, static_cast<std::size_t>(length), 0);
  }
}

std::vector<uint8_t> SectionReader::read_all() const {
  std::vector<uint8_t> buffer;
  read(buffer, 0);
  return buffer;
}

void SectionReader::check_range(uint64_t position, uint64_t length) const {
  const uint64_t total = size();
  if (position > total || length > total - position) {
    throw std::out_of_range("Section reader: read of " + std::to_string(length) + " bytes at "
      + std::to_string(position) + " exceeds section of " + std::to_string(total) + " bytes");
  }
}

void SectionReader::check_slice(uint64_t start, uint64_t end) const {
  if (start > end || end > size()) {
    throw std::out_of_range("Section reader: invalid slice [" + std::to_string(start) + ", "
      + std::to_string(end) + ") of section with " + std::to_string(size()) + " bytes");
  }
}


//==============================================
// BUFFER SECTION READER
//==============================================

BufferSectionReader::BufferSectionReader(std::vector<uint8_t> data)
  : BufferSectionReader(std::make_shared<std::vector<uint8_t>>(std::move(data))) {}

BufferSectionReader::BufferSectionReader(std::shared_ptr<const std::vector<uint8_t>> data)
  : data_(std::move(data))
  , offset_(0)
  , length_(0) {
  if (!data_) {
    throw std::invalid_argument("Section reader: null buffer");
  }
  length_ = data_->size();
}

BufferSectionReader::BufferSectionReader(std::shared_ptr<const std::vector<uint8_t>> data,
                                         uint64_t offset, uint64_t length)
  : data_(std::move(data))
  , offset_(offset)
  , length_(length) {}

void BufferSectionReader::read_at(uint8_t* out, std::size_t length, uint64_t position) const {
  check_range(position, length);
  if (length > 0) {
    std::memcpy(out, data_->data() + offset_ + position, length);
  }
}

std::unique_ptr<SectionReader> BufferSectionReader::slice(uint64_t start, uint64_t end) const {
  check_slice(start, end);
  return std::unique_ptr<SectionReader>(new BufferSectionReader(data_, offset_ + start, end - start));
}


//==============================================
// FILE SECTION READER
//==============================================

FileSectionReader::FileSectionReader(const std::filesystem::path& path)
  : file_(std::make_shared<OpenFile>())
  , offset_(0)
  , length_(0) {
  file_->path = path;
  file_->stream.open(path, std::ios::binary);
  if (!file_->stream) {
    BOOST_LOG_TRIVIAL(error) << "Section reader: Failed to open file: " << path.string();
    throw SectionReaderError("Section reader: Failed to open file: " + path.string());
  }

  std::error_code ec;
  length_ = std::filesystem::file_size(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Section reader: Failed to get size of " << path.string() << ": " << ec.message();
    throw SectionReaderError("Section reader: Failed to get file size: " + path.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Section reader: Opened " << path.string() << " (" << length_ << " bytes)";
}

FileSectionReader::FileSectionReader(std::shared_ptr<OpenFile> file, uint64_t offset, uint64_t length)
  : file_(std::move(file))
  , offset_(offset)
  , length_(length) {}

void FileSectionReader::read_at(uint8_t* out, std::size_t length, uint64_t position) const {
  check_range(position, length);
  if (length == 0) {
    return;
  }

  std::lock_guard<std::mutex> lock(file_->mutex);
  file_->stream.clear();
  file_->stream.seekg(static_cast<std::streamoff>(offset_ + position));
  file_->stream.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(length));
  if (static_cast<std::size_t>(file_->stream.gcount()) != length) {
    BOOST_LOG_TRIVIAL(error) << "Section reader: Short read from " << file_->path.string()
                             << ": wanted " << length << " bytes, got " << file_->stream.gcount();
    throw SectionReaderError("Section reader: Short read from file: " + file_->path.string());
  }
}

std::unique_ptr<SectionReader> FileSectionReader::slice(uint64_t start, uint64_t end) const {
  check_slice(start, end);
  return std::unique_ptr<SectionReader>(new FileSectionReader(file_, offset_ + start, end - start));
}

} // namespace swarm::chunker
