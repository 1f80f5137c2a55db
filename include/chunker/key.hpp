#ifndef SWARM_CHUNKER_KEY_HPP
#define SWARM_CHUNKER_KEY_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <functional>
#include <iosfwd>

namespace swarm::chunker {

// Content address of a chunk: the digest of the chunk's encoded buffer.
// The length is whatever the configured hasher produces (32 bytes for SHA-256).
class Key {
public:
  Key() = default;
  explicit Key(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
  Key(const uint8_t* data, std::size_t length) : bytes_(data, data + length) {}

  // Parses a lowercase or uppercase hex string
  // Throws std::invalid_argument on odd length or non-hex characters
  static Key from_hex(const std::string& hex);

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  const uint8_t* data() const { return bytes_.data(); }
  std::size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  std::string to_hex() const;

  bool operator==(const Key& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Key& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Key& other) const { return bytes_ < other.bytes_; }

private:
  std::vector<uint8_t> bytes_;
};

std::ostream& operator<<(std::ostream& os, const Key& key);

} // namespace swarm::chunker

namespace std {

template <>
struct hash<swarm::chunker::Key> {
  std::size_t operator()(const swarm::chunker::Key& key) const noexcept;
};

} // namespace std

#endif // SWARM_CHUNKER_KEY_HPP
