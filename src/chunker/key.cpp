#include "chunker/key.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <algorithm>

namespace swarm::chunker {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Key Key::from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Key: Hex string has odd length: " + std::to_string(hex.size()));
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Key: Invalid hex character in: " + hex);
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return Key(std::move(bytes));
}

std::string Key::to_hex() const {
  // Convert the raw bytes to a hexadecimal string
  std::stringstream ss;
  for (uint8_t byte : bytes_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
  return os << key.to_hex();
}

} // namespace swarm::chunker

std::size_t std::hash<swarm::chunker::Key>::operator()(const swarm::chunker::Key& key) const noexcept {
  // Keys are digests, so the leading bytes are already well mixed
  std::size_t value = 0;
  if (key.empty()) {
    return value;
  }
  std::memcpy(&value, key.data(), std::min(sizeof(value), key.size()));
  return value ^ key.size();
}
