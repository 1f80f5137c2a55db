#include <gtest/gtest.h>
#include <sstream>
#include <unordered_map>
#include "chunker/chunk.hpp"
#include "chunker/chunker_error.hpp"
#include "chunker/key.hpp"

using namespace swarm::chunker;

TEST(KeyTest, HexRoundTrip) {
  Key key(std::vector<uint8_t>{0x00, 0x0f, 0xa5, 0xff});
  EXPECT_EQ(key.to_hex(), "000fa5ff");
  EXPECT_EQ(Key::from_hex("000fa5ff"), key);
  EXPECT_EQ(Key::from_hex("000FA5FF"), key);

  std::ostringstream os;
  os << key;
  EXPECT_EQ(os.str(), "000fa5ff");
}

TEST(KeyTest, InvalidHexIsRejected) {
  EXPECT_THROW(Key::from_hex("abc"), std::invalid_argument);
  EXPECT_THROW(Key::from_hex("zz"), std::invalid_argument);
  EXPECT_THROW(Key::from_hex("0g"), std::invalid_argument);
  EXPECT_TRUE(Key::from_hex("").empty());
}

TEST(KeyTest, OrderingAndHashing) {
  Key a(std::vector<uint8_t>{1, 2, 3});
  Key b(std::vector<uint8_t>{1, 2, 4});
  EXPECT_LT(a, b);
  EXPECT_NE(a, b);

  std::unordered_map<Key, int> map;
  map[a] = 1;
  map[b] = 2;
  map[Key()] = 3;
  EXPECT_EQ(map.size(), 3u);
  EXPECT_EQ(map.at(Key::from_hex("010203")), 1);
  EXPECT_EQ(map.at(Key()), 3);
}

TEST(ChunkTest, SizePrefixIsLittleEndian) {
  std::vector<uint8_t> buffer(SIZE_PREFIX_LENGTH);
  encode_size_prefix(buffer.data(), 0x0102030405060708ULL);
  EXPECT_EQ(buffer, (std::vector<uint8_t>{0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01}));
  EXPECT_EQ(decode_size_prefix(buffer), 0x0102030405060708ULL);

  buffer.push_back(0xEE);
  EXPECT_EQ(decode_size_prefix(buffer), 0x0102030405060708ULL);
}

TEST(ChunkTest, ShortBufferIsMalformed) {
  EXPECT_THROW(decode_size_prefix(std::vector<uint8_t>(7, 0)), MalformedChunkError);
  EXPECT_THROW(decode_size_prefix(std::vector<uint8_t>()), MalformedChunkError);
}

TEST(ChunkTest, RequestHasNoData) {
  Chunk request = Chunk::request(Key::from_hex("abcd"));
  EXPECT_TRUE(request.is_request());
  EXPECT_EQ(request.key.to_hex(), "abcd");

  Chunk chunk(Key::from_hex("abcd"), std::vector<uint8_t>(8, 0), 0);
  EXPECT_FALSE(chunk.is_request());
}
