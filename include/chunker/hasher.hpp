#ifndef SWARM_CHUNKER_HASHER_HPP
#define SWARM_CHUNKER_HASHER_HPP

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace swarm::chunker {

// Digest capability injected into the chunker
class Hasher {
public:
  virtual ~Hasher() = default;

  // Returns the digest of length bytes starting at data
  virtual std::vector<uint8_t> digest(const uint8_t* data, std::size_t length) const = 0;
  // Number of bytes every digest has
  virtual std::size_t digest_length() const = 0;

  std::vector<uint8_t> digest(const std::vector<uint8_t>& data) const {
    return digest(data.data(), data.size());
  }
};

// Hasher backed by an OpenSSL EVP message digest
class EvpHasher : public Hasher {
public:
  static constexpr const char* DEFAULT_DIGEST = "SHA256";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws HashConfigError if OpenSSL does not know the digest name
  explicit EvpHasher(const std::string& digest_name = DEFAULT_DIGEST);


  // ---- HASHER INTERFACE ----
  std::vector<uint8_t> digest(const uint8_t* data, std::size_t length) const override;
  std::size_t digest_length() const override { return digest_length_; }
  using Hasher::digest;


  // ---- GETTERS ----
  const std::string& name() const { return name_; }

private:
  // ---- PARAMETERS ----
  std::string name_;
  const EVP_MD* md_;
  std::size_t digest_length_;
};

// Creates the default hasher or one selected by EVP digest name
std::shared_ptr<const Hasher> make_hasher(const std::string& digest_name = EvpHasher::DEFAULT_DIGEST);

} // namespace swarm::chunker

#endif // SWARM_CHUNKER_HASHER_HPP
