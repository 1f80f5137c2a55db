#include "chunker/hasher.hpp"
#include "chunker/chunker_error.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace swarm::chunker {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw ChunkerError("Hasher: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

EvpHasher::EvpHasher(const std::string& digest_name)
  : name_(digest_name)
  , md_(EVP_get_digestbyname(digest_name.c_str()))
  , digest_length_(0) {
  if (!md_) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Unknown digest: " << digest_name;
    throw HashConfigError("unknown digest '" + digest_name + "'");
  }

  int length = EVP_MD_size(md_);
  if (length <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Digest " << digest_name << " has no fixed output length";
    throw HashConfigError("digest '" + digest_name + "' has no fixed output length");
  }
  digest_length_ = static_cast<std::size_t>(length);

  BOOST_LOG_TRIVIAL(debug) << "Hasher: Using " << digest_name << " with " << digest_length_ << " byte digests";
}

//==============================================
// HASHER INTERFACE
//==============================================

std::vector<uint8_t> EvpHasher::digest(const uint8_t* data, std::size_t length) const {
  DigestContext context;
  std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
  unsigned int result_length = 0;

  // Initialize the context with the configured algorithm
  if (!EVP_DigestInit_ex(context.get(), md_, nullptr)) {
    throw ChunkerError("Hasher: Failed to initialize digest");
  }

  // Feed the input data into the hash function
  if (length > 0 && !EVP_DigestUpdate(context.get(), data, length)) {
    throw ChunkerError("Hasher: Failed to update digest");
  }

  if (!EVP_DigestFinal_ex(context.get(), result.data(), &result_length)) {
    throw ChunkerError("Hasher: Failed to finalize digest");
  }

  result.resize(result_length);
  return result;
}

std::shared_ptr<const Hasher> make_hasher(const std::string& digest_name) {
  return std::make_shared<EvpHasher>(digest_name);
}

} // namespace swarm::chunker
