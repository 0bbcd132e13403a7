#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <sstream>
#include "logger/logger.hpp"

namespace diskprobe::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256Hasher::Sha256Hasher()
  : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

//==============================================
// STREAMING OPERATIONS
//==============================================

void Sha256Hasher::update(const uint8_t* data, size_t length) {
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
}

std::string Sha256Hasher::finalize() {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), digest, &digest_len)) {
    throw DigestError("Failed to finalize hash");
  }

  std::string result = to_hex(digest, digest_len);
  reset();
  return result;
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string Sha256Hasher::hash(const std::vector<uint8_t>& data) {
  Sha256Hasher hasher;
  hasher.update(data);
  return hasher.finalize();
}

std::string Sha256Hasher::hash(std::istream& input) {
  Sha256Hasher hasher;
  std::vector<char> buffer(BUFFER_SIZE);
  size_t total_bytes = 0;

  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()))
         || input.gcount() > 0) {
    auto bytes_read = static_cast<size_t>(input.gcount());
    hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), bytes_read);
    total_bytes += bytes_read;
  }

  if (input.bad()) {
    throw DigestError("Failed to read input stream after " + std::to_string(total_bytes) + " bytes");
  }

  LOG_TRACE << "Hasher: Digested " << total_bytes << " bytes from stream";
  return hasher.finalize();
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace diskprobe::crypto
