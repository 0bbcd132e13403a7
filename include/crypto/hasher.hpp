#ifndef DISKPROBE_CRYPTO_HASHER_HPP
#define DISKPROBE_CRYPTO_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace diskprobe::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Streaming SHA-256. Feed bytes with update(), read the lowercase hex
// digest with finalize(). After finalize() the hasher is reset and can
// be reused for the next input.
class Sha256Hasher {
public:
  static constexpr size_t HEX_DIGEST_LENGTH = 64;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;


  // ---- STREAMING OPERATIONS ----
  void update(const uint8_t* data, size_t length);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  std::string finalize();


  // ---- ONE-SHOT HELPERS ----
  static std::string hash(const std::vector<uint8_t>& data);
  // Consumes the stream to EOF; throws DigestError if the stream goes bad
  static std::string hash(std::istream& input);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  static constexpr size_t BUFFER_SIZE = 1024 * 1024;

  // Initializes the digest context with SHA-256
  void reset();
};

// Lowercase hex rendering of raw digest bytes
std::string to_hex(const uint8_t* data, size_t length);

} // namespace diskprobe::crypto

#endif // DISKPROBE_CRYPTO_HASHER_HPP
