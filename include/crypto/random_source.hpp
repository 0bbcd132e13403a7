#ifndef DISKPROBE_CRYPTO_RANDOM_SOURCE_HPP
#define DISKPROBE_CRYPTO_RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "crypto_error.hpp"

namespace diskprobe::crypto {

// Produces chunk payloads from the OpenSSL CSPRNG.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Returns exactly `size` random bytes; throws RandomSourceError if the
  // generator cannot be used
  virtual std::vector<uint8_t> generate(size_t size) const;
};

} // namespace diskprobe::crypto

#endif // DISKPROBE_CRYPTO_RANDOM_SOURCE_HPP
