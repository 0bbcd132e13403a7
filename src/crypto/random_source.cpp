#include "crypto/random_source.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <climits>
#include <string>
#include "logger/logger.hpp"

namespace diskprobe::crypto {

std::vector<uint8_t> RandomSource::generate(size_t size) const {
  LOG_TRACE << "Random source: Generating " << size << " bytes";

  std::vector<uint8_t> buffer(size);

  // RAND_bytes takes an int length
  size_t offset = 0;
  while (offset < size) {
    size_t block = std::min<size_t>(size - offset, static_cast<size_t>(INT_MAX));
    if (RAND_bytes(buffer.data() + offset, static_cast<int>(block)) != 1) {
      unsigned long code = ERR_get_error();
      char reason[256] = {0};
      ERR_error_string_n(code, reason, sizeof(reason));
      LOG_ERROR << "Random source: RAND_bytes failed: " << reason;
      throw RandomSourceError(std::string("Failed to generate random bytes: ") + reason);
    }
    offset += block;
  }

  return buffer;
}

} // namespace diskprobe::crypto
