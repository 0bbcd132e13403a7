#ifndef DISKPROBE_CRYPTO_ERROR_HPP
#define DISKPROBE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace diskprobe::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class RandomSourceError : public CryptoError {
public:
    explicit RandomSourceError(const std::string& message) 
        : CryptoError("Random source error: " + message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

} // namespace diskprobe::crypto

#endif // DISKPROBE_CRYPTO_ERROR_HPP
