#ifndef DISKPROBE_PROBE_ERROR_HPP
#define DISKPROBE_PROBE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace diskprobe::probe {

class ProbeError : public std::runtime_error {
public:
    explicit ProbeError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Bad size expression, out-of-range value or unusable target directory.
// Always raised before the first chunk is written.
class ConfigError : public ProbeError {
public:
    explicit ConfigError(const std::string& message) 
        : ProbeError(message) {}
};

// Base for failures tied to one chunk
class ChunkError : public ProbeError {
public:
    ChunkError(size_t index, const std::string& message)
        : ProbeError(message), index_(index) {}

    size_t index() const { return index_; }

private:
    size_t index_;
};

// A write failed for a reason other than the device being full
class WriteError : public ChunkError {
public:
    WriteError(size_t index, const std::string& label, std::error_code ec)
        : ChunkError(index, "Failed to write chunk #" + label + ": " + ec.message())
        , code_(ec) {}

    const std::error_code& code() const { return code_; }

private:
    std::error_code code_;
};

class ReadError : public ChunkError {
public:
    ReadError(size_t index, const std::string& label, const std::string& reason)
        : ChunkError(index, "Failed to read chunk #" + label + ": " + reason) {}
};

// The bytes read back differ from the bytes written
class VerificationMismatch : public ChunkError {
public:
    VerificationMismatch(size_t index, const std::string& label,
                         const std::string& expected, const std::string& actual)
        : ChunkError(index, "Verification failed for chunk #" + label)
        , expected_(expected)
        , actual_(actual) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_ERROR_HPP
