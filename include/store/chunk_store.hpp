#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace diskprobe {
namespace store {

// Result of a single chunk write
enum class WriteStatus {
  Written,
  Exhausted,   // device reported it is out of space
  Failed       // any other failure, see WriteOutcome::error
};

struct WriteOutcome {
  WriteStatus status = WriteStatus::Written;
  std::error_code error;

  static WriteOutcome written() { return {WriteStatus::Written, {}}; }
  static WriteOutcome exhausted(std::error_code ec) { return {WriteStatus::Exhausted, ec}; }
  static WriteOutcome failed(std::error_code ec) { return {WriteStatus::Failed, ec}; }
};

// Width of the zero-padded index in a chunk filename
constexpr size_t CHUNK_INDEX_WIDTH = 5;
// First index whose name would no longer sort in index order
constexpr size_t MAX_CHUNK_COUNT = 100000;

// chk_00007.bin
std::string chunk_filename(size_t index);
// 00007, as used in log lines
std::string chunk_label(size_t index);

// True for the errno values that mean "the device is full"
bool is_out_of_space(const std::error_code& ec);

// Storage the probe writes chunks into and re-reads them from.
class ChunkStorage {
public:
  virtual ~ChunkStorage() = default;

  virtual std::filesystem::path chunk_path(size_t index) const = 0;
  // Creates or truncates the chunk file and writes the whole buffer.
  // A chunk the device ran out of room for is not left on disk.
  virtual WriteOutcome write_chunk(size_t index, const std::vector<uint8_t>& data) = 0;
  // Re-reads the chunk file from disk and returns its SHA-256 hex digest
  virtual std::string digest_chunk(size_t index) const = 0;
};

class DirectoryChunkStore : public ChunkStorage {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The directory must already exist and be readable and writable
  explicit DirectoryChunkStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  std::filesystem::path chunk_path(size_t index) const override;
  WriteOutcome write_chunk(size_t index, const std::vector<uint8_t>& data) override;
  std::string digest_chunk(size_t index) const override;


  // ---- QUERY OPERATIONS ----
  bool has(size_t index) const;
  std::uintmax_t get_file_size(size_t index) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Directory the chunk files live in
  std::filesystem::path base_path_;


  // ---- WRITE SUPPORT ----
  // Writes every byte, retrying short writes and EINTR
  static std::error_code write_all(int fd, const uint8_t* data, size_t length);
};

// Throws StoreError unless path is an existing, accessible directory
void check_directory_accessible(const std::filesystem::path& path);

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message, std::error_code ec = {})
    : std::runtime_error(ec ? message + ": " + ec.message() : message)
    , code_(ec) {}

  const std::error_code& code() const { return code_; }

private:
  std::error_code code_;
};

} // namespace store
} // namespace diskprobe
