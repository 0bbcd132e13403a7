#include "store/chunk_store.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "crypto/hasher.hpp"
#include "logger/logger.hpp"

namespace diskprobe {
namespace store {

//==============================================
// NAMING HELPERS
//==============================================

std::string chunk_label(size_t index) {
  std::ostringstream ss;
  ss << std::setw(CHUNK_INDEX_WIDTH) << std::setfill('0') << index;
  return ss.str();
}

std::string chunk_filename(size_t index) {
  return "chk_" + chunk_label(index) + ".bin";
}

bool is_out_of_space(const std::error_code& ec) {
  if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
    return false;
  }
#ifdef EDQUOT
  if (ec.value() == EDQUOT) {
    return true;
  }
#endif
  return ec.value() == ENOSPC;
}

void check_directory_accessible(const std::filesystem::path& path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    LOG_DEBUG << "Store: Directory does not exist: " << path.string();
    throw StoreError(path.string() + " is not accessible", ec);
  }
  if (!std::filesystem::is_directory(status)) {
    LOG_DEBUG << "Store: Path exists but is not a directory: " << path.string();
    throw StoreError(path.string() + " is not a directory");
  }
  if (::access(path.c_str(), R_OK | W_OK | X_OK) != 0) {
    std::error_code access_ec(errno, std::generic_category());
    LOG_DEBUG << "Store: Directory is not readable and writable: " << path.string();
    throw StoreError(path.string() + " is not accessible", access_ec);
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

DirectoryChunkStore::DirectoryChunkStore(const std::filesystem::path& base_path)
  : base_path_(base_path) {
  LOG_TRACE << "Store: Initializing chunk store at: " << base_path_.string();
  check_directory_accessible(base_path_);
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::filesystem::path DirectoryChunkStore::chunk_path(size_t index) const {
  return base_path_ / chunk_filename(index);
}

WriteOutcome DirectoryChunkStore::write_chunk(size_t index, const std::vector<uint8_t>& data) {
  std::filesystem::path file_path = chunk_path(index);
  LOG_TRACE << "Store: Writing " << data.size() << " bytes to " << file_path.string();

  int fd = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    std::error_code ec(errno, std::generic_category());
    LOG_TRACE << "Store: Failed to open " << file_path.string() << ": " << ec.message();
    return is_out_of_space(ec) ? WriteOutcome::exhausted(ec) : WriteOutcome::failed(ec);
  }

  std::error_code ec = write_all(fd, data.data(), data.size());

  // Delayed allocation can surface ENOSPC only at close
  if (::close(fd) != 0 && !ec) {
    ec = std::error_code(errno, std::generic_category());
  }

  if (ec) {
    LOG_TRACE << "Store: Failed to write " << file_path.string() << ": " << ec.message();
    if (!is_out_of_space(ec)) {
      return WriteOutcome::failed(ec);
    }
    // Chunks past the exhaustion point stay absent, truncated ones included
    if (::unlink(file_path.c_str()) != 0) {
      LOG_WARN << "Store: Could not remove partial chunk " << file_path.string() << ": "
               << std::error_code(errno, std::generic_category()).message();
    }
    return WriteOutcome::exhausted(ec);
  }

  return WriteOutcome::written();
}

std::string DirectoryChunkStore::digest_chunk(size_t index) const {
  std::filesystem::path file_path = chunk_path(index);
  LOG_TRACE << "Store: Re-reading " << file_path.string();

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Failed to open file: " + file_path.string(),
                     std::error_code(errno, std::generic_category()));
  }

  try {
    return crypto::Sha256Hasher::hash(file);
  } catch (const crypto::DigestError& e) {
    throw StoreError("Failed to read file: " + file_path.string() + " (" + e.what() + ")");
  }
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool DirectoryChunkStore::has(size_t index) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(chunk_path(index), ec);
}

std::uintmax_t DirectoryChunkStore::get_file_size(size_t index) const {
  std::error_code ec;
  auto size = std::filesystem::file_size(chunk_path(index), ec);
  if (ec) {
    throw StoreError("Failed to stat file: " + chunk_path(index).string(), ec);
  }
  return size;
}

//==============================================
// WRITE SUPPORT
//==============================================

std::error_code DirectoryChunkStore::write_all(int fd, const uint8_t* data, size_t length) {
  size_t written = 0;
  while (written < length) {
    ssize_t result = ::write(fd, data + written, length - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::error_code(errno, std::generic_category());
    }
    if (result == 0) {
      // A zero-length write on a regular file means no room was left
      return std::make_error_code(std::errc::no_space_on_device);
    }
    written += static_cast<size_t>(result);
  }
  return {};
}

} // namespace store
} // namespace diskprobe
