// ---- CRYPTO ----
// DigestContext Documentation
/*
DOCUMENTATION:
CLASS: DigestContext (RAII Wrapper)

VARIABLES:
  . EVP_MD_CTX* ctx
      - OpenSSL message digest context pointer
      - Initialized to nullptr

CONSTRUCTOR:
  . DigestContext()
      - Creates new EVP digest context
      - Throws DigestError if context creation fails

METHODS:
  . ~DigestContext()
      - Destructor that frees the digest context
  . EVP_MD_CTX* get()
      - Returns the underlying digest context pointer
*/

// Sha256Hasher Documentation
/*
DOCUMENTATION:
CLASS: Sha256Hasher

VARIABLES:
. static constexpr size_t HEX_DIGEST_LENGTH = 64
    - Length of the lowercase hex rendering
. static constexpr size_t BUFFER_SIZE = 1 MiB
    - Read size used when hashing an input stream
. std::unique_ptr<DigestContext> context_
    - Digest context, re-initialized after every finalize()

CONSTRUCTOR:
. Sha256Hasher()
    - Creates the context and initializes it with EVP_sha256()
    - Throws DigestError on OpenSSL failure

METHODS:
Public:
  . void update(const uint8_t* data, size_t length)
      - Feeds bytes into the running digest
  . std::string finalize()
      - Returns the lowercase hex digest and resets the hasher
  . static std::string hash(const std::vector<uint8_t>& data)
      - One-shot digest of an in-memory buffer
  . static std::string hash(std::istream& input)
      - Digest of everything remaining in the stream
      - Throws DigestError if the stream goes bad
*/

// RandomSource Documentation
/*
DOCUMENTATION:
CLASS: RandomSource

METHODS:
  . virtual std::vector<uint8_t> generate(size_t size) const
      - Fills a buffer of exactly size bytes with RAND_bytes
      - Calls RAND_bytes in pieces of at most INT_MAX bytes
      - Throws RandomSourceError with the OpenSSL reason on failure
*/

// CryptoError Documentation
/*
DOCUMENTATION:
CLASS: CryptoError
  - Base class for crypto errors, derives from std::runtime_error

CLASS: RandomSourceError
  - Prefixes "Random source error: "

CLASS: DigestError
  - Prefixes "Digest error: "
*/


// ---- LOGGER ----
// Logger Documentation
/*
DOCUMENTATION:
NAMESPACE: diskprobe::logging

TYPES:
. enum class severity_level { trace, debug, info, warning, error, fatal }
. enum class Verbosity { quiet, normal, verbose }
. struct LogConfig
    - verbosity: console threshold (error / info / debug)
    - log_file: optional path for a timestamped file sink at trace

FUNCTIONS:
. void init_logging(const LogConfig& config)
    - Removes all sinks and installs stdout (below error) and stderr
      (error and above) console sinks with plain message formatting
    - Adds a file sink when log_file is set
. void set_log_level(severity_level min_level)
    - Re-filters the console sinks only
. void enable_logging() / void disable_logging()
    - Toggle the Boost.Log core

MACROS:
. LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR, LOG_FATAL
    - Stream into the global severity logger
*/


// ---- STORE ----
// DirectoryChunkStore Documentation
/*
DOCUMENTATION:
CLASS: DirectoryChunkStore : ChunkStorage

VARIABLES:
. std::filesystem::path base_path_
    - Directory the chunk files are written into

CONSTRUCTOR:
. explicit DirectoryChunkStore(const std::filesystem::path& base_path)
    - Does not create the directory
    - Throws StoreError if it is missing, not a directory, or not
      readable and writable

METHODS:
Public:
  Core Storage:
  . std::filesystem::path chunk_path(size_t index) const
      - base_path_ / chk_NNNNN.bin
  . WriteOutcome write_chunk(size_t index, const std::vector<uint8_t>& data)
      - open(O_CREAT | O_TRUNC), full write loop, close()
      - ENOSPC / EDQUOT from open, write or close -> Exhausted
      - Any other errno -> Failed with the error code
      - On Exhausted after open() the partial file is unlinked
  . std::string digest_chunk(size_t index) const
      - Opens the file and hands it to Sha256Hasher::hash(std::istream&)
      - Throws StoreError if the file cannot be opened, or wraps the
        DigestError if reading it fails

  Query Operations:
  . bool has(size_t index) const
  . std::uintmax_t get_file_size(size_t index) const
      - Throws StoreError if the file is missing

Private:
  . static std::error_code write_all(int fd, const uint8_t* data, size_t length)
      - Retries EINTR and short writes
      - A zero-length write is reported as no_space_on_device
*/


// ---- PROBE ----
// WritePhase Documentation
/*
DOCUMENTATION:
CLASS: WritePhase

CONSTRUCTOR:
. WritePhase(ChunkStorage& storage, const RandomSource& random, ProgressReporter& progress)

METHODS:
  . void run(RunState& state)
      - For i in 0..requested-1: generate, write, apply_outcome
      - Progress is started with the requested count and stopped on exit
  . static WriteDecision apply_outcome(RunState&, size_t index, const WriteOutcome&, const std::vector<uint8_t>& data)
      - Written: hashes data (the in-memory buffer), appends ChunkRecord
      - Exhausted: logs the failing index, sets exhausted_at, returns Stop
      - Failed: throws WriteError(index, error code)
*/

// VerifyPhase Documentation
/*
DOCUMENTATION:
CLASS: VerifyPhase

CONSTRUCTOR:
. VerifyPhase(const ChunkStorage& storage, ProgressReporter& progress)

METHODS:
  . void run(RunState& state)
      - For i in 0..files_written()-1: digest_chunk(i) against records[i]
      - Throws ReadError when the chunk cannot be read back
      - Throws VerificationMismatch on the first differing digest
*/

// ProbeRunner Documentation
/*
DOCUMENTATION:
CLASS: ProbeRunner

VARIABLES:
. ProbeConfig config_
    - target_dir, chunk_count, chunk_size, multiplexer_warning
. RunState state_
    - Requested count, chunk size, ChunkRecords, exhausted_at, files_verified

METHODS:
  . RunSummary run()
      - validate() -> optional multiplexer prompt -> write phase ->
        verify phase -> summary lines
      - Only returns when every written chunk verified
*/


// ---- CLI ----
// run_probe Documentation
/*
DOCUMENTATION:
FUNCTION: int run_probe(const ProgramOptions& options, RunServices& services)

PARAMETERS:
. RunServices
    - random, progress and prompt are always supplied by the caller
    - storage may be null, in which case a DirectoryChunkStore is built
      on the configured target directory

BEHAVIOUR:
  . Builds and validates the ProbeConfig, then runs a ProbeRunner
  . Returns 0 when every written chunk verified, complete or partial
  . On any exception: stops the progress bar, logs
    "An error occurred: <what>" at fatal, returns 1
*/
