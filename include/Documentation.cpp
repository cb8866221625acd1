// ---- CRYPTO ----
// fingerprint Documentation
/*
DOCUMENTATION:
FUNCTION: fingerprint

SIGNATURE:
  . Fingerprint fingerprint(string_view bytes)
      - MD5 digest of bytes through OpenSSL EVP
      - 16 bytes for any input length
      - Throws FingerprintError if the EVP context cannot be created or driven

HELPERS:
  . string to_hex(const Fingerprint& fp)
      - 32 lowercase hex characters
  . struct FingerprintHash
      - Hash functor for unordered containers keyed by Fingerprint
*/


// ---- STORE ----
// ChunkStore Documentation
/*
DOCUMENTATION:
CLASS: ChunkStore

VARIABLES:
. FingerprintFunction fingerprint_fn_
    - Digest used to key chunks, MD5 unless injected
. unordered_map<Fingerprint, Chunk, FingerprintHash> chunks_
    - Append-only fingerprint -> bytes mapping
. ChunkStoreStats stats_
    - Puts, dedup hits, distinct chunks, stored bytes
. mutable mutex mutex_
    - Makes put a single check-then-insert section

CONSTRUCTOR:
. ChunkStore()
    - Uses crypto::fingerprint
. ChunkStore(FingerprintFunction fingerprint_fn)
    - Throws invalid_argument on an empty function

METHODS:
Public:
  Core Storage Operations:
  . Fingerprint put(string_view bytes, const string& context)
      - Absent fingerprint: stores a copy of bytes
      - Present with equal bytes: dedup hit, nothing stored
      - Present with different bytes: throws CollisionError(fingerprint, context)
  . const Chunk& get(const Fingerprint& fingerprint) const
      - Throws UnknownChunkError if absent
      - Reference stays valid for the lifetime of the store

  Query Operations:
  . bool has(const Fingerprint&) const
  . size_t chunk_count() const
  . uint64_t stored_bytes() const
  . ChunkStoreStats stats() const
  . void for_each_chunk(visitor) const
*/

// FileRegistry Documentation
/*
DOCUMENTATION:
CLASS: FileRegistry

VARIABLES:
. vector<FileEntry> entries_
    - Entries in registration order
. unordered_map<string, size_t> index_
    - Path -> position in entries_
. set<string> reserved_
    - Paths claimed by a chunking still in progress

METHODS:
Public:
  . void reserve_path(const string& path)
      - Throws DuplicatePathError if the path is registered or claimed
  . void release_path(const string& path)
  . void register_file(FileEntry entry)
      - Throws DuplicatePathError if the path exists, fulfils a claim
  . optional<FileEntry> lookup(const string& path) const
  . optional<uint64_t> size_of(const string& path) const
  . bool contains(const string& path) const
  . set<string> list_paths() const
  . size_t file_count() const
  . void for_each_file(visitor) const
      - Visits a snapshot, the visitor may query the registry
      - Registration order
*/

// Reader Documentation
/*
DOCUMENTATION:
CLASS: Reader

CONSTRUCTOR:
. Reader(const ChunkStore&, const FileRegistry&)
    - Holds references only, both must outlive the reader

METHODS:
Public:
  . uint64_t size(const string& path) const
  . bool mem(const string& path) const
  . set<string> list() const
  . vector<string_view> read(const string& path, uint64_t offset, uint64_t length) const
      - Clamps length to the file size, resolves only the chunks the window
        touches, then calls range::read_range
  . string read_all(const string& path) const

  Paths resolve as given or with one leading '/' removed.
  Unknown paths throw PathNotFoundError.
*/


// ---- CHUNKER ----
// FileChunker Documentation
/*
DOCUMENTATION:
CLASS: FileChunker

VARIABLES:
. ChunkStore& chunk_store_
. FileRegistry& registry_
. ChunkerOptions options_
    - sector_size, 4096 by default

METHODS:
Public:
  . FileEntry chunk_file(const string& path, string_view bytes)
      - Windows of sector_size bytes, last one short
      - Empty input gives an entry with no chunks
      - Registers the entry, throws DuplicatePathError before storing anything
  . FileEntry chunk_stream(const string& path, istream& input)
      - Reads input to the end then calls chunk_file
*/


// ---- RANGE ----
// read_range Documentation
/*
DOCUMENTATION:
FUNCTIONS: classify, fold_chunk, read_range, resolve_chunks

STATE:
. RangeState { remaining_offset, chunk_start, remaining_length }
    - Starts at (offset, 0, length)

OVERLAP CLASSES (checked in this order):
. Satisfied        remaining_length == 0
. Before           chunk_end <= remaining_offset
. After            chunk_start >= window_end
. CoversRemainder  chunk_start <= remaining_offset, chunk_end >= window_end
. Suffix           chunk_start <= remaining_offset, chunk_end < window_end
. Inside           chunk_start > remaining_offset, chunk_end <= window_end
. Prefix           chunk_start > remaining_offset, chunk_end > window_end

FOLD STEP:
. chunk_start += chunk length
. remaining_offset += emitted bytes
. remaining_length -= emitted bytes

NOTES:
. window_end saturates at UINT64_MAX
. Never throws, out of range windows give short or empty results
. Fragments are views into the chunk buffers
*/


// ---- WALKER ----
// DirectoryWalker Documentation
/*
DOCUMENTATION:
CLASS: DirectoryWalker

CONSTRUCTOR:
. DirectoryWalker(const string& root, vector<string> extensions = {})
    - Extensions are accepted with or without a leading dot

METHODS:
Public:
  . vector<string> discover() const
      - Sorted, '/'-separated, relative to root
      - Throws WalkError if root is not a directory
  . size_t walk(const Visitor& visitor) const
      - Reads each file in binary mode, returns the number visited
  . bool admits(const path& file) const
      - Files without an extension always pass the filter
*/
