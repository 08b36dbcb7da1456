// ---- HASHER ----
// Digest Documentation
/*
DOCUMENTATION:
CLASS: Digest<N>

VARIABLES:
  . static constexpr size_t SIZE = N
      - Width of the digest in bytes
  . array<uint8_t, N> bytes_
      - Raw digest bytes, all zero when default constructed

CONSTRUCTOR:
  . constexpr Digest()
      - Creates the all-zero digest (used as the filler leaf hash)
  . explicit Digest(const array<uint8_t, N>& bytes)
      - Wraps bytes produced by a hasher

METHODS:
  . static Digest from_hex(const string& hex)
      - Parses exactly 2*N hex characters, either case
      - Throws HasherError on bad length or characters
  . string to_hex() const
      - Lowercase hex rendering, used as a catalog key
  . bool is_zero() const
  . const uint8_t* data() const / size_t size() const / bytes()
  . operator==, operator!=, operator<<
*/

// Sha256Hasher Documentation
/*
DOCUMENTATION:
CLASS: Sha256Hasher

VARIABLES:
  . using hash_type = Digest<32>

CONSTRUCTOR:
  . Sha256Hasher() (stateless)

METHODS:
  . hash_type digest(const uint8_t* data, size_t size) const
      - One-shot SHA-256 over data with OpenSSL EVP_Digest
      - Throws HasherError if any OpenSSL call fails
*/

// ---- MERKLE ----
// MerkleTree Documentation
/*
DOCUMENTATION:
CLASS: MerkleTree<Hasher>

VARIABLES:
  . vector<hash_type> nodes_
      - Leaves first, then each parent level, root last
      - 2L - 1 entries for L leaves

CONSTRUCTOR:
  . private MerkleTree(vector<hash_type> nodes)
      - Only reachable through build() and from_leaf_hashes()

METHODS:
Public:
  Construction:
  . static MerkleTree build(hasher, leaves, policy)
      - Digests each leaf over leaf_bytes(leaf)
  . static MerkleTree build(hasher, leaves, policy, digest_leaf)
      - Same with a caller-supplied leaf digest
  . static MerkleTree from_leaf_hashes(hasher, level, policy)
      - Strict: throws MerkleError(LeafCount) unless count is a power of two
      - Padded: appends zero hashes up to next_pow2(count)
      - Throws MerkleError(LeafCount) for zero leaves under either policy

  Navigation:
  . pair<hash_type, size_t> sibling_of(size_t idx) const
      - Throws MerkleError(InvalidIdx) for the root or a missing node
  . pair<hash_type, size_t> parent_of(size_t idx) const
      - Throws MerkleError(InvalidIdx) for the root or a missing node
  . Proof get_proof(size_t leaf_idx) const
      - height - 1 sibling hashes, bottom up
      - Throws MerkleError(InvalidIdx) when leaf_idx >= leaf_count()

FREE FUNCTIONS:
  . root_from_leaf_hash(hasher, leaf_hash, leaf_idx, leaf_count, proof)
      - Folds proof over leaf_hash; even index = left operand
      - leaf_count is rounded up with next_pow2, so the real count works
      - Throws MerkleError(InvalidIdx) for a zero count, bad index or proof length
  . root_from_partial(hasher, leaf, leaf_idx, leaf_count, proof)
*/

// ---- FILE ----
// ChunkAssembler Documentation
/*
DOCUMENTATION:
CLASS: ChunkAssembler

VARIABLES:
  . size_t chunk_size_
  . vector<uint8_t> buffer_
      - Bytes of the chunk being filled
  . size_t next_idx_
      - Index given to the next emitted chunk
  . bool finished_

CONSTRUCTOR:
  . explicit ChunkAssembler(size_t chunk_size = CHUNK_BYTES)
      - Throws FileError if chunk_size is 0

METHODS:
  . vector<Chunk> ingest(const uint8_t* data, size_t size)
      - Fragments of any length; returns chunks they completed
      - Throws logic_error after finish()
  . optional<Chunk> finish()
      - Emits the short tail, if any
*/

// File Documentation
/*
DOCUMENTATION:
CLASS: File

VARIABLES:
  . vector<Chunk> chunks_
      - Real chunks only, last one may be short
  . ChunkTree tree_
      - Padded SHA-256 tree over zero-padded chunk digests

CONSTRUCTOR:
  . explicit File(const vector<uint8_t>& data)
  . explicit File(const string& data)
  . static File from_stream(istream& input)
      - All throw FileError(File) for empty input

METHODS:
  . const Hash& root() const / Hash trusted_root() const
  . size_t size() const
      - Number of real chunks
  . size_t leaf_count() const
      - next_pow2(size())
  . pair<Chunk, Proof> get_chunk(size_t idx) const
      - Throws FileError(File) when idx >= size()
      - Wraps MerkleError as FileError(Merkle)

FREE FUNCTIONS:
  . bool verify_piece(const Hash& trusted_root, const Piece& piece, size_t piece_count)
      - False on any mismatch, including a malformed proof
*/

// ---- REPO ----
// Repository Documentation
/*
DOCUMENTATION:
CLASS: Repository

VARIABLES:
  . unordered_map<string, File> files_
      - Keyed by lowercase hex root

METHODS:
  . void add(File file)
  . string add_from_path(const string& path)
      - Throws RepoError(File) if the path cannot be opened or holds no data
  . vector<FileDescription> list() const
  . Piece get_piece(const string& hash, size_t idx) const
      - Throws RepoError(DoesntExist) for an unknown hash or index
  . bool contains(const string& hash) const
  . const File* find(const string& hash) const

EXCEPTIONS:
. RepoError
    - kind() is RepoErrc::DoesntExist or RepoErrc::File
*/

// ---- CLI ----
// CLI Documentation
/*
DOCUMENTATION:
CLASS: CLI

VARIABLES:
  . Repository& repository_
  . istream& in_ / ostream& out_
      - Default to cin and cout
  . bool running_

METHODS:
  . void run()
      - Reads commands until "quit" or end of input
  . help, ls, add <path>, piece <hash> <idx>, verify <hash> <idx>, quit
*/
