#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "file/chunker.hpp"
#include "file/file.hpp"
#include "test_utils.hpp"

using namespace pmtorrent::file;
using pmtorrent::hasher::Sha256Hasher;

class FileTest : public ::testing::Test {
protected:
  Sha256Hasher hasher;

  void SetUp() override {
    init_test_logging();
  }

  Hash rebuild_root(const Chunk& chunk, const Proof& proof, std::size_t leaf_count) const {
    return root_from_partial(hasher, chunk.data().data(), chunk.size(), chunk.leaf_idx(),
                             leaf_count, proof);
  }
};

TEST_F(FileTest, UniformContentPadsToPowerOfTwo) {
  File file(std::vector<uint8_t>(6144, 0xAB));

  EXPECT_EQ(file.size(), 6u);
  EXPECT_EQ(file.leaf_count(), 8u);

  const auto& nodes = file.tree().nodes();
  ASSERT_EQ(nodes.size(), 15u);
  EXPECT_EQ(nodes[6], FILLER_HASH);
  EXPECT_EQ(nodes[7], FILLER_HASH);

  // Identical chunks share a leaf hash
  for (std::size_t i = 1; i < 6; ++i) {
    EXPECT_EQ(nodes[i], nodes[0]);
  }
  EXPECT_EQ(file.root(), nodes.back());
  EXPECT_EQ(file.trusted_root(), file.root());
}

TEST_F(FileTest, ShortTailChunkReconstructsRoot) {
  File file(std::vector<uint8_t>(6145, 0xAB));
  ASSERT_EQ(file.size(), 7u);

  auto [chunk, proof] = file.get_chunk(6);
  EXPECT_EQ(chunk.size(), 1u);
  EXPECT_EQ(chunk.leaf_idx(), 6u);
  EXPECT_EQ(proof.size(), 3u);
  EXPECT_EQ(rebuild_root(chunk, proof, file.leaf_count()), file.trusted_root());

  // A remote verifier only knows the chunk count
  EXPECT_EQ(rebuild_root(chunk, proof, file.size()), file.trusted_root());
}

TEST_F(FileTest, EveryChunkReconstructsRoot) {
  for (std::size_t size : {1u, 1024u, 1025u, 4096u, 5000u, 9 * 1024u + 3, 33 * 1024u}) {
    File file(make_random_bytes(size, static_cast<uint32_t>(size)));
    for (std::size_t i = 0; i < file.size(); ++i) {
      auto [chunk, proof] = file.get_chunk(i);
      ASSERT_EQ(proof.size(), file.tree().height() - 1);
      EXPECT_EQ(rebuild_root(chunk, proof, file.leaf_count()), file.root())
        << "chunk " << i << " of " << size << " bytes";
      EXPECT_EQ(rebuild_root(chunk, proof, file.size()), file.root())
        << "chunk " << i << " of " << size << " bytes, real count";
    }
  }
}

TEST_F(FileTest, EmptyInputIsRejected) {
  try {
    File file(std::vector<uint8_t>{});
    FAIL() << "Expected FileError";
  } catch (const FileError& e) {
    EXPECT_EQ(e.kind(), FileErrc::File);
    EXPECT_FALSE(e.merkle_code().has_value());
  }

  std::istringstream empty;
  EXPECT_THROW(File::from_stream(empty), FileError);
}

TEST_F(FileTest, ChunkIndexOutOfRange) {
  File file(std::vector<uint8_t>(6144, 1));

  // Filler leaves are not chunks
  for (std::size_t idx : {6u, 7u, 8u, 1000u}) {
    try {
      file.get_chunk(idx);
      ADD_FAILURE() << "Expected FileError for index " << idx;
    } catch (const FileError& e) {
      EXPECT_EQ(e.kind(), FileErrc::File);
    }
  }
}

TEST_F(FileTest, ZeroPaddingIsPartOfTheLeafHash) {
  // A short chunk hashes like its zero-padded form
  std::vector<uint8_t> one{1};
  std::vector<uint8_t> padded(CHUNK_BYTES, 0);
  padded[0] = 1;

  File short_file(one);
  File padded_file(padded);
  EXPECT_EQ(short_file.root(), padded_file.root());

  // but the stored chunk keeps its true length
  EXPECT_EQ(short_file.get_chunk(0).first.size(), 1u);
  EXPECT_EQ(padded_file.get_chunk(0).first.size(), CHUNK_BYTES);

  EXPECT_EQ(digest_chunk(hasher, one.data(), one.size()),
            hasher.digest(padded.data(), padded.size()));
}

TEST_F(FileTest, SingleChunkFile) {
  File file(std::string("hello"));
  EXPECT_EQ(file.size(), 1u);
  EXPECT_EQ(file.leaf_count(), 1u);
  EXPECT_EQ(file.tree().size(), 1u);

  auto [chunk, proof] = file.get_chunk(0);
  EXPECT_TRUE(proof.empty());
  EXPECT_EQ(file.root(), digest_chunk(hasher, chunk.data().data(), chunk.size()));
}

TEST_F(FileTest, FullChunksHashAsRawLeaves) {
  // With no short tail, zero padding never applies
  auto data = make_random_bytes(4 * CHUNK_BYTES, 9);
  auto chunks = Chunker().split(data);
  auto tree = ChunkTree::build(hasher, chunks, pmtorrent::merkle::LeafPolicy::Padded);

  EXPECT_EQ(tree.root(), File(data).root());
}

TEST_F(FileTest, StreamMatchesBuffer) {
  auto data = make_random_bytes(20000, 11);
  std::istringstream input(std::string(data.begin(), data.end()));

  File from_stream = File::from_stream(input);
  File from_buffer(data);
  EXPECT_EQ(from_stream.root(), from_buffer.root());
  EXPECT_EQ(from_stream.size(), from_buffer.size());
}

TEST_F(FileTest, DifferentContentDifferentRoot) {
  auto data = make_random_bytes(4096);
  File original(data);
  data[4000] ^= 0x01;
  File changed(data);
  EXPECT_NE(original.root(), changed.root());
}

TEST_F(FileTest, VerifyPiece) {
  File file(make_random_bytes(7 * 1024 + 100));
  const Hash trusted = file.trusted_root();

  for (std::size_t i = 0; i < file.size(); ++i) {
    auto [chunk, proof] = file.get_chunk(i);
    EXPECT_TRUE(verify_piece(trusted, Piece{chunk, proof}, file.size())) << "piece " << i;
  }
}

TEST_F(FileTest, VerifyPieceRejectsTampering) {
  File file(make_random_bytes(5 * 1024));
  const Hash trusted = file.trusted_root();
  auto [chunk, proof] = file.get_chunk(2);

  // Altered content
  std::vector<uint8_t> bytes = chunk.data();
  bytes[10] ^= 0xFF;
  EXPECT_FALSE(verify_piece(trusted, Piece{Chunk(bytes, 2), proof}, file.size()));

  // Content claimed at another position
  EXPECT_FALSE(verify_piece(trusted, Piece{Chunk(chunk.data(), 3), proof}, file.size()));

  // Altered proof
  Proof forged = proof;
  forged[1] = FILLER_HASH;
  EXPECT_FALSE(verify_piece(trusted, Piece{chunk, forged}, file.size()));

  // Wrong root
  EXPECT_FALSE(verify_piece(File(std::string("other")).root(), Piece{chunk, proof}, file.size()));
}

TEST_F(FileTest, VerifyPieceTreatsMalformedProofAsMismatch) {
  File file(make_random_bytes(4 * 1024));
  auto [chunk, proof] = file.get_chunk(1);

  Proof truncated(proof.begin(), proof.end() - 1);
  EXPECT_FALSE(verify_piece(file.root(), Piece{chunk, truncated}, file.size()));

  // Chunk index beyond the declared piece count
  EXPECT_FALSE(verify_piece(file.root(), Piece{Chunk(chunk.data(), 9), proof}, file.size()));
}
