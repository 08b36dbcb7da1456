#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace pmtorrent;

class CLITest : public ::testing::Test {
protected:
  repo::Repository repository;

  void SetUp() override {
    init_test_logging();
  }

  // Runs the shell over script and returns everything it printed
  std::string run_script(const std::string& script) {
    std::istringstream in(script);
    std::ostringstream out;
    cli::CLI shell(repository, in, out);
    shell.run();
    return out.str();
  }

  static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
  }
};

TEST_F(CLITest, HelpListsCommands) {
  std::string out = run_script("help\nquit\n");
  EXPECT_TRUE(contains(out, "Available commands:"));
  EXPECT_TRUE(contains(out, "piece <hash> <idx>"));
  EXPECT_TRUE(contains(out, "verify <hash> <idx>"));
}

TEST_F(CLITest, EmptyRepository) {
  EXPECT_TRUE(contains(run_script("ls\nquit\n"), "No files published"));
}

TEST_F(CLITest, ListShowsPieceCounts) {
  file::File file(make_random_bytes(2500));
  std::string hash = file.root().to_hex();
  repository.add(file);

  EXPECT_TRUE(contains(run_script("ls\n"), hash + "  3 pieces"));
}

TEST_F(CLITest, PieceCommandPrintsProof) {
  file::File file(make_random_bytes(4 * 1024 + 10));
  std::string hash = file.root().to_hex();
  repository.add(file);

  std::string out = run_script("piece " + hash + " 4\nquit\n");
  EXPECT_TRUE(contains(out, "Piece 4: 10 bytes"));

  auto proof = file.get_chunk(4).second;
  ASSERT_EQ(proof.size(), 3u);
  for (const auto& h : proof) {
    EXPECT_TRUE(contains(out, "  " + h.to_hex()));
  }
}

TEST_F(CLITest, VerifyCommand) {
  file::File file(make_random_bytes(3 * 1024));
  std::string hash = file.root().to_hex();
  repository.add(file);

  std::string out = run_script("verify " + hash + " 0\nverify " + hash + " 2\nquit\n");
  std::size_t first = out.find("OK");
  ASSERT_NE(first, std::string::npos);
  EXPECT_NE(out.find("OK", first + 2), std::string::npos);
  EXPECT_FALSE(contains(out, "MISMATCH"));
}

TEST_F(CLITest, ReportsErrors) {
  file::File file(std::string("tiny"));
  std::string hash = file.root().to_hex();
  repository.add(file);

  std::string out = run_script(
    "piece " + hash + " 1\n"
    "piece " + std::string(64, 'f') + " 0\n"
    "verify " + hash + " -1\n"
    "frobnicate\n"
    "piece " + hash + "\n"
    "quit\n");

  EXPECT_TRUE(contains(out, "Error fetching piece: Repository: No piece 1"));
  EXPECT_TRUE(contains(out, "Error fetching piece: Repository: No file with hash"));
  EXPECT_TRUE(contains(out, "Invalid piece index: -1"));
  EXPECT_TRUE(contains(out, "Unknown command or invalid arguments"));
}

TEST_F(CLITest, AddCommand) {
  auto dir = std::filesystem::temp_directory_path() / "pmtorrent_cli_test";
  std::filesystem::create_directories(dir);
  auto path = (dir / "input.txt").string();
  {
    std::ofstream out(path, std::ios::binary);
    out << "published through the shell";
  }

  std::string out = run_script("add " + path + "\nadd " + (dir / "nope").string() + "\nls\nquit\n");
  std::filesystem::remove_all(dir);

  std::string hash = file::File(std::string("published through the shell")).root().to_hex();
  EXPECT_TRUE(contains(out, "Added " + path + " as " + hash));
  EXPECT_TRUE(contains(out, "Error adding file"));
  EXPECT_TRUE(contains(out, hash + "  1 pieces"));
  EXPECT_EQ(repository.size(), 1u);
}

TEST_F(CLITest, QuitStopsProcessing) {
  std::string out = run_script("quit\nls\n");
  EXPECT_FALSE(contains(out, "No files published"));
}
