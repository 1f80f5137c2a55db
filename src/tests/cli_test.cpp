#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "cli/cli.hpp"
#include "store/mem_store.hpp"
#include "test_utils.hpp"

using namespace swarm;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  store::MemStore mem_store;
  dpa::DPA archive{chunker::TreeChunker(), mem_store};

  void SetUp() override {
    init_test_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("cli_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string run(const std::string& commands) {
    std::istringstream input(commands);
    std::ostringstream output;
    cli::CLI shell(archive, mem_store, input, output);
    shell.run();
    return output.str();
  }

  std::filesystem::path write_file(const std::string& name, const std::string& content) {
    std::filesystem::path path = test_dir / name;
    std::ofstream(path, std::ios::binary) << content;
    return path;
  }
};

TEST_F(CLITest, StorePrintsRootKey) {
  auto path = write_file("hello.txt", "Hello, Swarm!");
  std::string output = run("store " + path.string() + "\nquit\n");

  chunker::Key expected = archive.store(std::vector<uint8_t>{'H', 'e', 'l', 'l', 'o', ',', ' ',
                                                         'S', 'w', 'a', 'r', 'm', '!'});
  EXPECT_NE(output.find(expected.to_hex()), std::string::npos);
}

TEST_F(CLITest, ReadHasAndSize) {
  const std::string content = "Chunked content for the shell";
  chunker::Key key = archive.store(std::vector<uint8_t>(content.begin(), content.end()));
  const std::string hex = key.to_hex();

  std::string output = run("read " + hex + "\nhas " + hex + "\nsize " + hex + "\n");
  EXPECT_NE(output.find(content), std::string::npos);
  EXPECT_NE(output.find("yes"), std::string::npos);
  EXPECT_NE(output.find(std::to_string(content.size())), std::string::npos);
}

TEST_F(CLITest, ReadToFile) {
  const std::string content = "Written out by the shell";
  chunker::Key key = archive.store(std::vector<uint8_t>(content.begin(), content.end()));
  auto out_path = test_dir / "out.txt";

  std::string output = run("read " + key.to_hex() + " " + out_path.string() + "\n");
  EXPECT_NE(output.find("Wrote " + std::to_string(content.size()) + " bytes"), std::string::npos);

  std::ifstream file(out_path, std::ios::binary);
  std::stringstream written;
  written << file.rdbuf();
  EXPECT_EQ(written.str(), content);
}

TEST_F(CLITest, UnknownKeyReportsMissingChunk) {
  const std::string hex(64, 'a');
  std::string output = run("read " + hex + "\nhas " + hex + "\n");
  EXPECT_NE(output.find("Content incomplete, missing chunk: " + hex), std::string::npos);
  EXPECT_NE(output.find("no"), std::string::npos);
}

TEST_F(CLITest, InvalidInput) {
  std::string output = run("frobnicate now\nstore\nhas xyz\nhelp\n");
  EXPECT_NE(output.find("Unknown command: frobnicate"), std::string::npos);
  EXPECT_NE(output.find("Invalid input"), std::string::npos);
  EXPECT_NE(output.find("Error looking up key"), std::string::npos);
  EXPECT_NE(output.find("Commands:"), std::string::npos);
}

TEST_F(CLITest, MissingFileIsReported) {
  std::string output = run("store " + (test_dir / "nope.bin").string() + "\n");
  EXPECT_NE(output.find("Error storing file"), std::string::npos);
}

TEST_F(CLITest, QuitStopsReading) {
  std::string output = run("quit\nhelp\n");
  EXPECT_EQ(output.find("Commands:"), std::string::npos);
}
