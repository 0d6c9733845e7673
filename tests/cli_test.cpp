#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "in_memory_database.hpp"
#include "test_utils.hpp"

using namespace gridstore;
using gridstore::testing::InMemoryDatabase;

class CLITest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("cli_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);

    database = std::make_shared<InMemoryDatabase>();
    grid_bucket = std::make_unique<bucket::Bucket>(database);
    shell = std::make_unique<cli::CLI>(*grid_bucket, input, output);
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  std::string write_local_file(const std::string& name, const std::string& content) {
    auto path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path.string();
  }

  // Runs one command and returns what it printed
  std::string run(const std::string& line) {
    output.str("");
    EXPECT_TRUE(shell->execute(line));
    return output.str();
  }

  std::string put(const std::string& path) {
    auto printed = run("put " + path);
    auto marker = printed.find(" as ");
    EXPECT_NE(marker, std::string::npos) << printed;
    return printed.substr(marker + 4, 24);
  }

  std::filesystem::path test_dir;
  std::istringstream input;
  std::ostringstream output;
  std::shared_ptr<InMemoryDatabase> database;
  std::unique_ptr<bucket::Bucket> grid_bucket;
  std::unique_ptr<cli::CLI> shell;
};

TEST_F(CLITest, HelpListsCommands) {
  auto printed = run("help");
  for (const char* command : {"put", "get", "cat", "ls", "rm", "mv", "drop", "quit"}) {
    EXPECT_NE(printed.find(command), std::string::npos) << command;
  }
}

TEST_F(CLITest, PutThenCat) {
  auto id = put(write_local_file("hello.txt", "hello grid"));

  EXPECT_EQ(run("cat " + id), "hello grid\n");
}

TEST_F(CLITest, GetWritesLocalCopy) {
  auto id = put(write_local_file("source.bin", "binary payload"));
  const auto target = (test_dir / "copy.bin").string();

  auto printed = run("get " + id + " " + target);
  EXPECT_NE(printed.find("Wrote"), std::string::npos) << printed;

  std::ifstream copy(target, std::ios::binary);
  std::stringstream content;
  content << copy.rdbuf();
  EXPECT_EQ(content.str(), "binary payload");
}

TEST_F(CLITest, ListShowsStoredFiles) {
  put(write_local_file("one.txt", "1"));
  put(write_local_file("two.txt", "22"));

  auto printed = run("ls");
  EXPECT_NE(printed.find("one.txt"), std::string::npos);
  EXPECT_NE(printed.find("two.txt"), std::string::npos);
  EXPECT_NE(printed.find("2 file(s)"), std::string::npos);

  auto filtered = run("ls two.txt");
  EXPECT_EQ(filtered.find("one.txt"), std::string::npos);
  EXPECT_NE(filtered.find("1 file(s)"), std::string::npos);
}

TEST_F(CLITest, RenameAndRemove) {
  auto id = put(write_local_file("old_name.txt", "x"));

  EXPECT_NE(run("mv " + id + " new name.txt").find("Renamed"), std::string::npos);
  EXPECT_NE(run("ls").find("new name.txt"), std::string::npos);

  EXPECT_NE(run("rm " + id).find("File deleted successfully"), std::string::npos);
  EXPECT_NE(run("ls").find("0 file(s)"), std::string::npos);
}

TEST_F(CLITest, ErrorsAreReported) {
  const std::string missing = bsoncxx::oid{}.to_string();

  EXPECT_NE(run("rm " + missing).find("Error deleting file: File not found: " + missing), std::string::npos);
  EXPECT_NE(run("cat nonsense").find("Invalid file id: nonsense"), std::string::npos);
  EXPECT_NE(run("mv " + missing + " other").find("No file with id"), std::string::npos);
  EXPECT_NE(run("put " + (test_dir / "absent").string()).find("Error opening file"), std::string::npos);
  EXPECT_NE(run("frobnicate").find("Unknown command"), std::string::npos);
}

TEST_F(CLITest, DropEmptiesBucket) {
  put(write_local_file("a.txt", "a"));

  EXPECT_NE(run("drop").find("Dropped bucket fs"), std::string::npos);
  EXPECT_FALSE(database->has_collection("fs.files"));
  EXPECT_FALSE(database->has_collection("fs.chunks"));
}

TEST_F(CLITest, RunStopsAtQuit) {
  input.str("help\nquit\nhelp\n");
  shell->run();

  EXPECT_FALSE(shell->execute("quit"));
  EXPECT_FALSE(shell->execute("exit"));
  // Only the help before quit was executed
  std::string printed = output.str();
  auto first = printed.find("Available commands:");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(printed.find("Available commands:", first + 1), std::string::npos);
}

TEST_F(CLITest, GetKeepsStoredNameInsideWorkingDirectory) {
  auto id = put(write_local_file("payload.txt", "contained"));
  grid_bucket->rename(bsoncxx::oid{id}, "../outside/escape.txt");

  const auto work_dir = test_dir / "work";
  std::filesystem::create_directories(work_dir);
  const auto previous = std::filesystem::current_path();
  std::filesystem::current_path(work_dir);
  auto printed = run("get " + id);
  std::filesystem::current_path(previous);

  EXPECT_NE(printed.find("Wrote 9 bytes to escape.txt"), std::string::npos) << printed;
  EXPECT_TRUE(std::filesystem::exists(work_dir / "escape.txt"));
  EXPECT_FALSE(std::filesystem::exists(test_dir / "outside"));
}

TEST(ChunkSizeTest, ParsesInt32Range) {
  std::int32_t chunk_size = 7;

  EXPECT_TRUE(cli::parse_chunk_size("1024", chunk_size));
  EXPECT_EQ(chunk_size, 1024);
  EXPECT_TRUE(cli::parse_chunk_size("2147483647", chunk_size));
  EXPECT_EQ(chunk_size, 2147483647);

  EXPECT_FALSE(cli::parse_chunk_size("5000000000", chunk_size));
  EXPECT_FALSE(cli::parse_chunk_size("2147483648", chunk_size));
  EXPECT_FALSE(cli::parse_chunk_size("12abc", chunk_size));
  EXPECT_FALSE(cli::parse_chunk_size("", chunk_size));
  EXPECT_FALSE(cli::parse_chunk_size("big", chunk_size));
  EXPECT_EQ(chunk_size, 2147483647);
}
