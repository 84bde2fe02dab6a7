#include <gtest/gtest.h>
#include <sstream>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace memblob;

class CLITest : public ::testing::Test {
protected:
  std::unique_ptr<store::BlobStore> store;
  std::istringstream input;
  std::ostringstream output;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    store = make_store(std::make_shared<ManualClock>());
    shell = std::make_unique<cli::CLI>(*store, input, output);
  }

  std::string run(const std::string& line) {
    output.str("");
    EXPECT_TRUE(shell->execute(line));
    return output.str();
  }
};

TEST_F(CLITest, ContainerCommands) {
  EXPECT_NE(run("mkc photos eu").find("Created container photos"), std::string::npos);
  EXPECT_NE(run("mkc photos").find("already exists"), std::string::npos);
  EXPECT_NE(run("lsc").find("photos (eu)"), std::string::npos);

  run("put photos a.jpg bytes");
  EXPECT_NE(run("rmc photos --if-empty").find("not empty"), std::string::npos);
  run("rmc photos");
  EXPECT_FALSE(store->container_exists("photos"));
}

TEST_F(CLITest, PutGetAndRanges) {
  run("mkc c");
  EXPECT_NE(run("put c note hello world").find("etag"), std::string::npos);
  EXPECT_EQ(run("get c note"), "hello world\n");
  EXPECT_EQ(run("get c note 0-4"), "hello\n");
  EXPECT_NE(run("get c missing").find("Not found"), std::string::npos);
  EXPECT_NE(run("head c note").find("ETag"), std::string::npos);

  run("rm c note");
  EXPECT_FALSE(store->blob_exists("c", "note"));
}

TEST_F(CLITest, ListingCommand) {
  run("mkc c");
  run("put c a x");
  run("put c a/b x");
  run("put c a/c/d x");

  std::string flat = run("ls c");
  EXPECT_NE(flat.find("[BLOB] a\n"), std::string::npos);
  EXPECT_NE(flat.find("[DIR]  a/\n"), std::string::npos);

  std::string deep = run("ls c -r");
  EXPECT_NE(deep.find("a/c/d"), std::string::npos);
}

TEST_F(CLITest, ErrorsAreReportedNotThrown) {
  EXPECT_NE(run("get ghost key").find("Error 404"), std::string::npos);
  run("mkc c");
  run("put c k v");
  EXPECT_NE(run("get c k 9-1").find("Error 400"), std::string::npos);
  EXPECT_NE(run("frobnicate").find("Unknown command"), std::string::npos);
  EXPECT_NE(run("put c").find("Usage"), std::string::npos);
}

TEST_F(CLITest, RunStopsOnQuit) {
  input.str("mkc c\nquit\nmkc never\n");
  shell->run();
  EXPECT_TRUE(store->container_exists("c"));
  EXPECT_FALSE(store->container_exists("never"));
  EXPECT_FALSE(shell->execute("quit"));
}
