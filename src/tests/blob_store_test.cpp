#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include "store/blob_store.hpp"
#include "store/store_error.hpp"
#include "test_utils.hpp"

using namespace memblob::store;
using memblob::content::BytesPayload;
using memblob::content::StreamPayload;

class BlobStoreTest : public ::testing::Test {
protected:
  std::shared_ptr<ManualClock> clock;
  std::unique_ptr<BlobStore> store;

  void SetUp() override {
    clock = std::make_shared<ManualClock>();
    store = make_store(clock);
    ASSERT_NE(store, nullptr);
  }

  // Helper methods to reduce repetition
  void put_and_verify(const std::string& container, const std::string& key, const std::string& data) {
    std::string etag;
    ASSERT_NO_THROW(etag = store->put_blob(container, key, data)) << "Failed to store key: " << key;
    ASSERT_TRUE(store->blob_exists(container, key)) << "Key should exist after storing: " << key;

    auto blob = store->get_blob(container, key);
    ASSERT_TRUE(blob.has_value()) << "Failed to retrieve key: " << key;
    ASSERT_EQ(blob->payload_string(), data) << "Data mismatch for key: " << key;
    ASSERT_EQ(blob->metadata().etag, etag);
  }
};

//==============================================
// CONTAINER OPERATIONS
//==============================================

TEST_F(BlobStoreTest, CreateContainerOnlyOnce) {
  EXPECT_TRUE(store->create_container("photos", "eu-west"));
  EXPECT_FALSE(store->create_container("photos", "us-east"));
  EXPECT_TRUE(store->container_exists("photos"));
  EXPECT_EQ(store->container_location("photos"), "eu-west");
}

TEST_F(BlobStoreTest, CreateContainerUsesDefaultLocation) {
  EXPECT_TRUE(store->create_container("logs"));
  EXPECT_TRUE(store->create_container("tmp", ""));
  EXPECT_EQ(store->container_location("logs"), "default");
  EXPECT_EQ(store->container_location("tmp"), "default");
  EXPECT_FALSE(store->container_location("missing").has_value());
}

TEST_F(BlobStoreTest, PublicReadIsUnsupported) {
  CreateContainerOptions options;
  options.public_read = true;
  EXPECT_THROW(store->create_container("public", "default", options), InvalidArgumentError);
  EXPECT_FALSE(store->container_exists("public"));

  EXPECT_TRUE(store->create_container("private", "default", CreateContainerOptions{}));
}

TEST_F(BlobStoreTest, ListContainersCarriesLocation) {
  store->create_container("b", "loc-b");
  store->create_container("a", "loc-a");

  Page page = store->list_containers();
  ASSERT_EQ(page.size(), 2u);
  EXPECT_FALSE(page.next_marker.has_value());
  EXPECT_EQ(page.entries[0].name, "a");
  EXPECT_EQ(page.entries[0].type, StorageType::CONTAINER);
  EXPECT_EQ(page.entries[0].location, "loc-a");
  EXPECT_EQ(page.entries[1].name, "b");
  EXPECT_EQ(page.entries[1].location, "loc-b");
}

TEST_F(BlobStoreTest, DeleteContainerIsIdempotent) {
  EXPECT_NO_THROW(store->delete_container("never-created"));

  store->create_container("c");
  store->put_blob("c", "k", "v");
  store->delete_container("c");
  EXPECT_FALSE(store->container_exists("c"));
  EXPECT_NO_THROW(store->delete_container("c"));

  // Recreating starts empty
  store->create_container("c");
  EXPECT_FALSE(store->blob_exists("c", "k"));
}

TEST_F(BlobStoreTest, DeleteContainerIfEmpty) {
  EXPECT_TRUE(store->delete_container_if_empty("absent"));

  store->create_container("full");
  store->put_blob("full", "k", "v");
  EXPECT_FALSE(store->delete_container_if_empty("full"));
  EXPECT_TRUE(store->container_exists("full"));
  EXPECT_TRUE(store->blob_exists("full", "k"));

  store->delete_blob("full", "k");
  EXPECT_TRUE(store->delete_container_if_empty("full"));
  EXPECT_FALSE(store->container_exists("full"));
}

TEST_F(BlobStoreTest, SeedContainersFromConfig) {
  memblob::config::StoreConfig config;
  config.default_location = "rack-1";
  config.seed_containers = {"stub", "inbox"};
  auto seeded = make_store(clock, config);

  EXPECT_TRUE(seeded->container_exists("stub"));
  EXPECT_TRUE(seeded->container_exists("inbox"));
  EXPECT_EQ(seeded->container_location("stub"), "rack-1");
  EXPECT_FALSE(store->container_exists("stub"));
}

//==============================================
// BLOB OPERATIONS
//==============================================

TEST_F(BlobStoreTest, BasicOperations) {
  store->create_container("c");

  put_and_verify("c", "test_key", "Hello, Store!");
  put_and_verify("c", "empty_key", "");

  EXPECT_EQ(store->get_blob("c", "test_key")->metadata().etag, "a59d7881839bcf86d703345127f6a577");
  EXPECT_FALSE(store->get_blob("c", "nonexistent_key").has_value());
}

TEST_F(BlobStoreTest, MissingContainerVersusMissingKey) {
  EXPECT_THROW(store->put_blob("nope", "k", "v"), ContainerNotFoundError);
  EXPECT_THROW(store->get_blob("nope", "k"), ContainerNotFoundError);
  EXPECT_THROW(store->blob_metadata("nope", "k"), ContainerNotFoundError);
  EXPECT_THROW(store->clear_container("nope"), ContainerNotFoundError);
  EXPECT_THROW(store->count_blobs("nope"), ContainerNotFoundError);
  EXPECT_FALSE(store->blob_exists("nope", "k"));
  EXPECT_NO_THROW(store->delete_blob("nope", "k"));

  store->create_container("c");
  EXPECT_FALSE(store->get_blob("c", "k").has_value());
  EXPECT_FALSE(store->blob_metadata("c", "k").has_value());
  EXPECT_NO_THROW(store->delete_blob("c", "k"));
}

TEST_F(BlobStoreTest, ContainerNotFoundCarriesName) {
  store->create_container("real");
  try {
    store->get_blob("ghost", "k");
    FAIL() << "expected ContainerNotFoundError";
  } catch (const ContainerNotFoundError& e) {
    EXPECT_EQ(e.container(), "ghost");
    EXPECT_EQ(e.code(), ErrorCode::CONTAINER_NOT_FOUND);
    EXPECT_NE(std::string(e.what()).find("real"), std::string::npos);
    EXPECT_EQ(error_code_to_status(e.code()), 404);
  }
}

TEST_F(BlobStoreTest, OverwriteReplacesPayloadAndMetadata) {
  store->create_container("c");
  store->put_blob("c", "k", "first", "text/plain", {{"Version", "1"}, {"Owner", "ann"}});
  auto before = store->get_blob("c", "k");
  ASSERT_TRUE(before.has_value());

  clock->advance(std::chrono::seconds(60));
  std::string etag = store->put_blob("c", "k", "second version", "", {{"Version", "2"}});
  auto after = store->get_blob("c", "k");
  ASSERT_TRUE(after.has_value());

  EXPECT_EQ(after->payload_string(), "second version");
  EXPECT_EQ(after->metadata().etag, etag);
  EXPECT_NE(after->metadata().etag, before->metadata().etag);
  EXPECT_EQ(after->metadata().last_modified, before->metadata().last_modified + std::chrono::seconds(60));
  EXPECT_EQ(after->metadata().content.content_type, DEFAULT_CONTENT_TYPE);
  EXPECT_EQ(after->metadata().user_metadata.size(), 1u);
  EXPECT_EQ(after->metadata().user_metadata.at("version"), "2");
  EXPECT_EQ(after->metadata().content.content_length, 14u);
}

TEST_F(BlobStoreTest, ReturnedBlobIsIndependentCopy) {
  store->create_container("c");
  store->put_blob("c", "k", "payload", "", {{"tag", "original"}});

  auto blob = store->get_blob("c", "k");
  ASSERT_TRUE(blob.has_value());
  blob->metadata().user_metadata["tag"] = "changed";
  blob->metadata().etag = "forged";
  blob->set_payload(Bytes{'x'});

  auto again = store->get_blob("c", "k");
  EXPECT_EQ(again->metadata().user_metadata.at("tag"), "original");
  EXPECT_EQ(again->metadata().etag, "321c3cf486ed509164edec1e1981fec8");
  EXPECT_EQ(again->payload_string(), "payload");
}

TEST_F(BlobStoreTest, BlobMetadataWithoutPayload) {
  store->create_container("c");
  store->put_blob("c", "doc.txt", "hello", "text/plain", {{"Lang", "en"}});

  auto metadata = store->blob_metadata("c", "doc.txt");
  ASSERT_TRUE(metadata.has_value());
  EXPECT_EQ(metadata->name, "doc.txt");
  EXPECT_EQ(metadata->container, "c");
  EXPECT_EQ(metadata->etag, "5d41402abc4b2a76b9719d911017c592");
  EXPECT_EQ(metadata->uri, "mem://c/doc.txt");
  EXPECT_EQ(metadata->content.content_type, "text/plain");
  EXPECT_EQ(metadata->user_metadata.at("lang"), "en");
  EXPECT_EQ(metadata->last_modified, clock->now());
}

TEST_F(BlobStoreTest, StreamAndBytePayloads) {
  store->create_container("c");

  std::stringstream input("streamed content");
  StreamPayload stream(input);
  store->put_blob("c", "stream", stream);
  EXPECT_EQ(store->get_blob("c", "stream")->payload_string(), "streamed content");

  BytesPayload bytes(Bytes{0x00, 0xff, 0x10});
  store->put_blob("c", "binary", bytes, "application/x-raw");
  auto blob = store->get_blob("c", "binary");
  EXPECT_EQ(blob->payload(), (Bytes{0x00, 0xff, 0x10}));
  EXPECT_EQ(blob->metadata().content.content_type, "application/x-raw");
}

TEST_F(BlobStoreTest, RemoveAndClear) {
  store->create_container("c");
  for (int i = 0; i < 5; ++i) {
    store->put_blob("c", "key" + std::to_string(i), "data");
  }
  EXPECT_EQ(store->count_blobs("c"), 5u);

  store->delete_blob("c", "key0");
  EXPECT_FALSE(store->blob_exists("c", "key0"));
  EXPECT_EQ(store->count_blobs("c"), 4u);

  store->clear_container("c");
  EXPECT_EQ(store->count_blobs("c"), 0u);
  EXPECT_TRUE(store->container_exists("c"));
  EXPECT_TRUE(store->list_blobs("c").empty());
}

TEST_F(BlobStoreTest, EdgeCaseKeys) {
  store->create_container("c");
  const std::vector<std::string> keys = {
    "",
    "../path/traversal",
    std::string(1024, 'a'),
    "/absolute/path",
    "\\windows\\path",
    "unicode/\xc3\xa9t\xc3\xa9"
  };

  for (const auto& key : keys) {
    put_and_verify("c", key, "Test data");
  }
  EXPECT_EQ(store->count_blobs("c"), keys.size());
}

TEST_F(BlobStoreTest, LargePayloadRoundTrip) {
  store->create_container("c");
  const std::string large(1024 * 1024, 'X');
  put_and_verify("c", "large", large);
  EXPECT_EQ(store->blob_metadata("c", "large")->content.content_length, large.size());
}

TEST(ContainerTest, NullBlobIsAnInvariantViolation) {
  Container container("c", "default");
  EXPECT_THROW(container.put(nullptr), InternalInvariantError);
  EXPECT_EQ(container.size(), 0u);
}

TEST(StoreErrorTest, StatusCodes) {
  EXPECT_EQ(error_code_to_status(ErrorCode::CONTAINER_NOT_FOUND), 404);
  EXPECT_EQ(error_code_to_status(ErrorCode::PRECONDITION_FAILED), 412);
  EXPECT_EQ(error_code_to_status(ErrorCode::NOT_MODIFIED), 304);
  EXPECT_EQ(error_code_to_status(ErrorCode::INVALID_ARGUMENT), 400);
  EXPECT_EQ(error_code_to_status(ErrorCode::INTERNAL_INVARIANT), 500);

  InternalInvariantError error("missing entry");
  EXPECT_EQ(error.code(), ErrorCode::INTERNAL_INVARIANT);
  EXPECT_NE(std::string(error.what()).find("missing entry"), std::string::npos);
}

class BlobRepositoryTest : public ::testing::Test {
protected:
  ContainerRegistry registry;
  memblob::content::ContentPipeline pipeline{
    std::make_shared<ManualClock>(),
    std::make_shared<memblob::content::Md5HashProvider>(),
    std::make_shared<memblob::content::SchemeLocatorBuilder>()};
  BlobRepository repository{registry, pipeline};

  void SetUp() override {
    registry.create_container("c", "default");
  }
};

TEST_F(BlobRepositoryTest, GetBlobReturnsIndependentCopyOrAbsent) {
  BytesPayload payload(std::string("hello"));
  repository.put_blob("c", "k", payload, "", {{"Tag", "v1"}});

  std::optional<Blob> copy = repository.get_blob("c", "k");
  ASSERT_TRUE(copy.has_value());
  EXPECT_EQ(copy->payload_string(), "hello");
  EXPECT_EQ(copy->metadata().etag, "5d41402abc4b2a76b9719d911017c592");
  EXPECT_EQ(copy->metadata().uri, "mem://c/k");

  copy->metadata().user_metadata["tag"] = "changed";
  copy->set_payload(Bytes{'x'});
  std::shared_ptr<const Blob> stored = repository.find_blob("c", "k");
  ASSERT_NE(stored, nullptr);
  EXPECT_EQ(stored->metadata().user_metadata.at("tag"), "v1");
  EXPECT_EQ(stored->payload_string(), "hello");

  EXPECT_FALSE(repository.get_blob("c", "missing").has_value());
  EXPECT_THROW(repository.get_blob("ghost", "k"), ContainerNotFoundError);
}
