#ifndef MEMBLOB_STORE_TYPES_HPP
#define MEMBLOB_STORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memblob::store {

using Bytes = std::vector<uint8_t>;
using Timestamp = std::chrono::system_clock::time_point;
// Keys are lowercase once stored
using UserMetadata = std::map<std::string, std::string>;
using Headers = std::multimap<std::string, std::string>;

constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Kind of entry in a listing
enum class StorageType {
  CONTAINER,
  BLOB,
  RELATIVE_PATH
};

std::string to_string(StorageType type);

// Content headers that travel with a payload
struct ContentMetadata {
  uint64_t content_length = 0;
  Bytes content_md5;
  std::string content_type;
  std::string content_disposition;
  std::string content_encoding;
  std::string content_language;
};

struct BlobMetadata {
  std::string name;
  std::string container;
  std::string etag;
  Timestamp last_modified;
  std::string uri;
  UserMetadata user_metadata;
  ContentMetadata content;

  // Independent copy; nothing is shared with the source
  BlobMetadata clone() const;
};

class Blob {
public:
  Blob(BlobMetadata metadata, std::shared_ptr<const Bytes> payload);


  // ---- GETTERS AND SETTERS ----
  const BlobMetadata& metadata() const { return metadata_; }
  BlobMetadata& metadata() { return metadata_; }

  const Bytes& payload() const { return *payload_; }
  std::string payload_string() const;

  // Replaces the payload and keeps content_length in step with it
  void set_payload(Bytes payload);


  // ---- COPY AND VIEWS ----
  // Metadata is deep-copied; the payload buffer is immutable and shared
  Blob clone() const;
  // ETag, Last-Modified, content headers and user metadata as header pairs
  Headers headers() const;

private:
  BlobMetadata metadata_;
  std::shared_ptr<const Bytes> payload_;
};

// Listing projection of a container, blob or folded path
struct StorageMetadata {
  StorageType type = StorageType::BLOB;
  std::string name;
  std::optional<std::string> location;
  std::string etag;
  std::optional<Timestamp> last_modified;
  std::optional<uint64_t> size;
  std::string uri;
  UserMetadata user_metadata;

  static StorageMetadata from_blob(const BlobMetadata& metadata);
  static StorageMetadata relative_path(const std::string& name);
};

// One page of listing results
struct Page {
  std::vector<StorageMetadata> entries;
  // Name of the last entry returned when more entries remain
  std::optional<std::string> next_marker;

  std::size_t size() const { return entries.size(); }
  bool empty() const { return entries.empty(); }
};

// Formats a timestamp as an RFC 822 date in GMT
std::string format_rfc822(Timestamp time);

} // namespace memblob::store

#endif // MEMBLOB_STORE_TYPES_HPP
