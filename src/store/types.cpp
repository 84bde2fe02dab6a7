#include "store/types.hpp"
#include <ctime>
#include <utility>

namespace memblob::store {

std::string to_string(StorageType type) {
  switch (type) {
    case StorageType::CONTAINER: return "CONTAINER";
    case StorageType::BLOB: return "BLOB";
    case StorageType::RELATIVE_PATH: return "RELATIVE_PATH";
    default: return "UNKNOWN";
  }
}

BlobMetadata BlobMetadata::clone() const {
  BlobMetadata copy;
  copy.name = name;
  copy.container = container;
  copy.etag = etag;
  copy.last_modified = last_modified;
  copy.uri = uri;
  copy.user_metadata = user_metadata;
  copy.content = content;
  return copy;
}

//==============================================
// BLOB
//==============================================

Blob::Blob(BlobMetadata metadata, std::shared_ptr<const Bytes> payload)
  : metadata_(std::move(metadata))
  , payload_(payload ? std::move(payload) : std::make_shared<const Bytes>()) {
}

std::string Blob::payload_string() const {
  return std::string(payload_->begin(), payload_->end());
}

void Blob::set_payload(Bytes payload) {
  metadata_.content.content_length = payload.size();
  payload_ = std::make_shared<const Bytes>(std::move(payload));
}

Blob Blob::clone() const {
  return Blob(metadata_.clone(), payload_);
}

Headers Blob::headers() const {
  Headers headers;
  headers.emplace("ETag", metadata_.etag);
  headers.emplace("Last-Modified", format_rfc822(metadata_.last_modified));
  headers.emplace("Content-Length", std::to_string(metadata_.content.content_length));

  const ContentMetadata& content = metadata_.content;
  if (!content.content_type.empty()) {
    headers.emplace("Content-Type", content.content_type);
  }
  if (!content.content_disposition.empty()) {
    headers.emplace("Content-Disposition", content.content_disposition);
  }
  if (!content.content_encoding.empty()) {
    headers.emplace("Content-Encoding", content.content_encoding);
  }
  if (!content.content_language.empty()) {
    headers.emplace("Content-Language", content.content_language);
  }

  for (const auto& [key, value] : metadata_.user_metadata) {
    headers.emplace(key, value);
  }
  return headers;
}

//==============================================
// STORAGE METADATA
//==============================================

StorageMetadata StorageMetadata::from_blob(const BlobMetadata& metadata) {
  StorageMetadata entry;
  entry.type = StorageType::BLOB;
  entry.name = metadata.name;
  entry.etag = metadata.etag;
  entry.last_modified = metadata.last_modified;
  entry.size = metadata.content.content_length;
  entry.uri = metadata.uri;
  entry.user_metadata = metadata.user_metadata;
  return entry;
}

StorageMetadata StorageMetadata::relative_path(const std::string& name) {
  StorageMetadata entry;
  entry.type = StorageType::RELATIVE_PATH;
  entry.name = name;
  return entry;
}

std::string format_rfc822(Timestamp time) {
  std::time_t raw = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&raw, &utc);

  char buffer[64];
  std::size_t written = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &utc);
  return std::string(buffer, written);
}

} // namespace memblob::store
