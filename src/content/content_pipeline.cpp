#include "content/content_pipeline.hpp"
#include "store/store_error.hpp"
#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace memblob::content {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ContentPipeline::ContentPipeline(std::shared_ptr<const Clock> clock,
                                 std::shared_ptr<const HashProvider> hasher,
                                 std::shared_ptr<const LocatorBuilder> locator)
  : clock_(std::move(clock))
  , hasher_(std::move(hasher))
  , locator_(std::move(locator)) {
  if (!clock_ || !hasher_ || !locator_) {
    throw store::InvalidArgumentError("Content pipeline requires clock, hasher and locator");
  }
}


//==============================================
// PIPELINE
//==============================================

store::Blob ContentPipeline::prepare(const std::string& container, const std::string& key,
                                     PayloadSource& source, const std::string& content_type,
                                     const store::UserMetadata& user_metadata) const {
  LOG_DEBUG << "ContentPipeline: Preparing " << container << "/" << key;

  // Normalize to an owned buffer before hashing
  store::Bytes data = source.materialize();
  store::Bytes md5 = hasher_->digest(data);

  store::BlobMetadata metadata;
  metadata.name = key;
  metadata.container = container;
  metadata.etag = hex_encode(md5);
  metadata.last_modified = clock_->now();
  metadata.uri = locator_->locator(container, key);
  metadata.user_metadata = normalize_user_metadata(user_metadata);

  // Carry over the source's content headers
  metadata.content = source.content_metadata();
  if (!content_type.empty()) {
    metadata.content.content_type = content_type;
  }
  if (metadata.content.content_type.empty()) {
    metadata.content.content_type = store::DEFAULT_CONTENT_TYPE;
  }
  metadata.content.content_length = data.size();
  metadata.content.content_md5 = std::move(md5);

  LOG_DEBUG << "ContentPipeline: " << key << " length " << data.size()
            << " etag " << metadata.etag;

  return store::Blob(std::move(metadata), std::make_shared<const store::Bytes>(std::move(data)));
}

store::UserMetadata ContentPipeline::normalize_user_metadata(const store::UserMetadata& user_metadata) {
  store::UserMetadata normalized;
  for (const auto& [key, value] : user_metadata) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    normalized[lower] = value;
  }
  return normalized;
}

} // namespace memblob::content
