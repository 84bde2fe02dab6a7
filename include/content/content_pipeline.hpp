#ifndef MEMBLOB_CONTENT_PIPELINE_HPP
#define MEMBLOB_CONTENT_PIPELINE_HPP

#include <memory>
#include <string>
#include "collaborators.hpp"
#include "payload.hpp"
#include "../store/types.hpp"

namespace memblob::content {

// Turns a payload source into a ready-to-store blob: owned buffer, MD5
// ETag, timestamp, locator, normalized user metadata and content headers.
class ContentPipeline {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ContentPipeline(std::shared_ptr<const Clock> clock,
                  std::shared_ptr<const HashProvider> hasher,
                  std::shared_ptr<const LocatorBuilder> locator);


  // ---- PIPELINE ----
  // An empty content_type keeps the source's type, falling back to
  // application/octet-stream
  store::Blob prepare(const std::string& container, const std::string& key,
                      PayloadSource& source, const std::string& content_type,
                      const store::UserMetadata& user_metadata) const;

  // Lowercases every key; on collision the entry iterated last wins
  static store::UserMetadata normalize_user_metadata(const store::UserMetadata& user_metadata);

private:
  // ---- PARAMETERS ----
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<const HashProvider> hasher_;
  std::shared_ptr<const LocatorBuilder> locator_;
};

} // namespace memblob::content

#endif // MEMBLOB_CONTENT_PIPELINE_HPP
