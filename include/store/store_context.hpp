#ifndef MEMBLOB_STORE_CONTEXT_HPP
#define MEMBLOB_STORE_CONTEXT_HPP

#include <memory>
#include <string>
#include "../content/collaborators.hpp"
#include "../listing/directory_marker.hpp"

namespace memblob::store {

// External collaborators handed to a BlobStore
struct StoreContext {
  std::shared_ptr<const content::Clock> clock;
  std::shared_ptr<const content::HashProvider> hasher;
  std::shared_ptr<const content::LocatorBuilder> locator;
  std::shared_ptr<const listing::DirectoryMarkerDetector> directory_detector;

  // System clock, MD5, scheme://container/key, default marker detection
  static StoreContext defaults(const std::string& uri_scheme = "mem") {
    StoreContext context;
    context.clock = std::make_shared<content::SystemClock>();
    context.hasher = std::make_shared<content::Md5HashProvider>();
    context.locator = std::make_shared<content::SchemeLocatorBuilder>(uri_scheme);
    context.directory_detector = std::make_shared<listing::DefaultDirectoryMarkerDetector>();
    return context;
  }
};

} // namespace memblob::store

#endif // MEMBLOB_STORE_CONTEXT_HPP
