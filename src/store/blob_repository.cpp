#include "store/blob_repository.hpp"
#include "logger/logger.hpp"
#include <utility>

namespace memblob::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobRepository::BlobRepository(ContainerRegistry& registry, const content::ContentPipeline& pipeline)
  : registry_(registry)
  , pipeline_(pipeline) {
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string BlobRepository::put_blob(const std::string& container, const std::string& key,
                                     content::PayloadSource& payload, const std::string& content_type,
                                     const UserMetadata& user_metadata) {
  LOG_DEBUG << "BlobRepository: Put blob with key [" << key << "] to container [" << container << "]";

  // Fail fast before reading the payload
  registry_.with_container(container, [](Container&) {});

  // Hashing runs outside every lock
  auto blob = std::make_shared<const Blob>(
    pipeline_.prepare(container, key, payload, content_type, user_metadata));
  std::string etag = blob->metadata().etag;

  // The container may have been deleted while hashing
  registry_.with_container(container, [&blob](Container& target) {
    target.put(std::move(blob));
  });

  LOG_INFO << "BlobRepository: Stored " << container << "/" << key << " etag " << etag;
  return etag;
}

std::optional<Blob> BlobRepository::get_blob(const std::string& container, const std::string& key) const {
  std::shared_ptr<const Blob> stored = find_blob(container, key);
  if (!stored) {
    return std::nullopt;
  }
  return stored->clone();
}

std::shared_ptr<const Blob> BlobRepository::find_blob(const std::string& container, const std::string& key) const {
  LOG_DEBUG << "BlobRepository: Retrieving blob with key " << key << " from container " << container;

  std::shared_ptr<const Blob> stored = registry_.with_container(container, [&key](Container& target) {
    return target.find(key);
  });
  if (!stored) {
    LOG_DEBUG << "BlobRepository: Item " << key << " does not exist in container " << container;
  }
  return stored;
}

void BlobRepository::remove_blob(const std::string& container, const std::string& key) {
  bool removed = false;
  registry_.if_container(container, [&key, &removed](Container& target) {
    removed = target.erase(key);
  });

  if (removed) {
    LOG_INFO << "BlobRepository: Removed " << container << "/" << key;
  } else {
    LOG_DEBUG << "BlobRepository: Nothing to remove at " << container << "/" << key;
  }
}

void BlobRepository::clear(const std::string& container) {
  registry_.with_container(container, [](Container& target) {
    target.clear();
  });
  LOG_INFO << "BlobRepository: Cleared container " << container;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlobRepository::blob_exists(const std::string& container, const std::string& key) const {
  bool exists = false;
  registry_.if_container(container, [&key, &exists](Container& target) {
    exists = target.contains(key);
  });
  LOG_DEBUG << "BlobRepository: Key " << key << (exists ? " exists" : " not found")
            << " in container " << container;
  return exists;
}

std::optional<BlobMetadata> BlobRepository::blob_metadata(const std::string& container, const std::string& key) const {
  std::shared_ptr<const Blob> stored = find_blob(container, key);
  if (!stored) {
    return std::nullopt;
  }
  return stored->metadata().clone();
}

std::size_t BlobRepository::count_blobs(const std::string& container) const {
  return registry_.with_container(container, [](Container& target) {
    return target.size();
  });
}

std::vector<std::shared_ptr<const Blob>> BlobRepository::snapshot(const std::string& container) const {
  return registry_.with_container(container, [](Container& target) {
    return target.snapshot();
  });
}

} // namespace memblob::store
