#ifndef MEMBLOB_BLOB_REPOSITORY_HPP
#define MEMBLOB_BLOB_REPOSITORY_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "container_registry.hpp"
#include "types.hpp"
#include "../content/content_pipeline.hpp"
#include "../content/payload.hpp"

namespace memblob::store {

// Blob operations over the containers held by a ContainerRegistry
class BlobRepository {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BlobRepository(ContainerRegistry& registry, const content::ContentPipeline& pipeline);


  // ---- CORE STORAGE OPERATIONS ----
  // Hashes and stores the payload, replacing any previous blob under key.
  // Returns the new ETag.
  std::string put_blob(const std::string& container, const std::string& key,
                       content::PayloadSource& payload, const std::string& content_type,
                       const UserMetadata& user_metadata);
  // nullopt when the key is absent; throws if the container is missing
  std::optional<Blob> get_blob(const std::string& container, const std::string& key) const;
  // Shared handle on the stored blob itself, nullptr when the key is absent
  std::shared_ptr<const Blob> find_blob(const std::string& container, const std::string& key) const;
  void remove_blob(const std::string& container, const std::string& key);
  void clear(const std::string& container);


  // ---- QUERY OPERATIONS ----
  // False for a missing container
  bool blob_exists(const std::string& container, const std::string& key) const;
  std::optional<BlobMetadata> blob_metadata(const std::string& container, const std::string& key) const;
  std::size_t count_blobs(const std::string& container) const;
  // Every blob of the container at call time
  std::vector<std::shared_ptr<const Blob>> snapshot(const std::string& container) const;

private:
  // ---- PARAMETERS ----
  ContainerRegistry& registry_;
  const content::ContentPipeline& pipeline_;
};

} // namespace memblob::store

#endif // MEMBLOB_BLOB_REPOSITORY_HPP
