#ifndef MEMBLOB_BLOB_STORE_HPP
#define MEMBLOB_BLOB_STORE_HPP

#include <optional>
#include <string>
#include "blob_repository.hpp"
#include "container_registry.hpp"
#include "store_context.hpp"
#include "types.hpp"
#include "../conditional/conditional_request.hpp"
#include "../config/store_config.hpp"
#include "../content/content_pipeline.hpp"
#include "../content/payload.hpp"
#include "../listing/listing_engine.hpp"

namespace memblob::store {

struct CreateContainerOptions {
  // Not supported by the in-memory store
  bool public_read = false;
};

// In-memory blob store. One instance owns all container and blob state;
// every operation is synchronous and safe to call from any thread.
class BlobStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BlobStore(const config::StoreConfig& config = config::StoreConfig{});
  // Collaborators left null in context fall back to StoreContext::defaults
  BlobStore(const config::StoreConfig& config, StoreContext context);

  BlobStore(const BlobStore&) = delete;
  BlobStore& operator=(const BlobStore&) = delete;


  // ---- CONTAINER OPERATIONS ----
  bool create_container(const std::string& name);
  bool create_container(const std::string& name, const std::string& location);
  bool create_container(const std::string& name, const std::string& location,
                        const CreateContainerOptions& options);
  void delete_container(const std::string& name);
  bool delete_container_if_empty(const std::string& name);
  void clear_container(const std::string& name);
  bool container_exists(const std::string& name) const;
  std::optional<std::string> container_location(const std::string& name) const;
  Page list_containers() const;


  // ---- BLOB OPERATIONS ----
  std::string put_blob(const std::string& container, const std::string& key,
                       content::PayloadSource& payload, const std::string& content_type = "",
                       const UserMetadata& user_metadata = {});
  std::string put_blob(const std::string& container, const std::string& key,
                       const std::string& data, const std::string& content_type = "",
                       const UserMetadata& user_metadata = {});
  // nullopt when the key is absent. Throws ContainerNotFoundError,
  // PreconditionFailedError, NotModifiedError or InvalidArgumentError.
  std::optional<Blob> get_blob(const std::string& container, const std::string& key,
                               const conditional::GetOptions& options = {}) const;
  std::optional<BlobMetadata> blob_metadata(const std::string& container, const std::string& key) const;
  void delete_blob(const std::string& container, const std::string& key);
  bool blob_exists(const std::string& container, const std::string& key) const;
  std::size_t count_blobs(const std::string& container) const;


  // ---- LISTING ----
  Page list_blobs(const std::string& container, const listing::ListOptions& options = {}) const;


  // ---- GETTERS ----
  const config::StoreConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  config::StoreConfig config_;
  StoreContext context_;
  content::ContentPipeline pipeline_;
  ContainerRegistry registry_;
  BlobRepository repository_;
  listing::ListingEngine listing_;

  static StoreContext complete(StoreContext context, const config::StoreConfig& config);
};

} // namespace memblob::store

#endif // MEMBLOB_BLOB_STORE_HPP
