#include "store/blob_store.hpp"
#include "logger/logger.hpp"
#include <utility>

namespace memblob::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobStore::BlobStore(const config::StoreConfig& config)
  : BlobStore(config, StoreContext{}) {
}

BlobStore::BlobStore(const config::StoreConfig& config, StoreContext context)
  : config_(config)
  , context_(complete(std::move(context), config))
  , pipeline_(context_.clock, context_.hasher, context_.locator)
  , registry_()
  , repository_(registry_, pipeline_)
  , listing_(repository_, context_.directory_detector, config_.default_max_results) {
  LOG_INFO << "BlobStore: Initializing with default location " << config_.default_location
           << " and URI scheme " << config_.uri_scheme;

  for (const auto& name : config_.seed_containers) {
    registry_.create_container(name, config_.default_location);
  }
}

StoreContext BlobStore::complete(StoreContext context, const config::StoreConfig& config) {
  StoreContext defaults = StoreContext::defaults(config.uri_scheme);
  if (!context.clock) context.clock = defaults.clock;
  if (!context.hasher) context.hasher = defaults.hasher;
  if (!context.locator) context.locator = defaults.locator;
  if (!context.directory_detector) context.directory_detector = defaults.directory_detector;
  return context;
}


//==============================================
// CONTAINER OPERATIONS
//==============================================

bool BlobStore::create_container(const std::string& name) {
  return registry_.create_container(name, config_.default_location);
}

bool BlobStore::create_container(const std::string& name, const std::string& location) {
  return registry_.create_container(name, location.empty() ? config_.default_location : location);
}

bool BlobStore::create_container(const std::string& name, const std::string& location,
                                 const CreateContainerOptions& options) {
  if (options.public_read) {
    LOG_ERROR << "BlobStore: Public read requested for container " << name;
    throw InvalidArgumentError("publicRead is not supported");
  }
  return create_container(name, location);
}

void BlobStore::delete_container(const std::string& name) {
  registry_.delete_container(name);
}

bool BlobStore::delete_container_if_empty(const std::string& name) {
  return registry_.delete_container_if_empty(name);
}

void BlobStore::clear_container(const std::string& name) {
  repository_.clear(name);
}

bool BlobStore::container_exists(const std::string& name) const {
  return registry_.container_exists(name);
}

std::optional<std::string> BlobStore::container_location(const std::string& name) const {
  return registry_.container_location(name);
}

Page BlobStore::list_containers() const {
  Page page;
  page.entries = registry_.list_containers();
  return page;
}


//==============================================
// BLOB OPERATIONS
//==============================================

std::string BlobStore::put_blob(const std::string& container, const std::string& key,
                                content::PayloadSource& payload, const std::string& content_type,
                                const UserMetadata& user_metadata) {
  return repository_.put_blob(container, key, payload, content_type, user_metadata);
}

std::string BlobStore::put_blob(const std::string& container, const std::string& key,
                                const std::string& data, const std::string& content_type,
                                const UserMetadata& user_metadata) {
  content::BytesPayload payload(data);
  return repository_.put_blob(container, key, payload, content_type, user_metadata);
}

std::optional<Blob> BlobStore::get_blob(const std::string& container, const std::string& key,
                                        const conditional::GetOptions& options) const {
  if (options.unconditional()) {
    return repository_.get_blob(container, key);
  }
  std::shared_ptr<const Blob> stored = repository_.find_blob(container, key);
  if (!stored) {
    return std::nullopt;
  }
  return conditional::ConditionalRequestEvaluator::evaluate(*stored, options);
}

std::optional<BlobMetadata> BlobStore::blob_metadata(const std::string& container, const std::string& key) const {
  return repository_.blob_metadata(container, key);
}

void BlobStore::delete_blob(const std::string& container, const std::string& key) {
  repository_.remove_blob(container, key);
}

bool BlobStore::blob_exists(const std::string& container, const std::string& key) const {
  return repository_.blob_exists(container, key);
}

std::size_t BlobStore::count_blobs(const std::string& container) const {
  return repository_.count_blobs(container);
}


//==============================================
// LISTING
//==============================================

Page BlobStore::list_blobs(const std::string& container, const listing::ListOptions& options) const {
  return listing_.list(container, options);
}

} // namespace memblob::store
