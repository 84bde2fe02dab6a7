#include "store/container_registry.hpp"
#include "logger/logger.hpp"
#include <sstream>
#include <utility>

namespace memblob::store {

//==============================================
// CONTAINER
//==============================================

Container::Container(std::string name, std::string location)
  : name_(std::move(name))
  , location_(std::move(location)) {
}

std::shared_ptr<const Blob> Container::find(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto it = blobs_.find(key);
  return it != blobs_.end() ? it->second : nullptr;
}

bool Container::contains(const std::string& key) const {
  std::shared_lock lock(mutex_);
  return blobs_.count(key) > 0;
}

void Container::put(std::shared_ptr<const Blob> blob) {
  if (!blob) {
    throw InternalInvariantError("null blob stored in container " + name_);
  }
  std::string key = blob->metadata().name;
  std::unique_lock lock(mutex_);
  blobs_[key] = std::move(blob);
}

bool Container::erase(const std::string& key) {
  std::unique_lock lock(mutex_);
  return blobs_.erase(key) > 0;
}

void Container::clear() {
  std::unique_lock lock(mutex_);
  blobs_.clear();
}

std::size_t Container::size() const {
  std::shared_lock lock(mutex_);
  return blobs_.size();
}

std::vector<std::shared_ptr<const Blob>> Container::snapshot() const {
  std::shared_lock lock(mutex_);
  std::vector<std::shared_ptr<const Blob>> blobs;
  blobs.reserve(blobs_.size());
  for (const auto& entry : blobs_) {
    blobs.push_back(entry.second);
  }
  return blobs;
}


//==============================================
// CONTAINER LIFECYCLE
//==============================================

bool ContainerRegistry::create_container(const std::string& name, const std::string& location) {
  std::unique_lock lock(mutex_);
  bool created = containers_.emplace(name, std::make_shared<Container>(name, location)).second;
  if (created) {
    LOG_INFO << "ContainerRegistry: Created container " << name << " in location " << location;
  } else {
    LOG_DEBUG << "ContainerRegistry: Container " << name << " already exists";
  }
  return created;
}

void ContainerRegistry::delete_container(const std::string& name) {
  std::unique_lock lock(mutex_);
  if (containers_.erase(name) > 0) {
    LOG_INFO << "ContainerRegistry: Deleted container " << name;
  } else {
    LOG_DEBUG << "ContainerRegistry: Delete of absent container " << name << " ignored";
  }
}

bool ContainerRegistry::delete_container_if_empty(const std::string& name) {
  // Blob writers hold the shared lock, so the emptiness check cannot race a put
  std::unique_lock lock(mutex_);
  auto it = containers_.find(name);
  if (it == containers_.end()) {
    return true;
  }
  if (it->second->size() != 0) {
    LOG_DEBUG << "ContainerRegistry: Container " << name << " not empty, kept";
    return false;
  }
  containers_.erase(it);
  LOG_INFO << "ContainerRegistry: Deleted empty container " << name;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ContainerRegistry::container_exists(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return containers_.count(name) > 0;
}

std::optional<std::string> ContainerRegistry::container_location(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto it = containers_.find(name);
  if (it == containers_.end()) {
    return std::nullopt;
  }
  return it->second->location();
}

std::vector<StorageMetadata> ContainerRegistry::list_containers() const {
  std::shared_lock lock(mutex_);
  std::vector<StorageMetadata> containers;
  containers.reserve(containers_.size());
  for (const auto& [name, container] : containers_) {
    StorageMetadata entry;
    entry.type = StorageType::CONTAINER;
    entry.name = name;
    entry.location = container->location();
    containers.push_back(std::move(entry));
  }
  return containers;
}

ContainerNotFoundError ContainerRegistry::not_found(const std::string& name) const {
  std::ostringstream message;
  message << "container " << name << " not in [";
  bool first = true;
  for (const auto& entry : containers_) {
    message << (first ? "" : ", ") << entry.first;
    first = false;
  }
  message << "]";

  LOG_ERROR << "ContainerRegistry: " << message.str();
  return ContainerNotFoundError(name, message.str());
}

} // namespace memblob::store
