#ifndef MEMBLOB_CONTAINER_REGISTRY_HPP
#define MEMBLOB_CONTAINER_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "store_error.hpp"
#include "types.hpp"

namespace memblob::store {

// Key to blob mapping of one container. Stored blobs are immutable and
// replaced as a whole, so a reader holding one never sees a partial write.
class Container {
public:
  Container(std::string name, std::string location);

  const std::string& name() const { return name_; }
  const std::string& location() const { return location_; }

  std::shared_ptr<const Blob> find(const std::string& key) const;
  bool contains(const std::string& key) const;
  void put(std::shared_ptr<const Blob> blob);
  bool erase(const std::string& key);
  void clear();
  std::size_t size() const;

  // Current blobs, taken under one shared lock
  std::vector<std::shared_ptr<const Blob>> snapshot() const;

private:
  const std::string name_;
  const std::string location_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const Blob>> blobs_;
};

class ContainerRegistry {
public:

  // ---- CONTAINER LIFECYCLE ----
  // Single check-and-insert; true only for the call that created it
  bool create_container(const std::string& name, const std::string& location);
  // Drops the container with all its blobs; absent names are ignored
  void delete_container(const std::string& name);
  // True if absent or deleted, false if it still holds blobs
  bool delete_container_if_empty(const std::string& name);


  // ---- QUERY OPERATIONS ----
  bool container_exists(const std::string& name) const;
  std::optional<std::string> container_location(const std::string& name) const;
  // Sorted by name
  std::vector<StorageMetadata> list_containers() const;


  // ---- CONTAINER ACCESS ----
  // Runs fn(Container&) while the container is guaranteed to stay
  // registered; throws ContainerNotFoundError if it is missing
  template <typename Fn>
  auto with_container(const std::string& name, Fn&& fn) const {
    std::shared_lock lock(mutex_);
    auto it = containers_.find(name);
    if (it == containers_.end()) {
      throw not_found(name);
    }
    return fn(*it->second);
  }

  // Same as with_container, but returns false instead of throwing
  template <typename Fn>
  bool if_container(const std::string& name, Fn&& fn) const {
    std::shared_lock lock(mutex_);
    auto it = containers_.find(name);
    if (it == containers_.end()) {
      return false;
    }
    fn(*it->second);
    return true;
  }

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::shared_ptr<Container>> containers_;

  // Caller holds mutex_
  ContainerNotFoundError not_found(const std::string& name) const;
};

} // namespace memblob::store

#endif // MEMBLOB_CONTAINER_REGISTRY_HPP
