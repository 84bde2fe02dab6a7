#ifndef MEMBLOB_LISTING_ENGINE_HPP
#define MEMBLOB_LISTING_ENGINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "directory_marker.hpp"
#include "../store/blob_repository.hpp"
#include "../store/types.hpp"

namespace memblob::listing {

constexpr int DEFAULT_MAX_RESULTS = 1000;
constexpr char DELIMITER = '/';

struct ListOptions {
  // Resume strictly after this name
  std::optional<std::string> marker;
  std::optional<std::string> prefix;
  // Unset means the store's configured default
  std::optional<int> max_results;
  bool recursive = false;
  bool detailed = false;
};

// Hierarchy projection used when folding a page
struct DelimiterConfig {
  std::string prefix;
  char delimiter = DELIMITER;

  // Portion of a name removed before looking for the delimiter
  std::string strip_prefix() const;
};

// ---- LISTING STEPS ----
// Each step is a pure function over a name-sorted entry sequence.

// Projects blobs to entries, renaming directory markers to RELATIVE_PATH,
// sorted by name with duplicate names removed
std::vector<store::StorageMetadata> to_sorted_entries(
  const std::vector<std::shared_ptr<const store::Blob>>& blobs,
  const DirectoryMarkerDetector& detector);

// Entries whose name is strictly greater than marker
std::vector<store::StorageMetadata> entries_after(
  std::vector<store::StorageMetadata> entries, const std::string& marker);

// Entries starting with prefix, excluding the prefix itself
std::vector<store::StorageMetadata> entries_with_prefix(
  std::vector<store::StorageMetadata> entries, const std::string& prefix);

// Keeps the first max_results entries. Returns the continuation marker
// when entries were dropped.
std::optional<std::string> truncate_entries(
  std::vector<store::StorageMetadata>& entries, int max_results);

// Common-prefix name for an entry, nullopt if it stays a flat entry
std::optional<std::string> common_prefix_of(const std::string& name, const DelimiterConfig& config);

// Folds nested names into RELATIVE_PATH common prefixes
std::vector<store::StorageMetadata> fold_common_prefixes(
  const std::vector<store::StorageMetadata>& entries, const DelimiterConfig& config);

void strip_user_metadata(std::vector<store::StorageMetadata>& entries);


// Paginated, optionally hierarchical listing over one container
class ListingEngine {
public:
  ListingEngine(const store::BlobRepository& repository,
                std::shared_ptr<const DirectoryMarkerDetector> detector,
                int default_max_results = DEFAULT_MAX_RESULTS);

  // Throws ContainerNotFoundError; never fails for any other input
  store::Page list(const std::string& container, const ListOptions& options) const;

private:
  const store::BlobRepository& repository_;
  std::shared_ptr<const DirectoryMarkerDetector> detector_;
  int default_max_results_;
};

} // namespace memblob::listing

#endif // MEMBLOB_LISTING_ENGINE_HPP
