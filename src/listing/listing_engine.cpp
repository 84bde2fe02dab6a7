#include "listing/listing_engine.hpp"
#include "logger/logger.hpp"
#include <algorithm>
#include <utility>

namespace memblob::listing {

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool name_less(const store::StorageMetadata& a, const store::StorageMetadata& b) {
  return a.name < b.name;
}

bool same_name(const store::StorageMetadata& a, const store::StorageMetadata& b) {
  return a.name == b.name;
}

// Entries must already be sorted; the first entry of each name is kept
void drop_duplicate_names(std::vector<store::StorageMetadata>& entries) {
  entries.erase(std::unique(entries.begin(), entries.end(), same_name), entries.end());
}

} // namespace

std::string DelimiterConfig::strip_prefix() const {
  if (!prefix.empty() && prefix.back() == delimiter) {
    return prefix;
  }
  return prefix + delimiter;
}


//==============================================
// LISTING STEPS
//==============================================

std::vector<store::StorageMetadata> to_sorted_entries(
    const std::vector<std::shared_ptr<const store::Blob>>& blobs,
    const DirectoryMarkerDetector& detector) {
  std::vector<store::StorageMetadata> entries;
  entries.reserve(blobs.size());

  for (const auto& blob : blobs) {
    store::StorageMetadata entry = store::StorageMetadata::from_blob(blob->metadata());
    if (auto directory = detector.detect(blob->metadata())) {
      entry.name = *directory;
      entry.type = store::StorageType::RELATIVE_PATH;
    }
    entries.push_back(std::move(entry));
  }

  // A real blob wins over a marker renamed onto the same name
  std::sort(entries.begin(), entries.end(),
            [](const store::StorageMetadata& a, const store::StorageMetadata& b) {
              if (a.name != b.name) return a.name < b.name;
              return static_cast<int>(a.type) < static_cast<int>(b.type);
            });
  drop_duplicate_names(entries);
  return entries;
}

std::vector<store::StorageMetadata> entries_after(
    std::vector<store::StorageMetadata> entries, const std::string& marker) {
  auto first = std::find_if(entries.begin(), entries.end(),
                            [&marker](const store::StorageMetadata& entry) {
                              return entry.name > marker;
                            });
  entries.erase(entries.begin(), first);
  return entries;
}

std::vector<store::StorageMetadata> entries_with_prefix(
    std::vector<store::StorageMetadata> entries, const std::string& prefix) {
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&prefix](const store::StorageMetadata& entry) {
                                 return !starts_with(entry.name, prefix) || entry.name == prefix;
                               }),
                entries.end());
  return entries;
}

std::optional<std::string> truncate_entries(
    std::vector<store::StorageMetadata>& entries, int max_results) {
  if (max_results <= 0) {
    entries.clear();
    return std::nullopt;
  }

  auto limit = static_cast<std::size_t>(max_results);
  if (entries.size() <= limit) {
    return std::nullopt;
  }

  entries.resize(limit);
  return entries.back().name;
}

std::optional<std::string> common_prefix_of(const std::string& name, const DelimiterConfig& config) {
  std::string strip = config.strip_prefix();
  std::string head;
  std::string remainder = name;
  if (starts_with(name, strip)) {
    head = strip;
    remainder = name.substr(strip.size());
  }

  std::size_t pos = remainder.find(config.delimiter);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return head + remainder.substr(0, pos + 1);
}

std::vector<store::StorageMetadata> fold_common_prefixes(
    const std::vector<store::StorageMetadata>& entries, const DelimiterConfig& config) {
  std::vector<store::StorageMetadata> flat;
  std::vector<store::StorageMetadata> prefixes;

  for (const auto& entry : entries) {
    if (auto common = common_prefix_of(entry.name, config)) {
      prefixes.push_back(store::StorageMetadata::relative_path(*common));
    } else {
      flat.push_back(entry);
    }
  }

  // Flat entries come first so they survive a name clash with a prefix
  std::vector<store::StorageMetadata> folded = std::move(flat);
  folded.insert(folded.end(), prefixes.begin(), prefixes.end());
  std::stable_sort(folded.begin(), folded.end(), name_less);
  drop_duplicate_names(folded);
  return folded;
}

void strip_user_metadata(std::vector<store::StorageMetadata>& entries) {
  for (auto& entry : entries) {
    entry.user_metadata.clear();
  }
}


//==============================================
// LISTING ENGINE
//==============================================

ListingEngine::ListingEngine(const store::BlobRepository& repository,
                             std::shared_ptr<const DirectoryMarkerDetector> detector,
                             int default_max_results)
  : repository_(repository)
  , detector_(std::move(detector))
  , default_max_results_(default_max_results) {
  if (!detector_) {
    detector_ = std::make_shared<DefaultDirectoryMarkerDetector>();
  }
}

store::Page ListingEngine::list(const std::string& container, const ListOptions& options) const {
  LOG_DEBUG << "ListingEngine: Listing container " << container
            << " prefix [" << options.prefix.value_or("") << "]"
            << " marker [" << options.marker.value_or("") << "]"
            << (options.recursive ? " recursive" : "");

  std::vector<store::StorageMetadata> entries =
    to_sorted_entries(repository_.snapshot(container), *detector_);

  if (options.marker) {
    entries = entries_after(std::move(entries), *options.marker);
  }

  if (options.prefix) {
    entries = entries_with_prefix(std::move(entries), *options.prefix);
  }

  store::Page page;
  page.next_marker = truncate_entries(entries, options.max_results.value_or(default_max_results_));

  if (!options.recursive) {
    DelimiterConfig config;
    config.prefix = options.prefix.value_or("");
    entries = fold_common_prefixes(entries, config);
  }

  if (!options.detailed) {
    strip_user_metadata(entries);
  }

  page.entries = std::move(entries);
  LOG_DEBUG << "ListingEngine: Returning " << page.size() << " entries"
            << (page.next_marker ? " with marker " + *page.next_marker : std::string());
  return page;
}

} // namespace memblob::listing
