#include "listing/directory_marker.hpp"
#include <cstring>

namespace memblob::listing {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string without_trailing_slash(std::string name) {
  while (!name.empty() && name.back() == '/') {
    name.pop_back();
  }
  return name;
}

} // namespace

std::optional<std::string> DefaultDirectoryMarkerDetector::detect(const store::BlobMetadata& metadata) const {
  const std::string& name = metadata.name;
  std::string directory;

  const std::string& type = metadata.content.content_type;
  if (ends_with(name, FOLDER_SUFFIX)) {
    directory = name.substr(0, name.size() - std::strlen(FOLDER_SUFFIX));
  } else if (type == "application/directory" || type == "application/x-directory") {
    directory = without_trailing_slash(name);
  } else if (metadata.content.content_length == 0 && ends_with(name, "/")) {
    directory = without_trailing_slash(name);
  }

  // A marker must name a directory; "/" or a bare suffix stays a plain blob
  if (directory.empty()) {
    return std::nullopt;
  }
  return directory;
}

} // namespace memblob::listing
