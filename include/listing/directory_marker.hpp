#ifndef MEMBLOB_DIRECTORY_MARKER_HPP
#define MEMBLOB_DIRECTORY_MARKER_HPP

#include <optional>
#include <string>
#include "../store/types.hpp"

namespace memblob::listing {

// Recognizes placeholder blobs that stand for a pseudo-directory
class DirectoryMarkerDetector {
public:
  virtual ~DirectoryMarkerDetector() = default;
  // Directory name if the blob is a marker
  virtual std::optional<std::string> detect(const store::BlobMetadata& metadata) const = 0;
};

// Markers written by common blob store tools:
//   content type application/directory or application/x-directory
//   names ending in "_$folder$"
//   zero-length blobs whose name ends in "/"
class DefaultDirectoryMarkerDetector : public DirectoryMarkerDetector {
public:
  static constexpr const char* FOLDER_SUFFIX = "_$folder$";

  std::optional<std::string> detect(const store::BlobMetadata& metadata) const override;
};

} // namespace memblob::listing

#endif // MEMBLOB_DIRECTORY_MARKER_HPP
