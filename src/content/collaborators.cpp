#include "content/collaborators.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace memblob::content {

store::Timestamp SystemClock::now() const {
  return std::chrono::system_clock::now();
}

SchemeLocatorBuilder::SchemeLocatorBuilder(std::string scheme)
  : scheme_(std::move(scheme)) {
}

std::string SchemeLocatorBuilder::locator(const std::string& container, const std::string& key) const {
  std::string path = key;
  // Keys that already start with a slash must not produce "//" after the host
  if (!path.empty() && path.front() == '/') {
    path.erase(0, 1);
  }
  return scheme_ + "://" + container + "/" + path;
}

std::string hex_encode(const store::Bytes& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace memblob::content
