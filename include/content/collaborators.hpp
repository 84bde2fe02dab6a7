#ifndef MEMBLOB_CONTENT_COLLABORATORS_HPP
#define MEMBLOB_CONTENT_COLLABORATORS_HPP

#include <string>
#include "../store/types.hpp"

namespace memblob::content {

// Source of last-modified timestamps
class Clock {
public:
  virtual ~Clock() = default;
  virtual store::Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
  store::Timestamp now() const override;
};

// Computes the fixed-size content digest behind an ETag
class HashProvider {
public:
  virtual ~HashProvider() = default;
  virtual store::Bytes digest(const store::Bytes& data) const = 0;
};

// MD5 through the OpenSSL EVP interface
class Md5HashProvider : public HashProvider {
public:
  static constexpr size_t DIGEST_SIZE = 16;

  store::Bytes digest(const store::Bytes& data) const override;
};

// Builds the synthetic URI stored with each blob
class LocatorBuilder {
public:
  virtual ~LocatorBuilder() = default;
  virtual std::string locator(const std::string& container, const std::string& key) const = 0;
};

// scheme://container/key
class SchemeLocatorBuilder : public LocatorBuilder {
public:
  explicit SchemeLocatorBuilder(std::string scheme = "mem");

  std::string locator(const std::string& container, const std::string& key) const override;

  const std::string& scheme() const { return scheme_; }

private:
  std::string scheme_;
};

// Lowercase hexadecimal rendering of raw digest bytes
std::string hex_encode(const store::Bytes& bytes);

} // namespace memblob::content

#endif // MEMBLOB_CONTENT_COLLABORATORS_HPP
