#ifndef MEMBLOB_CONTENT_PAYLOAD_HPP
#define MEMBLOB_CONTENT_PAYLOAD_HPP

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include "../store/types.hpp"

namespace memblob::content {

// Readable content handed to put_blob. Every variant is normalized to an
// owned buffer before hashing.
class PayloadSource {
public:
  virtual ~PayloadSource() = default;

  // Reads the whole source into a new buffer. Stream-backed sources can be
  // materialized once.
  virtual store::Bytes materialize() = 0;
  // Byte count if known without reading
  virtual std::optional<uint64_t> length() const = 0;
  // Content headers supplied with the payload
  virtual store::ContentMetadata content_metadata() const { return metadata_; }

  void set_content_type(const std::string& value) { metadata_.content_type = value; }
  void set_content_disposition(const std::string& value) { metadata_.content_disposition = value; }
  void set_content_encoding(const std::string& value) { metadata_.content_encoding = value; }
  void set_content_language(const std::string& value) { metadata_.content_language = value; }

protected:
  store::ContentMetadata metadata_;
};

// In-memory bytes
class BytesPayload : public PayloadSource {
public:
  explicit BytesPayload(store::Bytes data);
  explicit BytesPayload(const std::string& data);

  store::Bytes materialize() override { return data_; }
  std::optional<uint64_t> length() const override { return data_.size(); }

private:
  store::Bytes data_;
};

// Reads an input stream to its end
class StreamPayload : public PayloadSource {
public:
  explicit StreamPayload(std::istream& input);

  store::Bytes materialize() override;
  std::optional<uint64_t> length() const override { return length_; }

private:
  static constexpr size_t BUFFER_SIZE = 4096;

  std::istream& input_;
  bool consumed_ = false;
  std::optional<uint64_t> length_;
};

// Forwards reads to a wrapped source; its own non-empty content headers
// take precedence over the delegate's
class DelegatingPayload : public PayloadSource {
public:
  explicit DelegatingPayload(std::unique_ptr<PayloadSource> delegate);

  store::Bytes materialize() override { return delegate_->materialize(); }
  std::optional<uint64_t> length() const override { return delegate_->length(); }
  store::ContentMetadata content_metadata() const override;

  const PayloadSource& delegate() const { return *delegate_; }

private:
  std::unique_ptr<PayloadSource> delegate_;
};

} // namespace memblob::content

#endif // MEMBLOB_CONTENT_PAYLOAD_HPP
