#include "content/payload.hpp"
#include "store/store_error.hpp"
#include "logger/logger.hpp"
#include <utility>

namespace memblob::content {

BytesPayload::BytesPayload(store::Bytes data)
  : data_(std::move(data)) {
}

BytesPayload::BytesPayload(const std::string& data)
  : data_(data.begin(), data.end()) {
}

//==============================================
// STREAM PAYLOAD
//==============================================

StreamPayload::StreamPayload(std::istream& input)
  : input_(input) {
}

store::Bytes StreamPayload::materialize() {
  if (consumed_) {
    throw store::ContentError("Stream payload already consumed");
  }
  if (!input_.good()) {
    LOG_ERROR << "Payload: Invalid input stream";
    throw store::ContentError("Invalid input stream");
  }
  consumed_ = true;

  store::Bytes data;
  char buffer[BUFFER_SIZE];

  // Read input stream in chunks
  while (input_.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + input_.gcount());
  }

  // Handle final partial chunk if present
  if (input_.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + input_.gcount());
  }

  if (input_.bad()) {
    throw store::ContentError("Failed reading input stream");
  }

  length_ = data.size();
  LOG_DEBUG << "Payload: Materialized " << data.size() << " bytes from stream";
  return data;
}

//==============================================
// DELEGATING PAYLOAD
//==============================================

DelegatingPayload::DelegatingPayload(std::unique_ptr<PayloadSource> delegate)
  : delegate_(std::move(delegate)) {
  if (!delegate_) {
    throw store::InvalidArgumentError("Delegating payload requires a delegate");
  }
}

store::ContentMetadata DelegatingPayload::content_metadata() const {
  store::ContentMetadata merged = delegate_->content_metadata();
  if (!metadata_.content_type.empty()) merged.content_type = metadata_.content_type;
  if (!metadata_.content_disposition.empty()) merged.content_disposition = metadata_.content_disposition;
  if (!metadata_.content_encoding.empty()) merged.content_encoding = metadata_.content_encoding;
  if (!metadata_.content_language.empty()) merged.content_language = metadata_.content_language;
  return merged;
}

} // namespace memblob::content
