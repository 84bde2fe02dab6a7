#include "conditional/conditional_request.hpp"
#include "store/store_error.hpp"
#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace memblob::conditional {

namespace {

bool all_digits(const std::string& value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

uint64_t parse_offset(const std::string& value, const std::string& spec) {
  if (!all_digits(value)) {
    throw store::InvalidArgumentError("malformed range " + spec);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw store::InvalidArgumentError("range offset out of bounds in " + spec);
  }
}

} // namespace

//==============================================
// BYTE RANGE
//==============================================

ByteRange::ByteRange(Kind kind, uint64_t first, uint64_t last)
  : kind_(kind), first_(first), last_(last) {
}

ByteRange ByteRange::parse(const std::string& spec) {
  std::size_t dash = spec.find('-');
  if (dash == std::string::npos || spec.find('-', dash + 1) != std::string::npos) {
    throw store::InvalidArgumentError("malformed range " + spec);
  }

  std::string head = spec.substr(0, dash);
  std::string tail = spec.substr(dash + 1);

  if (head.empty()) {
    return ByteRange(Kind::SUFFIX, parse_offset(tail, spec), 0);
  }
  if (tail.empty()) {
    return ByteRange(Kind::FROM, parse_offset(head, spec), 0);
  }

  uint64_t first = parse_offset(head, spec);
  uint64_t last = parse_offset(tail, spec);
  if (first > last) {
    throw store::InvalidArgumentError("range start after end in " + spec);
  }
  return ByteRange(Kind::BOUNDED, first, last);
}

store::Bytes ByteRange::extract(const store::Bytes& data) const {
  const uint64_t size = data.size();
  uint64_t begin = 0;
  uint64_t end = 0;  // exclusive

  switch (kind_) {
    case Kind::SUFFIX:
      begin = size - std::min(first_, size);
      end = size;
      break;
    case Kind::FROM:
      begin = std::min(first_, size);
      end = size;
      break;
    case Kind::BOUNDED:
      begin = std::min(first_, size);
      end = std::min(last_, size == 0 ? 0 : size - 1) + 1;
      end = std::max(begin, std::min(end, size));
      break;
  }

  return store::Bytes(data.begin() + static_cast<std::ptrdiff_t>(begin),
                      data.begin() + static_cast<std::ptrdiff_t>(end));
}


//==============================================
// EVALUATION
//==============================================

void ConditionalRequestEvaluator::check_preconditions(const store::BlobMetadata& metadata,
                                                      const GetOptions& options) {
  if (options.if_match && metadata.etag != *options.if_match) {
    LOG_WARN << "ConditionalRequest: If-Match " << *options.if_match << " failed for " << metadata.name;
    throw store::PreconditionFailedError("etag " + metadata.etag + " does not match " + *options.if_match);
  }

  if (options.if_none_match && metadata.etag == *options.if_none_match) {
    LOG_DEBUG << "ConditionalRequest: If-None-Match hit for " << metadata.name;
    throw store::NotModifiedError("etag " + metadata.etag + " matches");
  }

  if (options.if_modified_since && metadata.last_modified < *options.if_modified_since) {
    LOG_DEBUG << "ConditionalRequest: " << metadata.name << " not modified since "
              << store::format_rfc822(*options.if_modified_since);
    throw store::NotModifiedError(store::format_rfc822(metadata.last_modified) + " is before " +
                                  store::format_rfc822(*options.if_modified_since));
  }

  if (options.if_unmodified_since && metadata.last_modified > *options.if_unmodified_since) {
    LOG_WARN << "ConditionalRequest: " << metadata.name << " modified after "
             << store::format_rfc822(*options.if_unmodified_since);
    throw store::PreconditionFailedError(store::format_rfc822(metadata.last_modified) + " is after " +
                                         store::format_rfc822(*options.if_unmodified_since));
  }
}

store::Blob ConditionalRequestEvaluator::evaluate(const store::Blob& stored, const GetOptions& options) {
  check_preconditions(stored.metadata(), options);

  store::Blob blob = stored.clone();
  if (!options.ranges.empty()) {
    blob.set_payload(extract_ranges(stored.payload(), options.ranges));
    LOG_DEBUG << "ConditionalRequest: Served " << options.ranges.size() << " range(s), "
              << blob.metadata().content.content_length << " bytes of " << stored.payload().size();
  }
  return blob;
}

store::Bytes ConditionalRequestEvaluator::extract_ranges(const store::Bytes& data,
                                                         const std::vector<std::string>& ranges) {
  // Parse all first so a bad spec late in the list fails the whole request
  std::vector<ByteRange> parsed;
  parsed.reserve(ranges.size());
  for (const auto& spec : ranges) {
    parsed.push_back(ByteRange::parse(spec));
  }

  store::Bytes out;
  for (const auto& range : parsed) {
    store::Bytes part = range.extract(data);
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

} // namespace memblob::conditional
