#ifndef MEMBLOB_CONDITIONAL_REQUEST_HPP
#define MEMBLOB_CONDITIONAL_REQUEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../store/types.hpp"

namespace memblob::conditional {

struct GetOptions {
  std::optional<std::string> if_match;
  std::optional<std::string> if_none_match;
  std::optional<store::Timestamp> if_modified_since;
  std::optional<store::Timestamp> if_unmodified_since;
  // Byte ranges, "N-M", "N-" or "-N", served in this order
  std::vector<std::string> ranges;

  // No preconditions and no ranges
  bool unconditional() const {
    return !if_match && !if_none_match && !if_modified_since && !if_unmodified_since && ranges.empty();
  }
};

// One parsed byte range. Offsets are inclusive.
//
// Clamping against a payload of L bytes:
//   "-N"   last min(N, L) bytes
//   "N-"   bytes N..L-1, nothing if N >= L
//   "N-M"  bytes N..min(M, L-1), nothing if N >= L
// N > M in "N-M" is rejected when parsing.
class ByteRange {
public:
  enum class Kind {
    SUFFIX,
    FROM,
    BOUNDED
  };

  // Throws InvalidArgumentError for anything but the three shapes
  static ByteRange parse(const std::string& spec);

  // Selected bytes of data after clamping
  store::Bytes extract(const store::Bytes& data) const;

  Kind kind() const { return kind_; }
  uint64_t first() const { return first_; }

private:
  ByteRange(Kind kind, uint64_t first, uint64_t last);

  Kind kind_;
  // Suffix length for SUFFIX
  uint64_t first_;
  uint64_t last_;
};

class ConditionalRequestEvaluator {
public:
  // Checks, in order, if-match, if-none-match, if-modified-since and
  // if-unmodified-since; throws PreconditionFailedError or NotModifiedError
  // on the first one that fails
  static void check_preconditions(const store::BlobMetadata& metadata, const GetOptions& options);

  // Independent copy of stored after preconditions pass, with its payload
  // replaced by the requested ranges when there are any
  static store::Blob evaluate(const store::Blob& stored, const GetOptions& options);

  // Concatenation of each range in request order; overlaps repeat bytes
  static store::Bytes extract_ranges(const store::Bytes& data, const std::vector<std::string>& ranges);
};

} // namespace memblob::conditional

#endif // MEMBLOB_CONDITIONAL_REQUEST_HPP
