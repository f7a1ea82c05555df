#pragma once
#include <string>

namespace sl {

// Codes:
//   FETCH_FAILED     collaborator reported failure / transport error
//   BAD_PAYLOAD      response is not the expected JSON shape
//   MALFORMED_BAR    a bar violates a price/volume invariant
//   BAD_DAY_KEY      a bar time is not a calendar day
//   UNORDERED_SERIES bars are not ascending by time
//   DUPLICATE_TIME   two bars share a time key
//   EMPTY_SERIES     no bars where at least one is required
struct DataError {
  std::string code;
  std::string message;
};

} // namespace sl
