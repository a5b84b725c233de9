#include "MeterReading.h"

#include <stdexcept>
#include <utility>
#include <folly/Conv.h>

MeterReading::MeterReading(folly::StringPiece nmi, Timestamp timestamp,
                           Consumption consumption)
  : nmi_(nmi.str())
  , timestamp_(timestamp)
  , consumption_(std::move(consumption))
{
  size_t length = countCodePoints(nmi);
  if (length == 0 || length > kMaxNmiLength)
    throw std::invalid_argument(folly::to<std::string>(
        "Invalid NMI: '", nmi, "' (must be 1-", kMaxNmiLength, " characters)"));
  if (consumption_.isNegative())
    throw std::invalid_argument(folly::to<std::string>(
        "Invalid consumption: ", consumption_.toString(),
        " (must be non-negative)"));
}

size_t countCodePoints(folly::StringPiece s) noexcept {
  size_t n = 0;
  for (char c : s) {
    // skip continuation bytes 10xxxxxx
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++n;
  }
  return n;
}
