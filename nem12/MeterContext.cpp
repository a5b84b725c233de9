#include "MeterContext.h"

#include <stdexcept>
#include <folly/Conv.h>
#include <folly/String.h>

MeterContext MeterContext::fromRecord(const std::vector<folly::StringPiece> &fields) {
  if (fields.size() < kMinFields)
    throw std::invalid_argument(folly::to<std::string>(
        "Invalid 200 record: insufficient fields (got ", fields.size(),
        ", need at least ", kMinFields, ")"));

  MeterContext ctx;
  ctx.nmi = folly::trimWhitespace(fields[1]).str();
  if (ctx.nmi.empty())
    throw std::invalid_argument("Invalid 200 record: empty NMI");

  auto interval = folly::tryTo<int>(folly::trimWhitespace(fields[8]));
  if (!interval)
    throw std::invalid_argument(folly::to<std::string>(
        "Invalid interval length in 200 record: '", fields[8], "'"));

  ctx.intervalMinutes = *interval;
  if (ctx.intervalMinutes <= 0)
    throw std::invalid_argument(folly::to<std::string>(
        "Invalid interval length: ", ctx.intervalMinutes, " (must be positive)"));

  return ctx;
}
