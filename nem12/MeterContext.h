#ifndef NEM12_METER_CONTEXT_H
#define NEM12_METER_CONTEXT_H

#include <string>
#include <vector>

#include <folly/Range.h>

/* Meter configuration declared by a 200 record. Applies to every
 * following 300 record until the next 200 record replaces it. */
struct MeterContext {
  std::string nmi;
  int intervalMinutes = 0;

  /** Minimum number of fields in a 200 record. */
  static constexpr size_t kMinFields = 9;

  /** Parse a split 200 record. Field 2 is the NMI and field 9 is the
    * interval length. Throws `invalid_argument` if malformed. */
  static MeterContext fromRecord(const std::vector<folly::StringPiece> &fields);

  /** Number of interval values a 300 record carries for this meter. */
  int intervalsPerDay() const noexcept { return 24 * 60 / intervalMinutes; }
};

#endif // NEM12_METER_CONTEXT_H
