#ifndef NEM12_METER_READING_H
#define NEM12_METER_READING_H

#include <chrono>
#include <string>
#include <cstddef>

#include <folly/Range.h>

#include "Consumption.h"

// Second precision covers years 1 through 10000
using Timestamp = std::chrono::sys_seconds;

/* A single interval value attributed to a meter. Timestamps are
 * UTC wall-clock values marking the end of the interval. */
class MeterReading {
 public:
  static constexpr size_t kMaxNmiLength = 10;

  MeterReading() = default;

  /** Throws `invalid_argument` on empty or overlong NMI or
    * negative consumption. */
  MeterReading(folly::StringPiece nmi, Timestamp timestamp,
               Consumption consumption);

  const std::string& nmi() const noexcept { return nmi_; }
  Timestamp timestamp() const noexcept { return timestamp_; }
  const Consumption& consumption() const noexcept { return consumption_; }

  bool operator==(const MeterReading& rhs) const noexcept {
    return nmi_ == rhs.nmi_ && timestamp_ == rhs.timestamp_ &&
      consumption_ == rhs.consumption_;
  }

 private:
  std::string nmi_;
  Timestamp timestamp_;
  Consumption consumption_;
};

/** Number of UTF-8 code points in `s`. */
size_t countCodePoints(folly::StringPiece s) noexcept;

#endif // NEM12_METER_READING_H
