#ifndef NEM12_CONSUMPTION_H
#define NEM12_CONSUMPTION_H

#include <cstdint>
#include <string>
#include <ostream>

#include <arrow/util/decimal.h>
#include <folly/Optional.h>
#include <folly/Range.h>

/* Exact base-10 quantity as carried by NEM12 interval values.
 * Keeps the scale of the source text so that re-serialization
 * reproduces trailing zeros ("0.50" stays "0.50"). */
class Consumption {
 public:
  static constexpr int32_t kMaxPrecision = 38;

  Consumption() noexcept = default;
  Consumption(arrow::Decimal128 value, int32_t scale) noexcept
    : value_(value), scale_(scale)
  {}

  /** Parse plain or exponent notation. Returns none on garbage,
    * non-finite tokens or more than kMaxPrecision digits. */
  static folly::Optional<Consumption> fromString(folly::StringPiece s);

  bool isNegative() const noexcept { return value_.IsNegative(); }
  bool isZero() const noexcept { return value_ == arrow::Decimal128(0); }
  const arrow::Decimal128& unscaled() const noexcept { return value_; }
  int32_t scale() const noexcept { return scale_; }

  /** Plain decimal notation, never scientific. */
  std::string toString() const;

  /* Exact comparison of value and scale: "1.0" != "1.00" */
  bool operator==(const Consumption& rhs) const noexcept {
    return value_ == rhs.value_ && scale_ == rhs.scale_;
  }
  bool operator!=(const Consumption& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  arrow::Decimal128 value_;
  int32_t scale_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Consumption& c);

#endif // NEM12_CONSUMPTION_H
