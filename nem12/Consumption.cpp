#include "Consumption.h"

#include <string_view>
#include <folly/String.h>

folly::Optional<Consumption> Consumption::fromString(folly::StringPiece s) {
  arrow::Decimal128 value;
  int32_t precision = 0;
  int32_t scale = 0;

  s = folly::trimWhitespace(s);
  if (s.empty())
    return folly::none;

  arrow::Status st = arrow::Decimal128::FromString(
      std::string_view(s.data(), s.size()), &value, &precision, &scale);
  if (!st.ok() || precision > kMaxPrecision)
    return folly::none;

  // Exponent notation may yield a negative scale: fold it into the value
  if (scale < 0) {
    auto rescaled = value.Rescale(scale, 0);
    if (!rescaled.ok())
      return folly::none;
    value = *rescaled;
    scale = 0;
  }

  return Consumption(value, scale);
}

std::string Consumption::toString() const {
  std::string digits = value_.ToIntegerString();
  std::string ret;

  bool negative = !digits.empty() && digits[0] == '-';
  if (negative)
    digits.erase(0, 1);

  if (scale_ > 0) {
    size_t scale = static_cast<size_t>(scale_);
    if (digits.size() <= scale)
      digits.insert(0, scale + 1 - digits.size(), '0');
    digits.insert(digits.size() - scale, 1, '.');
  }

  ret.reserve(digits.size() + 1);
  if (negative)
    ret += '-';
  ret += digits;
  return ret;
}

std::ostream& operator<<(std::ostream& os, const Consumption& c) {
  return os << c.toString();
}
