#ifndef NEM12_READING_SOURCE_H
#define NEM12_READING_SOURCE_H

#include <vector>
#include <cstddef>
#include <utility>

#include "MeterReading.h"

/* Forward-only, single-pass producer of readings. */
class ReadingSource {
 public:
  virtual ~ReadingSource() = default;

  /** Fetch the next reading. Returns false once exhausted. */
  virtual bool nextReading(MeterReading &reading) = 0;
};

/* Replays readings held in memory. */
class VectorReadingSource final : public ReadingSource {
 public:
  explicit VectorReadingSource(std::vector<MeterReading> rows)
    : rows_(std::move(rows))
  {}

  bool nextReading(MeterReading &reading) override {
    if (pos_ == rows_.size())
      return false;
    reading = rows_[pos_++];
    return true;
  }

 private:
  std::vector<MeterReading> rows_;
  size_t pos_ = 0;
};

#endif // NEM12_READING_SOURCE_H
