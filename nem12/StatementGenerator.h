#ifndef NEM12_STATEMENT_GENERATOR_H
#define NEM12_STATEMENT_GENERATOR_H

#include <cstdint>
#include <cstddef>
#include <string>

#include <folly/Range.h>

#include "MeterReading.h"
#include "ReadingSource.h"

/* Renders readings pulled from a source as multi-row INSERT statements
 * for the meter_readings table, `batchSize` rows per statement. */
class StatementGenerator {
 public:
  static constexpr int64_t kDefaultBatchSize = 1000;
  static constexpr folly::StringPiece kTableName = "meter_readings";

  /** Throws `invalid_argument` if batchSize < 1. The source must
    * outlive the generator. */
  explicit StatementGenerator(ReadingSource &source,
                              int64_t batchSize = kDefaultBatchSize);

  /** Render the next statement into `statement`. Returns false once the
    * source is drained. Errors thrown by the source propagate. */
  bool nextStatement(std::string &statement);

  int64_t batchSize() const noexcept { return batchSize_; }
  size_t numStatements() const noexcept { return numStatements_; }
  size_t numReadings() const noexcept { return numReadings_; }

  /** Double single quotes so `s` can sit inside a SQL string literal. */
  static std::string escapeLiteral(folly::StringPiece s);

  /** YYYY-MM-DD HH:MM:SS in UTC. */
  static std::string formatTimestamp(Timestamp ts);

  /** ('<nmi>', '<timestamp>', <consumption>) */
  static std::string formatValue(const MeterReading &reading);

 private:
  ReadingSource &source_;
  int64_t batchSize_;
  MeterReading reading_;
  size_t numStatements_ = 0;
  size_t numReadings_ = 0;
};

#endif // NEM12_STATEMENT_GENERATOR_H
